#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "Editor/Config.h"
#include "Editor/Replay.h"
#include "Editor/VimEngine.h"
#include "Utils/Debug.h"

using namespace std;
namespace fs = std::filesystem;

// vimnote-replay <file> <keys> [--egui]
//
// Loads <file> (missing file = empty note), plays <keys> in vim notation
// and prints the final state. :w writes the file back, :q stops early.
int main(int argc, char* argv[]) {
  if(argc < 3 || argc > 4) {
    cerr << "usage: " << argv[0] << " <file> <keys> [--egui]\n";
    return 1;
  }

  fs::path path = argv[1];
  string keys = argv[2];
  bool egui = argc == 4 && string(argv[3]) == "--egui";
  if(argc == 4 && !egui) {
    cerr << "unknown option: " << argv[3] << '\n';
    return 1;
  }

  try {
    string document = fs::exists(path) ? load_document(path) : string();
    VimEngine engine(document, egui ? Config::eguiHost() : Config::standard());

    ReplayResult result = replay(engine, keys, [&](const string& text) {
      save_document(path, text);
      cout << "wrote " << path.string() << " (" << text.size() << " bytes)\n";
    });

    printReport(cout, engine, result);
  } catch(const exception& e) {
    cerr << "error: " << e.what() << '\n';
    return 1;
  }

  if constexpr(DEBUG_ENABLED) {
    cerr << get_debug_output();
  }
  return 0;
}
