#include "Replay.h"

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "Keyboard/SequenceTokenizer.h"
#include "Utils/Debug.h"
#include "Utils/StringUtils.h"

using namespace std;

string load_document(const filesystem::path& path) {
  ifstream in(path, ios::binary);
  if(!in) throw runtime_error("Can't read " + path.string());

  ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void save_document(const filesystem::path& path, const string& text) {
  ofstream out(path, ios::binary | ios::trunc);
  if(!out) throw runtime_error("Can't write " + path.string());
  out << text;
  if(!out) throw runtime_error("Write failed for " + path.string());
}

ReplayResult replay(VimEngine& engine, const vector<InputEvent>& events,
                    const function<void(const string&)>& onSave) {
  ReplayResult result;
  for(const InputEvent& ev : events) {
    DispatchResult r = engine.handle(ev);
    ++result.eventsFed;
    if(!r.action) continue;

    HostAction action = *r.action;
    result.actions.push_back(action);
    if(action == HostAction::Save || action == HostAction::SaveQuit) {
      if(onSave) onSave(engine.text());
    }
    if(action == HostAction::Quit || action == HostAction::SaveQuit) {
      result.quit = true;
      debug("replay stopped after", result.eventsFed, "events");
      break;
    }
  }
  return result;
}

ReplayResult replay(VimEngine& engine, string_view keys,
                    const function<void(const string&)>& onSave) {
  return replay(engine, globalTokenizer().tokenize(keys), onSave);
}

void printReport(ostream& os, const VimEngine& engine, const ReplayResult& result) {
  os << "text:   " << quotedPrintable(engine.text()) << '\n';
  os << "cursor: " << engine.line() + 1 << ':' << engine.column() + 1 << '\n';
  os << "mode:   " << engine.modeLabel() << '\n';
  os << "actions:";
  if(result.actions.empty()) os << " (none)";
  for(HostAction a : result.actions) os << ' ' << actionName(a);
  os << '\n';
}
