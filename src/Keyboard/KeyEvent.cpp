#include "KeyEvent.h"

using namespace std;

// Generate name array from same source
#define STRING_VALUE(name, str) str,
static const char *g_key_names[] = {VIMNOTE_KEYS(STRING_VALUE)};
#undef STRING_VALUE

const char* keyName(Key key) {
  int idx = static_cast<int>(key);
  if (idx < 0 || idx >= KEY_COUNT) return "None";
  return g_key_names[idx];
}

optional<Key> keyFromName(string_view name) {
  for (int i = 0; i < KEY_COUNT; i++) {
    if (name == g_key_names[i]) return static_cast<Key>(i);
  }
  return nullopt;
}
