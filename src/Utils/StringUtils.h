#pragma once

#include <string>
#include <string_view>

// Escape special characters for readable display (newlines -> \n, etc.)
inline std::string makePrintable(std::string_view s) {
  std::string result;
  result.reserve(s.size() * 2);
  for (char c : s) {
    switch (c) {
      case '\n': result += "\\n"; break;
      case '\t': result += "\\t"; break;
      case '\r': result += "\\r"; break;
      case '\\': result += "\\\\"; break;
      default: result += c; break;
    }
  }
  return result;
}

// Wrap in double quotes after escaping, for log lines.
inline std::string quotedPrintable(std::string_view s) {
  return "\"" + makePrintable(s) + "\"";
}
