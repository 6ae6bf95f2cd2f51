#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "Action.h"
#include "VimEngine.h"
#include "Keyboard/InputEvent.h"

// Host-side helpers for driving a VimEngine from a script of keystrokes.
// File I/O lives here, never in the engine.

struct ReplayResult {
  std::vector<HostAction> actions;
  std::size_t eventsFed = 0;
  bool quit = false;  // stopped early on :q / :wq
};

// Whole file as one string. Throws std::runtime_error if it can't be read.
std::string load_document(const std::filesystem::path& path);

// Throws std::runtime_error if the file can't be written.
void save_document(const std::filesystem::path& path, const std::string& text);

// Feed events in order. onSave gets the document for :w and :wq. Stops
// after the first :q or :wq.
ReplayResult replay(VimEngine& engine, const std::vector<InputEvent>& events,
                    const std::function<void(const std::string&)>& onSave);

// Tokenize (globalTokenizer) and replay.
ReplayResult replay(VimEngine& engine, std::string_view keys,
                    const std::function<void(const std::string&)>& onSave);

// Document, "line:col" (1-based), mode label, actions.
void printReport(std::ostream& os, const VimEngine& engine, const ReplayResult& result);
