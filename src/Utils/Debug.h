// Debug.h

#pragma once
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

#ifdef VIMNOTE_DEBUG
constexpr bool DEBUG_ENABLED = true;
#else
constexpr bool DEBUG_ENABLED = false;
#endif

// In-memory log. The engine never writes to stdout/stderr itself; the host
// (or a test) decides whether to read it back.
inline std::ostringstream& dout() {
    static std::ostringstream stream;
    return stream;
}

// Past this many bytes the oldest half of the log is dropped, on a line boundary.
constexpr std::size_t DEBUG_OUTPUT_LIMIT = 1 << 20;

inline void trim_debug_output() {
    auto& os = dout();
    std::string kept = os.str();
    if (kept.size() <= DEBUG_OUTPUT_LIMIT) return;
    kept.erase(0, kept.size() - DEBUG_OUTPUT_LIMIT / 2);
    auto nl = kept.find('\n');
    kept.erase(0, nl == std::string::npos ? kept.size() : nl + 1);
    os.str(kept);
    os.seekp(0, std::ios::end);
}

// Space between elements, and new line
template<typename... Args>
inline void debug([[maybe_unused]] Args&&... args){
    if constexpr(DEBUG_ENABLED){
        auto& os = dout();
        const char* sep = "";
        ((os<<sep<<std::forward<Args>(args), sep=" "), ...);
        os<<'\n';
        if (static_cast<std::size_t>(os.tellp()) > DEBUG_OUTPUT_LIMIT) {
            trim_debug_output();
        }
    }
}

inline std::string get_debug_output() {
    return dout().str();
}

inline void clear_debug_output() {
    dout().str("");
    dout().clear();
}
