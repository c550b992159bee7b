// Debug.h
//
// In-memory trace of resolver decisions. Compiled out unless FUZZYPATCH_DEBUG
// is defined; the buffer itself always exists so callers need no #ifdefs.

#pragma once
#include <sstream>
#include <string>

#ifdef FUZZYPATCH_DEBUG
constexpr bool DEBUG_ENABLED = true;
#else
constexpr bool DEBUG_ENABLED = false;
#endif

inline std::ostringstream& dout() {
    static std::ostringstream stream;
    return stream;
}

// Space between elements, and new line
template<typename... Args>
inline void debug([[maybe_unused]] Args&&... args){
    if constexpr(DEBUG_ENABLED){
        auto& os = dout();
        const char* sep = "";
        ((os<<sep<<std::forward<Args>(args), sep=" "), ...);
        os<<'\n';
    }
}

inline std::string get_debug_output() {
    return dout().str();
}

inline void clear_debug_output() {
    dout().str("");
    dout().clear();
}

// Hand the trace to a consumer (CLI --debug, FFI host) and start over
inline std::string take_debug_output() {
    std::string out = get_debug_output();
    clear_debug_output();
    return out;
}
