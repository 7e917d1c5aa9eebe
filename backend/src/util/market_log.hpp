#pragma once
#include <iostream>
#include <mutex>
#include <string>

// Console logging with bracketed component tags ("[settlement] ...").
// Tests point the stream elsewhere (or at nullptr) to keep output quiet.
inline std::ostream*& market_log_stream() {
    static std::ostream* stream = &std::cerr;
    return stream;
}

inline void set_market_log_stream(std::ostream* stream) { market_log_stream() = stream; }

inline void market_log(const char* tag, const std::string& msg) {
    static std::mutex io_mtx;
    std::lock_guard<std::mutex> lk(io_mtx);
    std::ostream* os = market_log_stream();
    if (!os) return;
    (*os) << "[" << tag << "] " << msg << std::endl;
}
