// include/layerstore/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <iostream>
#include <mutex>

// Direct hex dump of a byte range, lowercase, no separators
inline std::string hex_dump_bytes(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// --- Logging Macros ---

inline std::mutex& log_output_mutex() {
    static std::mutex m;
    return m;
}

// Helper function for the variadic template macro
template<typename... Args>
void print_log_line(std::ostream& os, const char* level, Args&&... args) {
    std::lock_guard<std::mutex> lock(log_output_mutex());
    os << level;
    (os << ... << std::forward<Args>(args));
    os << std::endl;
}

// #define LAYERSTORE_DEBUG_LOG
// #define LAYERSTORE_TRACE_LOG

#ifdef LAYERSTORE_DEBUG_LOG
    #define LOG_DEBUG(level, ...) \
        do { print_log_line(std::cout, "[" #level "] ", __VA_ARGS__); } while(0)
#else
    #define LOG_DEBUG(level, ...) // No-op when not debugging
#endif

#ifdef LAYERSTORE_TRACE_LOG
    #define LOG_TRACE(...) do { print_log_line(std::cout, "[TRACE] ", __VA_ARGS__); } while(0)
#else
    #define LOG_TRACE(...) do {} while(0)
#endif

#define LOG_INFO(...) do { print_log_line(std::cout, "[INFO] ", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { print_log_line(std::cerr, "[WARN] ", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { print_log_line(std::cerr, "[ERROR] ", __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { print_log_line(std::cerr, "[FATAL] ", __VA_ARGS__); } while(0)
