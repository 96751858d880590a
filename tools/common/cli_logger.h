#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string_view>
#include <unordered_set>
#include <utility>

#ifndef _WIN32
#include <clocale>
#include <langinfo.h>
#endif

namespace dctools::log {

// Quiet shows warnings and errors only; -v adds Info, -vv adds Debug.
enum class Severity : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline int verbosity = 0;

inline void set_verbosity(int level) {
    verbosity = std::clamp(level, 0, 2);
}

inline bool enabled(Severity s) {
    switch (s) {
        case Severity::Debug: return verbosity >= 2;
        case Severity::Info: return verbosity >= 1;
        case Severity::Warn:
        case Severity::Error: return true;
    }
    return true;
}

// UTF-8 markers are used only when the terminal's codeset is UTF-8.
inline bool utf8_console() {
    static const bool value = []() {
#ifdef _WIN32
        return false;
#else
        std::setlocale(LC_CTYPE, "");
        const char* codeset = nl_langinfo(CODESET);
        if (!codeset) return false;
        std::string_view cs(codeset);
        return cs == "UTF-8" || cs == "utf-8" || cs == "utf8";
#endif
    }();
    return value;
}

constexpr std::string_view marker(Severity s, bool utf8) {
    switch (s) {
        case Severity::Debug: return utf8 ? "[🐞] " : "[DEBUG] ";
        case Severity::Info: return utf8 ? "[🔈] " : "[INFO] ";
        case Severity::Warn: return utf8 ? "⚠️ " : "[WARN] ";
        case Severity::Error: return utf8 ? "❌ " : "[ERROR] ";
    }
    return "";
}

template <typename... Args>
void write_line(std::ostream& out, Args&&... args) {
    ((out << std::forward<Args>(args) << ' '), ...);
    out << '\n';
}

template <typename... Args>
void emit(Severity s, Args&&... args) {
    if (!enabled(s)) return;
    std::cerr << marker(s, utf8_console());
    write_line(std::cerr, std::forward<Args>(args)...);
}

template <typename... Args> void debug(Args&&... args) { emit(Severity::Debug, std::forward<Args>(args)...); }
template <typename... Args> void info(Args&&... args) { emit(Severity::Info, std::forward<Args>(args)...); }
template <typename... Args> void warn(Args&&... args) { emit(Severity::Warn, std::forward<Args>(args)...); }
template <typename... Args> void error(Args&&... args) { emit(Severity::Error, std::forward<Args>(args)...); }

// print writes usage and report text to stdout, unprefixed.
template <typename... Args>
void print(Args&&... args) {
    write_line(std::cout, std::forward<Args>(args)...);
}

// report_warnings forwards decoder warnings ({code, message} records).
template <typename Warnings>
void report_warnings(std::string_view source, const Warnings& warnings) {
    for (const auto& w : warnings)
        warn(source, w.code + ":", w.message);
}

namespace detail {

inline std::mutex once_mutex;
inline std::unordered_set<uint64_t> once_keys;

inline bool should_log_once(uint64_t key) {
    std::lock_guard<std::mutex> lock(once_mutex);
    return once_keys.insert(key).second;
}

// FNV-1a
constexpr uint64_t hash_key(std::string_view key) {
    uint64_t h = 14695981039346656037ull;
    for (char c : key) {
        h ^= static_cast<unsigned char>(c);
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace detail

} // namespace dctools::log

namespace dctools::cli {
    using namespace dctools::log;
}

#define LOGI(...) ::dctools::log::info(__VA_ARGS__)
#define LOGW(...) ::dctools::log::warn(__VA_ARGS__)
#define LOGE(...) ::dctools::log::error(__VA_ARGS__)

#if DCTOOLS_DEBUG
    #define LOGD(...) ::dctools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif

// Logs only the first warning seen for a given key string.
#define LOGW_ONCE(key, ...) \
    do { \
        if (::dctools::log::detail::should_log_once(::dctools::log::detail::hash_key(key))) \
            ::dctools::log::warn(__VA_ARGS__); \
    } while (false)
