#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/console.h — Levelled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::info("Listening on", host + ":" + std::to_string(port));
//    console::warn("Failed to load from settings file:", reason);
//
//  Tests can capture output with console::setSink().
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace ytapi::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

// ── Parse a LOG_LEVEL value ("warning" is accepted for "warn") ──
inline std::optional<Level> parseLevel(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

// A sink receives the level and the joined message (no timestamp, no color).
using Sink = std::function<void(Level, const std::string&)>;

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& minLevel() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

inline Sink& sink() {
    static Sink s;
    return s;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
        return arg.dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
std::string join(const Args&... args) {
    std::string out;
    bool first = true;
    auto appendOne = [&](const auto& arg) {
        if (!first) out += ' ';
        first = false;
        out += stringify(arg);
    };
    (appendOne(args), ...);
    return out;
}

template <typename... Args>
void print(Level level, const char* color, const char* prefix, const Args&... args) {
    if (level < minLevel().load()) return;

    auto message = join(args...);

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (sink()) {
        sink()(level, message);
        return;
    }

    std::ostream& os = level >= Level::Warn ? std::cerr : std::cout;
    os << Colors::Gray << "[" << timestamp() << "] "
       << color << prefix << Colors::Reset << message << std::endl;
}

} // namespace detail

// ── Global minimum level ──
inline void setLevel(Level level) { detail::minLevel().store(level); }
inline Level level() { return detail::minLevel().load(); }

// ── Replace the output stream; an empty Sink restores stdout/stderr ──
inline void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(detail::sinkMutex());
    detail::sink() = std::move(sink);
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, detail::Colors::Cyan, "● ", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, detail::Colors::Green, "✔ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, detail::Colors::Red, "✖ ", args...);
}

} // namespace ytapi::console
