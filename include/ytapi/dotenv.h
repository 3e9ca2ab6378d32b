#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/dotenv.h — Load KEY=VALUE pairs from a .env file
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    dotenv::load();              // ./.env, existing variables win
//    dotenv::load("prod.env", true);
//
//  Accepted syntax:
//    # comment
//    export NAME=value
//    NAME="double quoted\nwith escapes"
//    NAME='single quoted, literal'
//    NAME=unquoted value  # trailing comment
// ═══════════════════════════════════════════════════════════════════

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ytapi::dotenv {

using Entry = std::pair<std::string, std::string>;

namespace detail {

inline std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

inline std::string unescapeDoubleQuoted(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char next = s[++i];
            switch (next) {
                case 'n':  out += '\n'; break;
                case 't':  out += '\t'; break;
                case 'r':  out += '\r'; break;
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                default:   out += '\\'; out += next; break;
            }
        } else {
            out += s[i];
        }
    }
    return out;
}

inline std::string parseValue(const std::string& raw) {
    auto value = trim(raw);
    if (value.empty()) return value;

    char quote = value.front();
    if (quote == '"' || quote == '\'') {
        auto close = value.find(quote, 1);
        // Skip escaped quotes inside double-quoted values
        while (quote == '"' && close != std::string::npos && value[close - 1] == '\\') {
            close = value.find(quote, close + 1);
        }
        if (close != std::string::npos) {
            auto inner = value.substr(1, close - 1);
            return quote == '"' ? unescapeDoubleQuoted(inner) : inner;
        }
        // Unterminated quote: keep the text as written
        return value;
    }

    auto comment = value.find(" #");
    if (comment != std::string::npos) {
        value = trim(value.substr(0, comment));
    }
    return value;
}

} // namespace detail

// ── Parse .env text into ordered entries; malformed lines are skipped ──
inline std::vector<Entry> parse(const std::string& text) {
    std::vector<Entry> entries;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        auto trimmed = detail::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = detail::trim(trimmed.substr(7));
        }

        auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;

        auto key = detail::trim(trimmed.substr(0, eq));
        if (key.empty()) continue;

        entries.emplace_back(key, detail::parseValue(trimmed.substr(eq + 1)));
    }
    return entries;
}

// ── Apply a .env file to the process environment ──
//    Returns the number of variables set. A missing file sets nothing.
inline std::size_t load(const std::string& path = ".env", bool override = false) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return 0;

    std::ostringstream oss;
    oss << file.rdbuf();

    std::size_t applied = 0;
    for (auto& [key, value] : parse(oss.str())) {
        if (!override && std::getenv(key.c_str()) != nullptr) continue;
        if (::setenv(key.c_str(), value.c_str(), 1) == 0) {
            ++applied;
        }
    }
    return applied;
}

} // namespace ytapi::dotenv
