#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/env.h — Environment variable lookup
// ═══════════════════════════════════════════════════════════════════
//
//  Everything that reads configuration takes an env::Lookup, so tests
//  can substitute a fixed map for the process environment.
// ═══════════════════════════════════════════════════════════════════

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace ytapi::env {

using Lookup = std::function<std::optional<std::string>(const std::string&)>;

inline Lookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

inline Lookup fromMap(std::unordered_map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

// ── Value or fallback when unset or empty ──
inline std::string getOr(const Lookup& lookup, const std::string& name,
                         const std::string& fallback) {
    auto value = lookup(name);
    return (value && !value->empty()) ? *value : fallback;
}

} // namespace ytapi::env
