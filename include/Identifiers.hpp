/**
 * @file Identifiers.hpp
 * @brief Génération d'identifiants aléatoires (format UUID v4)
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>
#include <string>

namespace morphine {

/**
 * @brief Identifiant aléatoire 128 bits au format 8-4-4-4-12
 */
inline std::string generateId() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng();
        lo = rng();
    }

    // Version 4, variante RFC 4122
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

/**
 * @brief Identifiant préfixé ("<prefix>:<uuid>")
 */
inline std::string generateId(const std::string& prefix) {
    return prefix + ":" + generateId();
}

} // namespace morphine
