#pragma once

#include <cstdint>
#include <string>

namespace morphine {

/**
 * Phases du module de rêve
 */
enum class DreamState : uint8_t {
    AWAKE,              // Accumulation d'expériences

    // Phases d'un cycle de rêve
    DREAM_CONSOLIDATE,  // Regroupement des décisions par signature
    DREAM_EXPLORE,      // Génération de scénarios synthétiques
    DREAM_DECAY         // Oubli et purge des patterns éteints
};

/**
 * Convertit un DreamState en string lisible
 */
inline std::string dreamStateToString(DreamState state) {
    switch (state) {
        case DreamState::AWAKE:             return "AWAKE";
        case DreamState::DREAM_CONSOLIDATE: return "DREAM_CONSOLIDATE";
        case DreamState::DREAM_EXPLORE:     return "DREAM_EXPLORE";
        case DreamState::DREAM_DECAY:       return "DREAM_DECAY";
        default:                            return "UNKNOWN";
    }
}

/**
 * Vérifie si le module est en train de rêver (toute phase)
 */
inline bool isDreaming(DreamState state) {
    return state == DreamState::DREAM_CONSOLIDATE ||
           state == DreamState::DREAM_EXPLORE ||
           state == DreamState::DREAM_DECAY;
}

} // namespace morphine
