/**
 * @file DreamingModule.hpp
 * @brief Module de rêve : synthèse de patterns en arrière-plan
 * @version 1.0
 * @date 2026-10-19
 *
 * Toutes les 5 minutes, si le tampon contient plus de 10 expériences et que
 * l'on est dans la fenêtre de basse activité (5 premières minutes de
 * l'heure), le module enchaîne trois phases :
 * 1. CONSOLIDATE : regroupe les décisions par signature
 *    "<Type>_<confiance:.2>_<poids contexte:.2>" (force ×1.1 sur répétition)
 * 2. EXPLORE : un scénario synthétique par pattern de force > 2
 * 3. DECAY : force ×0.95, purge des patterns éteints
 */

#pragma once

#include "DreamState.hpp"
#include "OrchestratorConfig.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace morphine {

/**
 * Callback pour notifier les changements de phase
 */
using DreamStateCallback = std::function<void(DreamState oldState, DreamState newState)>;

class DreamingModule {
public:
    explicit DreamingModule(const DreamingConfig& config = DreamingConfig{});
    ~DreamingModule();

    DreamingModule(const DreamingModule&) = delete;
    DreamingModule& operator=(const DreamingModule&) = delete;

    // ═══════════════════════════════════════════════════════════
    // CYCLE DE VIE
    // ═══════════════════════════════════════════════════════════

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // ═══════════════════════════════════════════════════════════
    // EXPÉRIENCES (entrée)
    // ═══════════════════════════════════════════════════════════

    /**
     * Ajoute une décision au tampon (la plus ancienne est évincée au-delà
     * de la capacité). Sûr pendant un cycle en cours.
     */
    void incorporateExperience(const MetacognitiveDecision& decision);

    [[nodiscard]] size_t getExperienceCount() const;
    [[nodiscard]] std::vector<MetacognitiveDecision> getExperiences() const;

    // ═══════════════════════════════════════════════════════════
    // CYCLE DE RÊVE
    // ═══════════════════════════════════════════════════════════

    /**
     * Conditions d'activation à l'instant now (secondes epoch)
     */
    [[nodiscard]] bool shouldActivate(double now) const;

    /**
     * Exécute un cycle si les conditions sont réunies
     * @return true si le cycle a eu lieu
     */
    bool dreamCycle(double now = nowSeconds());

    /**
     * Exécute un cycle complet sans vérifier les conditions
     */
    void forceDreamCycle();

    /**
     * Signature d'une décision (collisions assumées : grossissement voulu)
     */
    [[nodiscard]] static std::string patternSignature(const MetacognitiveDecision& decision);

    // ═══════════════════════════════════════════════════════════
    // ACCÈS À L'ÉTAT
    // ═══════════════════════════════════════════════════════════

    [[nodiscard]] DreamState getState() const { return state_.load(); }
    [[nodiscard]] bool isActive() const { return isDreaming(state_.load()); }

    [[nodiscard]] std::vector<DreamPattern> getDiscoveredPatterns() const;
    [[nodiscard]] size_t getPatternCount() const;
    [[nodiscard]] std::vector<json> getNovelDiscoveries() const;

    void setStateChangeCallback(DreamStateCallback callback);

    [[nodiscard]] const DreamingConfig& getConfig() const { return config_; }

    struct Stats {
        size_t cycles_completed = 0;
        size_t scenarios_generated = 0;
        size_t patterns_purged = 0;
    };

    [[nodiscard]] Stats getStats() const;

private:
    void dreamLoop();
    void transitionTo(DreamState newState);

    void consolidatePatterns(const std::vector<MetacognitiveDecision>& experiences);
    void generateNovelScenarios();
    void decayPatterns();

    json makeScenario(const DreamPattern& pattern);

    DreamingConfig config_;

    // Tampon d'expériences
    mutable std::mutex experience_mutex_;
    std::deque<MetacognitiveDecision> experience_buffer_;

    // Patterns et journal des découvertes (modifiés par le cycle seulement)
    mutable std::shared_mutex pattern_mutex_;
    std::map<std::string, DreamPattern> discovered_patterns_;
    std::deque<json> novel_discoveries_;
    Stats stats_;

    // Un seul cycle à la fois
    std::mutex cycle_mutex_;

    std::atomic<DreamState> state_{DreamState::AWAKE};
    mutable std::mutex callback_mutex_;
    DreamStateCallback stateChangeCallback_;

    std::atomic<bool> running_{false};
    std::thread dream_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    std::mt19937 rng_{std::random_device{}()};
};

} // namespace morphine
