/**
 * @file LactateCycle.hpp
 * @brief Cycle lactique : cache TTL des décisions incomplètes
 * @version 1.0
 * @date 2026-10-19
 *
 * Les décisions de faible confiance sont conservées une heure. Un balayage
 * périodique (30 s) purge les entrées expirées puis recalcule le niveau de
 * lactate = nombre / (1 + complétion moyenne), 0 si le cache est vide.
 */

#pragma once

#include "OrchestratorConfig.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace morphine {

class LactateCycle {
public:
    using Clock = std::chrono::system_clock;

    explicit LactateCycle(const LactateConfig& config = LactateConfig{});
    ~LactateCycle();

    LactateCycle(const LactateCycle&) = delete;
    LactateCycle& operator=(const LactateCycle&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // ═══════════════════════════════════════════════════════════════
    // ARCHIVAGE / RECHERCHE
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Archive une décision (nouvel identifiant à chaque appel)
     *
     * complétion = confiance × 100, payload = preuves des couches,
     * TTL fixe.
     * @return identifiant du résultat partiel créé
     */
    std::string storePartialResult(const MetacognitiveDecision& decision);

    /**
     * @brief Premier résultat dont l'id source vaut task_id
     */
    [[nodiscard]] std::optional<PartialResult> retrievePartialResult(const std::string& task_id) const;

    /**
     * @brief Tous les résultats dont l'id source contient stream_id
     *
     * Jointure approximative par sous-chaîne : un stream "s1" retrouve
     * aussi les résultats de "s10".
     */
    [[nodiscard]] std::vector<PartialResult> recoveryFromIncomplete(const std::string& stream_id) const;

    // ═══════════════════════════════════════════════════════════════
    // BALAYAGE
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Purge les entrées expirées à l'instant now et recalcule le niveau
     * @return nombre d'entrées purgées
     */
    size_t sweep(Clock::time_point now = Clock::now());

    [[nodiscard]] double getLactateLevel() const { return lactate_level_.load(); }
    [[nodiscard]] size_t getEntryCount() const;
    [[nodiscard]] const LactateConfig& getConfig() const { return config_; }

private:
    void sweepLoop();

    LactateConfig config_;

    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, PartialResult> incomplete_results_;
    std::atomic<double> lactate_level_{0.0};

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
};

} // namespace morphine
