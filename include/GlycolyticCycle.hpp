/**
 * @file GlycolyticCycle.hpp
 * @brief Cycle glycolytique : pool de workers auto-dimensionné
 * @version 1.0
 * @date 2026-10-19
 *
 * Boucle périodique (100 ms) en trois temps :
 * 1. Équilibrage : file triée par priorité/complexité décroissante,
 *    affectation aux workers libres
 * 2. Métriques : charge = occupés / total, débit = score moyen
 * 3. Auto-scaling : +1 worker si charge > 0.8, -1 worker libre si < 0.3,
 *    entre le plancher (taille initiale) et le plafond (32)
 */

#pragma once

#include "OrchestratorConfig.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace morphine {

/**
 * @class GlycolyticCycle
 * @brief Ordonnanceur de tâches à haut débit
 *
 * Le pool, la file, l'allocation et les métriques ne sont modifiés que par
 * la boucle d'équilibrage (et la libération des workers en fin de tâche) ;
 * les autres composants n'en lisent que des instantanés.
 */
class GlycolyticCycle {
public:
    using Allocation = std::unordered_map<std::string, double>;

    /**
     * @brief Constructeur (lève std::invalid_argument si config invalide)
     */
    explicit GlycolyticCycle(const GlycolyticConfig& config = GlycolyticConfig{});
    ~GlycolyticCycle();

    GlycolyticCycle(const GlycolyticCycle&) = delete;
    GlycolyticCycle& operator=(const GlycolyticCycle&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // CYCLE DE VIE
    // ═══════════════════════════════════════════════════════════════

    void start();

    /**
     * @brief Arrête la boucle, attend les exécutions en cours et annule
     *        les tâches encore en file (leur future vaut false)
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // ═══════════════════════════════════════════════════════════════
    // TÂCHES
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Met une tâche en file
     * @return future résolue à true si la tâche a réussi, false si elle a
     *         échoué ou a été annulée
     */
    std::future<bool> submitTask(Task task);

    /**
     * @brief Un tour de boucle : équilibrage, métriques, auto-scaling
     */
    void runCycle();

    void balanceLoad();
    void updateMetrics();
    void autoScale();

    // ═══════════════════════════════════════════════════════════════
    // ALLOCATION DE RESSOURCES
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Allocation cpu/memory/io pour un contexte (mise en cache)
     *
     * base = 1 / (1 + charge glycolytique)
     * cpu = base·(1 + confiance), memory = 0.8·base, io = 0.6·base
     */
    Allocation allocateResources(const StreamingContext& context,
                                 const MetabolicState& metabolic_state);

    static Allocation computeAllocation(double confidence_level, double glycolytic_load);

    // ═══════════════════════════════════════════════════════════════
    // LECTURES
    // ═══════════════════════════════════════════════════════════════

    [[nodiscard]] double getCurrentLoad() const { return current_load_.load(); }
    [[nodiscard]] Allocation getResourceAllocation() const;
    [[nodiscard]] PerformanceMetrics getMetrics() const;
    [[nodiscard]] std::vector<WorkerState> getWorkers() const;
    [[nodiscard]] size_t getWorkerCount() const;
    [[nodiscard]] size_t getBusyCount() const;
    [[nodiscard]] size_t getPendingCount() const;

    [[nodiscard]] size_t minWorkers() const { return min_workers_; }
    [[nodiscard]] size_t maxWorkers() const { return config_.max_workers; }
    [[nodiscard]] const GlycolyticConfig& getConfig() const { return config_; }

private:
    struct PendingTask {
        Task task;
        std::shared_ptr<std::promise<bool>> promise;
        uint64_t sequence = 0;
    };

    struct Execution {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void balancerLoop();
    void execute(const std::string& worker_id, PendingTask pending);
    void releaseWorker(const std::string& worker_id, double processing_time, bool failed);
    void reapExecutions(bool wait_all);
    double simulatedDuration(double estimated_time);
    WorkerState makeWorker();

    GlycolyticConfig config_;
    const size_t min_workers_;

    // Pool
    mutable std::shared_mutex pool_mutex_;
    std::vector<WorkerState> workers_;
    uint64_t next_worker_index_ = 0;

    // File d'attente
    mutable std::mutex queue_mutex_;
    std::vector<PendingTask> queue_;
    uint64_t next_sequence_ = 0;

    // Allocation et charge
    mutable std::shared_mutex allocation_mutex_;
    Allocation resource_allocation_;
    std::atomic<double> current_load_{0.0};

    // Métriques
    mutable std::mutex metrics_mutex_;
    PerformanceMetrics metrics_;
    bool latency_initialized_ = false;

    // Exécutions en vol
    std::mutex executions_mutex_;
    std::list<Execution> executions_;

    // Boucle
    std::atomic<bool> running_{false};
    std::thread balancer_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    // Gigue aléatoire
    std::mutex rng_mutex_;
    std::mt19937 rng_{std::random_device{}()};
};

} // namespace morphine
