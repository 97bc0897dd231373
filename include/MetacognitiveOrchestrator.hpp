/**
 * @file MetacognitiveOrchestrator.hpp
 * @brief Orchestrateur métacognitif de décisions en flux
 * @version 1.0
 * @date 2026-10-19
 *
 * Une paire de canaux bornés par stream et un thread de pipeline par stream.
 * Chaque contexte reçu déclenche un run :
 *   état métabolique → allocation → 3 couches en parallèle →
 *   pondération par confiance → décision → archivage (< 0.8) →
 *   expérience de rêve → émission sur le canal de sortie
 *
 * Les décisions d'un même stream sont émises dans l'ordre de soumission.
 */

#pragma once

#include "AISystem.hpp"
#include "Channel.hpp"
#include "CognitiveLayer.hpp"
#include "DreamingModule.hpp"
#include "GlycolyticCycle.hpp"
#include "LactateCycle.hpp"
#include "OrchestratorConfig.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace morphine {

// ═══════════════════════════════════════════════════════════════════════════
// STRUCTURES EXPOSÉES
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Extrémités remises à l'appelant par createStream
 *
 * Fermer (ou détruire) toutes les copies de input termine le stream après
 * traitement des contextes déjà soumis.
 */
struct StreamEndpoints {
    Sender<StreamingContext> input;
    Receiver<MetacognitiveDecision> output;
};

/**
 * @brief Instantané de santé (lecture seule, n'attend aucun run)
 */
struct SystemHealth {
    MetabolicState metabolic_state;
    size_t active_streams = 0;
    size_t registered_ai_systems = 0;
    PerformanceMetrics scheduler_metrics;
    size_t worker_count = 0;
    size_t pending_tasks = 0;
    size_t cached_partial_results = 0;
    size_t pattern_count = 0;
    size_t experience_count = 0;

    json toJson() const {
        return {
            {"metabolic_state", metabolic_state.toJson()},
            {"active_streams", active_streams},
            {"registered_ai_systems", registered_ai_systems},
            {"scheduler_metrics", scheduler_metrics.toJson()},
            {"worker_count", worker_count},
            {"pending_tasks", pending_tasks},
            {"cached_partial_results", cached_partial_results},
            {"pattern_count", pattern_count},
            {"experience_count", experience_count}
        };
    }
};

struct OrchestratorStats {
    size_t contexts_processed = 0;
    size_t decisions_emitted = 0;
    size_t decisions_dropped = 0;
    size_t layer_failures = 0;
    size_t ai_system_failures = 0;
    size_t archived_results = 0;
    size_t pending_calls = 0;       ///< appels de couches / systèmes IA encore en cours

    json toJson() const {
        return {
            {"contexts_processed", contexts_processed},
            {"decisions_emitted", decisions_emitted},
            {"decisions_dropped", decisions_dropped},
            {"layer_failures", layer_failures},
            {"ai_system_failures", ai_system_failures},
            {"archived_results", archived_results},
            {"pending_calls", pending_calls}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// ORCHESTRATEUR
// ═══════════════════════════════════════════════════════════════════════════

class MetacognitiveOrchestrator {
public:
    /**
     * @brief Constructeur (lève std::invalid_argument si config invalide)
     *
     * Les trois couches par défaut sont des SignalLayer lisant
     * context_score, reasoning_score et intuition_score.
     */
    explicit MetacognitiveOrchestrator(const OrchestratorConfig& config = OrchestratorConfig{});
    ~MetacognitiveOrchestrator();

    MetacognitiveOrchestrator(const MetacognitiveOrchestrator&) = delete;
    MetacognitiveOrchestrator& operator=(const MetacognitiveOrchestrator&) = delete;

    // ═══════════════════════════════════════════════════════════
    // CYCLE DE VIE
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Démarre les trois boucles métaboliques
     */
    void start();

    /**
     * @brief Ferme tous les streams, attend leurs pipelines puis arrête
     *        les boucles métaboliques
     */
    void shutdown();

    // ═══════════════════════════════════════════════════════════
    // STREAMS
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Ouvre un stream et démarre son pipeline
     * @return nullopt si le stream existe déjà (l'existant est intact)
     *         ou si l'orchestrateur est arrêté
     */
    std::optional<StreamEndpoints> createStream(const std::string& stream_id);

    /**
     * @brief Ferme l'entrée d'un stream (les contextes en file sont traités)
     */
    bool closeStream(const std::string& stream_id);

    [[nodiscard]] bool hasStream(const std::string& stream_id) const;
    [[nodiscard]] size_t getActiveStreamCount() const;

    /**
     * @brief Un run complet de pipeline, hors canal
     */
    MetacognitiveDecision processContext(const StreamingContext& context);

    // ═══════════════════════════════════════════════════════════
    // SYSTÈMES IA ET COUCHES
    // ═══════════════════════════════════════════════════════════

    bool registerAISystem(AISystemPtr system, double weight);
    bool unregisterAISystem(const std::string& system_id);
    [[nodiscard]] size_t getRegisteredSystemCount() const { return ai_systems_.size(); }

    void setContextLayer(CognitiveLayerPtr layer);
    void setReasoningLayer(CognitiveLayerPtr layer);
    void setIntuitionLayer(CognitiveLayerPtr layer);

    KnowledgeBase& getKnowledgeBase() { return *knowledge_base_; }

    // ═══════════════════════════════════════════════════════════
    // INTROSPECTION
    // ═══════════════════════════════════════════════════════════

    [[nodiscard]] MetabolicState assessMetabolicState() const;
    [[nodiscard]] SystemHealth getSystemHealth() const;
    [[nodiscard]] OrchestratorStats getStats() const;

    [[nodiscard]] std::vector<MetacognitiveDecision> getRecentDecisions(const std::string& stream_id) const;
    [[nodiscard]] std::optional<StreamingContext> getActiveContext(const std::string& stream_id) const;
    [[nodiscard]] std::vector<PartialResult> recoverIncomplete(const std::string& stream_id) const;
    [[nodiscard]] std::vector<DreamPattern> getDiscoveredPatterns() const;
    [[nodiscard]] std::vector<json> getNovelDiscoveries() const;

    GlycolyticCycle& glycolyticCycle() { return *glycolytic_; }
    LactateCycle& lactateCycle() { return *lactate_; }
    DreamingModule& dreamingModule() { return *dreaming_; }

    [[nodiscard]] const OrchestratorConfig& getConfig() const { return config_; }

    // ═══════════════════════════════════════════════════════════
    // FUSION (fonctions pures)
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Champ "confidence" numérique borné à [0, 1], sinon 0.5
     */
    [[nodiscard]] static double extractConfidence(const json& evidence);

    /**
     * @brief Poids = confiance / somme, tiers égaux si la somme est nulle
     */
    [[nodiscard]] static LayerContributions computeLayerWeights(double context_confidence,
                                                                double reasoning_confidence,
                                                                double intuition_confidence);

    [[nodiscard]] static double overallConfidence(const LayerContributions& contributions,
                                                  double context_confidence,
                                                  double reasoning_confidence,
                                                  double intuition_confidence);

    /**
     * @brief Type de décision : indice explicite, alerte, familles de clés,
     *        sinon StreamAnalysis
     */
    [[nodiscard]] static DecisionType classifyDecision(const StreamingContext& context,
                                                       const std::unordered_map<std::string, json>& evidence);

private:
    struct StreamEntry {
        std::shared_ptr<Channel<StreamingContext>> input;
        std::shared_ptr<Channel<MetacognitiveDecision>> output;
        std::thread pipeline;
    };

    void runPipeline(std::string stream_id,
                     Receiver<StreamingContext> input,
                     Sender<MetacognitiveDecision> output);
    void emitDecision(const Sender<MetacognitiveDecision>& output, const MetacognitiveDecision& decision);
    void reapFinishedPipelines();

    struct TrackedCall {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Travail d'un appel suivi ; rend la livraison du résultat
    using CallWork = std::function<std::function<void()>()>;

    /**
     * @brief Lance un appel sur un thread joignable
     * @return false si la clé a déjà max_pending_calls appels en cours
     */
    bool launchTracked(const std::string& key, CallWork work);
    void reapTrackedCalls(bool wait_all);

    std::future<json> launchLayer(const CognitiveLayerPtr& layer,
                                  const StreamingContext& context,
                                  json collected_evidence);
    json awaitLayer(std::future<json>& future,
                    std::chrono::steady_clock::time_point deadline,
                    const std::string& layer_name);
    json collectAIEvidence(const StreamingContext& context,
                           const GlycolyticCycle::Allocation& allocation);

    void recordDecision(const MetacognitiveDecision& decision);

    OrchestratorConfig config_;

    // Sous-systèmes (chacun propriétaire de son état)
    std::shared_ptr<GlycolyticCycle> glycolytic_;
    std::shared_ptr<LactateCycle> lactate_;
    std::shared_ptr<DreamingModule> dreaming_;

    AISystemRegistry ai_systems_;
    std::shared_ptr<KnowledgeBase> knowledge_base_;

    mutable std::mutex layers_mutex_;
    CognitiveLayerPtr context_layer_;
    CognitiveLayerPtr reasoning_layer_;
    CognitiveLayerPtr intuition_layer_;

    // Registre des streams (verrou limité à l'insertion / au retrait)
    mutable std::mutex streams_mutex_;
    std::condition_variable streams_cv_;
    std::unordered_map<std::string, StreamEntry> streams_;
    std::vector<std::thread> finished_pipelines_;
    bool shutting_down_ = false;

    // Appels de couches et de systèmes IA (threads joignables, plafonnés par clé)
    mutable std::mutex calls_mutex_;
    std::list<TrackedCall> tracked_calls_;
    std::unordered_map<std::string, size_t> pending_calls_;

    // Dernier contexte et décisions récentes par stream
    mutable std::shared_mutex history_mutex_;
    std::unordered_map<std::string, StreamingContext> active_contexts_;
    std::unordered_map<std::string, std::deque<MetacognitiveDecision>> recent_decisions_;

    // Compteurs
    std::atomic<size_t> contexts_processed_{0};
    std::atomic<size_t> decisions_emitted_{0};
    std::atomic<size_t> decisions_dropped_{0};
    std::atomic<size_t> layer_failures_{0};
    std::atomic<size_t> ai_system_failures_{0};
    std::atomic<size_t> archived_results_{0};
};

} // namespace morphine
