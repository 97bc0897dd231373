/**
 * @file Types.hpp
 * @brief Types et structures de données de l'orchestrateur métacognitif
 * @version 1.0
 * @date 2026-10-19
 */

#pragma once

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace morphine {

using json = nlohmann::json;

// Noms des trois couches cognitives (clés de l'évidence d'une décision)
inline const std::string LAYER_CONTEXT   = "context";
inline const std::string LAYER_REASONING = "reasoning";
inline const std::string LAYER_INTUITION = "intuition";

// Confiance neutre attribuée à une couche défaillante ou muette
constexpr double NEUTRAL_CONFIDENCE = 0.5;

/**
 * @brief Secondes depuis l'epoch Unix (horloge murale)
 */
inline double nowSeconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉNUMÉRATIONS
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Étape de traitement d'un contexte
 */
enum class ProcessingStage {
    CONTEXT,
    REASONING,
    INTUITION,
    COMPLETE
};

inline std::string toString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::CONTEXT:   return "Context";
        case ProcessingStage::REASONING: return "Reasoning";
        case ProcessingStage::INTUITION: return "Intuition";
        case ProcessingStage::COMPLETE:  return "Complete";
        default:                         return "Unknown";
    }
}

inline ProcessingStage parseProcessingStage(const std::string& str) {
    static const std::unordered_map<std::string, ProcessingStage> stageMap = {
        {"Context", ProcessingStage::CONTEXT},
        {"Reasoning", ProcessingStage::REASONING},
        {"Intuition", ProcessingStage::INTUITION},
        {"Complete", ProcessingStage::COMPLETE}
    };
    auto it = stageMap.find(str);
    return (it != stageMap.end()) ? it->second : ProcessingStage::CONTEXT;
}

/**
 * @brief Nature d'une décision métacognitive
 */
enum class DecisionType {
    BETTING_OPPORTUNITY,
    LOCATION_VERIFICATION,
    TRANSACTION_VALIDATION,
    STREAM_ANALYSIS,
    ALERT_GENERATION
};

inline std::string toString(DecisionType type) {
    switch (type) {
        case DecisionType::BETTING_OPPORTUNITY:    return "BettingOpportunity";
        case DecisionType::LOCATION_VERIFICATION:  return "LocationVerification";
        case DecisionType::TRANSACTION_VALIDATION: return "TransactionValidation";
        case DecisionType::STREAM_ANALYSIS:        return "StreamAnalysis";
        case DecisionType::ALERT_GENERATION:       return "AlertGeneration";
        default:                                   return "Unknown";
    }
}

/**
 * @brief Convertit une chaîne en DecisionType (nullopt si inconnue)
 */
inline std::optional<DecisionType> parseDecisionType(const std::string& str) {
    static const std::unordered_map<std::string, DecisionType> typeMap = {
        {"BettingOpportunity", DecisionType::BETTING_OPPORTUNITY},
        {"LocationVerification", DecisionType::LOCATION_VERIFICATION},
        {"TransactionValidation", DecisionType::TRANSACTION_VALIDATION},
        {"StreamAnalysis", DecisionType::STREAM_ANALYSIS},
        {"AlertGeneration", DecisionType::ALERT_GENERATION}
    };
    auto it = typeMap.find(str);
    if (it == typeMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ═══════════════════════════════════════════════════════════════════════════
// CONTEXTE ET DÉCISION
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Unité d'entrée soumise sur un stream
 */
struct StreamingContext {
    std::string stream_id;
    double timestamp = 0.0;                                // secondes epoch
    std::unordered_map<std::string, json> partial_data;
    double confidence_level = 0.0;
    ProcessingStage processing_stage = ProcessingStage::CONTEXT;

    json toJson() const {
        json j;
        j["stream_id"] = stream_id;
        j["timestamp"] = timestamp;
        j["partial_data"] = json::object();
        for (const auto& [key, value] : partial_data) {
            j["partial_data"][key] = value;
        }
        j["confidence_level"] = confidence_level;
        j["processing_stage"] = toString(processing_stage);
        return j;
    }

    static StreamingContext fromJson(const json& j) {
        StreamingContext ctx;
        ctx.stream_id = j.value("stream_id", "");
        ctx.timestamp = j.value("timestamp", nowSeconds());
        if (j.contains("partial_data") && j["partial_data"].is_object()) {
            for (const auto& [key, value] : j["partial_data"].items()) {
                ctx.partial_data[key] = value;
            }
        }
        ctx.confidence_level = j.value("confidence_level", 0.0);
        ctx.processing_stage = parseProcessingStage(j.value("processing_stage", "Context"));
        return ctx;
    }
};

/**
 * @brief Instantané de l'état métabolique
 */
struct MetabolicState {
    double glycolytic_load = 0.0;       // fraction de workers occupés [0, 1]
    double lactate_level = 0.0;         // pression des résultats incomplets
    bool dreaming_active = false;
    std::unordered_map<std::string, double> resource_allocation;

    json toJson() const {
        json alloc = json::object();
        for (const auto& [name, share] : resource_allocation) {
            alloc[name] = share;
        }
        return {
            {"glycolytic_load", glycolytic_load},
            {"lactate_level", lactate_level},
            {"dreaming_active", dreaming_active},
            {"resource_allocation", alloc}
        };
    }

    static MetabolicState fromJson(const json& j) {
        MetabolicState s;
        s.glycolytic_load = j.value("glycolytic_load", 0.0);
        s.lactate_level = j.value("lactate_level", 0.0);
        s.dreaming_active = j.value("dreaming_active", false);
        if (j.contains("resource_allocation") && j["resource_allocation"].is_object()) {
            for (const auto& [name, share] : j["resource_allocation"].items()) {
                s.resource_allocation[name] = share.get<double>();
            }
        }
        return s;
    }
};

/**
 * @brief Poids relatifs des trois couches (somme = 1) et état métabolique
 */
struct LayerContributions {
    double context_weight = 1.0 / 3.0;
    double reasoning_weight = 1.0 / 3.0;
    double intuition_weight = 1.0 / 3.0;
    MetabolicState metabolic_state;

    double sum() const { return context_weight + reasoning_weight + intuition_weight; }

    json toJson() const {
        return {
            {"context_weight", context_weight},
            {"reasoning_weight", reasoning_weight},
            {"intuition_weight", intuition_weight},
            {"metabolic_state", metabolic_state.toJson()}
        };
    }

    static LayerContributions fromJson(const json& j) {
        LayerContributions c;
        c.context_weight = j.value("context_weight", 1.0 / 3.0);
        c.reasoning_weight = j.value("reasoning_weight", 1.0 / 3.0);
        c.intuition_weight = j.value("intuition_weight", 1.0 / 3.0);
        if (j.contains("metabolic_state")) {
            c.metabolic_state = MetabolicState::fromJson(j["metabolic_state"]);
        }
        return c;
    }
};

/**
 * @brief Décision produite par un passage du pipeline
 */
struct MetacognitiveDecision {
    std::string decision_id;
    std::string stream_id;
    DecisionType decision_type = DecisionType::STREAM_ANALYSIS;
    double confidence = 0.0;
    std::unordered_map<std::string, json> evidence;    // une entrée par couche
    double timestamp = 0.0;
    LayerContributions layer_contributions;

    json evidenceJson() const {
        json j = json::object();
        for (const auto& [layer, blob] : evidence) {
            j[layer] = blob;
        }
        return j;
    }

    json toJson() const {
        return {
            {"decision_id", decision_id},
            {"stream_id", stream_id},
            {"decision_type", toString(decision_type)},
            {"confidence", confidence},
            {"evidence", evidenceJson()},
            {"timestamp", timestamp},
            {"layer_contributions", layer_contributions.toJson()}
        };
    }

    static MetacognitiveDecision fromJson(const json& j) {
        MetacognitiveDecision d;
        d.decision_id = j.value("decision_id", "");
        d.stream_id = j.value("stream_id", "");
        d.decision_type = parseDecisionType(j.value("decision_type", ""))
                              .value_or(DecisionType::STREAM_ANALYSIS);
        d.confidence = j.value("confidence", 0.0);
        if (j.contains("evidence") && j["evidence"].is_object()) {
            for (const auto& [layer, blob] : j["evidence"].items()) {
                d.evidence[layer] = blob;
            }
        }
        d.timestamp = j.value("timestamp", 0.0);
        if (j.contains("layer_contributions")) {
            d.layer_contributions = LayerContributions::fromJson(j["layer_contributions"]);
        }
        return d;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// MÉTABOLISME
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Unité de travail ordonnancée par le cycle glycolytique
 */
struct Task {
    std::string task_id;
    std::string stream_id;
    double complexity = 1.0;
    double priority = 1.0;
    double resource_requirement = 0.0;
    double estimated_time = 0.1;        // secondes
    double created_at = 0.0;            // secondes epoch

    // Travail réel (optionnel). Sans travail, l'exécution est simulée.
    std::function<void()> work;

    double ratio() const {
        return priority / std::max(complexity, 1e-9);
    }

    json toJson() const {
        return {
            {"task_id", task_id},
            {"stream_id", stream_id},
            {"complexity", complexity},
            {"priority", priority},
            {"resource_requirement", resource_requirement},
            {"estimated_time", estimated_time},
            {"created_at", created_at}
        };
    }
};

/**
 * @brief État d'un worker du pool
 */
struct WorkerState {
    std::string worker_id;
    bool is_busy = false;
    std::optional<std::string> current_task;
    double performance_score = 1.0;     // moyenne mobile exponentielle
    double resource_usage = 0.0;

    json toJson() const {
        return {
            {"worker_id", worker_id},
            {"is_busy", is_busy},
            {"current_task", current_task ? json(*current_task) : json(nullptr)},
            {"performance_score", performance_score},
            {"resource_usage", resource_usage}
        };
    }
};

/**
 * @brief Métriques agrégées du pool
 */
struct PerformanceMetrics {
    double throughput = 0.0;            // score moyen des workers
    double average_latency = 0.0;       // secondes
    double resource_efficiency = 0.0;
    double error_rate = 0.0;
    size_t tasks_completed = 0;
    size_t tasks_failed = 0;

    json toJson() const {
        return {
            {"throughput", throughput},
            {"average_latency", average_latency},
            {"resource_efficiency", resource_efficiency},
            {"error_rate", error_rate},
            {"tasks_completed", tasks_completed},
            {"tasks_failed", tasks_failed}
        };
    }
};

/**
 * @brief Résultat partiel conservé par le cycle lactique
 */
struct PartialResult {
    std::string result_id;
    std::string task_id;                // id de la décision source
    double completion_percentage = 0.0;
    json partial_data;
    double confidence = 0.0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::duration<double> ttl{3600.0};

    bool isExpired(std::chrono::system_clock::time_point now) const {
        return (now - created_at) >= ttl;
    }

    json toJson() const {
        return {
            {"result_id", result_id},
            {"task_id", task_id},
            {"completion_percentage", completion_percentage},
            {"partial_data", partial_data},
            {"confidence", confidence},
            {"created_at", std::chrono::duration<double>(created_at.time_since_epoch()).count()},
            {"ttl", ttl.count()}
        };
    }
};

/**
 * @brief Régularité extraite par le module de rêve
 */
struct DreamPattern {
    std::string pattern_id;             // signature
    std::string pattern_type;
    double strength = 1.0;
    double frequency = 1.0;
    std::unordered_map<std::string, double> associations;
    std::vector<json> generated_scenarios;

    json toJson() const {
        json assoc = json::object();
        for (const auto& [key, count] : associations) {
            assoc[key] = count;
        }
        return {
            {"pattern_id", pattern_id},
            {"pattern_type", pattern_type},
            {"strength", strength},
            {"frequency", frequency},
            {"associations", assoc},
            {"generated_scenarios", generated_scenarios}
        };
    }
};

} // namespace morphine
