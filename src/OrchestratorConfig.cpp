/**
 * @file OrchestratorConfig.cpp
 * @brief Chargement et validation de la configuration
 */

#include "OrchestratorConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace morphine {

using json = nlohmann::json;

std::string toString(DeliveryPolicy policy) {
    switch (policy) {
        case DeliveryPolicy::DROP_IF_FULL:  return "drop_if_full";
        case DeliveryPolicy::BLOCK_IF_FULL: return "block_if_full";
        default:                            return "unknown";
    }
}

DeliveryPolicy parseDeliveryPolicy(const std::string& str) {
    if (str == "drop_if_full") return DeliveryPolicy::DROP_IF_FULL;
    if (str == "block_if_full") return DeliveryPolicy::BLOCK_IF_FULL;
    throw std::invalid_argument("delivery_policy inconnue: " + str);
}

// ═══════════════════════════════════════════════════════════════════════════
// VALIDATION
// ═══════════════════════════════════════════════════════════════════════════

size_t GlycolyticConfig::resolvedInitialWorkers() const {
    if (initial_workers > 0) {
        return initial_workers;
    }
    // Nombre de cœurs, borné par le plafond du pool (1 si inconnu)
    const size_t cores = std::max<size_t>(1, std::thread::hardware_concurrency());
    return std::min(cores, max_workers);
}

void GlycolyticConfig::validate() const {
    const size_t initial = resolvedInitialWorkers();
    if (initial == 0) {
        throw std::invalid_argument("glycolytic: aucun worker (nombre de cœurs inconnu)");
    }
    if (max_workers < initial) {
        throw std::invalid_argument("glycolytic: max_workers < initial_workers");
    }
    if (balance_period_ms <= 0.0) {
        throw std::invalid_argument("glycolytic: balance_period_ms doit être > 0");
    }
    if (jitter < 0.0 || jitter > 0.2) {
        throw std::invalid_argument("glycolytic: jitter hors de [0, 0.2]");
    }
    if (scale_down_load < 0.0 || scale_up_load > 1.0 || scale_down_load >= scale_up_load) {
        throw std::invalid_argument("glycolytic: seuils de scaling incohérents");
    }
    if (score_smoothing <= 0.0 || score_smoothing >= 1.0) {
        throw std::invalid_argument("glycolytic: score_smoothing hors de ]0, 1[");
    }
}

void LactateConfig::validate() const {
    if (ttl_s <= 0.0) {
        throw std::invalid_argument("lactate: ttl_s doit être > 0");
    }
    if (sweep_period_s <= 0.0) {
        throw std::invalid_argument("lactate: sweep_period_s doit être > 0");
    }
}

void DreamingConfig::validate() const {
    if (cycle_period_s <= 0.0) {
        throw std::invalid_argument("dreaming: cycle_period_s doit être > 0");
    }
    if (experience_capacity == 0) {
        throw std::invalid_argument("dreaming: experience_capacity nulle");
    }
    if (idle_window_period_s <= 0.0 || idle_window_s < 0.0 || idle_window_s > idle_window_period_s) {
        throw std::invalid_argument("dreaming: fenêtre de basse activité incohérente");
    }
    if (decay_factor <= 0.0 || decay_factor >= 1.0) {
        throw std::invalid_argument("dreaming: decay_factor hors de ]0, 1[");
    }
    if (reinforcement_factor < 1.0) {
        throw std::invalid_argument("dreaming: reinforcement_factor < 1");
    }
    if (max_strength <= 0.0 || purge_floor < 0.0) {
        throw std::invalid_argument("dreaming: bornes de force invalides");
    }
    if (discovery_capacity == 0) {
        throw std::invalid_argument("dreaming: discovery_capacity nulle");
    }
}

void OrchestratorConfig::validate() const {
    glycolytic.validate();
    lactate.validate();
    dreaming.validate();

    if (channel_capacity == 0) {
        throw std::invalid_argument("orchestrator: channel_capacity nulle");
    }
    if (archive_threshold < 0.0 || archive_threshold > 1.0) {
        throw std::invalid_argument("orchestrator: archive_threshold hors de [0, 1]");
    }
    if (layer_timeout_ms <= 0.0) {
        throw std::invalid_argument("orchestrator: layer_timeout_ms doit être > 0");
    }
    if (max_pending_calls == 0) {
        throw std::invalid_argument("orchestrator: max_pending_calls nul");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CHARGEMENT
// ═══════════════════════════════════════════════════════════════════════════

void OrchestratorConfig::applyJson(const json& j) {
    if (j.contains("glycolytic")) {
        const auto& g = j["glycolytic"];
        glycolytic.initial_workers = g.value("initial_workers", glycolytic.initial_workers);
        glycolytic.max_workers = g.value("max_workers", glycolytic.max_workers);
        glycolytic.balance_period_ms = g.value("balance_period_ms", glycolytic.balance_period_ms);
        glycolytic.jitter = g.value("jitter", glycolytic.jitter);
        glycolytic.scale_up_load = g.value("scale_up_load", glycolytic.scale_up_load);
        glycolytic.scale_down_load = g.value("scale_down_load", glycolytic.scale_down_load);
        glycolytic.score_smoothing = g.value("score_smoothing", glycolytic.score_smoothing);
    }

    if (j.contains("lactate")) {
        const auto& l = j["lactate"];
        lactate.ttl_s = l.value("ttl_s", lactate.ttl_s);
        lactate.sweep_period_s = l.value("sweep_period_s", lactate.sweep_period_s);
    }

    if (j.contains("dreaming")) {
        const auto& d = j["dreaming"];
        dreaming.cycle_period_s = d.value("cycle_period_s", dreaming.cycle_period_s);
        dreaming.experience_capacity = d.value("experience_capacity", dreaming.experience_capacity);
        dreaming.min_experiences = d.value("min_experiences", dreaming.min_experiences);
        dreaming.idle_window_s = d.value("idle_window_s", dreaming.idle_window_s);
        dreaming.idle_window_period_s = d.value("idle_window_period_s", dreaming.idle_window_period_s);
        dreaming.reinforcement_factor = d.value("reinforcement_factor", dreaming.reinforcement_factor);
        dreaming.decay_factor = d.value("decay_factor", dreaming.decay_factor);
        dreaming.purge_floor = d.value("purge_floor", dreaming.purge_floor);
        dreaming.max_strength = d.value("max_strength", dreaming.max_strength);
        dreaming.scenario_threshold = d.value("scenario_threshold", dreaming.scenario_threshold);
        dreaming.discovery_capacity = d.value("discovery_capacity", dreaming.discovery_capacity);
        dreaming.scenarios_per_pattern = d.value("scenarios_per_pattern", dreaming.scenarios_per_pattern);
    }

    channel_capacity = j.value("channel_capacity", channel_capacity);
    archive_threshold = j.value("archive_threshold", archive_threshold);
    layer_timeout_ms = j.value("layer_timeout_ms", layer_timeout_ms);
    max_pending_calls = j.value("max_pending_calls", max_pending_calls);
    if (j.contains("delivery_policy")) {
        delivery_policy = parseDeliveryPolicy(j["delivery_policy"].get<std::string>());
    }
    recent_decisions_per_stream = j.value("recent_decisions_per_stream", recent_decisions_per_stream);
    route_ai_systems_through_scheduler =
        j.value("route_ai_systems_through_scheduler", route_ai_systems_through_scheduler);
    verbose = j.value("verbose", verbose);
}

bool OrchestratorConfig::loadFromJson(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Impossible d'ouvrir " << path << " (valeurs par défaut)\n";
        return false;
    }

    try {
        json root = json::parse(file);
        applyJson(root.contains("orchestrator") ? root["orchestrator"] : root);
        std::cout << "[Config] Configuration chargée depuis " << path << std::endl;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Erreur parsing " << path << ": " << e.what() << "\n";
        return false;
    }
}

namespace {

template <typename T, typename Parse>
void overrideFromEnv(const char* name, T& target, Parse parse) {
    if (const char* value = std::getenv(name)) {
        try {
            target = parse(value);
        } catch (const std::exception& e) {
            std::cerr << "[Config] Variable " << name << " ignorée: " << e.what() << "\n";
        }
    }
}

size_t parseSize(const std::string& s) { return static_cast<size_t>(std::stoul(s)); }
double parseDouble(const std::string& s) { return std::stod(s); }
bool parseBool(const std::string& s) { return s == "1" || s == "true" || s == "yes"; }

} // namespace

void OrchestratorConfig::loadFromEnvironment() {
    overrideFromEnv("MORPHINE_INITIAL_WORKERS", glycolytic.initial_workers, parseSize);
    overrideFromEnv("MORPHINE_MAX_WORKERS", glycolytic.max_workers, parseSize);
    overrideFromEnv("MORPHINE_PARTIAL_RESULT_TTL_S", lactate.ttl_s, parseDouble);
    overrideFromEnv("MORPHINE_DREAM_CYCLE_S", dreaming.cycle_period_s, parseDouble);
    overrideFromEnv("MORPHINE_CHANNEL_CAPACITY", channel_capacity, parseSize);
    overrideFromEnv("MORPHINE_ARCHIVE_THRESHOLD", archive_threshold, parseDouble);
    overrideFromEnv("MORPHINE_LAYER_TIMEOUT_MS", layer_timeout_ms, parseDouble);
    overrideFromEnv("MORPHINE_DELIVERY_POLICY", delivery_policy, parseDeliveryPolicy);
    overrideFromEnv("MORPHINE_VERBOSE", verbose, parseBool);
}

json OrchestratorConfig::toJson() const {
    return {
        {"glycolytic", {
            {"initial_workers", glycolytic.resolvedInitialWorkers()},
            {"max_workers", glycolytic.max_workers},
            {"balance_period_ms", glycolytic.balance_period_ms},
            {"jitter", glycolytic.jitter},
            {"scale_up_load", glycolytic.scale_up_load},
            {"scale_down_load", glycolytic.scale_down_load},
            {"score_smoothing", glycolytic.score_smoothing}
        }},
        {"lactate", {
            {"ttl_s", lactate.ttl_s},
            {"sweep_period_s", lactate.sweep_period_s}
        }},
        {"dreaming", {
            {"cycle_period_s", dreaming.cycle_period_s},
            {"experience_capacity", dreaming.experience_capacity},
            {"min_experiences", dreaming.min_experiences},
            {"idle_window_s", dreaming.idle_window_s},
            {"idle_window_period_s", dreaming.idle_window_period_s},
            {"reinforcement_factor", dreaming.reinforcement_factor},
            {"decay_factor", dreaming.decay_factor},
            {"purge_floor", dreaming.purge_floor},
            {"max_strength", dreaming.max_strength},
            {"scenario_threshold", dreaming.scenario_threshold},
            {"discovery_capacity", dreaming.discovery_capacity},
            {"scenarios_per_pattern", dreaming.scenarios_per_pattern}
        }},
        {"channel_capacity", channel_capacity},
        {"archive_threshold", archive_threshold},
        {"layer_timeout_ms", layer_timeout_ms},
        {"max_pending_calls", max_pending_calls},
        {"delivery_policy", toString(delivery_policy)},
        {"recent_decisions_per_stream", recent_decisions_per_stream},
        {"route_ai_systems_through_scheduler", route_ai_systems_through_scheduler},
        {"verbose", verbose}
    };
}

} // namespace morphine
