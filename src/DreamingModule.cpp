/**
 * @file DreamingModule.cpp
 * @brief Implémentation du module de rêve
 */

#include "DreamingModule.hpp"
#include "Identifiers.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iostream>

namespace morphine {

DreamingModule::DreamingModule(const DreamingConfig& config)
    : config_(config)
{
    config_.validate();
}

DreamingModule::~DreamingModule() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE
// ═══════════════════════════════════════════════════════════════════════════

void DreamingModule::start() {
    if (running_.exchange(true)) {
        return;
    }
    dream_thread_ = std::thread(&DreamingModule::dreamLoop, this);
    std::cout << "[DreamingModule] Démarré (cycle " << config_.cycle_period_s << "s, fenêtre "
              << config_.idle_window_s << "s/" << config_.idle_window_period_s << "s)" << std::endl;
}

void DreamingModule::stop() {
    const bool was_running = running_.exchange(false);
    loop_cv_.notify_all();
    if (dream_thread_.joinable()) {
        dream_thread_.join();
    }
    if (was_running) {
        std::cout << "[DreamingModule] Arrêté (" << getPatternCount() << " patterns)" << std::endl;
    }
}

void DreamingModule::dreamLoop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (running_.load()) {
        if (loop_cv_.wait_for(lock, config_.cyclePeriod(), [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        dreamCycle();
        lock.lock();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// EXPÉRIENCES
// ═══════════════════════════════════════════════════════════════════════════

void DreamingModule::incorporateExperience(const MetacognitiveDecision& decision) {
    std::lock_guard<std::mutex> lock(experience_mutex_);
    experience_buffer_.push_back(decision);
    while (experience_buffer_.size() > config_.experience_capacity) {
        experience_buffer_.pop_front();
    }
}

size_t DreamingModule::getExperienceCount() const {
    std::lock_guard<std::mutex> lock(experience_mutex_);
    return experience_buffer_.size();
}

std::vector<MetacognitiveDecision> DreamingModule::getExperiences() const {
    std::lock_guard<std::mutex> lock(experience_mutex_);
    return {experience_buffer_.begin(), experience_buffer_.end()};
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE RÊVE
// ═══════════════════════════════════════════════════════════════════════════

bool DreamingModule::shouldActivate(double now) const {
    if (getExperienceCount() <= config_.min_experiences) {
        return false;
    }
    // Fenêtre de basse activité : début de chaque période
    return std::fmod(now, config_.idle_window_period_s) < config_.idle_window_s;
}

bool DreamingModule::dreamCycle(double now) {
    if (!shouldActivate(now)) {
        return false;
    }
    forceDreamCycle();
    return true;
}

void DreamingModule::forceDreamCycle() {
    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);

    const std::vector<MetacognitiveDecision> experiences = getExperiences();

    transitionTo(DreamState::DREAM_CONSOLIDATE);
    consolidatePatterns(experiences);

    transitionTo(DreamState::DREAM_EXPLORE);
    generateNovelScenarios();

    transitionTo(DreamState::DREAM_DECAY);
    decayPatterns();

    transitionTo(DreamState::AWAKE);

    size_t patterns = 0;
    size_t discoveries = 0;
    {
        std::unique_lock<std::shared_mutex> lock(pattern_mutex_);
        stats_.cycles_completed++;
        patterns = discovered_patterns_.size();
        discoveries = novel_discoveries_.size();
    }
    std::cout << "[DreamingModule] Cycle terminé: " << experiences.size() << " expériences, "
              << patterns << " patterns, " << discoveries << " découvertes" << std::endl;
}

std::string DreamingModule::patternSignature(const MetacognitiveDecision& decision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "_%.2f_%.2f",
                  decision.confidence, decision.layer_contributions.context_weight);
    return toString(decision.decision_type) + buf;
}

void DreamingModule::consolidatePatterns(const std::vector<MetacognitiveDecision>& experiences) {
    std::unique_lock<std::shared_mutex> lock(pattern_mutex_);

    for (const auto& experience : experiences) {
        const std::string signature = patternSignature(experience);

        auto it = discovered_patterns_.find(signature);
        if (it != discovered_patterns_.end()) {
            DreamPattern& pattern = it->second;
            pattern.frequency += 1.0;
            pattern.strength = std::min(pattern.strength * config_.reinforcement_factor,
                                        config_.max_strength);
            pattern.associations[experience.stream_id] += 1.0;
        } else {
            DreamPattern pattern;
            pattern.pattern_id = signature;
            pattern.pattern_type = toString(experience.decision_type);
            pattern.strength = 1.0;
            pattern.frequency = 1.0;
            pattern.associations[experience.stream_id] = 1.0;
            discovered_patterns_.emplace(signature, std::move(pattern));
        }
    }
}

void DreamingModule::generateNovelScenarios() {
    std::unique_lock<std::shared_mutex> lock(pattern_mutex_);

    for (auto& [signature, pattern] : discovered_patterns_) {
        if (pattern.strength <= config_.scenario_threshold) {
            continue;
        }

        json scenario = makeScenario(pattern);

        pattern.generated_scenarios.push_back(scenario);
        if (pattern.generated_scenarios.size() > config_.scenarios_per_pattern) {
            pattern.generated_scenarios.erase(pattern.generated_scenarios.begin());
        }

        novel_discoveries_.push_back(std::move(scenario));
        while (novel_discoveries_.size() > config_.discovery_capacity) {
            novel_discoveries_.pop_front();
        }
        stats_.scenarios_generated++;
    }
}

json DreamingModule::makeScenario(const DreamPattern& pattern) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    json novel_elements = {
        {"unexpected_conditions", {"extreme_weather", "network_anomaly",
                                   "behavioral_outlier", "technical_malfunction"}},
        {"edge_cases", {"simultaneous_events", "rapid_state_changes",
                        "multi_factor_interactions"}},
        {"diversity_parameters", {
            {"temporal_variation", unit(rng_)},
            {"spatial_variation", unit(rng_)},
            {"behavioral_variation", unit(rng_)}
        }}
    };

    return {
        {"scenario_id", generateId()},
        {"based_on_pattern", pattern.pattern_id},
        {"scenario_type", "novel_edge_case"},
        {"generated_at", static_cast<int64_t>(nowSeconds())},
        {"diversity_score", unit(rng_)},
        {"scenario_data", {
            {"pattern_type", pattern.pattern_type},
            {"strength", pattern.strength},
            {"novel_elements", novel_elements}
        }}
    };
}

void DreamingModule::decayPatterns() {
    std::unique_lock<std::shared_mutex> lock(pattern_mutex_);

    for (auto& [signature, pattern] : discovered_patterns_) {
        pattern.strength *= config_.decay_factor;
        if (pattern.strength < config_.purge_floor) {
            pattern.strength = 0.0;
        }
    }

    for (auto it = discovered_patterns_.begin(); it != discovered_patterns_.end();) {
        if (it->second.strength <= 0.0) {
            it = discovered_patterns_.erase(it);
            stats_.patterns_purged++;
        } else {
            ++it;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// TRANSITIONS D'ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

void DreamingModule::transitionTo(DreamState newState) {
    const DreamState oldState = state_.exchange(newState);

    DreamStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = stateChangeCallback_;
    }
    if (callback && oldState != newState) {
        callback(oldState, newState);
    }
}

void DreamingModule::setStateChangeCallback(DreamStateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    stateChangeCallback_ = std::move(callback);
}

// ═══════════════════════════════════════════════════════════════════════════
// ACCÈS À L'ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

std::vector<DreamPattern> DreamingModule::getDiscoveredPatterns() const {
    std::shared_lock<std::shared_mutex> lock(pattern_mutex_);
    std::vector<DreamPattern> patterns;
    patterns.reserve(discovered_patterns_.size());
    for (const auto& [signature, pattern] : discovered_patterns_) {
        patterns.push_back(pattern);
    }
    return patterns;
}

size_t DreamingModule::getPatternCount() const {
    std::shared_lock<std::shared_mutex> lock(pattern_mutex_);
    return discovered_patterns_.size();
}

std::vector<json> DreamingModule::getNovelDiscoveries() const {
    std::shared_lock<std::shared_mutex> lock(pattern_mutex_);
    return {novel_discoveries_.begin(), novel_discoveries_.end()};
}

DreamingModule::Stats DreamingModule::getStats() const {
    std::shared_lock<std::shared_mutex> lock(pattern_mutex_);
    return stats_;
}

} // namespace morphine
