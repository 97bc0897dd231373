/**
 * @file LactateCycle.cpp
 * @brief Implémentation du cache des résultats incomplets
 */

#include "LactateCycle.hpp"
#include "Identifiers.hpp"

#include <iostream>

namespace morphine {

LactateCycle::LactateCycle(const LactateConfig& config)
    : config_(config)
{
    config_.validate();
}

LactateCycle::~LactateCycle() {
    stop();
}

void LactateCycle::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweep_thread_ = std::thread(&LactateCycle::sweepLoop, this);
    std::cout << "[LactateCycle] Démarré (TTL " << config_.ttl_s << "s, balayage "
              << config_.sweep_period_s << "s)" << std::endl;
}

void LactateCycle::stop() {
    const bool was_running = running_.exchange(false);
    loop_cv_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    if (was_running) {
        std::cout << "[LactateCycle] Arrêté (" << getEntryCount() << " résultats en cache)" << std::endl;
    }
}

void LactateCycle::sweepLoop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (running_.load()) {
        if (loop_cv_.wait_for(lock, config_.sweepPeriod(), [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        sweep();
        lock.lock();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ARCHIVAGE / RECHERCHE
// ═══════════════════════════════════════════════════════════════════════════

std::string LactateCycle::storePartialResult(const MetacognitiveDecision& decision) {
    PartialResult result;
    result.result_id = generateId();
    result.task_id = decision.decision_id;
    result.completion_percentage = decision.confidence * 100.0;
    result.partial_data = decision.evidenceJson();
    result.confidence = decision.confidence;
    result.created_at = Clock::now();
    result.ttl = std::chrono::duration<double>(config_.ttl_s);

    const std::string id = result.result_id;
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    incomplete_results_.emplace(id, std::move(result));
    return id;
}

std::optional<PartialResult> LactateCycle::retrievePartialResult(const std::string& task_id) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    for (const auto& [id, result] : incomplete_results_) {
        if (result.task_id == task_id) {
            return result;
        }
    }
    return std::nullopt;
}

std::vector<PartialResult> LactateCycle::recoveryFromIncomplete(const std::string& stream_id) const {
    std::vector<PartialResult> recovered;
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    for (const auto& [id, result] : incomplete_results_) {
        if (result.task_id.find(stream_id) != std::string::npos) {
            recovered.push_back(result);
        }
    }
    return recovered;
}

// ═══════════════════════════════════════════════════════════════════════════
// BALAYAGE
// ═══════════════════════════════════════════════════════════════════════════

size_t LactateCycle::sweep(Clock::time_point now) {
    size_t purged = 0;
    double level = 0.0;
    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        for (auto it = incomplete_results_.begin(); it != incomplete_results_.end();) {
            if (it->second.isExpired(now)) {
                it = incomplete_results_.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }

        if (!incomplete_results_.empty()) {
            double total_completion = 0.0;
            for (const auto& [id, result] : incomplete_results_) {
                total_completion += result.completion_percentage;
            }
            const double count = static_cast<double>(incomplete_results_.size());
            level = count / (1.0 + total_completion / count);
        }
    }

    lactate_level_.store(level);

    if (purged > 0) {
        std::cout << "[LactateCycle] " << purged << " résultats expirés purgés, niveau "
                  << level << std::endl;
    }
    return purged;
}

size_t LactateCycle::getEntryCount() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return incomplete_results_.size();
}

} // namespace morphine
