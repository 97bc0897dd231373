/**
 * @file AISystem.cpp
 * @brief Registre des systèmes IA
 */

#include "AISystem.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

namespace morphine {

bool AISystemRegistry::registerSystem(AISystemPtr system, double weight) {
    if (!system) {
        std::cerr << "[AISystemRegistry] Système nul ignoré\n";
        return false;
    }
    if (!std::isfinite(weight) || weight < 0.0) {
        std::cerr << "[AISystemRegistry] Poids invalide pour " << system->systemId() << " (" << weight << ")\n";
        return false;
    }

    const std::string id = system->systemId();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    systems_[id] = Entry{std::move(system), weight};
    return true;
}

bool AISystemRegistry::unregisterSystem(const std::string& system_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return systems_.erase(system_id) > 0;
}

std::optional<double> AISystemRegistry::getWeight(const std::string& system_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = systems_.find(system_id);
    if (it == systems_.end()) {
        return std::nullopt;
    }
    return it->second.weight;
}

std::vector<AISystemRegistry::Entry> AISystemRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Entry> entries;
    entries.reserve(systems_.size());
    for (const auto& [id, entry] : systems_) {
        entries.push_back(entry);
    }
    return entries;
}

size_t AISystemRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return systems_.size();
}

} // namespace morphine
