/**
 * @file CognitiveLayer.cpp
 * @brief Base de connaissances et couches fournies
 */

#include "CognitiveLayer.hpp"

#include <algorithm>
#include <mutex>

namespace morphine {

// ═══════════════════════════════════════════════════════════════════════════
// BASE DE CONNAISSANCES
// ═══════════════════════════════════════════════════════════════════════════

void KnowledgeBase::setFact(const std::string& key, json value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    facts_[key] = std::move(value);
}

bool KnowledgeBase::removeFact(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return facts_.erase(key) > 0;
}

std::optional<json> KnowledgeBase::getFact(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = facts_.find(key);
    if (it == facts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool KnowledgeBase::hasFact(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return facts_.count(key) > 0;
}

size_t KnowledgeBase::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return facts_.size();
}

double KnowledgeBase::getNumber(const std::string& key, double default_value) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = facts_.find(key);
    if (it == facts_.end() || !it->second.is_number()) {
        return default_value;
    }
    return it->second.get<double>();
}

// ═══════════════════════════════════════════════════════════════════════════
// COUCHES
// ═══════════════════════════════════════════════════════════════════════════

FunctionLayer::FunctionLayer(std::string name, ProcessFunction function)
    : name_(std::move(name))
    , function_(std::move(function))
{
}

json FunctionLayer::process(const StreamingContext& context,
                            const json& collected_evidence,
                            const KnowledgeBase& knowledge_base) {
    if (!function_) {
        return json::object();
    }
    return function_(context, collected_evidence, knowledge_base);
}

SignalLayer::SignalLayer(std::string name, std::string signal_key)
    : name_(std::move(name))
    , signal_key_(std::move(signal_key))
{
}

json SignalLayer::process(const StreamingContext& context,
                          const json& collected_evidence,
                          const KnowledgeBase& knowledge_base) {
    double signal = context.confidence_level;
    bool from_signal = false;

    auto it = context.partial_data.find(signal_key_);
    if (it != context.partial_data.end() && it->second.is_number()) {
        signal = it->second.get<double>();
        from_signal = true;
    }

    // Moyenne pondérée des confiances des systèmes IA
    double ai_sum = 0.0;
    double ai_weighted_sum = 0.0;
    double ai_weight = 0.0;
    size_t ai_count = 0;
    if (collected_evidence.is_object()) {
        for (const auto& [system_id, evidence] : collected_evidence.items()) {
            if (!evidence.is_object() || !evidence.contains("confidence") || !evidence["confidence"].is_number()) {
                continue;
            }
            const double confidence = evidence["confidence"].get<double>();
            const double weight = (evidence.contains("weight") && evidence["weight"].is_number())
                ? std::max(evidence["weight"].get<double>(), 0.0)
                : 1.0;
            ai_sum += confidence;
            ai_weighted_sum += weight * confidence;
            ai_weight += weight;
            ++ai_count;
        }
    }
    if (ai_count > 0) {
        const double ai_mean = (ai_weight > 0.0)
            ? ai_weighted_sum / ai_weight
            : ai_sum / static_cast<double>(ai_count);
        signal = 0.5 * signal + 0.5 * ai_mean;
    }

    signal += knowledge_base.getNumber(name_ + "_bias", 0.0);
    signal = std::clamp(signal, 0.0, 1.0);

    json result = {
        {"layer", name_},
        {"confidence", signal},
        {"signal_key", signal_key_},
        {"from_signal", from_signal},
        {"ai_systems_consulted", ai_count}
    };

    auto alert = context.partial_data.find("alert");
    if (alert != context.partial_data.end() && alert->second.is_boolean() && alert->second.get<bool>()) {
        result["alert"] = true;
    }
    return result;
}

} // namespace morphine
