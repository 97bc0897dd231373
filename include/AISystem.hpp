/**
 * @file AISystem.hpp
 * @brief Systèmes IA enfichables et registre pondéré
 * @version 1.0
 * @date 2026-10-19
 *
 * Un système IA est un évaluateur opaque : il produit une preuve JSON pour
 * un contexte, ou échoue (nullopt ou exception). L'orchestrateur tolère
 * l'échec de n'importe quel sous-ensemble de systèmes.
 */

#pragma once

#include "Types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace morphine {

class AISystem {
public:
    virtual ~AISystem() = default;

    /// Identifiant stable (clé du registre)
    [[nodiscard]] virtual std::string systemId() const = 0;

    /// Preuve pour ce contexte, nullopt en cas d'échec
    virtual std::optional<json> process(const StreamingContext& context) = 0;

    /// Confiance du système sur une entrée ; l'orchestrateur l'applique à
    /// chaque preuve produite par process() avant de la transmettre
    [[nodiscard]] virtual double confidence(const json& input) const = 0;

    /// Durée de traitement attendue (sert d'estimation au pool)
    [[nodiscard]] virtual std::chrono::milliseconds expectedProcessingTime() const = 0;
};

using AISystemPtr = std::shared_ptr<AISystem>;

/**
 * @brief Registre concurrent des systèmes IA et de leurs poids de confiance
 */
class AISystemRegistry {
public:
    struct Entry {
        AISystemPtr system;
        double weight = 1.0;
    };

    /**
     * @brief Enregistre un système (écrase système et poids si l'id existe)
     * @return false si le système est nul ou le poids négatif / non fini
     */
    bool registerSystem(AISystemPtr system, double weight);

    bool unregisterSystem(const std::string& system_id);

    [[nodiscard]] std::optional<double> getWeight(const std::string& system_id) const;
    [[nodiscard]] std::vector<Entry> snapshot() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> systems_;
};

} // namespace morphine
