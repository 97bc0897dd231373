/**
 * @file CognitiveLayer.hpp
 * @brief Couches cognitives (contexte, raisonnement, intuition) et base de connaissances
 * @version 1.0
 * @date 2026-10-19
 *
 * Les trois couches sont des producteurs de preuves indépendants. Leur
 * logique interne est externe à l'orchestrateur : seule compte la preuve
 * JSON retournée, dont le champ "confidence" pondère la fusion.
 */

#pragma once

#include "Types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace morphine {

// ═══════════════════════════════════════════════════════════════════════════
// BASE DE CONNAISSANCES
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Faits nommés partagés par les couches (lecture seule pendant un run)
 */
class KnowledgeBase {
public:
    void setFact(const std::string& key, json value);
    bool removeFact(const std::string& key);

    [[nodiscard]] std::optional<json> getFact(const std::string& key) const;
    [[nodiscard]] bool hasFact(const std::string& key) const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Valeur numérique d'un fait, ou défaut si absent / non numérique
     */
    [[nodiscard]] double getNumber(const std::string& key, double default_value) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, json> facts_;
};

// ═══════════════════════════════════════════════════════════════════════════
// COUCHES
// ═══════════════════════════════════════════════════════════════════════════

class CognitiveLayer {
public:
    virtual ~CognitiveLayer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Produit la preuve de la couche pour un contexte
     * @param collected_evidence preuves des systèmes IA (objet, vide hors couche contexte)
     */
    virtual json process(const StreamingContext& context,
                         const json& collected_evidence,
                         const KnowledgeBase& knowledge_base) = 0;
};

using CognitiveLayerPtr = std::shared_ptr<CognitiveLayer>;

/**
 * @brief Couche définie par un callable
 */
class FunctionLayer : public CognitiveLayer {
public:
    using ProcessFunction = std::function<json(const StreamingContext&, const json&, const KnowledgeBase&)>;

    FunctionLayer(std::string name, ProcessFunction function);

    [[nodiscard]] std::string name() const override { return name_; }
    json process(const StreamingContext& context,
                 const json& collected_evidence,
                 const KnowledgeBase& knowledge_base) override;

private:
    std::string name_;
    ProcessFunction function_;
};

/**
 * @brief Couche de signal : lit un score nommé dans les données partielles
 *
 * confiance = partial_data[signal_key] si numérique, sinon confidence_level
 * du contexte. Si des systèmes IA ont fourni des confiances, la couche fait
 * la moyenne de son signal et de leur moyenne pondérée par "weight". Un fait "<name>_bias" de la base de
 * connaissances est ajouté au résultat (borné à [0, 1]).
 */
class SignalLayer : public CognitiveLayer {
public:
    SignalLayer(std::string name, std::string signal_key);

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] const std::string& signalKey() const { return signal_key_; }

    json process(const StreamingContext& context,
                 const json& collected_evidence,
                 const KnowledgeBase& knowledge_base) override;

private:
    std::string name_;
    std::string signal_key_;
};

} // namespace morphine
