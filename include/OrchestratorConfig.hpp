/**
 * @file OrchestratorConfig.hpp
 * @brief Paramètres de l'orchestrateur et des trois cycles métaboliques
 * @version 1.0
 * @date 2026-10-19
 *
 * Les valeurs par défaut sont portées par les structures. Un fichier JSON
 * peut les surcharger (clés snake_case, sections par composant), puis les
 * variables d'environnement MORPHINE_*. validate() lève
 * std::invalid_argument : c'est la seule erreur fatale au démarrage.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace morphine {

/**
 * @brief Politique d'émission sur le canal de sortie d'un stream
 */
enum class DeliveryPolicy {
    DROP_IF_FULL,       // au plus une fois : décision perdue si tampon plein
    BLOCK_IF_FULL       // attend le consommateur (perte seulement si fermé)
};

std::string toString(DeliveryPolicy policy);
DeliveryPolicy parseDeliveryPolicy(const std::string& str);

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE GLYCOLYTIQUE (ordonnanceur)
// ═══════════════════════════════════════════════════════════════════════════

struct GlycolyticConfig {
    /// Taille initiale du pool (0 = nombre de cœurs de l'hôte borné par
    /// max_workers), aussi plancher
    size_t initial_workers = 0;

    /// Plafond du pool
    size_t max_workers = 32;

    /// Période de la boucle d'équilibrage
    double balance_period_ms = 100.0;

    /// Perturbation aléatoire de la durée simulée (≤ 20%)
    double jitter = 0.2;

    /// Seuils d'auto-scaling sur la charge
    double scale_up_load = 0.8;
    double scale_down_load = 0.3;

    /// Lissage du score de performance : score = (1-α)·score + α/temps
    double score_smoothing = 0.1;

    /**
     * @brief Taille initiale effective (résout 0 en min(cœurs, max_workers))
     */
    [[nodiscard]] size_t resolvedInitialWorkers() const;

    [[nodiscard]] std::chrono::milliseconds balancePeriod() const {
        return std::chrono::milliseconds(static_cast<long long>(balance_period_ms));
    }

    void validate() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE LACTIQUE (cache des résultats incomplets)
// ═══════════════════════════════════════════════════════════════════════════

struct LactateConfig {
    /// Durée de vie d'un résultat partiel (1h)
    double ttl_s = 3600.0;

    /// Période du balayage d'expiration
    double sweep_period_s = 30.0;

    [[nodiscard]] std::chrono::milliseconds sweepPeriod() const {
        return std::chrono::milliseconds(static_cast<long long>(sweep_period_s * 1000.0));
    }

    void validate() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// MODULE DE RÊVE (synthèse de patterns en arrière-plan)
// ═══════════════════════════════════════════════════════════════════════════

struct DreamingConfig {
    /// Période du cycle de rêve (5 minutes)
    double cycle_period_s = 300.0;

    /// Tampon d'expériences (les plus anciennes sont évincées)
    size_t experience_capacity = 1000;

    /// Nombre d'expériences à dépasser pour rêver
    size_t min_experiences = 10;

    /// Fenêtre de basse activité : les idle_window_s premières secondes
    /// de chaque période de idle_window_period_s (5 premières min de l'heure)
    double idle_window_s = 300.0;
    double idle_window_period_s = 3600.0;

    /// Renforcement / oubli
    double reinforcement_factor = 1.1;
    double decay_factor = 0.95;
    double purge_floor = 0.1;           // force < plancher → 0 → purgé
    double max_strength = 1000.0;

    /// Force au-delà de laquelle un pattern génère des scénarios
    double scenario_threshold = 2.0;

    /// Bornes du journal de découvertes et des scénarios par pattern
    size_t discovery_capacity = 10000;
    size_t scenarios_per_pattern = 50;

    [[nodiscard]] std::chrono::milliseconds cyclePeriod() const {
        return std::chrono::milliseconds(static_cast<long long>(cycle_period_s * 1000.0));
    }

    void validate() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// ORCHESTRATEUR
// ═══════════════════════════════════════════════════════════════════════════

struct OrchestratorConfig {
    GlycolyticConfig glycolytic;
    LactateConfig lactate;
    DreamingConfig dreaming;

    /// Capacité des canaux d'entrée et de sortie de chaque stream
    size_t channel_capacity = 1000;

    /// Confiance sous laquelle une décision est archivée comme incomplète
    double archive_threshold = 0.8;

    /// Délai maximal accordé à une couche ou à un système IA
    double layer_timeout_ms = 5000.0;

    /// Appels en cours tolérés par couche ou système IA ; au-delà, la
    /// couche est dégradée sans lancer de nouveau thread
    size_t max_pending_calls = 8;

    DeliveryPolicy delivery_policy = DeliveryPolicy::DROP_IF_FULL;

    /// Historique des décisions récentes conservé par stream
    size_t recent_decisions_per_stream = 100;

    /// Les systèmes IA passent par le pool glycolytique
    bool route_ai_systems_through_scheduler = true;

    /// Une ligne de log par décision
    bool verbose = false;

    [[nodiscard]] std::chrono::milliseconds layerTimeout() const {
        return std::chrono::milliseconds(static_cast<long long>(layer_timeout_ms));
    }

    /**
     * @brief Vérifie tous les invariants (lève std::invalid_argument)
     */
    void validate() const;

    /**
     * @brief Applique les clés présentes dans un objet JSON
     */
    void applyJson(const nlohmann::json& j);

    /**
     * @brief Charge depuis un fichier JSON (section "orchestrator" ou racine)
     * @return false si le fichier est absent ou illisible (défauts conservés)
     */
    bool loadFromJson(const std::string& path);

    /**
     * @brief Surcharge depuis les variables d'environnement MORPHINE_*
     */
    void loadFromEnvironment();

    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace morphine
