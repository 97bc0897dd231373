/**
 * @file main.cpp
 * @brief Point d'entrée du démon morphine_orchestrator
 * @version 1.0
 * @date 2026-10-19
 *
 * L'orchestrateur reçoit des contextes de stream via RabbitMQ, fusionne
 * les trois couches cognitives en décisions et les republie, pendant que
 * les cycles métaboliques régulent le pool, le cache et les patterns.
 */

#include "BridgeProtocol.hpp"
#include "DecisionBridge.hpp"
#include "MetacognitiveOrchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <random>

using namespace morphine;

// Signal handler pour arrêt propre
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\n[Main] Signal " << signal << " reçu, arrêt en cours...\n";
    g_running.store(false);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Affiche cette aide\n"
              << "  -c, --config <file>   Fichier de configuration JSON\n"
              << "  --host <host>         Hôte RabbitMQ (défaut: localhost)\n"
              << "  --port <port>         Port RabbitMQ (défaut: 5672)\n"
              << "  --user <user>         Utilisateur RabbitMQ (défaut: guest)\n"
              << "  --pass <password>     Mot de passe RabbitMQ\n"
              << "  --demo                Mode démonstration (sans RabbitMQ)\n"
              << "  --verbose             Une ligne de log par décision\n"
              << "\n";
}

/**
 * Système IA de démonstration : cote implicite → confiance
 */
class ImpliedOddsSystem : public AISystem {
public:
    std::string systemId() const override { return "implied_odds"; }

    std::optional<json> process(const StreamingContext& context) override {
        auto it = context.partial_data.find("odds");
        if (it == context.partial_data.end() || !it->second.is_number()) {
            return std::nullopt;
        }
        const double odds = it->second.get<double>();
        if (odds <= 1.0) {
            return std::nullopt;
        }
        return json{{"confidence", confidence(it->second)}, {"implied_probability", 1.0 / odds}};
    }

    double confidence(const json& input) const override {
        if (!input.is_number()) return NEUTRAL_CONFIDENCE;
        const double odds = input.get<double>();
        return odds > 1.0 ? std::min(1.0, 1.0 / odds + 0.3) : NEUTRAL_CONFIDENCE;
    }

    std::chrono::milliseconds expectedProcessingTime() const override {
        return std::chrono::milliseconds(20);
    }
};

void runDemo(MetacognitiveOrchestrator& orchestrator) {
    std::cout << "\n[Demo] Mode démonstration - deux streams simulés\n\n";

    orchestrator.registerAISystem(std::make_shared<ImpliedOddsSystem>(), 1.0);
    orchestrator.getKnowledgeBase().setFact("intuition_bias", -0.05);

    auto match = orchestrator.createStream("match-42");
    auto checkout = orchestrator.createStream("checkout-7");
    if (!match || !checkout) {
        std::cerr << "[Demo] Impossible d'ouvrir les streams\n";
        return;
    }

    std::mt19937 rng{42};
    std::uniform_real_distribution<double> score(0.3, 1.0);

    std::cout << "═══ Scénario 1: cotes en direct sur match-42 ═══\n";
    for (int i = 0; i < 12; ++i) {
        StreamingContext ctx;
        ctx.stream_id = "match-42";
        ctx.timestamp = nowSeconds();
        ctx.confidence_level = 0.9;
        ctx.partial_data["odds"] = 1.5 + 0.1 * i;
        ctx.partial_data["context_score"] = score(rng);
        ctx.partial_data["reasoning_score"] = score(rng);
        ctx.partial_data["intuition_score"] = score(rng);
        if (match->input.send(ctx) != SendResult::SENT) {
            std::cerr << "[Demo] Contexte refusé\n";
        }
    }

    std::cout << "\n═══ Scénario 2: paiement suspect sur checkout-7 ═══\n";
    for (int i = 0; i < 3; ++i) {
        StreamingContext ctx;
        ctx.stream_id = "checkout-7";
        ctx.timestamp = nowSeconds();
        ctx.confidence_level = 0.4;
        ctx.partial_data["payment_amount"] = 250.0 * (i + 1);
        ctx.partial_data["context_score"] = 0.3;
        ctx.partial_data["alert"] = (i == 2);
        if (checkout->input.send(ctx) != SendResult::SENT) {
            std::cerr << "[Demo] Contexte refusé\n";
        }
    }

    match->input.close();
    checkout->input.close();

    auto printDecisions = [](Receiver<MetacognitiveDecision>& output) {
        while (auto decision = output.receive()) {
            const auto& w = decision->layer_contributions;
            std::cout << "  " << std::left << std::setw(22) << toString(decision->decision_type)
                      << " conf=" << std::fixed << std::setprecision(3) << decision->confidence
                      << " poids=(" << w.context_weight << ", " << w.reasoning_weight << ", "
                      << w.intuition_weight << ")" << std::defaultfloat << "\n";
        }
    };
    printDecisions(match->output);
    printDecisions(checkout->output);

    std::cout << "\n═══ Scénario 3: cycle de rêve forcé ═══\n";
    orchestrator.dreamingModule().forceDreamCycle();
    for (const auto& pattern : orchestrator.getDiscoveredPatterns()) {
        std::cout << "  " << pattern.pattern_id << " force=" << std::fixed << std::setprecision(2)
                  << pattern.strength << " fréquence=" << pattern.frequency << std::defaultfloat << "\n";
    }

    std::cout << "\n╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                    STATISTIQUES DEMO                          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    const auto stats = orchestrator.getStats();
    const auto health = orchestrator.getSystemHealth();
    std::cout << "  Contextes traités    : " << stats.contexts_processed << "\n";
    std::cout << "  Décisions émises     : " << stats.decisions_emitted << "\n";
    std::cout << "  Décisions archivées  : " << stats.archived_results << "\n";
    std::cout << "  Échecs de couche     : " << stats.layer_failures << "\n";
    std::cout << "  Workers              : " << health.worker_count << "\n";
    std::cout << "  Patterns             : " << health.pattern_count << "\n";
    std::cout << "  Scénarios générés    : " << orchestrator.getNovelDiscoveries().size() << "\n\n";
}

int main(int argc, char* argv[]) {
    OrchestratorConfig config;
    RabbitMQConfig rabbitmq;
    std::string config_file = "config/morphine.json";
    bool demo_mode = false;
    bool verbose = false;

    // Surcharges CLI appliquées après le fichier
    std::optional<std::string> host, user, password;
    std::optional<int> port;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "--host") {
            if (i + 1 < argc) {
                host = argv[++i];
            }
        } else if (arg == "--port") {
            if (i + 1 < argc) {
                const std::string value = argv[++i];
                port = parsePort(value);
                if (!port) {
                    std::cerr << "[Main] Port invalide: " << value << "\n";
                    printUsage(argv[0]);
                    return 1;
                }
            }
        } else if (arg == "--user") {
            if (i + 1 < argc) {
                user = argv[++i];
            }
        } else if (arg == "--pass") {
            if (i + 1 < argc) {
                password = argv[++i];
            }
        } else if (arg == "--demo") {
            demo_mode = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "[Main] Option inconnue: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::cout << "[Main] Chargement configuration..." << std::endl;
        if (!config.loadFromJson(config_file)) {
            std::cout << "[Main] Utilisation des valeurs par défaut" << std::endl;
        }
        rabbitmq.loadFromJson(config_file);
        config.loadFromEnvironment();

        if (host) rabbitmq.host = *host;
        if (port) rabbitmq.port = *port;
        if (user) rabbitmq.user = *user;
        if (password) rabbitmq.password = *password;
        if (verbose) config.verbose = true;

        MetacognitiveOrchestrator orchestrator(config);
        orchestrator.start();

        if (demo_mode) {
            runDemo(orchestrator);
        } else {
            DecisionBridge bridge(orchestrator, rabbitmq);

            if (!bridge.start()) {
                std::cerr << "[Main] Échec du démarrage du pont RabbitMQ" << std::endl;
                orchestrator.shutdown();
                return 1;
            }

            std::cout << "[Main] Orchestrateur prêt. Appuyez sur Ctrl+C pour arrêter." << std::endl;

            while (g_running.load() && bridge.isRunning()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

            bridge.stop();
        }

        orchestrator.shutdown();
        std::cout << "[Main] Orchestrateur terminé proprement.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[Main] Erreur fatale: " << e.what() << "\n";
        return 1;
    }
}
