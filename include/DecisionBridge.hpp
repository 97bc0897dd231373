/**
 * @file DecisionBridge.hpp
 * @brief Pont RabbitMQ ↔ orchestrateur
 * @version 1.0
 * @date 2026-10-19
 *
 * - Consomme les contextes sur morphine.context.input (topic)
 * - Ouvre les streams à la demande, un thread de relais par stream
 * - Publie les décisions sur morphine.decision.output ("decision.<Type>")
 * - Publie périodiquement la santé sur morphine.health.output
 *
 * AmqpClient::Channel n'est pas thread-safe : un channel pour la
 * consommation, un autre pour la publication (thread dédié).
 */

#pragma once

#include "Channel.hpp"
#include "MetacognitiveOrchestrator.hpp"

#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace morphine {

/**
 * @brief Configuration RabbitMQ du démon
 */
struct RabbitMQConfig {
    std::string host = "localhost";
    int port = 5672;
    std::string user = "guest";
    std::string password = "guest";

    // Entrée contextes
    std::string input_exchange = "morphine.context.input";
    std::string input_routing_key = "context.#";
    std::string input_queue = "morphine_context_queue";

    // Sortie décisions
    std::string output_exchange = "morphine.decision.output";

    // Santé
    std::string health_exchange = "morphine.health.output";
    std::string health_routing_key = "health.snapshot";
    double health_period_s = 10.0;

    /**
     * @brief Applique la section "rabbitmq" d'un fichier de configuration
     */
    bool loadFromJson(const std::string& path);
    void applyJson(const nlohmann::json& j);
};

class DecisionBridge {
public:
    DecisionBridge(MetacognitiveOrchestrator& orchestrator, const RabbitMQConfig& config);
    ~DecisionBridge();

    DecisionBridge(const DecisionBridge&) = delete;
    DecisionBridge& operator=(const DecisionBridge&) = delete;

    /**
     * @brief Connexion RabbitMQ et démarrage des threads
     * @return false si la connexion échoue
     */
    bool start();

    /**
     * @brief Ferme les streams ouverts par le pont et arrête les threads
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    struct Stats {
        size_t messages_received = 0;
        size_t messages_rejected = 0;
        size_t decisions_published = 0;
        size_t health_published = 0;
        size_t publish_errors = 0;
    };

    [[nodiscard]] Stats getStats() const;

private:
    struct OutboundMessage {
        std::string exchange;
        std::string routing_key;
        std::string body;
    };

    struct Forwarder {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct BridgedStream {
        Sender<StreamingContext> input;
        Forwarder forwarder;
    };

    bool initRabbitMQ();
    void consumeLoop();
    void publishLoop();

    void handleMessage(const std::string& body);
    bool routeContext(const StreamingContext& context);
    void closeBridgedStream(const std::string& stream_id);
    void reapForwarders(bool wait_all);
    void publish(const OutboundMessage& message);

    MetacognitiveOrchestrator& orchestrator_;
    RabbitMQConfig config_;

    AmqpClient::Channel::ptr_t consume_channel_;
    AmqpClient::Channel::ptr_t publish_channel_;
    std::string consumer_tag_;

    std::atomic<bool> running_{false};
    std::thread consume_thread_;
    std::thread publish_thread_;

    // File vers le thread de publication
    Sender<OutboundMessage> outbound_tx_;
    Receiver<OutboundMessage> outbound_rx_;

    // Streams ouverts par le pont (thread de consommation + stop)
    std::mutex streams_mutex_;
    std::unordered_map<std::string, BridgedStream> streams_;
    std::list<Forwarder> closed_forwarders_;

    std::atomic<size_t> messages_received_{0};
    std::atomic<size_t> messages_rejected_{0};
    std::atomic<size_t> decisions_published_{0};
    std::atomic<size_t> health_published_{0};
    std::atomic<size_t> publish_errors_{0};
};

} // namespace morphine
