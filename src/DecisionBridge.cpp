/**
 * @file DecisionBridge.cpp
 * @brief Implémentation du pont RabbitMQ
 */

#include "DecisionBridge.hpp"
#include "BridgeProtocol.hpp"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <vector>

namespace morphine {

// ═══════════════════════════════════════════════════════════════════════════
// CONFIGURATION
// ═══════════════════════════════════════════════════════════════════════════

void RabbitMQConfig::applyJson(const nlohmann::json& j) {
    host = j.value("host", host);
    port = j.value("port", port);
    user = j.value("user", user);
    password = j.value("password", password);
    input_exchange = j.value("input_exchange", input_exchange);
    input_routing_key = j.value("input_routing_key", input_routing_key);
    input_queue = j.value("input_queue", input_queue);
    output_exchange = j.value("output_exchange", output_exchange);
    health_exchange = j.value("health_exchange", health_exchange);
    health_routing_key = j.value("health_routing_key", health_routing_key);
    health_period_s = j.value("health_period_s", health_period_s);
}

bool RabbitMQConfig::loadFromJson(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    try {
        nlohmann::json root = nlohmann::json::parse(file);
        if (root.contains("rabbitmq")) {
            applyJson(root["rabbitmq"]);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Config] Erreur parsing rabbitmq dans " << path << ": " << e.what() << "\n";
        return false;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE
// ═══════════════════════════════════════════════════════════════════════════

DecisionBridge::DecisionBridge(MetacognitiveOrchestrator& orchestrator, const RabbitMQConfig& config)
    : orchestrator_(orchestrator)
    , config_(config)
{
    auto outbound = makeChannel<OutboundMessage>(orchestrator_.getConfig().channel_capacity);
    outbound_tx_ = std::move(outbound.first);
    outbound_rx_ = std::move(outbound.second);
}

DecisionBridge::~DecisionBridge() {
    stop();
}

bool DecisionBridge::start() {
    if (running_.load()) {
        return true;
    }
    if (!initRabbitMQ()) {
        return false;
    }

    running_.store(true);
    publish_thread_ = std::thread(&DecisionBridge::publishLoop, this);
    consume_thread_ = std::thread(&DecisionBridge::consumeLoop, this);

    std::cout << "[DecisionBridge] Démarré (" << config_.input_exchange << " → "
              << config_.output_exchange << ")" << std::endl;
    return true;
}

void DecisionBridge::stop() {
    const bool was_running = running_.exchange(false);

    if (consume_thread_.joinable()) {
        consume_thread_.join();
    }

    // Fermer les entrées : les pipelines terminent, puis les relais
    std::vector<std::string> stream_ids;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (const auto& [stream_id, stream] : streams_) {
            stream_ids.push_back(stream_id);
        }
    }
    for (const auto& stream_id : stream_ids) {
        closeBridgedStream(stream_id);
    }
    reapForwarders(true);

    outbound_tx_.close();
    if (publish_thread_.joinable()) {
        publish_thread_.join();
    }

    consume_channel_.reset();
    publish_channel_.reset();

    if (was_running) {
        std::cout << "[DecisionBridge] Arrêté (" << decisions_published_.load()
                  << " décisions publiées)" << std::endl;
    }
}

bool DecisionBridge::initRabbitMQ() {
    try {
        AmqpClient::Channel::OpenOpts opts;
        opts.host = config_.host;
        opts.port = config_.port;
        opts.auth = AmqpClient::Channel::OpenOpts::BasicAuth{config_.user, config_.password};

        consume_channel_ = AmqpClient::Channel::Open(opts);
        publish_channel_ = AmqpClient::Channel::Open(opts);

        for (const auto& exchange : {config_.input_exchange, config_.output_exchange, config_.health_exchange}) {
            publish_channel_->DeclareExchange(exchange, AmqpClient::Channel::EXCHANGE_TYPE_TOPIC,
                                              false, true, false);
        }

        const std::string queue = consume_channel_->DeclareQueue(config_.input_queue, false, true, false, false);
        consume_channel_->BindQueue(queue, config_.input_exchange, config_.input_routing_key);
        consumer_tag_ = consume_channel_->BasicConsume(queue, "", true, false, false, 1);

        std::cout << "[DecisionBridge] Connexion RabbitMQ établie (" << config_.host << ":"
                  << config_.port << ", 2 channels)" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[DecisionBridge] Erreur RabbitMQ: " << e.what() << "\n";
        consume_channel_.reset();
        publish_channel_.reset();
        return false;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CONSOMMATION
// ═══════════════════════════════════════════════════════════════════════════

void DecisionBridge::consumeLoop() {
    while (running_.load()) {
        try {
            AmqpClient::Envelope::ptr_t envelope;
            bool received = consume_channel_->BasicConsumeMessage(consumer_tag_, envelope, 500);

            if (received && envelope) {
                const std::string body(envelope->Message()->Body().begin(),
                                       envelope->Message()->Body().end());
                handleMessage(body);
                consume_channel_->BasicAck(envelope);
            }

            reapForwarders(false);

        } catch (const std::exception& e) {
            std::cerr << "[DecisionBridge] Erreur consommation: " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

void DecisionBridge::handleMessage(const std::string& body) {
    messages_received_++;

    auto message = parseInboundMessage(body);
    if (!message) {
        messages_rejected_++;
        return;
    }

    if (message->kind == InboundKind::CLOSE_STREAM) {
        closeBridgedStream(message->stream_id);
        return;
    }

    if (!routeContext(message->context)) {
        messages_rejected_++;
    }
}

bool DecisionBridge::routeContext(const StreamingContext& context) {
    Sender<StreamingContext> input;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(context.stream_id);

        if (it == streams_.end()) {
            auto endpoints = orchestrator_.createStream(context.stream_id);
            if (!endpoints) {
                std::cerr << "[DecisionBridge] Stream " << context.stream_id << " indisponible\n";
                return false;
            }

            BridgedStream stream;
            stream.input = std::move(endpoints->input);
            stream.forwarder.done = std::make_shared<std::atomic<bool>>(false);
            stream.forwarder.thread = std::thread(
                [this, output = std::move(endpoints->output), done = stream.forwarder.done]() mutable {
                    while (auto decision = output.receive()) {
                        const SendResult result = outbound_tx_.send(OutboundMessage{
                            config_.output_exchange, decisionRoutingKey(*decision), decision->toJson().dump()});
                        if (result != SendResult::SENT) {
                            std::cerr << "[DecisionBridge] Décision " << decision->decision_id
                                      << " non publiée (file fermée)\n";
                        }
                    }
                    done->store(true);
                });

            it = streams_.emplace(context.stream_id, std::move(stream)).first;
        }
        input = it->second.input;
    }

    if (input.send(context) != SendResult::SENT) {
        // Pipeline terminé côté orchestrateur : le prochain message rouvrira le stream
        std::cerr << "[DecisionBridge] Stream " << context.stream_id << " fermé, contexte perdu\n";
        closeBridgedStream(context.stream_id);
        return false;
    }
    return true;
}

void DecisionBridge::closeBridgedStream(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    it->second.input.close();
    closed_forwarders_.push_back(std::move(it->second.forwarder));
    streams_.erase(it);
    std::cout << "[DecisionBridge] Stream " << stream_id << " fermé" << std::endl;
}

void DecisionBridge::reapForwarders(bool wait_all) {
    std::list<Forwarder> finished;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto it = closed_forwarders_.begin(); it != closed_forwarders_.end();) {
            if (wait_all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), closed_forwarders_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& forwarder : finished) {
        if (forwarder.thread.joinable()) {
            forwarder.thread.join();
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// PUBLICATION
// ═══════════════════════════════════════════════════════════════════════════

void DecisionBridge::publishLoop() {
    const auto health_period = std::chrono::milliseconds(
        static_cast<long long>(config_.health_period_s * 1000.0));
    auto next_health = std::chrono::steady_clock::now() + health_period;

    for (;;) {
        auto message = outbound_rx_.receiveFor(std::chrono::milliseconds(100));
        if (message) {
            publish(*message);
            decisions_published_++;
        } else if (outbound_rx_.channel()->isClosed()) {
            break;
        }

        if (running_.load() && std::chrono::steady_clock::now() >= next_health) {
            json health = orchestrator_.getSystemHealth().toJson();
            health["orchestrator_stats"] = orchestrator_.getStats().toJson();
            health["timestamp"] = nowSeconds();
            publish(OutboundMessage{config_.health_exchange, config_.health_routing_key, health.dump()});
            health_published_++;
            next_health = std::chrono::steady_clock::now() + health_period;
        }
    }
}

void DecisionBridge::publish(const OutboundMessage& message) {
    if (!publish_channel_) {
        return;
    }
    try {
        auto amqp_message = AmqpClient::BasicMessage::Create(message.body);
        amqp_message->ContentType("application/json");
        publish_channel_->BasicPublish(message.exchange, message.routing_key, amqp_message);
    } catch (const std::exception& e) {
        publish_errors_++;
        std::cerr << "[DecisionBridge] Erreur publication: " << e.what() << "\n";
    }
}

DecisionBridge::Stats DecisionBridge::getStats() const {
    Stats stats;
    stats.messages_received = messages_received_.load();
    stats.messages_rejected = messages_rejected_.load();
    stats.decisions_published = decisions_published_.load();
    stats.health_published = health_published_.load();
    stats.publish_errors = publish_errors_.load();
    return stats;
}

} // namespace morphine
