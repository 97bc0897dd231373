/**
 * @file BridgeProtocol.hpp
 * @brief Format des messages échangés par le pont RabbitMQ
 *
 * Entrée (morphine.context.input) :
 *   - un StreamingContext JSON (stream_id obligatoire)
 *   - {"type": "close_stream", "stream_id": "..."}
 * Sortie (morphine.decision.output) : MetacognitiveDecision JSON,
 *   clé de routage "decision.<Type>"
 */

#pragma once

#include "Types.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace morphine {

enum class InboundKind {
    CONTEXT,
    CLOSE_STREAM
};

struct InboundMessage {
    InboundKind kind = InboundKind::CONTEXT;
    std::string stream_id;
    StreamingContext context;
};

/**
 * @brief Décode un message entrant
 * @return nullopt si le corps est illisible ou sans stream_id
 */
inline std::optional<InboundMessage> parseInboundMessage(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) {
            std::cerr << "[DecisionBridge] Message ignoré (objet JSON attendu)\n";
            return std::nullopt;
        }

        InboundMessage message;
        message.stream_id = j.value("stream_id", "");
        if (message.stream_id.empty()) {
            std::cerr << "[DecisionBridge] Message ignoré (stream_id absent)\n";
            return std::nullopt;
        }

        if (j.value("type", "") == "close_stream") {
            message.kind = InboundKind::CLOSE_STREAM;
            return message;
        }

        message.kind = InboundKind::CONTEXT;
        message.context = StreamingContext::fromJson(j);
        return message;

    } catch (const json::exception& e) {
        std::cerr << "[DecisionBridge] Message illisible: " << e.what() << "\n";
        return std::nullopt;
    }
}

/**
 * @brief Port AMQP lu en ligne de commande
 * @return nullopt si non numérique ou hors de [1, 65535]
 */
inline std::optional<int> parsePort(const std::string& value) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (consumed != value.size() || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

inline std::string decisionRoutingKey(const MetacognitiveDecision& decision) {
    return "decision." + toString(decision.decision_type);
}

} // namespace morphine
