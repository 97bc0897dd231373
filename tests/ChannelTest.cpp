/**
 * @file ChannelTest.cpp
 * @brief Tests du canal borné et du format des messages du pont
 */

#include "TestHarness.hpp"

#include "BridgeProtocol.hpp"
#include "Channel.hpp"
#include "Identifiers.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace morphine;

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: CANAL
// ═══════════════════════════════════════════════════════════════════════════

void test_FifoOrder() {
    auto [tx, rx] = makeChannel<int>(16);
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(tx.send(i), SendResult::SENT);
    }
    for (int i = 0; i < 10; ++i) {
        auto value = rx.receive();
        ASSERT_TRUE(value.has_value());
        ASSERT_EQ(*value, i);
    }
}

void test_TrySendFullBuffer() {
    auto [tx, rx] = makeChannel<int>(2);
    ASSERT_EQ(tx.trySend(1), SendResult::SENT);
    ASSERT_EQ(tx.trySend(2), SendResult::SENT);
    ASSERT_EQ(tx.trySend(3), SendResult::FULL);
    ASSERT_EQ(rx.pending(), 2u);
}

void test_ReceiveDrainsAfterClose() {
    auto [tx, rx] = makeChannel<int>(8);
    tx.send(1);
    tx.send(2);
    tx.close();

    ASSERT_EQ(tx.send(3), SendResult::CLOSED);
    ASSERT_EQ(*rx.receive(), 1);
    ASSERT_EQ(*rx.receive(), 2);
    ASSERT_FALSE(rx.receive().has_value());
}

void test_LastSenderClosesChannel() {
    auto channel = std::make_shared<Channel<int>>(4);
    Receiver<int> rx(channel);
    {
        Sender<int> a(channel);
        Sender<int> b = a;
        a.send(7);
    }
    ASSERT_TRUE(channel->isClosed());
    ASSERT_EQ(*rx.receive(), 7);
    ASSERT_FALSE(rx.receive().has_value());
}

void test_ReceiverDropClosesChannel() {
    auto pair = makeChannel<int>(4);
    Sender<int> tx = pair.first;
    {
        Receiver<int> rx = std::move(pair.second);
    }
    ASSERT_EQ(tx.send(1), SendResult::CLOSED);
    ASSERT_TRUE(tx.isClosed());
}

void test_BlockingSendWaitsForConsumer() {
    auto [tx, rx] = makeChannel<int>(1);
    tx.send(0);

    std::atomic<bool> sent{false};
    std::thread producer([&tx = tx, &sent]() {
        tx.send(1);
        sent.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_FALSE(sent.load());

    ASSERT_EQ(*rx.receive(), 0);
    producer.join();
    ASSERT_TRUE(sent.load());
    ASSERT_EQ(*rx.receive(), 1);
}

void test_ReceiveForTimesOut() {
    auto [tx, rx] = makeChannel<int>(4);
    const auto start = std::chrono::steady_clock::now();
    auto value = rx.receiveFor(std::chrono::milliseconds(30));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(value.has_value());
    ASSERT_GE(elapsed, std::chrono::milliseconds(25));
    ASSERT_FALSE(tx.isClosed());
}

void test_ZeroCapacityRejected() {
    bool thrown = false;
    try {
        auto pair = makeChannel<int>(0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

void test_ConcurrentProducersKeepPerProducerOrder() {
    auto pair = makeChannel<std::pair<int, int>>(8);
    Receiver<std::pair<int, int>> rx = std::move(pair.second);

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([tx = pair.first, p]() {
            for (int i = 0; i < 100; ++i) {
                tx.send({p, i});
            }
        });
    }
    // Les copies des producteurs restent seules : le canal se ferme avec elles
    pair.first = Sender<std::pair<int, int>>();

    std::vector<int> last(4, -1);
    bool ordered = true;
    int received = 0;
    while (auto item = rx.receive()) {
        if (item->second != last[item->first] + 1) {
            ordered = false;
        }
        last[item->first] = item->second;
        ++received;
    }

    for (auto& t : producers) {
        t.join();
    }
    ASSERT_TRUE(ordered);
    ASSERT_EQ(received, 400);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: IDENTIFIANTS
// ═══════════════════════════════════════════════════════════════════════════

void test_IdentifierFormat() {
    const std::string id = generateId();
    ASSERT_EQ(id.size(), 36u);
    ASSERT_EQ(id[8], '-');
    ASSERT_EQ(id[14], '4');

    const std::string prefixed = generateId("s1");
    ASSERT_EQ(prefixed.rfind("s1:", 0), 0u);
}

void test_IdentifiersUnique() {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generateId());
    }
    ASSERT_EQ(ids.size(), 1000u);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: PROTOCOLE DU PONT
// ═══════════════════════════════════════════════════════════════════════════

void test_ParseContextMessage() {
    auto message = parseInboundMessage(
        R"({"stream_id":"s1","confidence_level":0.7,"partial_data":{"odds":2.1}})");
    ASSERT_TRUE(message.has_value());
    ASSERT_EQ(message->kind, InboundKind::CONTEXT);
    ASSERT_EQ(message->context.stream_id, "s1");
    ASSERT_NEAR(message->context.confidence_level, 0.7, 1e-9);
    ASSERT_NEAR(message->context.partial_data.at("odds").get<double>(), 2.1, 1e-9);
}

void test_ParseCloseMessage() {
    auto message = parseInboundMessage(R"({"type":"close_stream","stream_id":"s9"})");
    ASSERT_TRUE(message.has_value());
    ASSERT_EQ(message->kind, InboundKind::CLOSE_STREAM);
    ASSERT_EQ(message->stream_id, "s9");
}

void test_ParseRejectsInvalid() {
    ASSERT_FALSE(parseInboundMessage("pas du json").has_value());
    ASSERT_FALSE(parseInboundMessage("[1,2,3]").has_value());
    ASSERT_FALSE(parseInboundMessage(R"({"confidence_level":0.5})").has_value());
    ASSERT_FALSE(parseInboundMessage(R"({"stream_id":42})").has_value());
}

void test_DecisionRoutingKey() {
    MetacognitiveDecision decision;
    decision.decision_type = DecisionType::ALERT_GENERATION;
    ASSERT_EQ(decisionRoutingKey(decision), "decision.AlertGeneration");
}

void test_ParsePortRejectsInvalid() {
    ASSERT_EQ(parsePort("5672").value_or(-1), 5672);
    ASSERT_FALSE(parsePort("abc").has_value());
    ASSERT_FALSE(parsePort("").has_value());
    ASSERT_FALSE(parsePort("56x").has_value());
    ASSERT_FALSE(parsePort("0").has_value());
    ASSERT_FALSE(parsePort("70000").has_value());
    ASSERT_FALSE(parsePort("99999999999999999999").has_value());
}

int main() {
    printHeader("Channel / Protocole");

    std::cout << "\n>> Canal borne\n";
    RUN_TEST(FifoOrder);
    RUN_TEST(TrySendFullBuffer);
    RUN_TEST(ReceiveDrainsAfterClose);
    RUN_TEST(LastSenderClosesChannel);
    RUN_TEST(ReceiverDropClosesChannel);
    RUN_TEST(BlockingSendWaitsForConsumer);
    RUN_TEST(ReceiveForTimesOut);
    RUN_TEST(ZeroCapacityRejected);
    RUN_TEST(ConcurrentProducersKeepPerProducerOrder);

    std::cout << "\n>> Identifiants\n";
    RUN_TEST(IdentifierFormat);
    RUN_TEST(IdentifiersUnique);

    std::cout << "\n>> Protocole du pont\n";
    RUN_TEST(ParseContextMessage);
    RUN_TEST(ParseCloseMessage);
    RUN_TEST(ParseRejectsInvalid);
    RUN_TEST(DecisionRoutingKey);
    RUN_TEST(ParsePortRejectsInvalid);

    return printSummary();
}
