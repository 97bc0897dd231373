/**
 * @file OrchestratorTest.cpp
 * @brief Tests de l'orchestrateur métacognitif (fusion, pipeline, streams)
 */

#include "TestHarness.hpp"

#include "MetacognitiveOrchestrator.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace morphine;

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

OrchestratorConfig createConfig() {
    OrchestratorConfig cfg;
    cfg.glycolytic.initial_workers = 2;
    cfg.glycolytic.max_workers = 4;
    cfg.glycolytic.balance_period_ms = 5.0;
    cfg.layer_timeout_ms = 1000.0;
    return cfg;
}

CognitiveLayerPtr constantLayer(const std::string& name, double confidence) {
    return std::make_shared<FunctionLayer>(
        name, [name, confidence](const StreamingContext&, const json&, const KnowledgeBase&) {
            return json{{"layer", name}, {"confidence", confidence}};
        });
}

StreamingContext createContext(const std::string& stream_id, double confidence_level = 0.5) {
    StreamingContext ctx;
    ctx.stream_id = stream_id;
    ctx.timestamp = nowSeconds();
    ctx.confidence_level = confidence_level;
    return ctx;
}

bool waitUntil(const std::function<bool()>& condition, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

/**
 * Système IA de test à confiance fixe, ou en échec
 */
class FixedAISystem : public AISystem {
public:
    enum class Mode { OK, EMPTY, THROW };

    FixedAISystem(std::string id, double confidence, Mode mode = Mode::OK)
        : id_(std::move(id)), confidence_(confidence), mode_(mode) {}

    std::string systemId() const override { return id_; }

    std::optional<json> process(const StreamingContext&) override {
        calls_++;
        if (mode_ == Mode::THROW) {
            throw std::runtime_error("modèle indisponible");
        }
        if (mode_ == Mode::EMPTY) {
            return std::nullopt;
        }
        return json{{"confidence", confidence_}};
    }

    double confidence(const json&) const override { return confidence_; }

    std::chrono::milliseconds expectedProcessingTime() const override {
        return std::chrono::milliseconds(1);
    }

    int calls() const { return calls_.load(); }

private:
    std::string id_;
    double confidence_;
    Mode mode_;
    std::atomic<int> calls_{0};
};

/**
 * Système IA dont process() rend une confiance brute que confidence() corrige
 */
class RescoringAISystem : public AISystem {
public:
    RescoringAISystem(std::string id, double raw, double scored)
        : id_(std::move(id)), raw_(raw), scored_(scored) {}

    std::string systemId() const override { return id_; }

    std::optional<json> process(const StreamingContext&) override {
        return json{{"confidence", raw_}};
    }

    double confidence(const json&) const override { return scored_; }

    std::chrono::milliseconds expectedProcessingTime() const override {
        return std::chrono::milliseconds(1);
    }

private:
    std::string id_;
    double raw_;
    double scored_;
};

/**
 * Libère une couche bloquée en fin de test, même après un échec d'assertion
 */
struct ReleaseGuard {
    std::shared_ptr<std::atomic<bool>> flag;
    ~ReleaseGuard() { flag->store(true); }
};

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: FUSION
// ═══════════════════════════════════════════════════════════════════════════

void test_WeightsProportionalToConfidence() {
    auto w = MetacognitiveOrchestrator::computeLayerWeights(0.9, 0.8, 0.7);
    ASSERT_NEAR(w.context_weight, 0.375, 1e-9);
    ASSERT_NEAR(w.reasoning_weight, 0.8 / 2.4, 1e-9);
    ASSERT_NEAR(w.intuition_weight, 0.7 / 2.4, 1e-9);
    ASSERT_NEAR(w.sum(), 1.0, 1e-9);

    const double overall = MetacognitiveOrchestrator::overallConfidence(w, 0.9, 0.8, 0.7);
    ASSERT_NEAR(overall, (0.81 + 0.64 + 0.49) / 2.4, 1e-9);
}

void test_ZeroConfidencesGiveEqualThirds() {
    auto w = MetacognitiveOrchestrator::computeLayerWeights(0.0, 0.0, 0.0);
    ASSERT_NEAR(w.context_weight, 1.0 / 3.0, 1e-9);
    ASSERT_NEAR(w.reasoning_weight, 1.0 / 3.0, 1e-9);
    ASSERT_NEAR(w.intuition_weight, 1.0 / 3.0, 1e-9);
    ASSERT_NEAR(w.sum(), 1.0, 1e-9);
    ASSERT_NEAR(MetacognitiveOrchestrator::overallConfidence(w, 0.0, 0.0, 0.0), 0.0, 1e-12);
}

void test_WeightsSumToOne() {
    const double values[] = {0.0, 0.01, 0.3, 0.5, 0.77, 1.0};
    for (double c : values) {
        for (double r : values) {
            for (double i : values) {
                auto w = MetacognitiveOrchestrator::computeLayerWeights(c, r, i);
                ASSERT_NEAR(w.sum(), 1.0, 1e-9);
                ASSERT_GE(w.context_weight, 0.0);
                ASSERT_GE(w.reasoning_weight, 0.0);
                ASSERT_GE(w.intuition_weight, 0.0);
            }
        }
    }
}

void test_ExtractConfidence() {
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json{{"confidence", 0.42}}), 0.42, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json::object()), 0.5, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json{{"confidence", "haute"}}), 0.5, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json{{"confidence", 1.7}}), 1.0, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json{{"confidence", -0.2}}), 0.0, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(json("texte")), 0.5, 1e-12);
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(
                    json{{"confidence", std::numeric_limits<double>::quiet_NaN()}}), 0.5, 1e-12);
}

void test_ClassifyDecision() {
    std::unordered_map<std::string, json> evidence;

    StreamingContext hinted = createContext("s1");
    hinted.partial_data["decision_type"] = "LocationVerification";
    hinted.partial_data["odds"] = 2.0;
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(hinted, evidence),
              DecisionType::LOCATION_VERIFICATION);

    StreamingContext betting = createContext("s1");
    betting.partial_data["Market_Odds"] = 1.8;
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(betting, evidence),
              DecisionType::BETTING_OPPORTUNITY);

    StreamingContext payment = createContext("s1");
    payment.partial_data["payment_amount"] = 10.0;
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(payment, evidence),
              DecisionType::TRANSACTION_VALIDATION);

    StreamingContext gps = createContext("s1");
    gps.partial_data["gps_lat"] = 48.8;
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(gps, evidence),
              DecisionType::LOCATION_VERIFICATION);

    StreamingContext plain = createContext("s1");
    plain.partial_data["bitrate"] = 3000;
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(plain, evidence),
              DecisionType::STREAM_ANALYSIS);

    // Une alerte dans les preuves l'emporte sur les familles de clés
    evidence[LAYER_INTUITION] = {{"confidence", 0.9}, {"alert", true}};
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(betting, evidence),
              DecisionType::ALERT_GENERATION);

    // Alerte non booléenne ignorée
    evidence[LAYER_INTUITION] = {{"confidence", 0.9}, {"alert", "oui"}};
    ASSERT_EQ(MetacognitiveOrchestrator::classifyDecision(betting, evidence),
              DecisionType::BETTING_OPPORTUNITY);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: PIPELINE
// ═══════════════════════════════════════════════════════════════════════════

void test_HighConfidenceDecisionNotArchived() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.setContextLayer(constantLayer(LAYER_CONTEXT, 0.9));
    orchestrator.setReasoningLayer(constantLayer(LAYER_REASONING, 0.8));
    orchestrator.setIntuitionLayer(constantLayer(LAYER_INTUITION, 0.7));

    const auto decision = orchestrator.processContext(createContext("s1"));

    ASSERT_EQ(decision.stream_id, "s1");
    ASSERT_EQ(decision.decision_id.rfind("s1:", 0), 0u);
    ASSERT_EQ(decision.decision_type, DecisionType::STREAM_ANALYSIS);
    ASSERT_NEAR(decision.layer_contributions.context_weight, 0.375, 1e-9);
    ASSERT_NEAR(decision.layer_contributions.reasoning_weight, 0.8 / 2.4, 1e-9);
    ASSERT_NEAR(decision.layer_contributions.intuition_weight, 0.7 / 2.4, 1e-9);
    ASSERT_NEAR(decision.confidence, 1.94 / 2.4, 1e-9);
    ASSERT_GT(decision.confidence, 0.8);
    ASSERT_EQ(decision.evidence.size(), 3u);
    ASSERT_NEAR(decision.evidence.at(LAYER_REASONING)["confidence"].get<double>(), 0.8, 1e-12);

    ASSERT_EQ(orchestrator.lactateCycle().getEntryCount(), 0u);
    ASSERT_EQ(orchestrator.getStats().archived_results, 0u);
    ASSERT_EQ(orchestrator.dreamingModule().getExperienceCount(), 1u);
}

void test_LowConfidenceDecisionArchived() {
    MetacognitiveOrchestrator orchestrator(createConfig());

    // Couches par défaut sans score : confiance du contexte (0.5)
    const auto decision = orchestrator.processContext(createContext("s1", 0.5));
    ASSERT_NEAR(decision.confidence, 0.5, 1e-9);

    ASSERT_EQ(orchestrator.lactateCycle().getEntryCount(), 1u);
    auto archived = orchestrator.lactateCycle().retrievePartialResult(decision.decision_id);
    ASSERT_TRUE(archived.has_value());
    ASSERT_NEAR(archived->completion_percentage, 50.0, 1e-9);
    ASSERT_EQ(orchestrator.recoverIncomplete("s1").size(), 1u);
    ASSERT_EQ(orchestrator.dreamingModule().getExperienceCount(), 1u);
}

void test_VeryHighConfidenceIncorporatedNotCached() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    StreamingContext ctx = createContext("s1", 0.2);
    ctx.partial_data["context_score"] = 0.95;
    ctx.partial_data["reasoning_score"] = 0.95;
    ctx.partial_data["intuition_score"] = 0.95;

    const auto decision = orchestrator.processContext(ctx);
    ASSERT_NEAR(decision.confidence, 0.95, 1e-9);
    ASSERT_TRUE(decision.evidence.at(LAYER_CONTEXT)["from_signal"].get<bool>());
    ASSERT_EQ(orchestrator.lactateCycle().getEntryCount(), 0u);
    ASSERT_EQ(orchestrator.dreamingModule().getExperienceCount(), 1u);
    ASSERT_EQ(orchestrator.dreamingModule().getExperiences().front().decision_id, decision.decision_id);
}

void test_SlowLayerDegradedToNeutral() {
    OrchestratorConfig cfg = createConfig();
    cfg.layer_timeout_ms = 50.0;
    MetacognitiveOrchestrator orchestrator(cfg);

    orchestrator.setContextLayer(constantLayer(LAYER_CONTEXT, 0.9));
    orchestrator.setReasoningLayer(std::make_shared<FunctionLayer>(
        LAYER_REASONING, [](const StreamingContext&, const json&, const KnowledgeBase&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return json{{"confidence", 1.0}};
        }));
    orchestrator.setIntuitionLayer(constantLayer(LAYER_INTUITION, 0.9));

    const auto start = std::chrono::steady_clock::now();
    const auto decision = orchestrator.processContext(createContext("s1"));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_LT(elapsed, std::chrono::milliseconds(250));
    const auto& reasoning = decision.evidence.at(LAYER_REASONING);
    ASSERT_EQ(reasoning["status"].get<std::string>(), "degraded");
    ASSERT_EQ(reasoning["error"].get<std::string>(), "timeout");
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(reasoning), 0.5, 1e-12);
    ASSERT_EQ(orchestrator.getStats().layer_failures, 1u);
    ASSERT_NEAR(decision.layer_contributions.reasoning_weight, 0.5 / 2.3, 1e-9);
}

void test_BlockedLayerCallsStayBounded() {
    OrchestratorConfig cfg = createConfig();
    cfg.layer_timeout_ms = 20.0;
    cfg.max_pending_calls = 2;
    MetacognitiveOrchestrator orchestrator(cfg);

    auto release = std::make_shared<std::atomic<bool>>(false);
    auto calls = std::make_shared<std::atomic<int>>(0);
    orchestrator.setReasoningLayer(std::make_shared<FunctionLayer>(
        LAYER_REASONING, [release, calls](const StreamingContext&, const json&, const KnowledgeBase&) {
            (*calls)++;
            while (!release->load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return json{{"confidence", 1.0}};
        }));
    ReleaseGuard guard{release};

    int timeouts = 0;
    int saturated = 0;
    for (int i = 0; i < 20; ++i) {
        const auto decision = orchestrator.processContext(createContext("s1", 0.9));
        const auto& reasoning = decision.evidence.at(LAYER_REASONING);
        ASSERT_EQ(reasoning["status"].get<std::string>(), "degraded");
        const std::string error = reasoning["error"].get<std::string>();
        if (error == "timeout") {
            ++timeouts;
        } else if (error == "saturation") {
            ++saturated;
        }
    }

    // Deux appels bloqués au plus, aucun thread de plus ensuite
    ASSERT_EQ(calls->load(), 2);
    ASSERT_EQ(timeouts, 2);
    ASSERT_EQ(saturated, 18);
    ASSERT_EQ(orchestrator.getStats().layer_failures, 20u);
    ASSERT_TRUE(waitUntil([&]() { return orchestrator.getStats().pending_calls == 2; }));

    release->store(true);
    ASSERT_TRUE(waitUntil([&]() { return orchestrator.getStats().pending_calls == 0; }));

    const auto recovered = orchestrator.processContext(createContext("s1", 0.9));
    ASSERT_FALSE(recovered.evidence.at(LAYER_REASONING).contains("status"));
    ASSERT_NEAR(MetacognitiveOrchestrator::extractConfidence(recovered.evidence.at(LAYER_REASONING)), 1.0, 1e-12);
    ASSERT_EQ(calls->load(), 3);
}

void test_FailingLayerDegradedToNeutral() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.setIntuitionLayer(std::make_shared<FunctionLayer>(
        LAYER_INTUITION, [](const StreamingContext&, const json&, const KnowledgeBase&) -> json {
            throw std::runtime_error("intuition en panne");
        }));

    const auto decision = orchestrator.processContext(createContext("s1", 0.9));
    const auto& intuition = decision.evidence.at(LAYER_INTUITION);
    ASSERT_EQ(intuition["status"].get<std::string>(), "degraded");
    ASSERT_EQ(intuition["error"].get<std::string>(), "intuition en panne");
    ASSERT_EQ(orchestrator.getStats().layer_failures, 1u);
    ASSERT_NEAR(decision.layer_contributions.sum(), 1.0, 1e-9);
}

void test_AlertEvidenceClassified() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    StreamingContext ctx = createContext("s1", 0.6);
    ctx.partial_data["odds"] = 3.2;
    ctx.partial_data["alert"] = true;

    const auto decision = orchestrator.processContext(ctx);
    ASSERT_EQ(decision.decision_type, DecisionType::ALERT_GENERATION);
}

void test_KnowledgeBaseBiasApplied() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.getKnowledgeBase().setFact("context_bias", 0.2);

    StreamingContext ctx = createContext("s1");
    ctx.partial_data["context_score"] = 0.6;
    const auto decision = orchestrator.processContext(ctx);
    ASSERT_NEAR(decision.evidence.at(LAYER_CONTEXT)["confidence"].get<double>(), 0.8, 1e-9);

    orchestrator.getKnowledgeBase().setFact("context_bias", 0.9);
    const auto clamped = orchestrator.processContext(ctx);
    ASSERT_NEAR(clamped.evidence.at(LAYER_CONTEXT)["confidence"].get<double>(), 1.0, 1e-12);
}

void test_RecentDecisionsBounded() {
    OrchestratorConfig cfg = createConfig();
    cfg.recent_decisions_per_stream = 3;
    MetacognitiveOrchestrator orchestrator(cfg);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(orchestrator.processContext(createContext("s1")).decision_id);
    }
    const auto recent = orchestrator.getRecentDecisions("s1");
    ASSERT_EQ(recent.size(), 3u);
    ASSERT_EQ(recent.front().decision_id, ids[2]);
    ASSERT_EQ(recent.back().decision_id, ids[4]);
    ASSERT_TRUE(orchestrator.getRecentDecisions("s2").empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: SYSTÈMES IA
// ═══════════════════════════════════════════════════════════════════════════

void test_AIEvidenceFeedsContextLayer() {
    OrchestratorConfig cfg = createConfig();
    cfg.route_ai_systems_through_scheduler = false;
    MetacognitiveOrchestrator orchestrator(cfg);

    auto oracle = std::make_shared<FixedAISystem>("oracle", 1.0);
    ASSERT_TRUE(orchestrator.registerAISystem(oracle, 0.7));
    ASSERT_EQ(orchestrator.getRegisteredSystemCount(), 1u);

    StreamingContext ctx = createContext("s1");
    ctx.partial_data["context_score"] = 0.6;
    const auto decision = orchestrator.processContext(ctx);

    const auto& context_evidence = decision.evidence.at(LAYER_CONTEXT);
    ASSERT_EQ(context_evidence["ai_systems_consulted"].get<size_t>(), 1u);
    ASSERT_NEAR(context_evidence["confidence"].get<double>(), 0.8, 1e-9);
    ASSERT_EQ(oracle->calls(), 1);
}

void test_AIEvidenceThroughScheduler() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.start();

    auto oracle = std::make_shared<FixedAISystem>("oracle", 1.0);
    orchestrator.registerAISystem(oracle, 1.0);

    StreamingContext ctx = createContext("s1");
    ctx.partial_data["context_score"] = 0.6;
    const auto decision = orchestrator.processContext(ctx);

    ASSERT_NEAR(decision.evidence.at(LAYER_CONTEXT)["confidence"].get<double>(), 0.8, 1e-9);
    ASSERT_TRUE(waitUntil([&]() {
        return orchestrator.glycolyticCycle().getMetrics().tasks_completed >= 1;
    }));

    orchestrator.shutdown();
}

void test_FailingAISystemsTolerated() {
    OrchestratorConfig cfg = createConfig();
    cfg.route_ai_systems_through_scheduler = false;
    MetacognitiveOrchestrator orchestrator(cfg);

    orchestrator.registerAISystem(std::make_shared<FixedAISystem>("good", 0.4), 1.0);
    orchestrator.registerAISystem(
        std::make_shared<FixedAISystem>("empty", 0.9, FixedAISystem::Mode::EMPTY), 1.0);
    orchestrator.registerAISystem(
        std::make_shared<FixedAISystem>("broken", 0.9, FixedAISystem::Mode::THROW), 1.0);

    StreamingContext ctx = createContext("s1");
    ctx.partial_data["context_score"] = 0.6;
    const auto decision = orchestrator.processContext(ctx);

    const auto& context_evidence = decision.evidence.at(LAYER_CONTEXT);
    ASSERT_EQ(context_evidence["ai_systems_consulted"].get<size_t>(), 1u);
    ASSERT_NEAR(context_evidence["confidence"].get<double>(), 0.5, 1e-9);
    ASSERT_EQ(orchestrator.getStats().ai_system_failures, 2u);
}

void test_AIConfidenceRescoresWeightedEvidence() {
    OrchestratorConfig cfg = createConfig();
    cfg.route_ai_systems_through_scheduler = false;
    MetacognitiveOrchestrator orchestrator(cfg);

    // Brut 0.1 corrigé à 1.0 par le système, poids 3 contre 1
    orchestrator.registerAISystem(std::make_shared<RescoringAISystem>("rescored", 0.1, 1.0), 3.0);
    orchestrator.registerAISystem(std::make_shared<FixedAISystem>("low", 0.0), 1.0);

    StreamingContext ctx = createContext("s1");
    ctx.partial_data["context_score"] = 0.5;
    const auto decision = orchestrator.processContext(ctx);

    const auto& context_evidence = decision.evidence.at(LAYER_CONTEXT);
    ASSERT_EQ(context_evidence["ai_systems_consulted"].get<size_t>(), 2u);
    ASSERT_NEAR(context_evidence["confidence"].get<double>(), 0.5 * 0.5 + 0.5 * 0.75, 1e-9);
}

void test_InvalidAIWeightRejected() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    auto system = std::make_shared<FixedAISystem>("w", 0.5);

    ASSERT_FALSE(orchestrator.registerAISystem(system, std::numeric_limits<double>::quiet_NaN()));
    ASSERT_FALSE(orchestrator.registerAISystem(system, std::numeric_limits<double>::infinity()));
    ASSERT_FALSE(orchestrator.registerAISystem(system, -1.0));
    ASSERT_EQ(orchestrator.getRegisteredSystemCount(), 0u);

    ASSERT_TRUE(orchestrator.registerAISystem(system, 0.0));
    ASSERT_EQ(orchestrator.getRegisteredSystemCount(), 1u);
}

void test_RegistryOperations() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    ASSERT_FALSE(orchestrator.registerAISystem(nullptr, 1.0));

    orchestrator.registerAISystem(std::make_shared<FixedAISystem>("a", 0.5), 1.0);
    orchestrator.registerAISystem(std::make_shared<FixedAISystem>("a", 0.6), 2.0);
    ASSERT_EQ(orchestrator.getRegisteredSystemCount(), 1u);

    ASSERT_TRUE(orchestrator.unregisterAISystem("a"));
    ASSERT_FALSE(orchestrator.unregisterAISystem("a"));
    ASSERT_EQ(orchestrator.getRegisteredSystemCount(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: STREAMS
// ═══════════════════════════════════════════════════════════════════════════

void test_StreamPreservesOrder() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.setContextLayer(std::make_shared<FunctionLayer>(
        LAYER_CONTEXT, [](const StreamingContext& ctx, const json&, const KnowledgeBase&) {
            return json{{"confidence", 0.9}, {"seq", ctx.partial_data.at("seq")}};
        }));

    auto endpoints = orchestrator.createStream("s1");
    ASSERT_TRUE(endpoints.has_value());
    ASSERT_TRUE(orchestrator.hasStream("s1"));

    for (int i = 0; i < 20; ++i) {
        StreamingContext ctx = createContext("s1");
        ctx.partial_data["seq"] = i;
        ASSERT_EQ(endpoints->input.send(ctx), SendResult::SENT);
    }
    endpoints->input.close();

    int expected = 0;
    while (auto decision = endpoints->output.receive()) {
        ASSERT_EQ(decision->evidence.at(LAYER_CONTEXT)["seq"].get<int>(), expected);
        ++expected;
    }
    ASSERT_EQ(expected, 20);

    ASSERT_TRUE(waitUntil([&]() { return !orchestrator.hasStream("s1"); }));
    ASSERT_EQ(orchestrator.getActiveStreamCount(), 0u);
    ASSERT_FALSE(orchestrator.getActiveContext("s1").has_value());
    ASSERT_TRUE(orchestrator.getRecentDecisions("s1").empty());
}

void test_DuplicateStreamRejected() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    auto first = orchestrator.createStream("s1");
    ASSERT_TRUE(first.has_value());

    auto second = orchestrator.createStream("s1");
    ASSERT_FALSE(second.has_value());

    // Le stream existant reste utilisable
    ASSERT_EQ(first->input.send(createContext("s1")), SendResult::SENT);
    auto decision = first->output.receive();
    ASSERT_TRUE(decision.has_value());
    ASSERT_EQ(decision->stream_id, "s1");
}

void test_ConcurrentCreateSingleWinner() {
    MetacognitiveOrchestrator orchestrator(createConfig());

    std::vector<std::optional<StreamEndpoints>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&orchestrator, &results, i]() {
            results[i] = orchestrator.createStream("s2");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    int winners = 0;
    for (const auto& r : results) {
        if (r) {
            ++winners;
        }
    }
    ASSERT_EQ(winners, 1);
    ASSERT_EQ(orchestrator.getActiveStreamCount(), 1u);
}

void test_IndependentStreams() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    auto a = orchestrator.createStream("alpha");
    auto b = orchestrator.createStream("beta");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_EQ(orchestrator.getActiveStreamCount(), 2u);

    // beta n'est pas consommé : alpha avance quand même
    b->input.send(createContext("beta"));
    a->input.send(createContext("alpha"));
    auto decision = a->output.receive();
    ASSERT_TRUE(decision.has_value());
    ASSERT_EQ(decision->stream_id, "alpha");

    ASSERT_TRUE(orchestrator.closeStream("beta"));
    ASSERT_FALSE(orchestrator.closeStream("gamma"));
    ASSERT_TRUE(waitUntil([&]() { return !orchestrator.hasStream("beta"); }));
    ASSERT_TRUE(orchestrator.hasStream("alpha"));
}

void test_DropPolicyCountsLostDecisions() {
    OrchestratorConfig cfg = createConfig();
    cfg.channel_capacity = 2;
    cfg.delivery_policy = DeliveryPolicy::DROP_IF_FULL;
    MetacognitiveOrchestrator orchestrator(cfg);

    auto endpoints = orchestrator.createStream("s1");
    ASSERT_TRUE(endpoints.has_value());
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(endpoints->input.send(createContext("s1")), SendResult::SENT);
    }

    ASSERT_TRUE(waitUntil([&]() {
        const auto stats = orchestrator.getStats();
        return stats.decisions_emitted + stats.decisions_dropped == 5;
    }));
    const auto stats = orchestrator.getStats();
    ASSERT_EQ(stats.decisions_emitted, 2u);
    ASSERT_EQ(stats.decisions_dropped, 3u);
    ASSERT_EQ(endpoints->output.pending(), 2u);
}

void test_BlockPolicyDeliversEverything() {
    OrchestratorConfig cfg = createConfig();
    cfg.channel_capacity = 2;
    cfg.delivery_policy = DeliveryPolicy::BLOCK_IF_FULL;
    MetacognitiveOrchestrator orchestrator(cfg);

    auto endpoints = orchestrator.createStream("s1");
    ASSERT_TRUE(endpoints.has_value());
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(endpoints->input.send(createContext("s1")), SendResult::SENT);
    }
    endpoints->input.close();

    int received = 0;
    while (endpoints->output.receive()) {
        ++received;
    }
    ASSERT_EQ(received, 5);
    ASSERT_EQ(orchestrator.getStats().decisions_dropped, 0u);
}

void test_ShutdownClosesStreams() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.start();

    auto endpoints = orchestrator.createStream("s1");
    ASSERT_TRUE(endpoints.has_value());

    orchestrator.shutdown();
    ASSERT_EQ(orchestrator.getActiveStreamCount(), 0u);
    ASSERT_FALSE(endpoints->output.receive().has_value());
    ASSERT_EQ(endpoints->input.send(createContext("s1")), SendResult::CLOSED);
    ASSERT_FALSE(orchestrator.createStream("s3").has_value());
    ASSERT_FALSE(orchestrator.glycolyticCycle().isRunning());
}

// ═══════════════════════════════════════════════════════════════════════════
// TESTS: SANTÉ
// ═══════════════════════════════════════════════════════════════════════════

void test_SystemHealthSnapshot() {
    MetacognitiveOrchestrator orchestrator(createConfig());
    orchestrator.registerAISystem(std::make_shared<FixedAISystem>("a", 0.5), 1.0);
    orchestrator.processContext(createContext("s1", 0.3));

    const auto health = orchestrator.getSystemHealth();
    ASSERT_EQ(health.worker_count, 2u);
    ASSERT_EQ(health.registered_ai_systems, 1u);
    ASSERT_EQ(health.cached_partial_results, 1u);
    ASSERT_EQ(health.experience_count, 1u);
    ASSERT_EQ(health.active_streams, 0u);
    ASSERT_FALSE(health.metabolic_state.dreaming_active);
    ASSERT_NEAR(health.metabolic_state.resource_allocation.at("memory"), 0.8, 1e-9);

    const json j = health.toJson();
    ASSERT_TRUE(j.contains("scheduler_metrics"));
    ASSERT_EQ(j["registered_ai_systems"].get<size_t>(), 1u);
}

void test_InvalidConfigRejected() {
    OrchestratorConfig cfg = createConfig();
    cfg.archive_threshold = 1.5;
    bool thrown = false;
    try {
        MetacognitiveOrchestrator orchestrator(cfg);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

int main() {
    printHeader("MetacognitiveOrchestrator");

    std::cout << "\n>> Fusion\n";
    RUN_TEST(WeightsProportionalToConfidence);
    RUN_TEST(ZeroConfidencesGiveEqualThirds);
    RUN_TEST(WeightsSumToOne);
    RUN_TEST(ExtractConfidence);
    RUN_TEST(ClassifyDecision);

    std::cout << "\n>> Pipeline\n";
    RUN_TEST(HighConfidenceDecisionNotArchived);
    RUN_TEST(LowConfidenceDecisionArchived);
    RUN_TEST(VeryHighConfidenceIncorporatedNotCached);
    RUN_TEST(SlowLayerDegradedToNeutral);
    RUN_TEST(BlockedLayerCallsStayBounded);
    RUN_TEST(FailingLayerDegradedToNeutral);
    RUN_TEST(AlertEvidenceClassified);
    RUN_TEST(KnowledgeBaseBiasApplied);
    RUN_TEST(RecentDecisionsBounded);

    std::cout << "\n>> Systemes IA\n";
    RUN_TEST(AIEvidenceFeedsContextLayer);
    RUN_TEST(AIEvidenceThroughScheduler);
    RUN_TEST(FailingAISystemsTolerated);
    RUN_TEST(AIConfidenceRescoresWeightedEvidence);
    RUN_TEST(InvalidAIWeightRejected);
    RUN_TEST(RegistryOperations);

    std::cout << "\n>> Streams\n";
    RUN_TEST(StreamPreservesOrder);
    RUN_TEST(DuplicateStreamRejected);
    RUN_TEST(ConcurrentCreateSingleWinner);
    RUN_TEST(IndependentStreams);
    RUN_TEST(DropPolicyCountsLostDecisions);
    RUN_TEST(BlockPolicyDeliversEverything);
    RUN_TEST(ShutdownClosesStreams);

    std::cout << "\n>> Sante\n";
    RUN_TEST(SystemHealthSnapshot);
    RUN_TEST(InvalidConfigRejected);

    return printSummary();
}
