/**
 * @file MetacognitiveOrchestrator.cpp
 * @brief Implémentation de l'orchestrateur métacognitif
 */

#include "MetacognitiveOrchestrator.hpp"
#include "Identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace morphine {

namespace {

json degradedEvidence(const std::string& reason) {
    return {
        {"confidence", NEUTRAL_CONFIDENCE},
        {"status", "degraded"},
        {"error", reason}
    };
}

bool keyContainsAny(const std::string& key, std::initializer_list<const char*> words) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* word : words) {
        if (lower.find(word) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

MetacognitiveOrchestrator::MetacognitiveOrchestrator(const OrchestratorConfig& config)
    : config_(config)
{
    config_.validate();

    glycolytic_ = std::make_shared<GlycolyticCycle>(config_.glycolytic);
    lactate_ = std::make_shared<LactateCycle>(config_.lactate);
    dreaming_ = std::make_shared<DreamingModule>(config_.dreaming);
    knowledge_base_ = std::make_shared<KnowledgeBase>();

    context_layer_ = std::make_shared<SignalLayer>(LAYER_CONTEXT, "context_score");
    reasoning_layer_ = std::make_shared<SignalLayer>(LAYER_REASONING, "reasoning_score");
    intuition_layer_ = std::make_shared<SignalLayer>(LAYER_INTUITION, "intuition_score");
}

MetacognitiveOrchestrator::~MetacognitiveOrchestrator() {
    shutdown();
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE
// ═══════════════════════════════════════════════════════════════════════════

void MetacognitiveOrchestrator::start() {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        shutting_down_ = false;
    }
    glycolytic_->start();
    lactate_->start();
    dreaming_->start();
    std::cout << "[Orchestrator] Démarré (capacité canaux " << config_.channel_capacity
              << ", seuil d'archivage " << config_.archive_threshold
              << ", politique " << toString(config_.delivery_policy) << ")" << std::endl;
}

void MetacognitiveOrchestrator::shutdown() {
    size_t closed = 0;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        shutting_down_ = true;
        for (auto& [stream_id, entry] : streams_) {
            entry.input->close();
            entry.output->close();
            ++closed;
        }
    }

    // Les pipelines se retirent eux-mêmes du registre en sortant
    for (;;) {
        std::vector<std::thread> finished;
        bool empty = false;
        {
            std::unique_lock<std::mutex> lock(streams_mutex_);
            streams_cv_.wait(lock, [this] { return streams_.empty() || !finished_pipelines_.empty(); });
            finished.swap(finished_pipelines_);
            empty = streams_.empty();
        }
        for (auto& thread : finished) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        if (empty) {
            break;
        }
    }
    reapFinishedPipelines();

    glycolytic_->stop();
    lactate_->stop();
    dreaming_->stop();

    // Une couche encore bloquée retarde l'arrêt jusqu'à son retour
    reapTrackedCalls(true);

    if (closed > 0) {
        std::cout << "[Orchestrator] Arrêté (" << closed << " streams fermés)" << std::endl;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// STREAMS
// ═══════════════════════════════════════════════════════════════════════════

std::optional<StreamEndpoints> MetacognitiveOrchestrator::createStream(const std::string& stream_id) {
    reapFinishedPipelines();

    auto [input_tx, input_rx] = makeChannel<StreamingContext>(config_.channel_capacity);
    auto [output_tx, output_rx] = makeChannel<MetacognitiveDecision>(config_.channel_capacity);

    std::lock_guard<std::mutex> lock(streams_mutex_);
    if (shutting_down_) {
        std::cerr << "[Orchestrator] Arrêt en cours, stream " << stream_id << " refusé\n";
        return std::nullopt;
    }

    // Insertion atomique : un seul gagnant par stream_id
    auto [it, inserted] = streams_.try_emplace(stream_id);
    if (!inserted) {
        std::cerr << "[Orchestrator] Stream " << stream_id << " déjà actif, création ignorée\n";
        return std::nullopt;
    }

    StreamEntry& entry = it->second;
    entry.input = input_rx.channel();
    entry.output = output_rx.channel();
    entry.pipeline = std::thread(&MetacognitiveOrchestrator::runPipeline, this,
                                 stream_id, std::move(input_rx), std::move(output_tx));

    std::cout << "[Orchestrator] Stream " << stream_id << " ouvert" << std::endl;
    return StreamEndpoints{std::move(input_tx), std::move(output_rx)};
}

bool MetacognitiveOrchestrator::closeStream(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return false;
    }
    it->second.input->close();
    return true;
}

bool MetacognitiveOrchestrator::hasStream(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.count(stream_id) > 0;
}

size_t MetacognitiveOrchestrator::getActiveStreamCount() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

void MetacognitiveOrchestrator::reapFinishedPipelines() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        finished.swap(finished_pipelines_);
    }
    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void MetacognitiveOrchestrator::runPipeline(std::string stream_id,
                                            Receiver<StreamingContext> input,
                                            Sender<MetacognitiveDecision> output) {
    size_t processed = 0;

    // Consommateur unique : ordre FIFO garanti sur le stream
    while (auto context = input.receive()) {
        {
            std::unique_lock<std::shared_mutex> lock(history_mutex_);
            active_contexts_[stream_id] = *context;
        }
        const MetacognitiveDecision decision = processContext(*context);
        emitDecision(output, decision);
        ++processed;
    }

    output.close();
    {
        std::unique_lock<std::shared_mutex> lock(history_mutex_);
        active_contexts_.erase(stream_id);
        recent_decisions_.erase(stream_id);
    }

    std::cout << "[Orchestrator] Stream " << stream_id << " terminé (" << processed
              << " contextes traités)" << std::endl;

    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it != streams_.end()) {
        finished_pipelines_.push_back(std::move(it->second.pipeline));
        streams_.erase(it);
    }
    streams_cv_.notify_all();
}

void MetacognitiveOrchestrator::emitDecision(const Sender<MetacognitiveDecision>& output,
                                             const MetacognitiveDecision& decision) {
    const SendResult result = (config_.delivery_policy == DeliveryPolicy::BLOCK_IF_FULL)
        ? output.send(decision)
        : output.trySend(decision);

    if (result == SendResult::SENT) {
        decisions_emitted_++;
        return;
    }

    decisions_dropped_++;
    std::cerr << "[Orchestrator] Décision " << decision.decision_id << " abandonnée (canal "
              << (result == SendResult::FULL ? "plein" : "fermé") << ")\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// PIPELINE
// ═══════════════════════════════════════════════════════════════════════════

MetacognitiveDecision MetacognitiveOrchestrator::processContext(const StreamingContext& context) {
    contexts_processed_++;

    // 1-2. État métabolique et allocation pour ce contexte
    const MetabolicState metabolic_state = assessMetabolicState();
    const auto allocation = glycolytic_->allocateResources(context, metabolic_state);

    CognitiveLayerPtr context_layer;
    CognitiveLayerPtr reasoning_layer;
    CognitiveLayerPtr intuition_layer;
    {
        std::lock_guard<std::mutex> lock(layers_mutex_);
        context_layer = context_layer_;
        reasoning_layer = reasoning_layer_;
        intuition_layer = intuition_layer_;
    }

    // 3. Les trois couches en parallèle ; la couche contexte attend
    //    d'abord les preuves des systèmes IA
    const auto timeout = config_.layerTimeout();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto reasoning_future = launchLayer(reasoning_layer, context, json::object());
    auto intuition_future = launchLayer(intuition_layer, context, json::object());

    json collected_evidence = collectAIEvidence(context, allocation);
    auto context_future = launchLayer(context_layer, context, std::move(collected_evidence));
    const auto context_deadline = std::max(deadline, std::chrono::steady_clock::now() + timeout);

    // 4. Échec ou dépassement → preuve neutre
    json context_result = awaitLayer(context_future, context_deadline, LAYER_CONTEXT);
    json reasoning_result = awaitLayer(reasoning_future, deadline, LAYER_REASONING);
    json intuition_result = awaitLayer(intuition_future, deadline, LAYER_INTUITION);

    // 5. Pondération
    const double c = extractConfidence(context_result);
    const double r = extractConfidence(reasoning_result);
    const double i = extractConfidence(intuition_result);

    LayerContributions contributions = computeLayerWeights(c, r, i);
    contributions.metabolic_state = metabolic_state;

    // 6. Synthèse
    MetacognitiveDecision decision;
    decision.decision_id = generateId(context.stream_id);
    decision.stream_id = context.stream_id;
    decision.evidence[LAYER_CONTEXT] = std::move(context_result);
    decision.evidence[LAYER_REASONING] = std::move(reasoning_result);
    decision.evidence[LAYER_INTUITION] = std::move(intuition_result);
    decision.decision_type = classifyDecision(context, decision.evidence);
    decision.confidence = overallConfidence(contributions, c, r, i);
    decision.timestamp = nowSeconds();
    decision.layer_contributions = contributions;

    // 7. Décision incomplète → cycle lactique
    if (decision.confidence < config_.archive_threshold) {
        lactate_->storePartialResult(decision);
        archived_results_++;
    }

    // 8. Toujours transmise au module de rêve
    dreaming_->incorporateExperience(decision);

    recordDecision(decision);

    if (config_.verbose) {
        std::cout << "[Orchestrator] " << decision.stream_id << " → " << toString(decision.decision_type)
                  << " conf=" << std::fixed << std::setprecision(3) << decision.confidence
                  << " (c=" << contributions.context_weight
                  << " r=" << contributions.reasoning_weight
                  << " i=" << contributions.intuition_weight
                  << ", charge=" << metabolic_state.glycolytic_load << ")"
                  << std::defaultfloat << std::endl;
    }

    return decision;
}

std::future<json> MetacognitiveOrchestrator::launchLayer(const CognitiveLayerPtr& layer,
                                                         const StreamingContext& context,
                                                         json collected_evidence) {
    auto promise = std::make_shared<std::promise<json>>();
    std::future<json> future = promise->get_future();

    if (!layer) {
        promise->set_value(degradedEvidence("couche absente"));
        return future;
    }

    // Une couche bloquée ne retient pas le run au-delà du délai ; ses appels
    // en cours restent suivis et plafonnés
    const std::string layer_name = layer->name();
    std::shared_ptr<const KnowledgeBase> knowledge_base = knowledge_base_;
    auto evidence = std::make_shared<const json>(std::move(collected_evidence));
    const bool launched = launchTracked("layer:" + layer_name,
        [promise, layer, context, evidence, knowledge_base]() -> std::function<void()> {
            try {
                auto result = std::make_shared<json>(layer->process(context, *evidence, *knowledge_base));
                return [promise, result]() { promise->set_value(std::move(*result)); };
            } catch (...) {
                auto error = std::current_exception();
                return [promise, error]() { promise->set_exception(error); };
            }
        });

    if (!launched) {
        layer_failures_++;
        std::cerr << "[Orchestrator] Couche " << layer_name << " saturée ("
                  << config_.max_pending_calls << " appels en cours)\n";
        promise->set_value(degradedEvidence("saturation"));
    }
    return future;
}

bool MetacognitiveOrchestrator::launchTracked(const std::string& key, CallWork work) {
    reapTrackedCalls(false);

    std::lock_guard<std::mutex> lock(calls_mutex_);
    size_t& pending = pending_calls_[key];
    if (pending >= config_.max_pending_calls) {
        return false;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    TrackedCall call;
    call.done = done;
    call.thread = std::thread([this, key, work = std::move(work), done]() {
        // Place libérée avant la livraison du résultat
        std::function<void()> deliver = work();
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            auto it = pending_calls_.find(key);
            if (it != pending_calls_.end() && it->second > 0) {
                --it->second;
            }
        }
        if (deliver) {
            deliver();
        }
        done->store(true);
    });
    ++pending;
    tracked_calls_.push_back(std::move(call));
    return true;
}

void MetacognitiveOrchestrator::reapTrackedCalls(bool wait_all) {
    std::list<TrackedCall> finished;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (wait_all) {
            finished.swap(tracked_calls_);
        } else {
            for (auto it = tracked_calls_.begin(); it != tracked_calls_.end();) {
                if (it->done->load()) {
                    auto next = std::next(it);
                    finished.splice(finished.end(), tracked_calls_, it);
                    it = next;
                } else {
                    ++it;
                }
            }
        }
    }

    for (auto& call : finished) {
        if (call.thread.joinable()) {
            call.thread.join();
        }
    }
}

json MetacognitiveOrchestrator::awaitLayer(std::future<json>& future,
                                           std::chrono::steady_clock::time_point deadline,
                                           const std::string& layer_name) {
    if (future.wait_until(deadline) != std::future_status::ready) {
        layer_failures_++;
        std::cerr << "[Orchestrator] Couche " << layer_name << " hors délai\n";
        return degradedEvidence("timeout");
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        layer_failures_++;
        std::cerr << "[Orchestrator] Couche " << layer_name << " en échec: " << e.what() << "\n";
        return degradedEvidence(e.what());
    } catch (...) {
        layer_failures_++;
        std::cerr << "[Orchestrator] Couche " << layer_name << " en échec (exception inconnue)\n";
        return degradedEvidence("exception inconnue");
    }
}

json MetacognitiveOrchestrator::collectAIEvidence(const StreamingContext& context,
                                                  const GlycolyticCycle::Allocation& allocation) {
    json collected = json::object();

    const auto systems = ai_systems_.snapshot();
    if (systems.empty()) {
        return collected;
    }

    using ResultPromise = std::promise<std::optional<json>>;
    struct PendingCall {
        std::string system_id;
        AISystemPtr system;
        double weight = 1.0;
        std::future<std::optional<json>> result;
    };

    const bool via_scheduler = config_.route_ai_systems_through_scheduler && glycolytic_->isRunning();
    const auto cpu = allocation.find("cpu");
    std::vector<PendingCall> calls;
    calls.reserve(systems.size());

    for (const auto& entry : systems) {
        auto promise = std::make_shared<ResultPromise>();
        PendingCall call{entry.system->systemId(), entry.system, entry.weight, promise->get_future()};

        auto work = [system = entry.system, context, promise]() {
            std::optional<json> evidence;
            try {
                evidence = system->process(context);
            } catch (...) {
                promise->set_value(std::nullopt);
                throw;
            }
            promise->set_value(evidence);
            if (!evidence) {
                throw std::runtime_error("aucune preuve");
            }
        };

        if (via_scheduler) {
            Task task;
            task.task_id = generateId("ai");
            task.stream_id = context.stream_id;
            task.priority = std::max(entry.weight, 1e-6);
            task.complexity = 1.0;
            task.resource_requirement = (cpu != allocation.end()) ? cpu->second : 0.0;
            task.estimated_time = std::chrono::duration<double>(
                entry.system->expectedProcessingTime()).count();
            task.work = std::move(work);
            // Le résultat passe par la promesse du système, pas par la future de la tâche
            (void)glycolytic_->submitTask(std::move(task));
        } else {
            const bool launched = launchTracked("ai:" + call.system_id,
                [work = std::move(work), id = call.system_id]() -> std::function<void()> {
                    try {
                        work();
                    } catch (const std::exception& e) {
                        std::cerr << "[Orchestrator] Système IA " << id << " en échec: " << e.what() << "\n";
                    } catch (...) {
                        std::cerr << "[Orchestrator] Système IA " << id << " en échec (exception inconnue)\n";
                    }
                    return {};
                });
            if (!launched) {
                std::cerr << "[Orchestrator] Système IA " << call.system_id << " saturé\n";
                promise->set_value(std::nullopt);
            }
        }

        calls.push_back(std::move(call));
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.layerTimeout();
    for (auto& call : calls) {
        if (call.result.wait_until(deadline) != std::future_status::ready) {
            ai_system_failures_++;
            std::cerr << "[Orchestrator] Système IA " << call.system_id << " hors délai\n";
            continue;
        }
        std::optional<json> evidence;
        try {
            evidence = call.result.get();
        } catch (const std::future_error& e) {
            // Tâche annulée avant exécution (pool arrêté)
            std::cerr << "[Orchestrator] Système IA " << call.system_id << " annulé: " << e.what() << "\n";
        }
        if (!evidence) {
            ai_system_failures_++;
            continue;
        }

        // Confiance recalculée par le système lui-même, poids du registre
        if (evidence->is_object()) {
            try {
                const double scored = call.system->confidence(*evidence);
                if (std::isfinite(scored)) {
                    (*evidence)["confidence"] = std::clamp(scored, 0.0, 1.0);
                }
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] Système IA " << call.system_id
                          << " : confiance indisponible (" << e.what() << ")\n";
            }
            (*evidence)["weight"] = call.weight;
        }
        collected[call.system_id] = std::move(*evidence);
    }

    return collected;
}

void MetacognitiveOrchestrator::recordDecision(const MetacognitiveDecision& decision) {
    if (config_.recent_decisions_per_stream == 0) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(history_mutex_);
    auto& history = recent_decisions_[decision.stream_id];
    history.push_back(decision);
    while (history.size() > config_.recent_decisions_per_stream) {
        history.pop_front();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// FUSION
// ═══════════════════════════════════════════════════════════════════════════

double MetacognitiveOrchestrator::extractConfidence(const json& evidence) {
    if (!evidence.is_object()) {
        return NEUTRAL_CONFIDENCE;
    }
    auto it = evidence.find("confidence");
    if (it == evidence.end() || !it->is_number()) {
        return NEUTRAL_CONFIDENCE;
    }
    const double value = it->get<double>();
    if (!std::isfinite(value)) {
        return NEUTRAL_CONFIDENCE;
    }
    return std::clamp(value, 0.0, 1.0);
}

LayerContributions MetacognitiveOrchestrator::computeLayerWeights(double context_confidence,
                                                                  double reasoning_confidence,
                                                                  double intuition_confidence) {
    LayerContributions contributions;
    const double total = context_confidence + reasoning_confidence + intuition_confidence;
    if (total <= 0.0) {
        return contributions;   // tiers égaux
    }
    contributions.context_weight = context_confidence / total;
    contributions.reasoning_weight = reasoning_confidence / total;
    contributions.intuition_weight = intuition_confidence / total;
    return contributions;
}

double MetacognitiveOrchestrator::overallConfidence(const LayerContributions& contributions,
                                                    double context_confidence,
                                                    double reasoning_confidence,
                                                    double intuition_confidence) {
    return context_confidence * contributions.context_weight
         + reasoning_confidence * contributions.reasoning_weight
         + intuition_confidence * contributions.intuition_weight;
}

DecisionType MetacognitiveOrchestrator::classifyDecision(const StreamingContext& context,
                                                         const std::unordered_map<std::string, json>& evidence) {
    auto hint = context.partial_data.find("decision_type");
    if (hint != context.partial_data.end() && hint->second.is_string()) {
        if (auto type = parseDecisionType(hint->second.get<std::string>())) {
            return *type;
        }
    }

    for (const auto& [layer, blob] : evidence) {
        if (!blob.is_object()) {
            continue;
        }
        auto alert = blob.find("alert");
        if (alert != blob.end() && alert->is_boolean() && alert->get<bool>()) {
            return DecisionType::ALERT_GENERATION;
        }
    }

    for (const auto& [key, value] : context.partial_data) {
        if (keyContainsAny(key, {"bet", "odds", "market"})) {
            return DecisionType::BETTING_OPPORTUNITY;
        }
    }
    for (const auto& [key, value] : context.partial_data) {
        if (keyContainsAny(key, {"location", "gps", "geo"})) {
            return DecisionType::LOCATION_VERIFICATION;
        }
    }
    for (const auto& [key, value] : context.partial_data) {
        if (keyContainsAny(key, {"transaction", "payment", "wallet"})) {
            return DecisionType::TRANSACTION_VALIDATION;
        }
    }

    return DecisionType::STREAM_ANALYSIS;
}

// ═══════════════════════════════════════════════════════════════════════════
// SYSTÈMES IA ET COUCHES
// ═══════════════════════════════════════════════════════════════════════════

bool MetacognitiveOrchestrator::registerAISystem(AISystemPtr system, double weight) {
    const std::string id = system ? system->systemId() : std::string();
    if (!ai_systems_.registerSystem(std::move(system), weight)) {
        return false;
    }
    std::cout << "[Orchestrator] Système IA " << id << " enregistré (poids " << weight << ")" << std::endl;
    return true;
}

bool MetacognitiveOrchestrator::unregisterAISystem(const std::string& system_id) {
    return ai_systems_.unregisterSystem(system_id);
}

void MetacognitiveOrchestrator::setContextLayer(CognitiveLayerPtr layer) {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    context_layer_ = std::move(layer);
}

void MetacognitiveOrchestrator::setReasoningLayer(CognitiveLayerPtr layer) {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    reasoning_layer_ = std::move(layer);
}

void MetacognitiveOrchestrator::setIntuitionLayer(CognitiveLayerPtr layer) {
    std::lock_guard<std::mutex> lock(layers_mutex_);
    intuition_layer_ = std::move(layer);
}

// ═══════════════════════════════════════════════════════════════════════════
// INTROSPECTION
// ═══════════════════════════════════════════════════════════════════════════

MetabolicState MetacognitiveOrchestrator::assessMetabolicState() const {
    MetabolicState state;
    state.glycolytic_load = glycolytic_->getCurrentLoad();
    state.lactate_level = lactate_->getLactateLevel();
    state.dreaming_active = dreaming_->isActive();
    state.resource_allocation = glycolytic_->getResourceAllocation();
    return state;
}

SystemHealth MetacognitiveOrchestrator::getSystemHealth() const {
    SystemHealth health;
    health.metabolic_state = assessMetabolicState();
    health.active_streams = getActiveStreamCount();
    health.registered_ai_systems = ai_systems_.size();
    health.scheduler_metrics = glycolytic_->getMetrics();
    health.worker_count = glycolytic_->getWorkerCount();
    health.pending_tasks = glycolytic_->getPendingCount();
    health.cached_partial_results = lactate_->getEntryCount();
    health.pattern_count = dreaming_->getPatternCount();
    health.experience_count = dreaming_->getExperienceCount();
    return health;
}

OrchestratorStats MetacognitiveOrchestrator::getStats() const {
    OrchestratorStats stats;
    stats.contexts_processed = contexts_processed_.load();
    stats.decisions_emitted = decisions_emitted_.load();
    stats.decisions_dropped = decisions_dropped_.load();
    stats.layer_failures = layer_failures_.load();
    stats.ai_system_failures = ai_system_failures_.load();
    stats.archived_results = archived_results_.load();
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (const auto& [key, count] : pending_calls_) {
            stats.pending_calls += count;
        }
    }
    return stats;
}

std::vector<MetacognitiveDecision> MetacognitiveOrchestrator::getRecentDecisions(const std::string& stream_id) const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    auto it = recent_decisions_.find(stream_id);
    if (it == recent_decisions_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::optional<StreamingContext> MetacognitiveOrchestrator::getActiveContext(const std::string& stream_id) const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    auto it = active_contexts_.find(stream_id);
    if (it == active_contexts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PartialResult> MetacognitiveOrchestrator::recoverIncomplete(const std::string& stream_id) const {
    return lactate_->recoveryFromIncomplete(stream_id);
}

std::vector<DreamPattern> MetacognitiveOrchestrator::getDiscoveredPatterns() const {
    return dreaming_->getDiscoveredPatterns();
}

std::vector<json> MetacognitiveOrchestrator::getNovelDiscoveries() const {
    return dreaming_->getNovelDiscoveries();
}

} // namespace morphine
