/**
 * @file GlycolyticCycle.cpp
 * @brief Implémentation du pool de workers auto-dimensionné
 */

#include "GlycolyticCycle.hpp"
#include "Identifiers.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

namespace morphine {

namespace {
// Plancher du temps de traitement pour le score (évite 1/0)
constexpr double MIN_PROCESSING_TIME_S = 1e-3;
}

GlycolyticCycle::GlycolyticCycle(const GlycolyticConfig& config)
    : config_(config)
    , min_workers_((config.validate(), config.resolvedInitialWorkers()))
{
    workers_.reserve(config_.max_workers);
    for (size_t i = 0; i < min_workers_; ++i) {
        workers_.push_back(makeWorker());
    }
}

GlycolyticCycle::~GlycolyticCycle() {
    stop();
}

WorkerState GlycolyticCycle::makeWorker() {
    WorkerState worker;
    worker.worker_id = "worker_" + std::to_string(next_worker_index_++);
    worker.performance_score = 1.0;
    return worker;
}

// ═══════════════════════════════════════════════════════════════════════════
// CYCLE DE VIE
// ═══════════════════════════════════════════════════════════════════════════

void GlycolyticCycle::start() {
    if (running_.exchange(true)) {
        return;
    }
    balancer_thread_ = std::thread(&GlycolyticCycle::balancerLoop, this);
    std::cout << "[GlycolyticCycle] Démarré (" << min_workers_ << " workers, plafond "
              << config_.max_workers << ", période " << config_.balance_period_ms << "ms)" << std::endl;
}

void GlycolyticCycle::stop() {
    const bool was_running = running_.exchange(false);
    loop_cv_.notify_all();

    if (balancer_thread_.joinable()) {
        balancer_thread_.join();
    }

    reapExecutions(true);

    std::vector<PendingTask> cancelled;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        cancelled.swap(queue_);
    }
    for (auto& pending : cancelled) {
        pending.promise->set_value(false);
    }

    if (was_running) {
        std::cout << "[GlycolyticCycle] Arrêté (" << cancelled.size() << " tâches annulées)" << std::endl;
    }
}

void GlycolyticCycle::balancerLoop() {
    while (running_.load()) {
        runCycle();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, config_.balancePeriod(), [this] { return !running_.load(); });
    }
}

void GlycolyticCycle::runCycle() {
    reapExecutions(false);
    balanceLoad();
    updateMetrics();
    autoScale();
}

// ═══════════════════════════════════════════════════════════════════════════
// TÂCHES
// ═══════════════════════════════════════════════════════════════════════════

std::future<bool> GlycolyticCycle::submitTask(Task task) {
    if (task.task_id.empty()) {
        task.task_id = generateId("task");
    }
    if (task.created_at <= 0.0) {
        task.created_at = nowSeconds();
    }

    PendingTask pending;
    pending.task = std::move(task);
    pending.promise = std::make_shared<std::promise<bool>>();
    std::future<bool> result = pending.promise->get_future();

    std::lock_guard<std::mutex> lock(queue_mutex_);
    pending.sequence = next_sequence_++;
    queue_.push_back(std::move(pending));
    return result;
}

void GlycolyticCycle::balanceLoad() {
    std::vector<std::pair<std::string, PendingTask>> assignments;

    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex_);
        if (queue_.empty()) {
            return;
        }

        // Ratio priorité/complexité décroissant, ordre d'arrivée à égalité
        std::sort(queue_.begin(), queue_.end(), [](const PendingTask& a, const PendingTask& b) {
            const double ra = a.task.ratio();
            const double rb = b.task.ratio();
            if (ra != rb) return ra > rb;
            return a.sequence < b.sequence;
        });

        std::unique_lock<std::shared_mutex> pool_lock(pool_mutex_);
        size_t next = 0;
        for (auto& worker : workers_) {
            if (next >= queue_.size()) break;
            if (worker.is_busy) continue;

            PendingTask& pending = queue_[next++];
            worker.is_busy = true;
            worker.current_task = pending.task.task_id;
            worker.resource_usage = pending.task.resource_requirement;
            assignments.emplace_back(worker.worker_id, std::move(pending));
        }
        queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(next));
    }

    for (auto& [worker_id, pending] : assignments) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        Execution execution;
        execution.done = done;
        execution.thread = std::thread(
            [this, worker_id = worker_id, pending = std::move(pending), done]() mutable {
                execute(worker_id, std::move(pending));
                done->store(true);
            });

        std::lock_guard<std::mutex> lock(executions_mutex_);
        executions_.push_back(std::move(execution));
    }
}

void GlycolyticCycle::execute(const std::string& worker_id, PendingTask pending) {
    const auto start = std::chrono::steady_clock::now();
    bool failed = false;

    try {
        if (pending.task.work) {
            pending.task.work();
        } else {
            const double duration = simulatedDuration(pending.task.estimated_time);
            std::this_thread::sleep_for(std::chrono::duration<double>(duration));
        }
    } catch (const std::exception& e) {
        failed = true;
        std::cerr << "[GlycolyticCycle] Tâche " << pending.task.task_id
                  << " en échec sur " << worker_id << ": " << e.what() << "\n";
    } catch (...) {
        failed = true;
        std::cerr << "[GlycolyticCycle] Tâche " << pending.task.task_id
                  << " en échec sur " << worker_id << " (exception inconnue)\n";
    }

    const double processing_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    // Le worker est libéré quelle que soit l'issue
    releaseWorker(worker_id, processing_time, failed);
    pending.promise->set_value(!failed);
}

void GlycolyticCycle::releaseWorker(const std::string& worker_id, double processing_time, bool failed) {
    const double t = std::max(processing_time, MIN_PROCESSING_TIME_S);
    {
        std::unique_lock<std::shared_mutex> lock(pool_mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&](const WorkerState& w) { return w.worker_id == worker_id; });
        if (it != workers_.end()) {
            it->is_busy = false;
            it->current_task.reset();
            it->resource_usage = 0.0;
            it->performance_score = (1.0 - config_.score_smoothing) * it->performance_score
                                    + config_.score_smoothing / t;
        }
    }

    std::lock_guard<std::mutex> lock(metrics_mutex_);
    if (failed) {
        metrics_.tasks_failed++;
    } else {
        metrics_.tasks_completed++;
    }
    if (!latency_initialized_) {
        metrics_.average_latency = processing_time;
        latency_initialized_ = true;
    } else {
        metrics_.average_latency = (1.0 - config_.score_smoothing) * metrics_.average_latency
                                   + config_.score_smoothing * processing_time;
    }
    const size_t total = metrics_.tasks_completed + metrics_.tasks_failed;
    metrics_.error_rate = static_cast<double>(metrics_.tasks_failed) / static_cast<double>(total);
}

void GlycolyticCycle::reapExecutions(bool wait_all) {
    std::list<Execution> finished;
    {
        std::lock_guard<std::mutex> lock(executions_mutex_);
        if (wait_all) {
            finished.swap(executions_);
        } else {
            for (auto it = executions_.begin(); it != executions_.end();) {
                if (it->done->load()) {
                    auto next = std::next(it);
                    finished.splice(finished.end(), executions_, it);
                    it = next;
                } else {
                    ++it;
                }
            }
        }
    }

    for (auto& execution : finished) {
        if (execution.thread.joinable()) {
            execution.thread.join();
        }
    }
}

double GlycolyticCycle::simulatedDuration(double estimated_time) {
    std::uniform_real_distribution<double> dist(0.0, config_.jitter);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return std::max(0.0, estimated_time) * (1.0 + dist(rng_));
}

// ═══════════════════════════════════════════════════════════════════════════
// MÉTRIQUES ET AUTO-SCALING
// ═══════════════════════════════════════════════════════════════════════════

void GlycolyticCycle::updateMetrics() {
    double load = 0.0;
    double throughput = 0.0;
    {
        std::shared_lock<std::shared_mutex> lock(pool_mutex_);
        if (!workers_.empty()) {
            const auto busy = std::count_if(workers_.begin(), workers_.end(),
                                            [](const WorkerState& w) { return w.is_busy; });
            load = static_cast<double>(busy) / static_cast<double>(workers_.size());
            throughput = std::accumulate(workers_.begin(), workers_.end(), 0.0,
                                         [](double acc, const WorkerState& w) {
                                             return acc + w.performance_score;
                                         }) / static_cast<double>(workers_.size());
        }
    }

    current_load_.store(load);

    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.throughput = throughput;
    metrics_.resource_efficiency = load;
}

void GlycolyticCycle::autoScale() {
    const double load = current_load_.load();

    std::unique_lock<std::shared_mutex> lock(pool_mutex_);
    if (load > config_.scale_up_load && workers_.size() < config_.max_workers) {
        workers_.push_back(makeWorker());
    } else if (load < config_.scale_down_load && workers_.size() > min_workers_) {
        // Jamais de préemption : seul un worker libre peut partir
        auto it = std::find_if(workers_.rbegin(), workers_.rend(),
                               [](const WorkerState& w) { return !w.is_busy; });
        if (it != workers_.rend()) {
            workers_.erase(std::next(it).base());
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ALLOCATION
// ═══════════════════════════════════════════════════════════════════════════

GlycolyticCycle::Allocation GlycolyticCycle::computeAllocation(double confidence_level,
                                                               double glycolytic_load) {
    const double base = 1.0 / (1.0 + glycolytic_load);
    return {
        {"cpu", base * (1.0 + confidence_level)},
        {"memory", base * 0.8},
        {"io", base * 0.6}
    };
}

GlycolyticCycle::Allocation GlycolyticCycle::allocateResources(const StreamingContext& context,
                                                               const MetabolicState& metabolic_state) {
    Allocation allocation = computeAllocation(context.confidence_level, metabolic_state.glycolytic_load);

    std::unique_lock<std::shared_mutex> lock(allocation_mutex_);
    resource_allocation_ = allocation;
    return allocation;
}

GlycolyticCycle::Allocation GlycolyticCycle::getResourceAllocation() const {
    std::shared_lock<std::shared_mutex> lock(allocation_mutex_);
    return resource_allocation_;
}

PerformanceMetrics GlycolyticCycle::getMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

std::vector<WorkerState> GlycolyticCycle::getWorkers() const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    return workers_;
}

size_t GlycolyticCycle::getWorkerCount() const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    return workers_.size();
}

size_t GlycolyticCycle::getBusyCount() const {
    std::shared_lock<std::shared_mutex> lock(pool_mutex_);
    return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(),
                                             [](const WorkerState& w) { return w.is_busy; }));
}

size_t GlycolyticCycle::getPendingCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

} // namespace morphine
