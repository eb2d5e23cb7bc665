/**
 * Engine.cpp
 *
 * Batch lifecycle: validation, destination preparation, fan-out onto the
 * thread pool, serialized aggregation of progress and outcomes.
 */

#include "Engine.hpp"
#include "CancellationController.hpp"
#include "ConcurrencyLimiter.hpp"
#include "HttpSource.hpp"
#include "TransferWorker.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace qsde::core::transfer {

namespace fs = std::filesystem;

namespace {

uint64_t applyDelta(uint64_t value, int64_t delta) {
    if (delta < 0 && static_cast<uint64_t>(-delta) > value) {
        return 0;
    }
    return static_cast<uint64_t>(static_cast<int64_t>(value) + delta);
}

TaskOutcome failedOutcome(size_t index, const DownloadTask& task, std::string message) {
    TaskOutcome outcome;
    outcome.index = index;
    outcome.url = task.url;
    outcome.destination = task.destination;
    outcome.state = TransferState::Failed;
    outcome.error = ErrorClass::LocalResource;
    outcome.message = std::move(message);
    return outcome;
}

} // namespace

//=============================================================================
// Batch state
//=============================================================================

/**
 * One submitted batch. Counters and outcomes are only touched under `mutex`.
 */
struct Engine::BatchJob {
    BatchJob(std::vector<DownloadTask> batch, size_t capacity)
        : tasks(std::move(batch))
        , limiter(capacity)
        , runnable(tasks.size(), true)
        , outcomes(tasks.size())
        , fileBytes(tasks.size(), 0)
        , fileTotal(tasks.size(), 0) {
        taskSources.reserve(tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            taskSources.push_back(cancellation.deriveTaskSource());
        }
        progress.tasksTotal = tasks.size();
    }

    std::vector<DownloadTask> tasks;
    ConcurrencyLimiter limiter;
    CancellationController cancellation;
    std::vector<CancellationSource> taskSources;
    std::vector<bool> runnable;

    std::mutex mutex;
    ProgressSnapshot progress;
    std::vector<std::optional<TaskOutcome>> outcomes;
    std::vector<uint64_t> fileBytes;
    std::vector<uint64_t> fileTotal;
};

//=============================================================================
// Lifecycle
//=============================================================================

Engine::Engine(EngineConfig config)
    : Engine(std::move(config), nullptr) {}

Engine::Engine(EngineConfig config, std::shared_ptr<NetworkSource> source)
    : m_config(std::move(config))
    , m_source(source ? std::move(source) : std::make_shared<HttpSource>())
    , m_policy(m_config.retry)
    , m_maxConcurrency(std::max<size_t>(1, m_config.maxConcurrency))
    , m_chunkSize(std::max<size_t>(1, m_config.chunkSize))
    , m_network(m_config.network)
    , m_progressBus(m_config.progressQueueCapacity)
    , m_bytesBus(m_config.progressQueueCapacity)
    , m_outcomeBus(m_config.progressQueueCapacity) {

    Logger::instance().debug("Engine created (max concurrency: {}, worker threads: {}, chunk size: {})",
                             m_maxConcurrency.load(), m_config.workerThreads, m_chunkSize.load());
}

Engine::~Engine() {
    cancelAll();
}

//=============================================================================
// Submission
//=============================================================================

BatchSummary Engine::submit(std::vector<DownloadTask> tasks, std::optional<size_t> maxConcurrency) {
    const size_t limit = maxConcurrency.value_or(m_maxConcurrency.load());
    if (limit == 0) {
        throw std::invalid_argument("maxConcurrency must be at least 1");
    }
    for (size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].url.empty() || tasks[i].destination.empty()) {
            throw std::invalid_argument("task " + std::to_string(i) + " needs a url and a destination");
        }
    }

    auto job = std::make_shared<BatchJob>(std::move(tasks), limit);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_job) {
            throw std::logic_error("a batch is already running on this engine");
        }
        m_job = job;
    }

    // Detach the batch however submit() exits
    struct JobReset {
        Engine& engine;
        BatchJob& job;
        ~JobReset() {
            std::lock_guard<std::mutex> jobLock(job.mutex);
            std::lock_guard<std::mutex> lock(engine.m_mutex);
            engine.m_lastProgress = job.progress;
            engine.m_lastPeak = job.limiter.peakActive();
            engine.m_job.reset();
        }
    } reset{*this, *job};

    const auto started = std::chrono::steady_clock::now();
    Logger::instance().info("Batch started: {} task(s), max concurrency {}", job->tasks.size(), limit);

    prepare(*job);

    std::vector<std::pair<size_t, std::future<void>>> futures;
    if (!job->tasks.empty()) {
        ThreadPool pool(std::min(job->tasks.size(), m_config.workerThreads));
        Logger::instance().debug("Running batch on {} worker thread(s)", pool.size());

        for (size_t i = 0; i < job->tasks.size(); ++i) {
            if (!job->runnable[i]) continue;
            // In flight from the moment it is queued, so cancelAll also waits for tasks not yet started
            auto guard = std::make_shared<CancellationController::UnwindGuard>(job->cancellation);
            futures.emplace_back(i, pool.submit([this, job, i, guard]() mutable {
                runTask(job, i);
                guard.reset();
            }));
        }

        for (auto& [index, future] : futures) {
            try {
                future.get();
            } catch (const std::exception& e) {
                Logger::instance().critical("Worker for task {} stopped unexpectedly: {}", index, e.what());
                recordOutcome(*job, failedOutcome(index, job->tasks[index],
                                                  std::string("internal error: ") + e.what()));
            }
        }
    }

    BatchSummary summary = summarize(*job);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    Logger::instance().info("Batch finished in {}ms (peak concurrency {})",
                            elapsed.count(), job->limiter.peakActive());
    return summary;
}

void Engine::prepare(BatchJob& job) {
    for (size_t i = 0; i < job.tasks.size(); ++i) {
        auto& task = job.tasks[i];
        task.destination = utils::PathUtils::sanitizeFilename(task.destination).string();

        if (!m_config.createDirectories) continue;

        const fs::path parent = fs::path(task.destination).parent_path();
        if (parent.empty()) continue;

        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            Logger::instance().error("Cannot create directory {}: {}", parent.string(), ec.message());
            job.runnable[i] = false;
            recordOutcome(job, failedOutcome(i, task,
                                             "cannot create directory " + parent.string() + ": " + ec.message()));
        }
    }
}

void Engine::runTask(const std::shared_ptr<BatchJob>& job, size_t index) {
    WorkerEnvironment environment{
        *m_source,
        m_policy,
        job->limiter,
        [this] { return networkConfig(); },
        [this] { return m_chunkSize.load(); },
        {}
    };
    environment.hooks.onState = [](size_t task, TransferState state) {
        Logger::instance().trace("Task {} -> {}", task, toString(state));
    };
    environment.hooks.onProgress = [this, &job](size_t task, int64_t bytesDelta, int64_t expectedDelta) {
        recordProgress(*job, task, bytesDelta, expectedDelta);
    };

    TransferWorker worker(index, job->tasks[index], std::move(environment),
                          job->taskSources[index].token());
    recordOutcome(*job, worker.run());
}

//=============================================================================
// Aggregation
//=============================================================================

void Engine::recordProgress(BatchJob& job, size_t index, int64_t bytesDelta, int64_t expectedDelta) {
    ProgressSnapshot snapshot;
    std::optional<ByteProgress> fileProgress;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        job.progress.bytesTransferred = applyDelta(job.progress.bytesTransferred, bytesDelta);
        job.progress.bytesExpected = applyDelta(job.progress.bytesExpected, expectedDelta);
        job.fileBytes[index] = applyDelta(job.fileBytes[index], bytesDelta);
        job.fileTotal[index] = applyDelta(job.fileTotal[index], expectedDelta);
        snapshot = job.progress;

        if (bytesDelta > 0) {
            fileProgress = ByteProgress{
                index,
                fs::path(job.tasks[index].destination).filename().string(),
                static_cast<uint64_t>(bytesDelta),
                job.fileBytes[index],
                job.fileTotal[index]
            };
        }
    }

    m_progressBus.publish(snapshot);
    if (fileProgress) {
        m_bytesBus.publish(std::move(*fileProgress));
    }
}

void Engine::recordOutcome(BatchJob& job, TaskOutcome outcome) {
    ProgressSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        auto& slot = job.outcomes.at(outcome.index);
        if (slot) {
            return;
        }
        slot = outcome;
        ++job.progress.tasksFinished;
        snapshot = job.progress;
    }

    m_outcomeBus.publish(std::move(outcome));
    m_progressBus.publish(snapshot);
}

BatchSummary Engine::summarize(BatchJob& job) {
    BatchSummary summary;
    size_t localFailures = 0;

    {
        std::lock_guard<std::mutex> lock(job.mutex);
        summary.submitted = job.tasks.size();
        summary.outcomes.reserve(job.tasks.size());

        for (size_t i = 0; i < job.tasks.size(); ++i) {
            TaskOutcome outcome = job.outcomes[i]
                ? *job.outcomes[i]
                : failedOutcome(i, job.tasks[i], "task produced no outcome");

            switch (outcome.state) {
                case TransferState::Succeeded:
                    ++summary.succeeded;
                    break;
                case TransferState::Cancelled:
                    ++summary.cancelled;
                    break;
                default:
                    ++summary.failed;
                    if (outcome.error == ErrorClass::LocalResource) {
                        ++localFailures;
                    }
                    break;
            }
            summary.outcomes.push_back(std::move(outcome));
        }
    }

    summary.localResourceFailure = localFailures > 0;
    if (summary.localResourceFailure) {
        Logger::instance().critical("Local storage failure on {} task(s); check free space and "
                                    "permissions of the destination volume", localFailures);
    }
    return summary;
}

//=============================================================================
// Runtime control
//=============================================================================

void Engine::setNetworkConfig(const NetworkConfigUpdate& update) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (update.proxy) m_network.proxy = *update.proxy;
    if (update.userAgent) m_network.userAgent = *update.userAgent;
    if (update.timeout) m_network.timeout = *update.timeout;

    Logger::instance().info("Network config updated (proxy: '{}', user agent: '{}', timeout: {}s)",
                            m_network.proxy, m_network.userAgent, m_network.timeout.count());
}

void Engine::setRuntimeConfig(const RuntimeConfigUpdate& update) {
    if (update.maxConcurrency && *update.maxConcurrency == 0) {
        throw std::invalid_argument("maxConcurrency must be at least 1");
    }
    if (update.chunkSizeBytes && *update.chunkSizeBytes == 0) {
        throw std::invalid_argument("chunkSize must be at least 1 byte");
    }

    if (update.chunkSizeBytes) {
        m_chunkSize = *update.chunkSizeBytes;
        Logger::instance().info("Chunk size set to {} bytes", *update.chunkSizeBytes);
    }

    if (update.maxConcurrency) {
        m_maxConcurrency = *update.maxConcurrency;
        if (auto job = currentJob()) {
            job->limiter.setCapacity(*update.maxConcurrency);
        }
        Logger::instance().info("Max concurrency set to {}", *update.maxConcurrency);
    }
}

bool Engine::cancelAll() {
    auto job = currentJob();
    if (!job) {
        Logger::instance().debug("CancelAll: no batch running");
        return true;
    }

    if (job->cancellation.cancelAll()) {
        Logger::instance().info("Cancelling batch ({} worker(s) in flight)", job->cancellation.inFlight());
    }

    if (!job->cancellation.waitForUnwind(m_config.cancelGracePeriod)) {
        Logger::instance().warn("{} worker(s) still unwinding after {}ms",
                                job->cancellation.inFlight(), m_config.cancelGracePeriod.count());
        return false;
    }
    return true;
}

bool Engine::cancelTask(size_t index) {
    auto job = currentJob();
    if (!job || index >= job->taskSources.size()) {
        return false;
    }

    const bool fired = job->taskSources[index].cancel();
    if (fired) {
        Logger::instance().info("Cancelling task {} ({})", index, job->tasks[index].url);
    }
    return fired;
}

//=============================================================================
// Observation
//=============================================================================

SubscriptionPtr Engine::subscribeProgress(ProgressCallback callback) {
    return m_progressBus.subscribe(std::move(callback));
}

SubscriptionPtr Engine::subscribeBytes(ByteProgressCallback callback) {
    return m_bytesBus.subscribe(std::move(callback));
}

SubscriptionPtr Engine::subscribeOutcomes(OutcomeCallback callback) {
    return m_outcomeBus.subscribe(std::move(callback));
}

void Engine::unsubscribe(const SubscriptionPtr& subscription) {
    m_progressBus.unsubscribe(subscription);
    m_bytesBus.unsubscribe(subscription);
    m_outcomeBus.unsubscribe(subscription);
}

bool Engine::flushEvents(std::chrono::milliseconds timeout) {
    const bool progress = m_progressBus.waitIdle(timeout);
    const bool bytes = m_bytesBus.waitIdle(timeout);
    const bool outcomes = m_outcomeBus.waitIdle(timeout);
    return progress && bytes && outcomes;
}

ProgressSnapshot Engine::progress() const {
    if (auto job = currentJob()) {
        std::lock_guard<std::mutex> lock(job->mutex);
        return job->progress;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastProgress;
}

bool Engine::isRunning() const {
    return currentJob() != nullptr;
}

size_t Engine::maxConcurrency() const {
    if (auto job = currentJob()) {
        return job->limiter.capacity();
    }
    return m_maxConcurrency.load();
}

NetworkConfig Engine::networkConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_network;
}

size_t Engine::peakConcurrency() const {
    if (auto job = currentJob()) {
        return job->limiter.peakActive();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastPeak;
}

size_t Engine::droppedEvents() const {
    return m_progressBus.droppedCount() + m_bytesBus.droppedCount() + m_outcomeBus.droppedCount();
}

std::shared_ptr<Engine::BatchJob> Engine::currentJob() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_job;
}

} // namespace qsde::core::transfer
