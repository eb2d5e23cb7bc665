#pragma once

/**
 * Engine.hpp
 *
 * Batch transfer engine. Accepts a batch of tasks, admits them through a
 * concurrency limiter onto a bounded thread pool and aggregates their
 * terminal outcomes.
 */

#include "DownloadTask.hpp"
#include "EngineConfig.hpp"
#include "NetworkSource.hpp"
#include "RetryPolicy.hpp"
#include "../EventBus.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace qsde::core::transfer {

/**
 * Engine - concurrent transfer orchestrator
 *
 * Features:
 * - Bounded FIFO admission (live-adjustable limit)
 * - Staged writes published atomically after digest verification
 * - Classified retries with exponential backoff
 * - Batch-wide and per-task cancellation
 * - Non-blocking progress channels (aggregate, per file, outcomes)
 *
 * One batch runs at a time per instance. Every method other than submit()
 * may be called from any thread while a batch runs.
 */
class Engine {
public:
    using ProgressCallback = std::function<void(const ProgressSnapshot&)>;
    using ByteProgressCallback = std::function<void(const ByteProgress&)>;
    using OutcomeCallback = std::function<void(const TaskOutcome&)>;

    /**
     * Constructor using the HTTP transport
     * @param config Engine settings
     */
    explicit Engine(EngineConfig config = {});

    /**
     * Constructor with an explicit transport
     * @param config Engine settings
     * @param source Transport shared by all workers (nullptr = HTTP)
     */
    Engine(EngineConfig config, std::shared_ptr<NetworkSource> source);

    /**
     * Destructor - cancels a running batch
     */
    ~Engine();

    // Disable copy
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Run a batch to completion
     * @param tasks Tasks, copied on entry
     * @param maxConcurrency Admission limit for this batch (default: current setting)
     * @return Per-task outcomes and counts, in submission order
     * @throws std::invalid_argument on a zero limit or a task without url/destination
     * @throws std::logic_error when a batch is already running
     */
    BatchSummary submit(std::vector<DownloadTask> tasks,
                        std::optional<size_t> maxConcurrency = std::nullopt);

    /**
     * Update network settings for network operations started afterwards
     */
    void setNetworkConfig(const NetworkConfigUpdate& update);

    /**
     * Update the admission limit and chunk size, effective immediately
     * @throws std::invalid_argument on a zero limit or chunk size
     */
    void setRuntimeConfig(const RuntimeConfigUpdate& update);

    /**
     * Cancel every task of the running batch and wait, up to the grace
     * period, for in-flight workers to unwind. Idempotent; safe to call
     * from several threads at once. No-op when no batch runs.
     * @return false if some workers were still unwinding after the grace period
     */
    bool cancelAll();

    /**
     * Cancel one task of the running batch
     * @param index Position of the task in the submitted batch
     * @return true if the task exists and was not already cancelled
     */
    bool cancelTask(size_t index);

    /**
     * Subscribe to aggregate progress snapshots
     */
    SubscriptionPtr subscribeProgress(ProgressCallback callback);

    /**
     * Subscribe to per-file byte progress
     */
    SubscriptionPtr subscribeBytes(ByteProgressCallback callback);

    /**
     * Subscribe to terminal task outcomes
     */
    SubscriptionPtr subscribeOutcomes(OutcomeCallback callback);

    /**
     * Unsubscribe from any channel
     */
    void unsubscribe(const SubscriptionPtr& subscription);

    /**
     * Wait until queued progress events have been delivered
     * @return true if every channel drained in time
     */
    bool flushEvents(std::chrono::milliseconds timeout);

    /**
     * Progress of the running batch, or the final progress of the last one
     */
    ProgressSnapshot progress() const;

    bool isRunning() const;

    // Admission limit of the running batch, or the default for the next one
    size_t maxConcurrency() const;
    size_t chunkSize() const { return m_chunkSize.load(); }
    NetworkConfig networkConfig() const;
    const EngineConfig& config() const { return m_config; }

    // Highest number of simultaneously admitted tasks in the last batch
    size_t peakConcurrency() const;

    // Progress events dropped because a channel overflowed
    size_t droppedEvents() const;

private:
    struct BatchJob;

    void prepare(BatchJob& job);
    void runTask(const std::shared_ptr<BatchJob>& job, size_t index);
    void recordProgress(BatchJob& job, size_t index, int64_t bytesDelta, int64_t expectedDelta);
    void recordOutcome(BatchJob& job, TaskOutcome outcome);
    BatchSummary summarize(BatchJob& job);

    std::shared_ptr<BatchJob> currentJob() const;

private:
    EngineConfig m_config;
    std::shared_ptr<NetworkSource> m_source;
    RetryPolicy m_policy;

    std::atomic<size_t> m_maxConcurrency;
    std::atomic<size_t> m_chunkSize;

    mutable std::mutex m_mutex;
    NetworkConfig m_network;
    std::shared_ptr<BatchJob> m_job;
    ProgressSnapshot m_lastProgress;
    size_t m_lastPeak{0};

    EventBus<ProgressSnapshot> m_progressBus;
    EventBus<ByteProgress> m_bytesBus;
    EventBus<TaskOutcome> m_outcomeBus;
};

} // namespace qsde::core::transfer
