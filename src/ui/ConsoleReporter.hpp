#pragma once

/**
 * ConsoleReporter.hpp
 *
 * Headless progress reporting: turns engine events into log lines.
 */

#include "../core/EventBus.hpp"
#include "../core/transfer/DownloadTask.hpp"

#include <atomic>
#include <cstdint>

namespace qsde::core::transfer {
class Engine;
}

namespace qsde::ui {

/**
 * ConsoleReporter - logs task outcomes, coarse progress and the final summary
 *
 * Subscribes on construction and unsubscribes on destruction. All callbacks
 * run on the engine's event dispatch threads.
 */
class ConsoleReporter {
public:
    /**
     * @param engine Engine to observe; must outlive the reporter
     * @param progressStep Percent step between progress lines (0 = no progress lines)
     */
    explicit ConsoleReporter(core::transfer::Engine& engine, unsigned progressStep = 10);
    ~ConsoleReporter();

    ConsoleReporter(const ConsoleReporter&) = delete;
    ConsoleReporter& operator=(const ConsoleReporter&) = delete;

    /**
     * Log the outcome of a finished batch
     */
    void reportSummary(const core::transfer::BatchSummary& summary) const;

    size_t outcomesSeen() const { return m_outcomesSeen.load(); }

private:
    void onOutcome(const core::transfer::TaskOutcome& outcome);
    void onProgress(const core::transfer::ProgressSnapshot& snapshot);

    core::transfer::Engine& m_engine;
    unsigned m_progressStep;

    core::SubscriptionPtr m_outcomeSubscription;
    core::SubscriptionPtr m_progressSubscription;

    std::atomic<size_t> m_outcomesSeen{0};
    std::atomic<unsigned> m_lastPercent{0};
};

} // namespace qsde::ui
