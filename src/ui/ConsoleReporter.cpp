#include "ConsoleReporter.hpp"
#include "../core/Logger.hpp"
#include "../core/transfer/Engine.hpp"

namespace qsde::ui {

using namespace core::transfer;
using core::Logger;

ConsoleReporter::ConsoleReporter(Engine& engine, unsigned progressStep)
    : m_engine(engine)
    , m_progressStep(progressStep) {

    m_outcomeSubscription = m_engine.subscribeOutcomes([this](const TaskOutcome& outcome) {
        onOutcome(outcome);
    });

    if (m_progressStep > 0) {
        m_progressSubscription = m_engine.subscribeProgress([this](const ProgressSnapshot& snapshot) {
            onProgress(snapshot);
        });
    }
}

ConsoleReporter::~ConsoleReporter() {
    m_engine.unsubscribe(m_outcomeSubscription);
    m_engine.unsubscribe(m_progressSubscription);
}

void ConsoleReporter::onOutcome(const TaskOutcome& outcome) {
    ++m_outcomesSeen;

    switch (outcome.state) {
        case TransferState::Succeeded:
            Logger::instance().info("Downloaded {} ({} bytes, {} attempt(s))",
                                    outcome.destination, outcome.bytesTransferred, outcome.attempts);
            break;
        case TransferState::Cancelled:
            Logger::instance().info("Cancelled {}", outcome.url);
            break;
        default:
            Logger::instance().error("Failed {} [{}]: {}", outcome.url,
                                     outcome.error ? toString(*outcome.error) : "unknown",
                                     outcome.message);
            break;
    }
}

void ConsoleReporter::onProgress(const ProgressSnapshot& snapshot) {
    if (snapshot.tasksTotal == 0) return;

    // Tasks finished is known up front; bytes only once lengths are announced
    const unsigned percent = static_cast<unsigned>(snapshot.tasksFinished * 100 / snapshot.tasksTotal);
    const unsigned bucket = percent / m_progressStep * m_progressStep;

    unsigned last = m_lastPercent.load();
    while (bucket > last) {
        if (m_lastPercent.compare_exchange_weak(last, bucket)) {
            Logger::instance().info("Progress: {}% ({}/{} tasks, {} bytes)",
                                    bucket, snapshot.tasksFinished, snapshot.tasksTotal,
                                    snapshot.bytesTransferred);
            return;
        }
    }
}

void ConsoleReporter::reportSummary(const BatchSummary& summary) const {
    for (const auto& outcome : summary.outcomes) {
        if (outcome.state != TransferState::Failed) continue;
        Logger::instance().warn("  {} -> {} after {} attempt(s): {}",
                                outcome.url,
                                outcome.error ? toString(*outcome.error) : "unknown",
                                outcome.attempts, outcome.message);
    }

    if (summary.localResourceFailure) {
        Logger::instance().critical("Local storage errors occurred; check disk space and permissions");
    }

    Logger::instance().info("Batch completed. Success: {}, Failed: {}, Cancelled: {}",
                            summary.succeeded, summary.failed, summary.cancelled);
}

} // namespace qsde::ui
