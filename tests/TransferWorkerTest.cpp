#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/transfer/TransferWorker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace qsde::core::transfer;
using namespace qsde::test;
using namespace std::chrono_literals;

class TransferWorkerTest : public ::testing::Test {
protected:
    std::unique_ptr<TransferWorker> makeWorker(const DownloadTask& task,
                                               CancellationToken token = {}) {
        WorkerEnvironment environment{
            m_source,
            m_policy,
            m_limiter,
            [this] { return m_network; },
            [this] { return m_chunkSize.load(); },
            {}
        };
        environment.hooks.onState = [this](size_t, TransferState state) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_states.push_back(state);
        };
        environment.hooks.onProgress = [this](size_t, int64_t bytes, int64_t expected) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_byteDeltas.push_back(bytes);
            m_bytesNet += bytes;
            m_expectedNet += expected;
        };
        return std::make_unique<TransferWorker>(0, task, std::move(environment), std::move(token));
    }

    std::vector<TransferState> states() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_states;
    }

    TempDir m_dir;
    MockSource m_source;
    RetryPolicy m_policy{fastRetry()};
    ConcurrencyLimiter m_limiter{4};
    NetworkConfig m_network;
    std::atomic<size_t> m_chunkSize{1024};

    std::mutex m_mutex;
    std::vector<TransferState> m_states;
    std::vector<int64_t> m_byteDeltas;
    int64_t m_bytesNet{0};
    int64_t m_expectedNet{0};
};

//=============================================================================
// State machine
//=============================================================================

TEST(TransferStateMachineTest, ForwardTransitionsOnly) {
    EXPECT_TRUE(canTransition(TransferState::Pending, TransferState::Active));
    EXPECT_TRUE(canTransition(TransferState::Active, TransferState::Verifying));
    EXPECT_TRUE(canTransition(TransferState::Verifying, TransferState::Publishing));
    EXPECT_TRUE(canTransition(TransferState::Publishing, TransferState::Succeeded));

    EXPECT_FALSE(canTransition(TransferState::Pending, TransferState::Verifying));
    EXPECT_FALSE(canTransition(TransferState::Pending, TransferState::Succeeded));
    EXPECT_FALSE(canTransition(TransferState::Active, TransferState::Publishing));
    EXPECT_FALSE(canTransition(TransferState::Active, TransferState::Succeeded));
    EXPECT_FALSE(canTransition(TransferState::Publishing, TransferState::Active));
}

TEST(TransferStateMachineTest, RetryReentersActive) {
    EXPECT_TRUE(canTransition(TransferState::Active, TransferState::Active));
    EXPECT_TRUE(canTransition(TransferState::Verifying, TransferState::Active));
}

TEST(TransferStateMachineTest, TerminalStatesAreFinal) {
    for (auto terminal : {TransferState::Succeeded, TransferState::Failed, TransferState::Cancelled}) {
        for (auto next : {TransferState::Pending, TransferState::Active, TransferState::Verifying,
                          TransferState::Publishing, TransferState::Succeeded, TransferState::Failed,
                          TransferState::Cancelled}) {
            EXPECT_FALSE(canTransition(terminal, next)) << toString(terminal) << " -> " << toString(next);
        }
    }
}

TEST(TransferStateMachineTest, AnyLiveStateMayFailOrCancel) {
    for (auto live : {TransferState::Pending, TransferState::Active, TransferState::Verifying,
                      TransferState::Publishing}) {
        EXPECT_TRUE(canTransition(live, TransferState::Failed));
        EXPECT_TRUE(canTransition(live, TransferState::Cancelled));
    }
}

//=============================================================================
// Transfers
//=============================================================================

TEST_F(TransferWorkerTest, SuccessfulTransferPublishesVerifiedFile) {
    const std::string payload = makePayload(10000);
    m_source.serve("https://example.test/a.bin", payload);

    DownloadTask task("https://example.test/a.bin", m_dir.file("a.bin").string(), sha256(payload));
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Succeeded);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.bytesTransferred, payload.size());
    EXPECT_EQ(readFile(m_dir.file("a.bin")), payload);
    EXPECT_EQ(m_dir.stagedFiles(), 0u);

    EXPECT_EQ(states(), (std::vector<TransferState>{
        TransferState::Active, TransferState::Verifying,
        TransferState::Publishing, TransferState::Succeeded}));
    EXPECT_EQ(m_bytesNet, static_cast<int64_t>(payload.size()));
    EXPECT_EQ(m_expectedNet, static_cast<int64_t>(payload.size()));
}

TEST_F(TransferWorkerTest, TaskWithoutDigestSkipsVerification) {
    m_source.serve("https://example.test/plain", "plain body");

    auto worker = makeWorker(DownloadTask("https://example.test/plain", m_dir.file("plain").string()));
    EXPECT_EQ(worker->run().state, TransferState::Succeeded);
    EXPECT_EQ(readFile(m_dir.file("plain")), "plain body");
}

TEST_F(TransferWorkerTest, PermanentRemoteErrorIsNeverRetried) {
    DownloadTask task("https://example.test/missing", m_dir.file("missing").string());
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, ErrorClass::PermanentRemote);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(m_source.attempts(task.url), 1);
    EXPECT_FALSE(fs::exists(task.destination));
    EXPECT_EQ(m_dir.stagedFiles(), 0u);
}

TEST_F(TransferWorkerTest, IntegrityMismatchRefetchesAndSucceeds) {
    const std::string payload = makePayload(5000);
    MockSource::Script script;
    script.body = payload;
    script.corruptAttempts = 1;
    m_source.serve("https://example.test/c.bin", script);

    DownloadTask task("https://example.test/c.bin", m_dir.file("c.bin").string(), sha256(payload));
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Succeeded);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(worker->retryContext().integrityFailures, 1);
    EXPECT_EQ(readFile(task.destination), payload);
    EXPECT_EQ(m_dir.stagedFiles(), 0u);

    // Bytes of the rejected attempt were rolled back
    EXPECT_EQ(m_bytesNet, static_cast<int64_t>(payload.size()));
}

TEST_F(TransferWorkerTest, CorruptByteNeverReachesDestination) {
    const std::string payload = makePayload(3000);
    MockSource::Script script;
    script.body = payload;
    script.corruptAttempts = 100;
    m_source.serve("https://example.test/bad.bin", script);

    DownloadTask task("https://example.test/bad.bin", m_dir.file("bad.bin").string(), sha256(payload));
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Failed);
    EXPECT_EQ(outcome.error, ErrorClass::IntegrityMismatch);
    EXPECT_EQ(outcome.attempts, m_policy.settings().maxIntegrityAttempts);
    EXPECT_FALSE(fs::exists(task.destination));
    EXPECT_EQ(m_dir.stagedFiles(), 0u);
}

TEST_F(TransferWorkerTest, TransientFailuresAreRetried) {
    MockSource::Script script;
    script.body = "eventually";
    script.failures = {transientFailure(), httpFailure(503)};
    m_source.serve("https://example.test/flaky", script);

    DownloadTask task("https://example.test/flaky", m_dir.file("flaky").string(), sha256("eventually"));
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Succeeded);
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_GT(outcome.totalBackoff.count(), 0);
    EXPECT_GE(worker->retryContext().lastDelay, m_policy.settings().initialDelay);
}

TEST_F(TransferWorkerTest, TransientFailuresExhaustAttempts) {
    MockSource::Script script;
    script.body = "never";
    script.failures = {transientFailure(), transientFailure(), transientFailure(), transientFailure()};
    m_source.serve("https://example.test/down", script);

    DownloadTask task("https://example.test/down", m_dir.file("down").string());
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Failed);
    EXPECT_EQ(outcome.error, ErrorClass::Transient);
    EXPECT_EQ(outcome.attempts, m_policy.settings().maxAttempts);
    EXPECT_EQ(m_source.attempts(task.url), m_policy.settings().maxAttempts);
}

TEST_F(TransferWorkerTest, MissingDirectoryIsLocalResourceFailure) {
    m_source.serve("https://example.test/x", "x");

    DownloadTask task("https://example.test/x", (m_dir.path() / "no" / "such" / "x").string());
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Failed);
    EXPECT_EQ(outcome.error, ErrorClass::LocalResource);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(m_source.attempts(task.url), 0);
}

TEST_F(TransferWorkerTest, RenameFailureIsFatalAndDiscardsStagedFile) {
    // A non-empty directory in place of the destination makes rename fail
    const auto destination = m_dir.file("occupied");
    fs::create_directories(destination);
    writeFile(destination / "keep", "existing");

    const std::string payload = makePayload(3000);
    m_source.serve("https://example.test/occupied", payload);

    DownloadTask task("https://example.test/occupied", destination.string(), sha256(payload));
    auto worker = makeWorker(task);
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Failed);
    EXPECT_EQ(outcome.error, ErrorClass::LocalResource);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(m_source.attempts(task.url), 1);
    EXPECT_EQ(states(), (std::vector<TransferState>{
        TransferState::Active, TransferState::Verifying,
        TransferState::Publishing, TransferState::Failed}));

    EXPECT_EQ(m_dir.stagedFiles(), 0u);
    EXPECT_TRUE(fs::is_directory(destination));
    EXPECT_EQ(readFile(destination / "keep"), "existing");
    EXPECT_EQ(m_bytesNet, 0);
}

TEST(HttpStatusClassificationTest, RetryableAndPermanentStatuses) {
    struct Case {
        int status;
        ErrorClass expected;
    };
    const Case cases[] = {
        {400, ErrorClass::PermanentRemote},
        {403, ErrorClass::PermanentRemote},
        {404, ErrorClass::PermanentRemote},
        {408, ErrorClass::Transient},
        {429, ErrorClass::Transient},
        {500, ErrorClass::Transient},
        {503, ErrorClass::Transient},
        {0, ErrorClass::Transient},
    };

    for (const auto& c : cases) {
        EXPECT_EQ(classifyHttpStatus(c.status), c.expected) << "HTTP " << c.status;
    }

    EXPECT_TRUE(isSuccessStatus(200));
    EXPECT_TRUE(isSuccessStatus(206));
    EXPECT_FALSE(isSuccessStatus(304));
    EXPECT_FALSE(isSuccessStatus(0));
}

TEST_F(TransferWorkerTest, WritesFollowChunkSize) {
    m_chunkSize = 10;
    const std::string payload = makePayload(95);
    m_source.serve("https://example.test/chunks", payload);

    auto worker = makeWorker(DownloadTask("https://example.test/chunks", m_dir.file("chunks").string()));
    EXPECT_EQ(worker->run().state, TransferState::Succeeded);

    std::vector<int64_t> writes;
    for (int64_t delta : m_byteDeltas) {
        if (delta > 0) writes.push_back(delta);
    }
    ASSERT_EQ(writes.size(), 10u);
    EXPECT_EQ(writes.back(), 5);
    for (size_t i = 0; i + 1 < writes.size(); ++i) {
        EXPECT_EQ(writes[i], 10);
    }
}

TEST_F(TransferWorkerTest, NetworkSettingsReadPerAttempt) {
    m_network.userAgent = "qsde-test/2.0";
    m_network.proxy = "http://proxy.local:3128";
    m_source.serve("https://example.test/ua", "ua");

    auto worker = makeWorker(DownloadTask("https://example.test/ua", m_dir.file("ua").string()));
    worker->run();

    auto requests = m_source.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].network.userAgent, "qsde-test/2.0");
    EXPECT_EQ(requests[0].network.proxy, "http://proxy.local:3128");
}

//=============================================================================
// Cancellation
//=============================================================================

TEST_F(TransferWorkerTest, CancelDuringTransferDiscardsStagedFile) {
    MockSource::Script script;
    script.body = makePayload(64 * 1024);
    script.blockSize = 1024;
    script.blockUntilCancelled = true;
    m_source.serve("https://example.test/slow", script);
    m_chunkSize = 256;

    CancellationSource source;
    DownloadTask task("https://example.test/slow", m_dir.file("slow").string());
    auto worker = makeWorker(task, source.token());

    TaskOutcome outcome;
    std::thread runner([&] { outcome = worker->run(); });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (m_source.active() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(m_source.active(), 1u);
    EXPECT_EQ(m_dir.stagedFiles(), 1u);

    source.cancel();
    runner.join();

    EXPECT_EQ(outcome.state, TransferState::Cancelled);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_FALSE(fs::exists(task.destination));
    EXPECT_EQ(m_dir.stagedFiles(), 0u);
    EXPECT_EQ(m_bytesNet, 0);
    EXPECT_EQ(m_limiter.active(), 0u);
}

TEST_F(TransferWorkerTest, CancelDuringBackoffWinsOverRetry) {
    RetrySettings slow = fastRetry();
    slow.initialDelay = 10s;
    slow.maxDelay = 10s;
    m_policy = RetryPolicy(slow);

    MockSource::Script script;
    script.body = "late";
    script.failures = {transientFailure()};
    m_source.serve("https://example.test/backoff", script);

    CancellationSource source;
    DownloadTask task("https://example.test/backoff", m_dir.file("backoff").string());
    auto worker = makeWorker(task, source.token());

    TaskOutcome outcome;
    std::thread runner([&] { outcome = worker->run(); });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (m_source.attempts(task.url) == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(20ms);

    const auto cancelledAt = std::chrono::steady_clock::now();
    source.cancel();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - cancelledAt, 2s);
    EXPECT_EQ(outcome.state, TransferState::Cancelled);
    EXPECT_EQ(m_source.attempts(task.url), 1);
}

TEST_F(TransferWorkerTest, CancelledBeforeAdmissionNeverFetches) {
    m_source.serve("https://example.test/early", "early");

    CancellationSource source;
    source.cancel();

    DownloadTask task("https://example.test/early", m_dir.file("early").string());
    auto worker = makeWorker(task, source.token());
    TaskOutcome outcome = worker->run();

    EXPECT_EQ(outcome.state, TransferState::Cancelled);
    EXPECT_EQ(outcome.attempts, 0);
    EXPECT_EQ(m_source.attempts(task.url), 0);
    EXPECT_EQ(states(), (std::vector<TransferState>{TransferState::Cancelled}));
}
