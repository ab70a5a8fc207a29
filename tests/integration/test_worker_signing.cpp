#include "cluster_fixture.h"
#include "hash_utils.h"
#include "task_codec.h"
#include "task_hash.h"
#include "worker_identity.h"
#include "worker_node.h"
#include <atomic>
#include <filesystem>
#include <mutex>

namespace vouchrun {
namespace {

enum class Forgery {
    WRONG_KEY,   // Signs with a key other than the one it advertises
    UNSIGNED,    // Advertises a key but never signs
    REPLAYED     // Answers for a different task definition under the same task ID
};

// Single peer that answers synchronously with a doctored attestation
class ForgingTransport : public Transport {
public:
    explicit ForgingTransport(Forgery forgery) : forgery_(forgery) {
        auto advertised = WorkerIdentity::generate();
        advertised_key_ = advertised->get_worker_id();
        switch (forgery) {
            case Forgery::WRONG_KEY:
                node_ = std::make_unique<WorkerNode>("mallory", WorkerIdentity::generate());
                break;
            case Forgery::UNSIGNED:
                node_ = std::make_unique<WorkerNode>("mallory");
                break;
            case Forgery::REPLAYED:
                node_ = std::make_unique<WorkerNode>("mallory", std::move(advertised));
                break;
        }
    }

    std::vector<PeerInfo> connected_workers() override {
        PeerInfo info;
        info.worker_id = "mallory";
        info.capacity = 4;
        info.latency_hint_ms = 1.0;
        info.public_key = advertised_key_;
        return {info};
    }

    bool send_task(const std::string& worker_id, const Bytes& payload) override {
        Task task = TaskCodec::decode_task(payload);
        if (forgery_ == Forgery::REPLAYED) {
            task.ordinal += 1;
        }
        Bytes answer = TaskCodec::encode_result(node_->execute(task));
        sent_++;

        ResultCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(worker_id, task.task_id, answer);
        }
        return true;
    }

    void set_result_callback(ResultCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    size_t sent() const { return sent_; }

private:
    Forgery forgery_;
    std::string advertised_key_;
    std::unique_ptr<WorkerNode> node_;
    std::atomic<size_t> sent_{0};
    std::mutex mutex_;
    ResultCallback callback_;
};

class WorkerSigningIntegrationTest : public ClusterTest {
protected:
    void SetUp() override {
        ClusterTest::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "vouchrun_signing_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        forged_orchestrator.reset();
        forged_scheduler.reset();
        ClusterTest::TearDown();
        std::filesystem::remove_all(test_dir);
    }

    void start_forged(Forgery forgery) {
        forger = std::make_shared<ForgingTransport>(forgery);
        forged_scheduler = std::make_shared<Scheduler>(scheduler_config, forger);
        forged_orchestrator = std::make_unique<JobOrchestrator>(forged_scheduler, orchestrator_config);
    }

    // Runs a one-task job against the forging peer
    std::string run_forged_job(const Bytes& input) {
        std::string job_id = forged_orchestrator->submit(increment_job(input, "fixed-size"));
        auto result = forged_orchestrator->wait_for_result(job_id, std::chrono::seconds(30));
        EXPECT_TRUE(result.has_value());
        if (result) {
            EXPECT_TRUE(result->ok) << result->failure.message;
            EXPECT_EQ(result->output, incremented(input));
        }
        return job_id;
    }

    void expect_rejected_then_local(const std::string& job_id) {
        auto task = forged_orchestrator->details(job_id)->tasks.front();
        EXPECT_EQ(task.worker_id, LOCAL_WORKER_ID);
        EXPECT_EQ(task.attempts, 2);
        EXPECT_EQ(forger->sent(), 1u);

        auto mallory = forged_scheduler->registry().get("mallory");
        ASSERT_TRUE(mallory.has_value());
        EXPECT_NEAR(mallory->trust, 0.45, 1e-9);
        EXPECT_EQ(mallory->failures, 1u);
    }

    std::filesystem::path test_dir;
    std::shared_ptr<ForgingTransport> forger;
    std::shared_ptr<Scheduler> forged_scheduler;
    std::unique_ptr<JobOrchestrator> forged_orchestrator;
};

// ============================================================================
// Forged attestations
// ============================================================================

TEST_F(WorkerSigningIntegrationTest, ResultSignedWithOtherKeyIsRejected) {
    // Given: A peer whose signatures do not match its advertised key
    start_forged(Forgery::WRONG_KEY);

    // When: It returns an otherwise correct result
    std::string job_id = run_forged_job(sample_input(16));

    // Then: The result was rejected and the task re-run locally
    expect_rejected_then_local(job_id);
}

TEST_F(WorkerSigningIntegrationTest, UnsignedResultFromKeyedWorkerIsRejected) {
    start_forged(Forgery::UNSIGNED);

    std::string job_id = run_forged_job(sample_input(16));

    expect_rejected_then_local(job_id);
}

TEST_F(WorkerSigningIntegrationTest, ResultForAnotherTaskIsRejected) {
    // Given: A validly signed result computed for a different task definition
    start_forged(Forgery::REPLAYED);

    // When: It is returned under this task's ID
    std::string job_id = run_forged_job(sample_input(16));

    // Then: The task-hash commitment gives it away
    expect_rejected_then_local(job_id);
}

// ============================================================================
// Honest peers
// ============================================================================

TEST_F(WorkerSigningIntegrationTest, SignedResultsAreAccepted) {
    add_peer("peer-1");
    start();
    scheduler->refresh_workers();
    EXPECT_FALSE(scheduler->registry().get("peer-1")->public_key.empty());

    Bytes input = sample_input(16);
    std::string job_id = orchestrator->submit(increment_job(input, "fixed-size"));
    JobResult result = wait(job_id);

    ASSERT_TRUE(result.ok) << result.failure.message;
    EXPECT_EQ(orchestrator->details(job_id)->tasks.front().worker_id, "peer-1");
    EXPECT_NEAR(trust_of("peer-1"), 0.55, 1e-9);
}

TEST_F(WorkerSigningIntegrationTest, UnsignedWorkerIsAcceptedOnTaskHashAlone) {
    // Given: A peer that advertises no key
    LoopbackPeer peer;
    peer.worker_id = "plain";
    peer.sign_results = false;
    ASSERT_TRUE(transport->add_peer(peer));
    start();

    Bytes input = sample_input(16);
    std::string job_id = orchestrator->submit(increment_job(input, "fixed-size"));
    JobResult result = wait(job_id);

    // Then: Its results are checked by commitment and digest only
    ASSERT_TRUE(result.ok) << result.failure.message;
    EXPECT_EQ(orchestrator->details(job_id)->tasks.front().worker_id, "plain");
    EXPECT_TRUE(scheduler->registry().get("plain")->public_key.empty());
}

// ============================================================================
// Worker node
// ============================================================================

TEST_F(WorkerSigningIntegrationTest, NodeAttestsWhatItRan) {
    // Given: A worker node with its own key
    auto identity = WorkerIdentity::generate();
    ASSERT_NE(identity, nullptr);
    WorkerNode node("node-1", std::move(identity));

    Task task;
    task.task_id = "job:0";
    task.job_id = "job";
    task.input = {1, 2, 3};
    task.module = BuiltInPrograms::increment_bytes().bytecode();
    task.module_hash = HashUtils::sha256(task.module);

    // When: It handles the task payload
    ExecutionResult result = TaskCodec::decode_result(node.handle(TaskCodec::encode_task(task)));

    // Then: The result is bound to the task and signed by the node
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, (Bytes{2, 3, 4}));
    EXPECT_EQ(result.task_hash, task_hash(task));
    EXPECT_TRUE(WorkerIdentity::verify_attestation(result, node.public_key()));
}

TEST_F(WorkerSigningIntegrationTest, NodeRefusesModuleWithWrongHash) {
    WorkerNode node("node-1", WorkerIdentity::generate());

    Task task;
    task.task_id = "job:0";
    task.module = BuiltInPrograms::increment_bytes().bytecode();
    task.module_hash = HashUtils::sha256_string("not the module");

    ExecutionResult result = node.execute(task);

    EXPECT_EQ(result.outcome, OutcomeKind::TRAPPED);
    EXPECT_NE(result.error.find("hash"), std::string::npos);
    // Still attested, so the refusal itself is verifiable
    EXPECT_TRUE(WorkerIdentity::verify_attestation(result, node.public_key()));
}

TEST_F(WorkerSigningIntegrationTest, NodeKeySurvivesRestart) {
    // Given: A node key saved to disk
    auto identity = WorkerIdentity::generate();
    ASSERT_NE(identity, nullptr);
    std::string keyfile = (test_dir / "worker_key.pem").string();
    ASSERT_TRUE(identity->save_to_file(keyfile));
    std::string advertised = identity->get_worker_id();

    // When: The node restarts from the key file
    auto reloaded = WorkerIdentity::from_keyfile(keyfile);
    ASSERT_NE(reloaded, nullptr);
    WorkerNode node("node-1", std::move(reloaded));

    Task task;
    task.task_id = "job:0";
    task.input = {9};
    task.module = BuiltInPrograms::increment_bytes().bytecode();
    task.module_hash = HashUtils::sha256(task.module);
    ExecutionResult result = node.execute(task);

    // Then: Results it signs still verify against the key peers know
    EXPECT_EQ(node.public_key(), advertised);
    EXPECT_TRUE(WorkerIdentity::verify_attestation(result, advertised));
}

} // namespace
} // namespace vouchrun
