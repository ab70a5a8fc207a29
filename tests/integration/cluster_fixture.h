#pragma once

#include <gtest/gtest.h>
#include "builtin_programs.h"
#include "loopback_transport.h"
#include "scheduler.h"
#include "vouchrun/job_orchestrator.h"
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace vouchrun {

// Loopback peers, a scheduler and an orchestrator wired together.
// Tests adjust the configs and add peers, then call start().
class ClusterTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_config.latency_margin = std::chrono::milliseconds(500);
        orchestrator_config.default_limits.max_execution_time = std::chrono::milliseconds(2000);
    }

    void TearDown() override {
        orchestrator.reset();
        scheduler.reset();
        transport.reset();
    }

    void start(bool with_transport = true) {
        scheduler = std::make_shared<Scheduler>(scheduler_config,
                                                with_transport ? transport : nullptr);
        orchestrator = std::make_unique<JobOrchestrator>(scheduler, orchestrator_config);
    }

    void add_peer(const std::string& worker_id,
                  PeerBehavior behavior = PeerBehavior::HONEST,
                  double latency_hint_ms = 10.0,
                  int capacity = DEFAULT_WORKER_CAPACITY) {
        LoopbackPeer peer;
        peer.worker_id = worker_id;
        peer.behavior = behavior;
        peer.latency_hint_ms = latency_hint_ms;
        peer.capacity = capacity;
        ASSERT_TRUE(transport->add_peer(peer));
    }

    JobResult wait(const std::string& job_id) {
        auto result = orchestrator->wait_for_result(job_id, std::chrono::seconds(30));
        if (!result) {
            ADD_FAILURE() << "job " << job_id << " did not finish";
            return JobResult{};
        }
        return *result;
    }

    JobResult run(const JobRequest& request) {
        return wait(orchestrator->submit(request));
    }

    JobRequest increment_job(const Bytes& input, const std::string& split = "equal-parts") {
        JobRequest request;
        request.split_strategy = split;
        request.merge_strategy = "concat";
        request.input = input;
        request.module = BuiltInPrograms::increment_bytes().bytecode();
        return request;
    }

    double trust_of(const std::string& worker_id) {
        auto worker = scheduler->registry().get(worker_id);
        return worker ? worker->trust : -1.0;
    }

    static Bytes sample_input(size_t size) {
        Bytes input(size);
        for (size_t i = 0; i < size; ++i) {
            input[i] = static_cast<uint8_t>((i * 7 + 3) & 0xff);
        }
        return input;
    }

    // Sequential reference for increment_bytes
    static Bytes incremented(const Bytes& input) {
        Bytes output = input;
        for (auto& b : output) {
            b = static_cast<uint8_t>(b + 1);
        }
        return output;
    }

    SchedulerConfig scheduler_config;
    OrchestratorConfig orchestrator_config;
    std::shared_ptr<LoopbackTransport> transport = std::make_shared<LoopbackTransport>();
    std::shared_ptr<Scheduler> scheduler;
    std::unique_ptr<JobOrchestrator> orchestrator;
};

} // namespace vouchrun
