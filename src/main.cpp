/*
 * vouchrun - Verified distributed compute over untrusted peers
 * Split, sandbox, verify, merge
 */

#include "builtin_programs.h"
#include "config.h"
#include "loopback_transport.h"
#include "scheduler.h"
#include "worker_identity.h"
#include "vouchrun/job_orchestrator.h"
#include "vouchrun/strategy.h"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace vouchrun;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config FILE       Load JSON configuration\n"
              << "  --worker-key FILE   Load worker identity (PEM)\n"
              << "  --generate-key      Generate a worker identity and save it\n"
              << "  --peers N           Loopback peers for the demo (default 3)\n"
              << "  --demo              Run demo jobs over loopback peers\n";
}

int write_new_key(const std::string& keyfile) {
    auto identity = WorkerIdentity::generate();
    if (!identity) {
        std::cerr << "❌ Ed25519 key generation failed" << std::endl;
        return 1;
    }
    if (!identity->save_to_file(keyfile)) {
        std::cerr << "❌ Could not write " << keyfile << std::endl;
        return 1;
    }
    std::cout << "✅ Worker key written to " << keyfile << std::endl;
    std::cout << "   Public key: " << identity->get_worker_id() << std::endl;
    return 0;
}

bool report(JobOrchestrator& orchestrator, const std::string& job_id, const char* label) {
    auto result = orchestrator.wait_for_result(job_id, std::chrono::minutes(5));
    if (!result) {
        std::cerr << "❌ " << label << ": no result" << std::endl;
        return false;
    }
    if (!result->ok) {
        std::cerr << "❌ " << label << " failed: " << to_string(result->failure.kind)
                  << " (" << result->failure.message << ")" << std::endl;
        return false;
    }
    std::cout << "✅ " << label << " completed, " << result->output.size() << " bytes" << std::endl;
    return true;
}

int run_demo(const Config& config, int peer_count) {
    auto transport = std::make_shared<LoopbackTransport>();
    for (int i = 1; i <= peer_count; ++i) {
        LoopbackPeer peer;
        peer.worker_id = "peer-" + std::to_string(i);
        peer.latency_hint_ms = 10.0 * i;
        // With three or more peers the fastest one tampers with its output
        if (peer_count >= 3 && i == 1) {
            peer.behavior = PeerBehavior::CORRUPT_OUTPUT;
        }
        if (!transport->add_peer(peer)) {
            std::cerr << "❌ Failed to start " << peer.worker_id << std::endl;
            return 1;
        }
        std::cout << "   " << peer.worker_id << " (" << to_string(peer.behavior) << ")" << std::endl;
    }

    auto scheduler = std::make_shared<Scheduler>(config.scheduler, transport, config.sandbox);
    JobOrchestrator orchestrator(scheduler, config.orchestrator);

    bool ok = true;

    // Byte transform split into equal parts
    {
        Bytes input;
        for (int i = 0; i < 1024; ++i) {
            input.push_back(static_cast<uint8_t>(i & 0xff));
        }
        std::string job_id = orchestrator.submit("equal-parts", "concat", input,
                                                 BuiltInPrograms::increment_bytes().bytecode());
        ok = report(orchestrator, job_id, "increment-bytes") && ok;
    }

    // Matrix product by row blocks, committed with a Merkle root
    {
        Matrix a{3, 2, {1, 2, 3, 4, 5, 6}};
        Matrix b{2, 2, {7, 8, 9, 10}};
        Bytes input = a.encode();
        b.append_to(input);

        JobRequest request;
        request.split_strategy = "matrix-rows";
        request.merge_strategy = "matrix-rows";
        request.input = input;
        request.module = BuiltInPrograms::matrix_multiply().bytecode();
        request.verification = VerificationMode::MERKLE;
        std::string job_id = orchestrator.submit(request);
        if (report(orchestrator, job_id, "matrix-multiply")) {
            auto result = orchestrator.get_result(job_id);
            Matrix c;
            size_t offset = 0;
            if (result && Matrix::read(result->output, offset, c)) {
                for (int64_t r = 0; r < c.rows; ++r) {
                    std::cout << "   ";
                    for (int64_t col = 0; col < c.cols; ++col) {
                        std::cout << c.at(r, col) << " ";
                    }
                    std::cout << std::endl;
                }
            }
            auto details = orchestrator.details(job_id);
            if (details) {
                std::cout << "   Merkle root: " << details->merkle_root << std::endl;
            }
        } else {
            ok = false;
        }
    }

    std::cout << "------------------------------------------------" << std::endl;
    for (const auto& worker : scheduler->registry().snapshot()) {
        std::cout << "   " << worker.worker_id << " trust=" << worker.trust
                  << " status=" << to_string(worker.status)
                  << " ok=" << worker.successes << " failed=" << worker.failures << std::endl;
    }
    return ok ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string worker_key_file;
    bool generate_key = false;
    bool demo = false;
    int peer_count = 3;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--worker-key" && i + 1 < argc) {
            worker_key_file = argv[++i];
        } else if (arg == "--generate-key") {
            generate_key = true;
        } else if (arg == "--peers" && i + 1 < argc) {
            peer_count = std::atoi(argv[++i]);
        } else if (arg == "--demo") {
            demo = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (generate_key) {
        return write_new_key(worker_key_file.empty() ? "worker_key.pem" : worker_key_file);
    }

    std::unique_ptr<WorkerIdentity> worker_identity;
    if (!worker_key_file.empty()) {
        worker_identity = WorkerIdentity::from_keyfile(worker_key_file);
        if (!worker_identity) {
            std::cerr << "❌ Could not read an Ed25519 key from " << worker_key_file << std::endl;
            std::cerr << "   Create one with --generate-key --worker-key " << worker_key_file << std::endl;
            return 1;
        }
    }

    Config config;
    if (!config_file.empty()) {
        try {
            config = ConfigLoader::from_file(config_file);
        } catch (const std::runtime_error& e) {
            std::cerr << "❌ " << e.what() << std::endl;
            return 1;
        }
    }

    std::cout << "vouchrun - Verified Distributed Compute" << std::endl;
    std::cout << "   Split • Sandbox • Verify • Merge" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::cout << "Results: "
              << (worker_identity ? "signed by " + worker_identity->get_worker_id()
                                  : std::string("unsigned (no worker key)"))
              << std::endl;
    std::cout << "Verification: " << to_string(config.orchestrator.default_mode)
              << ", redundancy x" << config.scheduler.redundancy_factor
              << ", retries " << config.scheduler.max_retries
              << ", local fallback " << (config.scheduler.local_fallback ? "on" : "off") << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    if (!demo) {
        std::cout << "No network transport is configured; run with --demo to execute"
                  << " jobs over in-process peers." << std::endl;
        return 0;
    }

    if (peer_count < 0) {
        std::cerr << "❌ --peers must be non-negative" << std::endl;
        return 1;
    }
    std::cout << "Starting " << peer_count << " loopback peer(s)" << std::endl;

    try {
        return run_demo(config, peer_count);
    } catch (const std::exception& e) {
        std::cerr << "❌ Demo failed: " << e.what() << std::endl;
        return 1;
    }
}
