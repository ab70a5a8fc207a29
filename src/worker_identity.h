#pragma once

#include <string>
#include <vector>
#include <memory>

namespace vouchrun {

struct ExecutionResult;

// Peer identity used to attest execution results (Ed25519)
class WorkerIdentity {
public:
    // Load identity from private key file (PEM format)
    static std::unique_ptr<WorkerIdentity> from_keyfile(const std::string& keyfile_path);

    // Generate new identity (creates new Ed25519 keypair)
    static std::unique_ptr<WorkerIdentity> generate();

    // Worker ID is the base64-encoded public key
    std::string get_worker_id() const;

    std::vector<unsigned char> get_public_key() const;

    // Sign data and return base64-encoded signature, empty on failure
    std::string sign(const std::string& data) const;

    // Fill result.signature with a signature over result.attestation()
    bool attest(ExecutionResult& result) const;

    static bool verify(
        const std::string& data,
        const std::string& signature_b64,
        const std::string& public_key_b64
    );

    // Check result.signature against a worker's registered key
    static bool verify_attestation(const ExecutionResult& result,
                                   const std::string& public_key_b64);

    bool save_to_file(const std::string& filepath) const;

private:
    WorkerIdentity() = default;

    std::vector<unsigned char> private_key_;  // 32 bytes for Ed25519
    std::vector<unsigned char> public_key_;   // 32 bytes for Ed25519
};

} // namespace vouchrun
