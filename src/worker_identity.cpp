#include "worker_identity.h"
#include "hash_utils.h"
#include "vouchrun/types.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <cstdio>

namespace vouchrun {

namespace {

constexpr size_t ED25519_KEY_BYTES = 32;
constexpr size_t ED25519_SIGNATURE_BYTES = 64;

struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct FileCloser {
    void operator()(FILE* fp) const { fclose(fp); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using FilePtr = std::unique_ptr<FILE, FileCloser>;

const unsigned char* as_bytes(const std::string& data) {
    return reinterpret_cast<const unsigned char*>(data.data());
}

// Copy raw key material out of an Ed25519 key; false if it is not one
bool extract_keys(EVP_PKEY* pkey,
                  std::vector<unsigned char>& public_key,
                  std::vector<unsigned char>& private_key) {
    if (EVP_PKEY_id(pkey) != EVP_PKEY_ED25519) {
        return false;
    }
    size_t public_len = ED25519_KEY_BYTES;
    size_t private_len = ED25519_KEY_BYTES;
    public_key.assign(public_len, 0);
    private_key.assign(private_len, 0);
    if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_len) <= 0 ||
        EVP_PKEY_get_raw_private_key(pkey, private_key.data(), &private_len) <= 0) {
        public_key.clear();
        private_key.clear();
        return false;
    }
    return true;
}

PkeyPtr private_pkey(const std::vector<unsigned char>& private_key) {
    return PkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                private_key.data(), private_key.size()));
}

} // namespace

std::unique_ptr<WorkerIdentity> WorkerIdentity::generate() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return nullptr;
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return nullptr;
    }
    PkeyPtr pkey(raw);

    std::unique_ptr<WorkerIdentity> identity(new WorkerIdentity());
    if (!extract_keys(pkey.get(), identity->public_key_, identity->private_key_)) {
        return nullptr;
    }
    return identity;
}

std::unique_ptr<WorkerIdentity> WorkerIdentity::from_keyfile(const std::string& keyfile_path) {
    FilePtr fp(fopen(keyfile_path.c_str(), "r"));
    if (!fp) {
        return nullptr;
    }

    PkeyPtr pkey(PEM_read_PrivateKey(fp.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return nullptr;
    }

    std::unique_ptr<WorkerIdentity> identity(new WorkerIdentity());
    if (!extract_keys(pkey.get(), identity->public_key_, identity->private_key_)) {
        return nullptr;
    }
    return identity;
}

bool WorkerIdentity::save_to_file(const std::string& filepath) const {
    PkeyPtr pkey = private_pkey(private_key_);
    if (!pkey) {
        return false;
    }

    FilePtr fp(fopen(filepath.c_str(), "w"));
    if (!fp) {
        return false;
    }
    return PEM_write_PrivateKey(fp.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) > 0;
}

std::string WorkerIdentity::get_worker_id() const {
    return HashUtils::base64_encode(public_key_.data(), public_key_.size());
}

std::vector<unsigned char> WorkerIdentity::get_public_key() const {
    return public_key_;
}

std::string WorkerIdentity::sign(const std::string& data) const {
    PkeyPtr pkey = private_pkey(private_key_);
    MdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!pkey || !md_ctx ||
        EVP_DigestSignInit(md_ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        return "";
    }

    unsigned char signature[ED25519_SIGNATURE_BYTES];
    size_t signature_len = sizeof(signature);
    if (EVP_DigestSign(md_ctx.get(), signature, &signature_len, as_bytes(data), data.size()) <= 0) {
        return "";
    }
    return HashUtils::base64_encode(signature, signature_len);
}

bool WorkerIdentity::attest(ExecutionResult& result) const {
    result.signature = sign(result.attestation());
    return !result.signature.empty();
}

bool WorkerIdentity::verify(const std::string& data,
                            const std::string& signature_b64,
                            const std::string& public_key_b64) {
    auto key = HashUtils::base64_decode(public_key_b64);
    auto signature = HashUtils::base64_decode(signature_b64);
    if (key.size() != ED25519_KEY_BYTES || signature.size() != ED25519_SIGNATURE_BYTES) {
        return false;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, key.data(), key.size()));
    MdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!pkey || !md_ctx ||
        EVP_DigestVerifyInit(md_ctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        return false;
    }

    return EVP_DigestVerify(md_ctx.get(), signature.data(), signature.size(),
                            as_bytes(data), data.size()) == 1;
}

bool WorkerIdentity::verify_attestation(const ExecutionResult& result,
                                        const std::string& public_key_b64) {
    if (result.signature.empty()) {
        return false;
    }
    return verify(result.attestation(), result.signature, public_key_b64);
}

} // namespace vouchrun
