#include "lucid/crypto/hkdf.hpp"
#include "lucid/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace lucid::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            EVP_KDF_free(kdf);
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, PipelineFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::EncryptionError(
                "HKDF output size must be in [1, " + std::to_string(MAX_OUTPUT_LEN) +
                "], got " + std::to_string(output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("HKDF input key material cannot be empty"));
    }

    EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_HKDF, nullptr));
    if (!kdf) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("Failed to fetch HKDF algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
        return Result<Unit, PipelineFailure>::Err(
            PipelineFailure::EncryptionError("HKDF key derivation failed"));
    }
    return Result<Unit, PipelineFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, PipelineFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, PipelineFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, PipelineFailure>::Ok(std::move(output));
}

}
