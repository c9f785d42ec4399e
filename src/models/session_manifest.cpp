#include "lucid/models/session_manifest.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/constants.hpp"

namespace lucid::models {
using crypto::SodiumInterop;

std::vector<uint8_t> SessionManifest::CanonicalBytes() const {
    std::vector<uint8_t> out;
    out.reserve(PipelineConstants::MANIFEST_HASH_DOMAIN.size() +
                Constants::SESSION_ID_SIZE + 3 * 8 + Constants::HASH_SIZE + 2 * 8 + 1);
    out.insert(out.end(),
               PipelineConstants::MANIFEST_HASH_DOMAIN.begin(),
               PipelineConstants::MANIFEST_HASH_DOMAIN.end());
    out.insert(out.end(), session_id.bytes.begin(), session_id.bytes.end());
    encoding::AppendUint64LE(out, chunk_count);
    encoding::AppendUint64LE(out, total_plaintext_size);
    encoding::AppendUint64LE(out, total_ciphertext_size);
    out.insert(out.end(), merkle_root.begin(), merkle_root.end());
    encoding::AppendInt64LE(out, encoding::ToUnixMillis(started_at));
    encoding::AppendInt64LE(out, encoding::ToUnixMillis(ended_at));
    out.push_back(compression_enabled ? 1 : 0);
    return out;
}

Hash256 SessionManifest::ComputeHash() const {
    return SodiumInterop::Hash(CanonicalBytes());
}

bool SessionManifest::HasValidHash() const {
    const Hash256 expected = ComputeHash();
    return SodiumInterop::ConstantTimeEquals(expected, manifest_hash);
}

void SessionManifest::Seal() {
    manifest_hash = ComputeHash();
}

bool SealedRecord::VerifySignature() const {
    if (!signature.has_value()) {
        return true;
    }
    if (!signer_public_key.has_value()) {
        return false;
    }
    return crypto::ManifestSigner::Verify(*signer_public_key, manifest.manifest_hash, *signature);
}

}
