/**
 * @file record_session_example.cpp
 * @brief Records one session to disk, seals it, anchors it and plays it back
 *
 * Usage: lucid_record_example [storage-directory]
 */

#include "lucid/crypto/manifest_signer.hpp"
#include "lucid/crypto/secure_master_secret.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/debug/pipeline_logger.hpp"
#include "lucid/interfaces/i_anchor_chain.hpp"
#include "lucid/pipeline/session_orchestrator.hpp"
#include "lucid/storage/file_manifest_store.hpp"
#include "lucid/storage/file_system_chunk_store.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using namespace lucid;

namespace {

/// Stand-in ledger: every submission is confirmed on the second poll.
class LocalLedger final : public interfaces::IAnchorChain {
public:
    Result<models::TxRef, AnchorFailure> SubmitAnchor(
        const SessionId& session_id,
        const Hash256& merkle_root,
        const uint64_t chunk_count,
        const Hash256& manifest_hash) override {
        std::lock_guard guard(lock_);
        const models::TxRef tx = "local-" + std::to_string(++sequence_);
        polls_[tx] = 0;
        std::cout << "   ledger: " << tx << " <- session " << session_id.ToHex()
                  << ", " << chunk_count << " chunk(s), root " << encoding::ToHex(merkle_root).substr(0, 16)
                  << "..., manifest " << encoding::ToHex(manifest_hash).substr(0, 16) << "..." << std::endl;
        return Result<models::TxRef, AnchorFailure>::Ok(tx);
    }

    Result<models::ConfirmationStatus, AnchorFailure> GetConfirmation(const models::TxRef& tx_ref) override {
        std::lock_guard guard(lock_);
        const auto it = polls_.find(tx_ref);
        if (it == polls_.end()) {
            return Result<models::ConfirmationStatus, AnchorFailure>::Err(
                AnchorFailure::Rejected("Unknown transaction " + tx_ref));
        }
        return Result<models::ConfirmationStatus, AnchorFailure>::Ok(
            ++it->second >= 2 ? models::ConfirmationStatus::Confirmed : models::ConfirmationStatus::Pending);
    }

private:
    std::mutex lock_;
    uint64_t sequence_ = 0;
    std::map<models::TxRef, uint32_t> polls_;
};

std::vector<uint8_t> SampleRecording(const size_t size) {
    std::vector<uint8_t> data(size);
    const std::string line = "frame: cursor moved, window focused, key pressed\n";
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(line[i % line.size()]);
    }
    return data;
}

}

int main(int argc, char** argv) {
    std::cout << "=== Lucid - Record Session Example ===" << std::endl;
    std::cout << std::endl;

    const std::filesystem::path root = argc > 1
        ? std::filesystem::path(argv[1])
        : std::filesystem::temp_directory_path() / "lucid-record-example";

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Opening stores under " << root << "..." << std::endl;
    auto chunk_store = storage::FileSystemChunkStore::Open(root / "chunks");
    auto manifest_store = storage::FileManifestStore::Open(root / "manifests");
    if (chunk_store.IsErr() || manifest_store.IsErr()) {
        std::cerr << "Failed to open stores" << std::endl;
        return 1;
    }
    auto chunks = std::move(chunk_store).Unwrap();
    auto records = std::move(manifest_store).Unwrap();
    LocalLedger ledger;
    std::cout << "   ✓ Stores ready" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Preparing master secret and manifest signer..." << std::endl;
    auto secret_result = crypto::SecureMasterSecret::Generate();
    auto signer_result = crypto::ManifestSigner::Generate();
    if (secret_result.IsErr() || signer_result.IsErr()) {
        std::cerr << "Failed to prepare key material" << std::endl;
        return 1;
    }
    auto master_secret = std::move(secret_result).Unwrap();

    configuration::PipelineOptions options;
    options.signer = std::make_shared<const crypto::ManifestSigner>(std::move(signer_result).Unwrap());
    options.confirmation_interval = std::chrono::milliseconds(10);
    std::cout << "   ✓ Signer public key: " << encoding::ToHex(options.signer->PublicKey()) << std::endl;
    std::cout << std::endl;

    auto orchestrator_result = pipeline::SessionOrchestrator::Create(
        chunks, records, ledger, master_secret, options);
    if (orchestrator_result.IsErr()) {
        std::cerr << "Failed to start orchestrator: " << orchestrator_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto orchestrator = std::move(orchestrator_result).Unwrap();

    std::cout << "4. Recording 6 MiB in 256 KiB submissions..." << std::endl;
    auto config = configuration::SessionConfig::Default();
    config.chunk_min = 64 * 1024;
    config.chunk_max = 128 * 1024;
    auto session_result = orchestrator->CreateSession("example-user", config);
    if (session_result.IsErr()) {
        std::cerr << "Failed to create session: " << session_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const SessionId session = session_result.Unwrap();
    const auto recording = SampleRecording(6 * ChunkConstants::MEBIBYTE);
    constexpr size_t submission = 256 * 1024;
    for (size_t offset = 0; offset < recording.size(); offset += submission) {
        const size_t length = std::min(submission, recording.size() - offset);
        auto submitted = orchestrator->SubmitBytes(
            session, std::span<const uint8_t>(recording).subspan(offset, length));
        if (submitted.IsErr()) {
            std::cerr << "Submit failed: " << submitted.UnwrapErr().message << std::endl;
            return 1;
        }
    }
    std::cout << "   ✓ Session " << session.ToHex() << " recording" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Ending stream and anchoring..." << std::endl;
    if (auto ended = orchestrator->EndStream(session); ended.IsErr()) {
        std::cerr << "EndStream failed: " << ended.UnwrapErr().message << std::endl;
        return 1;
    }
    auto state = orchestrator->WaitForAnchoring(session);
    if (state.IsErr()) {
        std::cerr << "Session lookup failed: " << state.UnwrapErr().message << std::endl;
        return 1;
    }
    auto info = orchestrator->GetSessionInfo(session);
    if (info.IsErr() || !info.Unwrap().manifest) {
        std::cerr << "No manifest for session" << std::endl;
        return 1;
    }
    const auto& manifest = *info.Unwrap().manifest;
    std::cout << "   ✓ State: " << ToString(state.Unwrap()) << std::endl;
    std::cout << "   Chunks: " << manifest.chunk_count
              << ", plaintext " << manifest.total_plaintext_size
              << " bytes, stored " << manifest.total_ciphertext_size << " bytes" << std::endl;
    std::cout << "   Merkle root: " << encoding::ToHex(manifest.merkle_root) << std::endl;
    if (info.Unwrap().anchor) {
        std::cout << "   Anchor tx: " << info.Unwrap().anchor->tx_ref << std::endl;
    }
    std::cout << std::endl;

    std::cout << "6. Playing the session back from disk..." << std::endl;
    size_t offset = 0;
    bool identical = true;
    auto report = orchestrator->VerifySession(session,
        [&](uint64_t, std::span<const uint8_t> plaintext) {
            identical = identical && offset + plaintext.size() <= recording.size() &&
                        std::equal(plaintext.begin(), plaintext.end(), recording.begin() + static_cast<std::ptrdiff_t>(offset));
            offset += plaintext.size();
            return Result<Unit, PipelineFailure>::Ok(unit);
        });
    if (report.IsErr()) {
        std::cerr << "Verification failed: " << report.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ " << report.Unwrap().chunk_count << " chunk(s) authenticated, "
              << report.Unwrap().plaintext_bytes << " bytes recovered, "
              << (identical && offset == recording.size() ? "identical to input" : "MISMATCH") << std::endl;
    std::cout << std::endl;

    std::cout << "=== Done ===" << std::endl;
    return identical && offset == recording.size() ? 0 : 1;
}
