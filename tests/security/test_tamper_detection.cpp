#include <catch2/catch_test_macros.hpp>
#include "lucid/crypto/manifest_signer.hpp"
#include "lucid/pipeline/encryptor.hpp"
#include "lucid/pipeline/session_orchestrator.hpp"
#include "lucid/storage/in_memory_manifest_store.hpp"
#include "helpers/pipeline_doubles.hpp"
using namespace lucid;
using namespace lucid::pipeline;
using namespace lucid::test_helpers;
using configuration::SessionConfig;

namespace {

/// A sealed and anchored four-chunk session behind a tampering store.
struct SealedFixture {
    storage::InMemoryChunkStore chunks;
    TamperingChunkStore tampering{chunks};
    storage::InMemoryManifestStore records;
    ScriptedAnchorChain chain;
    FixedMasterSecret secrets;
    std::shared_ptr<const crypto::ManifestSigner> signer;
    std::unique_ptr<SessionOrchestrator> orchestrator;
    SessionId id;

    SealedFixture() {
        EnsureSodium();
        signer = std::make_shared<const crypto::ManifestSigner>(crypto::ManifestSigner::Generate().Unwrap());
        auto options = FastOptions();
        options.signer = signer;
        orchestrator = SessionOrchestrator::Create(tampering, records, chain, secrets, options).Unwrap();
        id = orchestrator->CreateSession("tamper", SessionConfig::Uncompressed(2048)).Unwrap();
        REQUIRE(orchestrator->SubmitBytes(id, NoiseBytes(4 * 2048 - 100)).IsOk());
        REQUIRE(orchestrator->EndStream(id).IsOk());
        REQUIRE(orchestrator->WaitForAnchoring(id).Unwrap() == SessionState::Anchored);
    }

    [[nodiscard]] models::SealedRecord Record() {
        return records.LoadRecord(id).Unwrap();
    }
};

void RequireIntegrityError(const Result<VerificationReport, PipelineFailure>& result) {
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == PipelineFailureType::IntegrityError);
}

}

TEST_CASE("Tamper Detection - Untouched Session Verifies", "[security][tamper]") {
    SealedFixture fixture;
    const SessionVerifier verifier(fixture.chunks);
    const auto record = fixture.Record();
    REQUIRE(record.manifest.chunk_count == 4);
    REQUIRE(verifier.VerifyStructure(record).IsOk());
    REQUIRE(verifier.Verify(record, fixture.secrets).IsOk());
    REQUIRE(fixture.orchestrator->VerifySession(fixture.id).IsOk());
}

TEST_CASE("Tamper Detection - Flipped Ciphertext Bit", "[security][tamper]") {
    SealedFixture fixture;
    fixture.tampering.FlipCiphertextBit(2, 13);

    SECTION("Root no longer matches") {
        const SessionVerifier verifier(fixture.tampering);
        auto structure = verifier.VerifyStructure(fixture.Record());
        RequireIntegrityError(structure);
        REQUIRE(structure.UnwrapErr().message == std::string(ErrorMessages::ROOT_MISMATCH));
        RequireIntegrityError(verifier.Verify(fixture.Record(), fixture.secrets));
    }
    SECTION("Orchestrator reports and keeps the session anchored") {
        std::vector<uint64_t> delivered;
        auto report = fixture.orchestrator->VerifySession(fixture.id,
            [&delivered](const uint64_t index, std::span<const uint8_t>) {
                delivered.push_back(index);
                return Result<Unit, PipelineFailure>::Ok(unit);
            });
        RequireIntegrityError(report);
        REQUIRE(delivered.empty());
        REQUIRE(fixture.orchestrator->GetStatus(fixture.id).Unwrap() == SessionState::Anchored);
    }
    SECTION("Chunk fails authentication on its own") {
        auto encryptor = Encryptor::Create(fixture.id, fixture.secrets).Unwrap();
        auto opened = encryptor.Decrypt(2, fixture.tampering.Get(fixture.id, 2).Unwrap());
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == PipelineFailureType::IntegrityError);
        REQUIRE(encryptor.Decrypt(2, fixture.chunks.Get(fixture.id, 2).Unwrap()).IsOk());
    }
}

TEST_CASE("Tamper Detection - Relocated And Missing Chunks", "[security][tamper]") {
    SealedFixture fixture;
    const auto record = fixture.Record();

    SECTION("Chunk moved to another index does not decrypt") {
        auto encryptor = Encryptor::Create(fixture.id, fixture.secrets).Unwrap();
        auto moved = encryptor.Decrypt(0, fixture.chunks.Get(fixture.id, 1).Unwrap());
        REQUIRE(moved.IsErr());
        REQUIRE(moved.UnwrapErr().type == PipelineFailureType::IntegrityError);
    }
    SECTION("Swapped chunks change the root") {
        storage::InMemoryChunkStore swapped;
        for (uint64_t i = 0; i < 4; ++i) {
            const uint64_t source = i == 0 ? 1 : (i == 1 ? 0 : i);
            const auto stored = fixture.chunks.Get(fixture.id, source).Unwrap();
            REQUIRE(swapped.Put(fixture.id, i, stored.ciphertext, stored.nonce, stored.tag).IsOk());
        }
        RequireIntegrityError(SessionVerifier(swapped).VerifyStructure(record));
    }
    SECTION("Dropped chunk is noticed") {
        storage::InMemoryChunkStore truncated;
        for (uint64_t i = 0; i < 3; ++i) {
            const auto stored = fixture.chunks.Get(fixture.id, i).Unwrap();
            REQUIRE(truncated.Put(fixture.id, i, stored.ciphertext, stored.nonce, stored.tag).IsOk());
        }
        RequireIntegrityError(SessionVerifier(truncated).VerifyStructure(record));
    }
    SECTION("Extra chunk is noticed") {
        const auto stored = fixture.chunks.Get(fixture.id, 3).Unwrap();
        REQUIRE(fixture.chunks.Put(fixture.id, 4, stored.ciphertext, stored.nonce, stored.tag).IsOk());
        RequireIntegrityError(SessionVerifier(fixture.chunks).VerifyStructure(record));
    }
}

TEST_CASE("Tamper Detection - Forged Plaintext Sizes", "[security][tamper]") {
    EnsureSodium();
    storage::InMemoryChunkStore chunks;
    storage::InMemoryManifestStore records;
    ScriptedAnchorChain chain;
    FixedMasterSecret secrets;
    auto orchestrator = SessionOrchestrator::Create(chunks, records, chain, secrets, FastOptions()).Unwrap();
    SessionConfig config;
    config.chunk_min = 16 * 1024;
    config.chunk_max = 32 * 1024;
    const auto id = orchestrator->CreateSession("sizes", config).Unwrap();
    REQUIRE(orchestrator->SubmitBytes(id, NoiseBytes(100 * 1024)).IsOk());
    REQUIRE(orchestrator->EndStream(id).IsOk());
    REQUIRE(orchestrator->WaitForAnchoring(id).Unwrap() == SessionState::Anchored);

    const SessionVerifier verifier(chunks);
    auto record = records.LoadRecord(id).Unwrap();
    REQUIRE(record.manifest.compression_enabled);
    REQUIRE(record.chunks.size() >= 2);
    REQUIRE(verifier.Verify(record, secrets).IsOk());

    SECTION("Enormous size is rejected without decompressing") {
        record.chunks[0].plaintext_size = uint64_t{1} << 62;
        REQUIRE(record.manifest.HasValidHash());
        RequireIntegrityError(verifier.VerifyStructure(record));
        RequireIntegrityError(verifier.Verify(record, secrets));
    }
    SECTION("Sizes shifted between chunks no longer add up per chunk") {
        record.chunks[0].plaintext_size += 1;
        record.chunks[1].plaintext_size -= 1;
        REQUIRE(verifier.VerifyStructure(record).IsOk());
        auto verified = verifier.Verify(record, secrets);
        REQUIRE(verified.IsErr());
        REQUIRE(verified.UnwrapErr().type == PipelineFailureType::CompressionError);
    }
    SECTION("Sizes that overflow when summed are rejected") {
        record.chunks[0].plaintext_size = ~uint64_t{0};
        RequireIntegrityError(verifier.VerifyStructure(record));
    }
}

TEST_CASE("Tamper Detection - Manifest And Signature", "[security][tamper][signature]") {
    SealedFixture fixture;
    const SessionVerifier verifier(fixture.chunks);
    auto record = fixture.Record();
    REQUIRE(record.signature.has_value());

    SECTION("Edited field breaks the manifest hash") {
        record.manifest.total_plaintext_size += 1;
        REQUIRE_FALSE(record.manifest.HasValidHash());
        RequireIntegrityError(verifier.VerifyStructure(record));
    }
    SECTION("Re-hashed manifest no longer matches the signature") {
        record.manifest.ended_at += std::chrono::seconds(1);
        record.manifest.Seal();
        REQUIRE(record.manifest.HasValidHash());
        REQUIRE_FALSE(record.VerifySignature());
        auto structure = verifier.VerifyStructure(record);
        RequireIntegrityError(structure);
        REQUIRE(structure.UnwrapErr().message == "Manifest signature does not verify");
    }
    SECTION("Signature from another key is rejected") {
        auto other = crypto::ManifestSigner::Generate().Unwrap();
        record.signer_public_key = other.PublicKey();
        RequireIntegrityError(verifier.VerifyStructure(record));
    }
    SECTION("Forged root with a fresh hash still fails") {
        record.manifest.merkle_root.fill(0x11);
        record.manifest.Seal();
        record.signature.reset();
        record.signer_public_key.reset();
        auto structure = verifier.VerifyStructure(record);
        RequireIntegrityError(structure);
        REQUIRE(structure.UnwrapErr().message == std::string(ErrorMessages::ROOT_MISMATCH));
    }
    SECTION("Anchored hash pins the original manifest") {
        record.manifest.chunk_count = 3;
        record.manifest.Seal();
        REQUIRE(fixture.chain.SubmissionsFor(record.manifest.manifest_hash) == 0);
        REQUIRE(fixture.chain.SubmissionsFor(fixture.Record().manifest.manifest_hash) == 1);
    }
}

TEST_CASE("Tamper Detection - Wrong Master Secret", "[security][tamper]") {
    SealedFixture fixture;
    FixedMasterSecret other_secret(0x43);
    const SessionVerifier verifier(fixture.chunks);
    const auto record = fixture.Record();

    REQUIRE(verifier.VerifyStructure(record).IsOk());
    auto report = verifier.Verify(record, other_secret);
    RequireIntegrityError(report);
    REQUIRE(report.UnwrapErr().message.find("Chunk 0") == 0);
}
