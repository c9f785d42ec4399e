#include <catch2/catch_test_macros.hpp>
#include "lucid/pipeline/session_orchestrator.hpp"
#include "lucid/storage/in_memory_manifest_store.hpp"
#include "helpers/pipeline_doubles.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <thread>
using namespace lucid;
using namespace lucid::pipeline;
using namespace lucid::test_helpers;
using configuration::SessionConfig;
using namespace std::chrono_literals;

namespace {

/// Chunk store whose Put blocks until the gate is opened.
class GatedChunkStore : public interfaces::IChunkStore {
public:
    void Open() {
        {
            std::lock_guard guard(lock_);
            open_ = true;
        }
        changed_.notify_all();
    }

    [[nodiscard]] bool WaitForWriter(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(lock_);
        return changed_.wait_for(lock, timeout, [this] { return waiting_ > 0; });
    }

    [[nodiscard]] Result<Unit, StoreFailure> Put(
        const SessionId& session_id,
        const uint64_t index,
        const std::span<const uint8_t> ciphertext,
        const crypto::Nonce192& nonce,
        const crypto::Tag128& tag) override {
        {
            std::unique_lock lock(lock_);
            ++waiting_;
            changed_.notify_all();
            changed_.wait(lock, [this] { return open_; });
            --waiting_;
        }
        return inner_.Put(session_id, index, ciphertext, nonce, tag);
    }

    [[nodiscard]] Result<models::StoredChunk, StoreFailure> Get(const SessionId& session_id, const uint64_t index) override {
        return inner_.Get(session_id, index);
    }

    [[nodiscard]] Result<std::vector<uint64_t>, StoreFailure> ListIndices(const SessionId& session_id) override {
        return inner_.ListIndices(session_id);
    }

    [[nodiscard]] Result<Unit, StoreFailure> DeleteSession(const SessionId& session_id) override {
        return inner_.DeleteSession(session_id);
    }

    [[nodiscard]] size_t ChunkCount() const { return inner_.ChunkCount(); }

private:
    storage::InMemoryChunkStore inner_;
    std::mutex lock_;
    std::condition_variable changed_;
    bool open_ = false;
    uint32_t waiting_ = 0;
};

struct SessionOutcome {
    bool recorded = false;
    SessionState state = SessionState::Created;
    bool played_back = false;
};

}

TEST_CASE("Concurrent Sessions - Independent Recordings", "[concurrency][sessions]") {
    EnsureSodium();
    storage::InMemoryChunkStore chunks;
    storage::InMemoryManifestStore records;
    ScriptedAnchorChain chain;
    FixedMasterSecret secrets;
    auto orchestrator = SessionOrchestrator::Create(chunks, records, chain, secrets, FastOptions()).Unwrap();

    constexpr size_t SESSION_COUNT = 8;
    std::vector<SessionOutcome> outcomes(SESSION_COUNT);
    std::vector<std::thread> workers;
    std::atomic<bool> recording_done{false};

    for (size_t s = 0; s < SESSION_COUNT; ++s) {
        workers.emplace_back([&, s] {
            const bool compressed = s % 2 == 0;
            const auto config = compressed ? [] {
                SessionConfig small;
                small.chunk_min = 16 * 1024;
                small.chunk_max = 32 * 1024;
                return small;
            }() : SessionConfig::Uncompressed(4096);
            const auto data = compressed ? TextBytes(80 * 1024 + s * 1111) : NoiseBytes(30'000 + s * 777, s + 1);

            auto created = orchestrator->CreateSession("worker-" + std::to_string(s), config);
            if (created.IsErr()) {
                return;
            }
            const SessionId id = created.Unwrap();
            for (size_t offset = 0; offset < data.size(); offset += 3001) {
                const size_t length = std::min<size_t>(3001, data.size() - offset);
                if (orchestrator->SubmitBytes(id, std::span<const uint8_t>(data).subspan(offset, length)).IsErr()) {
                    return;
                }
            }
            if (orchestrator->EndStream(id).IsErr()) {
                return;
            }
            outcomes[s].recorded = true;
            outcomes[s].state = orchestrator->WaitForAnchoring(id).Unwrap();

            std::vector<uint8_t> played;
            auto report = orchestrator->VerifySession(id, [&played](uint64_t, std::span<const uint8_t> plaintext) {
                played.insert(played.end(), plaintext.begin(), plaintext.end());
                return Result<Unit, PipelineFailure>::Ok(unit);
            });
            outcomes[s].played_back = report.IsOk() && played == data;
        });
    }

    std::thread observer([&] {
        while (!recording_done.load()) {
            (void)orchestrator->SweepExpired();
            (void)orchestrator->RetryPendingAnchors();
            (void)orchestrator->SessionCount();
            std::this_thread::sleep_for(1ms);
        }
    });

    for (auto& worker : workers) {
        worker.join();
    }
    recording_done.store(true);
    observer.join();

    for (size_t s = 0; s < SESSION_COUNT; ++s) {
        INFO("session " << s);
        REQUIRE(outcomes[s].recorded);
        REQUIRE(outcomes[s].state == SessionState::Anchored);
        REQUIRE(outcomes[s].played_back);
    }
    REQUIRE(orchestrator->SessionCount() == SESSION_COUNT);
    REQUIRE(chain.SubmitCalls() == SESSION_COUNT);
    REQUIRE(records.ListSessions().Unwrap().size() == SESSION_COUNT);
}

TEST_CASE("Concurrent Sessions - Concurrent Submits To One Session Are Serialized", "[concurrency][sessions]") {
    EnsureSodium();
    storage::InMemoryChunkStore chunks;
    storage::InMemoryManifestStore records;
    ScriptedAnchorChain chain;
    FixedMasterSecret secrets;
    auto orchestrator = SessionOrchestrator::Create(chunks, records, chain, secrets, FastOptions()).Unwrap();
    const SessionId id = orchestrator->CreateSession("shared", SessionConfig::Uncompressed(1000)).Unwrap();

    constexpr size_t WRITERS = 4;
    constexpr size_t SUBMITS = 50;
    std::atomic<size_t> failures{0};
    std::vector<std::thread> writers;
    for (size_t w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            const std::vector<uint8_t> block(100, static_cast<uint8_t>(w + 1));
            for (size_t i = 0; i < SUBMITS; ++i) {
                if (orchestrator->SubmitBytes(id, block).IsErr()) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    REQUIRE(failures.load() == 0);
    REQUIRE(orchestrator->EndStream(id).IsOk());
    REQUIRE(orchestrator->WaitForAnchoring(id).Unwrap() == SessionState::Anchored);

    std::vector<uint8_t> played;
    REQUIRE(orchestrator->VerifySession(id, [&played](uint64_t, std::span<const uint8_t> plaintext) {
        played.insert(played.end(), plaintext.begin(), plaintext.end());
        return Result<Unit, PipelineFailure>::Ok(unit);
    }).IsOk());
    REQUIRE(played.size() == WRITERS * SUBMITS * 100);
    for (size_t offset = 0; offset < played.size(); offset += 100) {
        const uint8_t first = played[offset];
        REQUIRE(std::all_of(played.begin() + static_cast<std::ptrdiff_t>(offset),
                            played.begin() + static_cast<std::ptrdiff_t>(offset + 100),
                            [first](const uint8_t b) { return b == first; }));
    }
}

TEST_CASE("Concurrent Sessions - Backpressure", "[concurrency][backpressure]") {
    EnsureSodium();
    GatedChunkStore gated;
    storage::InMemoryManifestStore records;
    ScriptedAnchorChain chain;
    FixedMasterSecret secrets;
    auto options = FastOptions();
    options.queue_depth = 1;
    auto orchestrator = SessionOrchestrator::Create(gated, records, chain, secrets, options).Unwrap();
    const SessionId id = orchestrator->CreateSession("slow-store", SessionConfig::Uncompressed(1000)).Unwrap();
    const auto data = NoiseBytes(20'000);

    std::atomic<bool> returned{false};
    std::optional<PipelineFailure> submit_error;

    SECTION("Submit waits for the store and then completes") {
        std::thread producer([&] {
            auto submitted = orchestrator->SubmitBytes(id, data);
            if (submitted.IsErr()) {
                submit_error = submitted.UnwrapErr();
            }
            returned.store(true);
        });
        REQUIRE(gated.WaitForWriter(5s));
        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(returned.load());
        const auto blocked = orchestrator->GetSessionInfo(id).Unwrap();
        REQUIRE(blocked.statistics.chunks_emitted < 20);
        REQUIRE(blocked.statistics.chunks_stored == 0);

        gated.Open();
        producer.join();
        REQUIRE_FALSE(submit_error.has_value());
        REQUIRE(orchestrator->EndStream(id).IsOk());
        REQUIRE(orchestrator->WaitForAnchoring(id).Unwrap() == SessionState::Anchored);
        REQUIRE(gated.ChunkCount() == 20);
        REQUIRE(orchestrator->VerifySession(id).IsOk());
    }
    SECTION("Abort releases a blocked submit") {
        std::thread producer([&] {
            auto submitted = orchestrator->SubmitBytes(id, data);
            if (submitted.IsErr()) {
                submit_error = submitted.UnwrapErr();
            }
            returned.store(true);
        });
        REQUIRE(gated.WaitForWriter(5s));
        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(returned.load());

        std::thread aborter([&] {
            (void)orchestrator->AbortSession(id);
        });
        producer.join();
        REQUIRE(returned.load());
        gated.Open();
        aborter.join();

        REQUIRE(submit_error.has_value());
        REQUIRE(submit_error->type == PipelineFailureType::Cancelled);
        const auto info = orchestrator->GetSessionInfo(id).Unwrap();
        REQUIRE(info.state == SessionState::Failed);
        REQUIRE(info.last_error->type == PipelineFailureType::Cancelled);
        REQUIRE(orchestrator->EndStream(id).IsErr());
        REQUIRE(chain.SubmitCalls() == 0);
    }
}
