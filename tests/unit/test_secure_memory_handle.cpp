#include <catch2/catch_test_macros.hpp>
#include "lucid/crypto/sodium_secure_memory_handle.hpp"
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/constants.hpp"
#include <algorithm>
using namespace lucid;
using namespace lucid::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate session key size") {
        auto result = SecureMemoryHandle::Allocate(Constants::SESSION_KEY_SIZE);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == Constants::SESSION_KEY_SIZE);
    }
    SECTION("Cannot allocate zero bytes") {
        auto result = SecureMemoryHandle::Allocate(0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment releases the previous region") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Write and Read", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Read returns what was written") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> write_data(32, 0x42);
        REQUIRE(handle.Write(write_data).IsOk());
        std::vector<uint8_t> read_data(32);
        REQUIRE(handle.Read(read_data).IsOk());
        REQUIRE(read_data == write_data);
    }
    SECTION("Short write zero-fills the remainder") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xFF)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2, 3}).IsOk());
        std::vector<uint8_t> read_data(8);
        REQUIRE(handle.Read(read_data).IsOk());
        REQUIRE(read_data == std::vector<uint8_t>{1, 2, 3, 0, 0, 0, 0, 0});
    }
    SECTION("Write larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = handle.Write(std::vector<uint8_t>(32, 0x42));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into too-small buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> buffer(16);
        REQUIRE(handle.Read(buffer).IsErr());
    }
    SECTION("Wiped handle rejects access") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        handle.Wipe();
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Write(std::vector<uint8_t>(4, 1)).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t>) { return 1; });
        REQUIRE(access.IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Scoped Access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Read access provides the full region") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(32, 0x42)).IsOk());
        auto result = handle.WithReadAccess([&](std::span<const uint8_t> span) {
            REQUIRE(span.size() == 32);
            REQUIRE(std::all_of(span.begin(), span.end(),
                [](uint8_t b) { return b == 0x42; }));
            return 42;
        });
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Write access allows modification") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto result = handle.WithWriteAccess([](std::span<uint8_t> span) {
            std::fill(span.begin(), span.end(), 0xFF);
            return unit;
        });
        REQUIRE(result.IsOk());
        std::vector<uint8_t> read_data(32);
        REQUIRE(handle.Read(read_data).IsOk());
        REQUIRE(std::all_of(read_data.begin(), read_data.end(),
            [](uint8_t b) { return b == 0xFF; }));
    }
}
