#include <catch2/catch_test_macros.hpp>
#include "lucid/crypto/sodium_interop.hpp"
#include "lucid/core/types.hpp"
#include <string_view>
using namespace lucid;
using namespace lucid::crypto;
namespace {
std::span<const uint8_t> Bytes(const std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}
}
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Small buffer is zeroed") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0));
    }
    SECTION("Large buffer is zeroed") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(10000, 0));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> a = {1, 2, 3, 4, 5};
    SECTION("Equal buffers") {
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different buffers") {
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different sizes") {
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Empty buffers are equal") {
        REQUIRE(SodiumInterop::ConstantTimeEquals({}, {}));
    }
}

TEST_CASE("SodiumInterop - BLAKE2b-256", "[sodium][crypto][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Known answer for the empty message") {
        REQUIRE(encoding::ToHex(SodiumInterop::Hash({})) ==
                "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
    }
    SECTION("Known answer for abc") {
        REQUIRE(encoding::ToHex(SodiumInterop::Hash(Bytes("abc"))) ==
                "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
    }
    SECTION("HashPair hashes the concatenation") {
        const Hash256 left = SodiumInterop::Hash(Bytes("left"));
        const Hash256 right = SodiumInterop::Hash(Bytes("right"));
        std::vector<uint8_t> joined(left.begin(), left.end());
        joined.insert(joined.end(), right.begin(), right.end());
        REQUIRE(SodiumInterop::HashPair(left, right) == SodiumInterop::Hash(joined));
        REQUIRE(SodiumInterop::HashPair(left, right) != SodiumInterop::HashPair(right, left));
    }
}

TEST_CASE("SodiumInterop - Incremental Hash State", "[sodium][crypto][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Split updates match the one-shot digest") {
        HashState state;
        state.Update(Bytes("session "));
        state.Update(Bytes("recording"));
        REQUIRE(state.FinalizeAndReset() == SodiumInterop::Hash(Bytes("session recording")));
    }
    SECTION("State is reusable after finalizing") {
        HashState state;
        state.Update(Bytes("first"));
        (void)state.FinalizeAndReset();
        state.Update(Bytes("second"));
        REQUIRE(state.FinalizeAndReset() == SodiumInterop::Hash(Bytes("second")));
        REQUIRE(state.FinalizeAndReset() == SodiumInterop::Hash({}));
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes generates correct size") {
        REQUIRE(SodiumInterop::GetRandomBytes(32).size() == 32);
    }
    SECTION("GetRandomBytes generates different values") {
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
}
