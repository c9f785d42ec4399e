#include <catch2/catch_test_macros.hpp>
#include "lucid/crypto/xchacha20_poly1305.hpp"
#include "lucid/crypto/sodium_interop.hpp"
using namespace lucid;
using namespace lucid::crypto;
TEST_CASE("XChaCha20Poly1305 - Seal and Open", "[crypto][aead]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(Constants::SESSION_KEY_SIZE);
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::XCHACHA20_NONCE_SIZE);
    const std::vector<uint8_t> plaintext = {'c', 'h', 'u', 'n', 'k', ' ', '0'};
    const std::vector<uint8_t> aad = {0xAA, 0xBB, 0xCC};

    auto sealed = XChaCha20Poly1305::Seal(key, nonce, plaintext, aad);
    REQUIRE(sealed.IsOk());
    const auto box = sealed.Unwrap();
    REQUIRE(box.ciphertext.size() == plaintext.size());
    REQUIRE(box.ciphertext != plaintext);

    SECTION("Opens with matching key, nonce and associated data") {
        auto opened = XChaCha20Poly1305::Open(key, nonce, box.ciphertext, box.tag, aad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Flipped ciphertext bit is rejected") {
        auto tampered = box.ciphertext;
        tampered[0] ^= 0x01;
        auto opened = XChaCha20Poly1305::Open(key, nonce, tampered, box.tag, aad);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == PipelineFailureType::IntegrityError);
    }
    SECTION("Flipped tag bit is rejected") {
        auto tag = box.tag;
        tag[15] ^= 0x80;
        REQUIRE(XChaCha20Poly1305::Open(key, nonce, box.ciphertext, tag, aad).IsErr());
    }
    SECTION("Different associated data is rejected") {
        const std::vector<uint8_t> other_aad = {0xAA, 0xBB, 0xCD};
        REQUIRE(XChaCha20Poly1305::Open(key, nonce, box.ciphertext, box.tag, other_aad).IsErr());
    }
    SECTION("Different key is rejected") {
        const auto other_key = SodiumInterop::GetRandomBytes(Constants::SESSION_KEY_SIZE);
        REQUIRE(XChaCha20Poly1305::Open(other_key, nonce, box.ciphertext, box.tag, aad).IsErr());
    }
}
TEST_CASE("XChaCha20Poly1305 - Parameter Checks", "[crypto][aead]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(Constants::SESSION_KEY_SIZE);
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::XCHACHA20_NONCE_SIZE);
    const std::vector<uint8_t> plaintext(64, 0x11);
    SECTION("Short key fails") {
        const std::vector<uint8_t> short_key(16, 0x01);
        auto sealed = XChaCha20Poly1305::Seal(short_key, nonce, plaintext);
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == PipelineFailureType::EncryptionError);
    }
    SECTION("Twelve-byte nonce fails") {
        const std::vector<uint8_t> ietf_nonce(12, 0x01);
        REQUIRE(XChaCha20Poly1305::Seal(key, ietf_nonce, plaintext).IsErr());
    }
    SECTION("Truncated tag fails") {
        auto box = XChaCha20Poly1305::Seal(key, nonce, plaintext).Unwrap();
        const std::span<const uint8_t> short_tag(box.tag.data(), 8);
        REQUIRE(XChaCha20Poly1305::Open(key, nonce, box.ciphertext, short_tag).IsErr());
    }
    SECTION("Empty plaintext still authenticates") {
        auto box = XChaCha20Poly1305::Seal(key, nonce, {}).Unwrap();
        REQUIRE(box.ciphertext.empty());
        auto opened = XChaCha20Poly1305::Open(key, nonce, box.ciphertext, box.tag);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
}
