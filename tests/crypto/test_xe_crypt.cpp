/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XeCrypt primitive tests (FIPS 180-1, RFC 2202 and common RC4 vectors)
 */

#include <gtest/gtest.h>
#include "crypto/xe_crypt.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace xcp360 {
namespace test {

static std::string to_hex(const u8* data, usize size) {
    std::string out;
    char buf[3];
    for (usize i = 0; i < size; i++) {
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        out += buf;
    }
    return out;
}

static std::string sha1_hex(const std::string& text) {
    u8 hash[Sha1::HASH_SIZE];
    Sha1::hash(reinterpret_cast<const u8*>(text.data()), text.size(), hash);
    return to_hex(hash, sizeof(hash));
}

static std::string hmac_hex(const std::vector<u8>& key, const std::string& text) {
    u8 mac[Sha1::HASH_SIZE];
    hmac_sha1(key.data(), key.size(), reinterpret_cast<const u8*>(text.data()), text.size(), mac);
    return to_hex(mac, sizeof(mac));
}

static std::string rc4_hex(const std::string& key, const std::string& text) {
    std::vector<u8> data(text.begin(), text.end());
    Rc4 rc4(reinterpret_cast<const u8*>(key.data()), key.size());
    rc4.process(data.data(), data.size());
    return to_hex(data.data(), data.size());
}

// ============================================================================
// SHA-1
// ============================================================================

TEST(Sha1Test, KnownVectors) {
    EXPECT_EQ(sha1_hex(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    EXPECT_EQ(sha1_hex("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(sha1_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST(Sha1Test, IncrementalMatchesOneShot) {
    std::string text(1000, 'a');

    Sha1 sha;
    for (usize i = 0; i < text.size(); i += 37) {
        usize n = std::min<usize>(37, text.size() - i);
        sha.update(reinterpret_cast<const u8*>(text.data()) + i, n);
    }
    u8 hash[Sha1::HASH_SIZE];
    sha.finalize(hash);

    EXPECT_EQ(to_hex(hash, sizeof(hash)), sha1_hex(text));
}

// ============================================================================
// HMAC-SHA1
// ============================================================================

TEST(HmacSha1Test, Rfc2202) {
    EXPECT_EQ(hmac_hex(std::vector<u8>(20, 0x0B), "Hi There"),
              "b617318655057264e28bc0b6fb378c8ef146be00");
    EXPECT_EQ(hmac_hex({'J', 'e', 'f', 'e'}, "what do ya want for nothing?"),
              "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79");
}

TEST(HmacSha1Test, KeyLongerThanBlock) {
    EXPECT_EQ(hmac_hex(std::vector<u8>(80, 0xAA),
                       "Test Using Larger Than Block-Size Key - Hash Key First"),
              "aa4ae5e15272d00e95705637ce8a3b55ed402112");
}

// ============================================================================
// RC4
// ============================================================================

TEST(Rc4Test, KnownVectors) {
    EXPECT_EQ(rc4_hex("Key", "Plaintext"), "bbf316e8d940af0ad3");
    EXPECT_EQ(rc4_hex("Wiki", "pedia"), "1021bf0420");
    EXPECT_EQ(rc4_hex("Secret", "Attack at dawn"), "45a01f645fc35b383552544b9bf5");
}

TEST(Rc4Test, SplitCallsContinueKeystream) {
    std::string text = "Attack at dawn";
    std::vector<u8> data(text.begin(), text.end());

    Rc4 rc4(reinterpret_cast<const u8*>("Secret"), 6);
    rc4.process(data.data(), 1);
    rc4.process(data.data() + 1, 5);
    rc4.process(data.data() + 6, data.size() - 6);

    EXPECT_EQ(to_hex(data.data(), data.size()), "45a01f645fc35b383552544b9bf5");
}

} // namespace test
} // namespace xcp360
