/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XeCrypt primitives
 *
 * The subset of the console's crypto library used by XCP packages:
 * SHA-1, HMAC-SHA1 (XeCryptHmacSha) and RC4 (XeCryptRc4).
 */

#pragma once

#include "xcp360/types.h"
#include <array>

namespace xcp360 {

/**
 * SHA-1 implementation
 */
class Sha1 {
public:
    static constexpr u32 HASH_SIZE = 20;
    static constexpr u32 BLOCK_SIZE = 64;

    Sha1();

    void reset();
    void update(const u8* data, usize size);
    void finalize(u8* hash);

    static void hash(const u8* data, usize size, u8* hash);

private:
    std::array<u32, 5> state_;
    std::array<u8, BLOCK_SIZE> buffer_;
    u32 buffer_size_ = 0;
    u64 total_size_ = 0;

    void transform(const u8* block);
};

/**
 * HMAC-SHA1 (XeCryptHmacSha)
 *
 * @param key     HMAC key, any length
 * @param data    Message
 * @param out     Receives Sha1::HASH_SIZE bytes
 */
void hmac_sha1(const u8* key, usize key_size, const u8* data, usize size, u8* out);

/**
 * RC4 stream cipher (XeCryptRc4)
 *
 * Encryption and decryption are the same operation. The keystream
 * position advances with every byte processed.
 */
class Rc4 {
public:
    Rc4() = default;
    Rc4(const u8* key, usize key_size) { set_key(key, key_size); }

    /**
     * Run the key schedule, resetting the keystream position
     */
    void set_key(const u8* key, usize key_size);

    /**
     * XOR the next size keystream bytes into data (in-place)
     */
    void process(u8* data, usize size);

private:
    std::array<u8, 256> s_{};
    u8 i_ = 0;
    u8 j_ = 0;
};

} // namespace xcp360
