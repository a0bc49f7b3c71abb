/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XeCrypt primitives implementation
 */

#include "xe_crypt.h"
#include <cstring>
#include <algorithm>

namespace xcp360 {

//=============================================================================
// SHA-1 Implementation
//=============================================================================

Sha1::Sha1() {
    reset();
}

void Sha1::reset() {
    state_[0] = 0x67452301;
    state_[1] = 0xEFCDAB89;
    state_[2] = 0x98BADCFE;
    state_[3] = 0x10325476;
    state_[4] = 0xC3D2E1F0;
    buffer_size_ = 0;
    total_size_ = 0;
}

static inline u32 rol32(u32 x, u32 n) {
    return (x << n) | (x >> (32 - n));
}

void Sha1::transform(const u8* block) {
    u32 w[80];

    // Prepare message schedule
    for (int i = 0; i < 16; i++) {
        w[i] = (static_cast<u32>(block[i*4]) << 24) | (static_cast<u32>(block[i*4+1]) << 16) |
               (static_cast<u32>(block[i*4+2]) << 8) | block[i*4+3];
    }
    for (int i = 16; i < 80; i++) {
        w[i] = rol32(w[i-3] ^ w[i-8] ^ w[i-14] ^ w[i-16], 1);
    }

    u32 a = state_[0];
    u32 b = state_[1];
    u32 c = state_[2];
    u32 d = state_[3];
    u32 e = state_[4];

    for (int i = 0; i < 80; i++) {
        u32 f, k;
        if (i < 20) {
            f = (b & c) | ((~b) & d);
            k = 0x5A827999;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDC;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6;
        }

        u32 temp = rol32(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rol32(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

void Sha1::update(const u8* data, usize size) {
    total_size_ += size;

    while (size > 0) {
        usize to_copy = std::min<usize>(size, BLOCK_SIZE - buffer_size_);
        memcpy(buffer_.data() + buffer_size_, data, to_copy);
        buffer_size_ += static_cast<u32>(to_copy);
        data += to_copy;
        size -= to_copy;

        if (buffer_size_ == BLOCK_SIZE) {
            transform(buffer_.data());
            buffer_size_ = 0;
        }
    }
}

void Sha1::finalize(u8* hash) {
    // Pad message
    buffer_[buffer_size_++] = 0x80;

    if (buffer_size_ > 56) {
        while (buffer_size_ < BLOCK_SIZE) buffer_[buffer_size_++] = 0;
        transform(buffer_.data());
        buffer_size_ = 0;
    }

    while (buffer_size_ < 56) buffer_[buffer_size_++] = 0;

    // Append length in bits (big-endian)
    u64 bit_len = total_size_ * 8;
    for (int i = 0; i < 8; i++) {
        buffer_[56 + i] = static_cast<u8>(bit_len >> (56 - i * 8));
    }

    transform(buffer_.data());

    // Output hash (big-endian)
    for (int i = 0; i < 5; i++) {
        hash[i*4 + 0] = static_cast<u8>(state_[i] >> 24);
        hash[i*4 + 1] = static_cast<u8>(state_[i] >> 16);
        hash[i*4 + 2] = static_cast<u8>(state_[i] >> 8);
        hash[i*4 + 3] = static_cast<u8>(state_[i]);
    }
}

void Sha1::hash(const u8* data, usize size, u8* hash) {
    Sha1 sha;
    sha.update(data, size);
    sha.finalize(hash);
}

//=============================================================================
// HMAC-SHA1
//=============================================================================

void hmac_sha1(const u8* key, usize key_size, const u8* data, usize size, u8* out) {
    std::array<u8, Sha1::BLOCK_SIZE> block_key{};

    // Keys longer than one block are hashed first
    if (key_size > Sha1::BLOCK_SIZE) {
        Sha1::hash(key, key_size, block_key.data());
    } else if (key_size > 0) {
        memcpy(block_key.data(), key, key_size);
    }

    std::array<u8, Sha1::BLOCK_SIZE> ipad;
    std::array<u8, Sha1::BLOCK_SIZE> opad;
    for (u32 i = 0; i < Sha1::BLOCK_SIZE; i++) {
        ipad[i] = block_key[i] ^ 0x36;
        opad[i] = block_key[i] ^ 0x5C;
    }

    u8 inner[Sha1::HASH_SIZE];
    Sha1 sha;
    sha.update(ipad.data(), ipad.size());
    sha.update(data, size);
    sha.finalize(inner);

    sha.reset();
    sha.update(opad.data(), opad.size());
    sha.update(inner, sizeof(inner));
    sha.finalize(out);
}

//=============================================================================
// RC4
//=============================================================================

void Rc4::set_key(const u8* key, usize key_size) {
    for (u32 i = 0; i < 256; i++) {
        s_[i] = static_cast<u8>(i);
    }

    u8 j = 0;
    for (u32 i = 0; i < 256; i++) {
        j = static_cast<u8>(j + s_[i] + key[i % key_size]);
        std::swap(s_[i], s_[j]);
    }

    i_ = 0;
    j_ = 0;
}

void Rc4::process(u8* data, usize size) {
    for (usize n = 0; n < size; n++) {
        i_ = static_cast<u8>(i_ + 1);
        j_ = static_cast<u8>(j_ + s_[i_]);
        std::swap(s_[i_], s_[j_]);
        data[n] ^= s_[static_cast<u8>(s_[i_] + s_[j_])];
    }
}

} // namespace xcp360
