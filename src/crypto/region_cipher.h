/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Region cipher
 *
 * Session key = HMAC-SHA1(master key, record checksum), used as an RC4
 * key. The 8-byte confounder is run through the keystream and thrown
 * away before any payload byte is processed.
 */

#pragma once

#include "xcp360/types.h"
#include "xe_crypt.h"
#include "container/xcp_format.h"
#include <vector>

namespace xcp360 {

class RegionCipher {
public:
    RegionCipher(const std::vector<u8>& master_key, const KeyRecord& record);

    /**
     * Apply the continuing keystream to data (in-place).
     * Decryption and encryption are the same operation.
     */
    void apply(u8* data, usize size);

    /**
     * Payload bytes processed so far (confounder excluded)
     */
    u64 position() const { return position_; }

private:
    Rc4 rc4_;
    u64 position_ = 0;
};

} // namespace xcp360
