/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Decrypting reader
 *
 * A cursor that drives one region cipher forward over the container.
 * Used for the file table, where fixed-size entries and variable-length
 * names share a single keystream.
 */

#pragma once

#include "xcp360/types.h"
#include "container_buffer.h"
#include "crypto/region_cipher.h"

namespace xcp360 {

class DecryptingReader {
public:
    DecryptingReader(ContainerBuffer& buffer, const RegionCipher& cipher, u64 offset)
        : buffer_(buffer), cipher_(cipher), offset_(offset) {}

    /**
     * Decrypt the next size bytes in place and advance past them
     */
    Status decrypt_next(u64 size);

    /**
     * Decrypt one byte at a time until a zero byte is produced.
     * At least one byte is always consumed.
     * @param length Receives the bytes consumed, terminator included
     */
    Status decrypt_until_terminator(u32& length);

    u64 offset() const { return offset_; }

private:
    ContainerBuffer& buffer_;
    RegionCipher cipher_;
    u64 offset_;
};

} // namespace xcp360
