/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Decrypting reader implementation
 */

#include "decrypting_reader.h"
#include "core/log_buffer.h"

namespace xcp360 {

Status DecryptingReader::decrypt_next(u64 size) {
    Status status = buffer_.decrypt_range(cipher_, offset_, size);
    if (status != Status::Ok) {
        return status;
    }
    offset_ += size;
    return Status::Ok;
}

Status DecryptingReader::decrypt_until_terminator(u32& length) {
    length = 0;

    for (;;) {
        if (!buffer_.contains(offset_, 1)) {
            XCP360_LOG_E(LogComponent::Container,
                         "Unterminated string at 0x%llx runs past the container end",
                         static_cast<unsigned long long>(offset_ - length));
            return Status::CorruptContainer;
        }

        Status status = buffer_.decrypt_range(cipher_, offset_, 1);
        if (status != Status::Ok) {
            return status;
        }

        u8 value = buffer_.data()[offset_];
        offset_++;
        length++;

        if (value == 0) {
            return Status::Ok;
        }
    }
}

} // namespace xcp360
