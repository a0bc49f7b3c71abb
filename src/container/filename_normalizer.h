/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Filename normalizer
 *
 * Replaces the last three characters of every decrypted file-table name
 * with the entry's zero-padded ordinal ("000", "001", ...). The name
 * length and terminator are unchanged, so the table layout is preserved,
 * and extracted members sort back into table order.
 */

#pragma once

#include "xcp360/types.h"
#include "container_buffer.h"
#include <string>

namespace xcp360 {

class FilenameNormalizer {
public:
    static constexpr u32 ORDINAL_DIGITS = 3;
    static constexpr u32 MAX_ENTRIES = 1000;

    explicit FilenameNormalizer(ContainerBuffer& buffer) : buffer_(buffer) {}

    /**
     * Rename the next entry's name in place.
     * @param name_offset  Offset of the first name character
     * @param name_length  Name length including the terminator
     * @param original     Receives the decrypted name before renaming
     * @param normalized   Receives the name as written back
     */
    Status normalize(u64 name_offset, u32 name_length,
                     std::string& original, std::string& normalized);

    /**
     * Number of names renamed so far
     */
    u32 count() const { return next_ordinal_; }

    static std::string ordinal_tag(u32 ordinal);

private:
    ContainerBuffer& buffer_;
    u32 next_ordinal_ = 0;
};

} // namespace xcp360
