/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Filename normalizer implementation
 */

#include "filename_normalizer.h"
#include "core/log_buffer.h"

#include <cstdio>

namespace xcp360 {

std::string FilenameNormalizer::ordinal_tag(u32 ordinal) {
    char tag[16];
    snprintf(tag, sizeof(tag), "%03u", ordinal);
    return tag;
}

Status FilenameNormalizer::normalize(u64 name_offset, u32 name_length,
                                     std::string& original, std::string& normalized) {
    if (next_ordinal_ >= MAX_ENTRIES) {
        XCP360_LOG_E(LogComponent::Container, "More than %u file entries", MAX_ENTRIES);
        return Status::CorruptContainer;
    }
    if (name_length == 0 || !buffer_.contains(name_offset, name_length)) {
        return Status::CorruptContainer;
    }

    u32 chars = name_length - 1;
    const char* name = reinterpret_cast<const char*>(buffer_.data() + name_offset);
    original.assign(name, chars);

    if (chars < ORDINAL_DIGITS) {
        XCP360_LOG_E(LogComponent::Container,
                     "File entry %u name \"%s\" is too short to carry an ordinal",
                     next_ordinal_, original.c_str());
        return Status::CorruptContainer;
    }

    std::string tag = ordinal_tag(next_ordinal_);
    Status status = buffer_.write(name_offset + chars - ORDINAL_DIGITS, tag.data(), ORDINAL_DIGITS);
    if (status != Status::Ok) {
        return status;
    }

    normalized = original;
    normalized.replace(chars - ORDINAL_DIGITS, ORDINAL_DIGITS, tag);
    next_ordinal_++;
    return Status::Ok;
}

} // namespace xcp360
