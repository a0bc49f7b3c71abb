/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Master key parsing implementation
 */

#include "master_key.h"
#include "log_buffer.h"

namespace xcp360 {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Status parse_master_key(const std::string& text, std::vector<u8>& key) {
    key.clear();

    if (text.empty()) {
        XCP360_LOG_E(LogComponent::Core, "No key specified");
        return Status::InvalidArgument;
    }

    if (text.size() % 2 != 0) {
        key.assign(text.begin(), text.end());
        return Status::Ok;
    }

    key.reserve(text.size() / 2);
    for (usize i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            XCP360_LOG_E(LogComponent::Core, "Key is not valid hex at position %zu", i);
            key.clear();
            return Status::InvalidArgument;
        }
        key.push_back(static_cast<u8>((hi << 4) | lo));
    }
    return Status::Ok;
}

} // namespace xcp360
