/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Master key parsing
 */

#pragma once

#include "xcp360/types.h"
#include <string>
#include <vector>

namespace xcp360 {

/**
 * Convert a user supplied key to bytes.
 *
 * Even-length strings are hex ("0A1b..."), anything else is used as
 * raw bytes. Empty keys and bad hex digits are InvalidArgument.
 */
Status parse_master_key(const std::string& text, std::vector<u8>& key);

} // namespace xcp360
