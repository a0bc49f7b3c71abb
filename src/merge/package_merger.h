/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Package merger
 *
 * Concatenates the members extracted from a decrypted XCP, in file-table
 * order, into one STFS package and stamps it as a LIVE package.
 */

#pragma once

#include "xcp360/types.h"
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace xcp360 {

// STFS magic values
enum class StfsMagic : u32 {
    CON  = 0x434F4E20,  // 'CON ' - Console signed
    LIVE = 0x4C495645,  // 'LIVE' - Xbox Live signed
    PIRS = 0x50495253,  // 'PIRS' - Publisher signed
};

/**
 * Extracted member, in merge order
 */
struct MergeMember {
    std::filesystem::path path;
    s32 ordinal;         // -1 if the name carries no ordinal
    u64 size;
};

struct MergeResult {
    std::vector<MergeMember> members;
    u64 output_size = 0;
};

class PackageMerger {
public:
    static constexpr usize CHUNK_SIZE = 4096;

    /**
     * List every regular file below member_dir in merge order:
     * by trailing 3-digit ordinal, then names without one.
     */
    Status collect(const std::string& member_dir, std::vector<MergeMember>& members);

    /**
     * Concatenate the members into output_path and write the LIVE magic
     * over its first 4 bytes.
     */
    Status merge(const std::string& member_dir, const std::string& output_path,
                 MergeResult& result);

    /**
     * Ordinal from the last 3 characters of a filename, or -1
     */
    static s32 parse_ordinal(const std::string& filename);

private:
    Status append_file(FILE* out, const MergeMember& member, u64& written);
    Status write_magic(FILE* out);
};

} // namespace xcp360
