/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XCP decryptor
 *
 * Walks an XCP container and decrypts it into a plain cabinet, in
 * this fixed order:
 *   1. header (validates the key through the cabinet magic)
 *   2. folder table
 *   3. file table, renaming each member to its ordinal
 *   4. folder data, one region per folder
 */

#pragma once

#include "xcp360/types.h"
#include "xcp_format.h"
#include "container_buffer.h"
#include <string>
#include <vector>

namespace xcp360 {

/**
 * Folder descriptor plus the data region it protects
 */
struct FolderRegion {
    CabFolder folder;
    u64 key_offset;      // Key record inside the folder's platform data
    u64 data_offset;
    u64 data_size;
};

/**
 * Decrypted file-table entry
 */
struct FileRecord {
    CabEntry entry;
    u64 entry_offset;
    u64 name_offset;
    std::string original_name;   // Name as stored in the package
    std::string name;            // Ordinal name written back
};

struct ParsedContainer {
    CabHeader header;
    std::vector<FolderRegion> folders;
    std::vector<FileRecord> files;
};

class XcpDecryptor {
public:
    XcpDecryptor() = default;

    /**
     * Set the master key used for every region
     */
    void set_key(const std::vector<u8>& master_key);

    /**
     * Decrypt the container in place.
     *
     * Returns InvalidKey if the header magic does not match after
     * decryption; in that case nothing past the header was touched.
     * Any failure leaves the buffer partially decrypted.
     */
    Status decrypt(ContainerBuffer& buffer, ParsedContainer& out);

private:
    std::vector<u8> master_key_;
    bool key_set_ = false;

    Status decrypt_region(ContainerBuffer& buffer, u64 key_offset,
                          u64 data_offset, u64 size, const char* label);

    Status decrypt_header(ContainerBuffer& buffer, CabHeader& header);
    Status decrypt_folder_table(ContainerBuffer& buffer, const CabHeader& header);
    Status decrypt_file_table(ContainerBuffer& buffer, const CabHeader& header,
                              std::vector<FileRecord>& files);
    Status parse_folders(const ContainerBuffer& buffer, const CabHeader& header,
                         std::vector<FolderRegion>& folders);
    Status decrypt_folders(ContainerBuffer& buffer, const std::vector<FolderRegion>& folders);
};

} // namespace xcp360
