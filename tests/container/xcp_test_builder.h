/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Synthetic XCP containers for tests.
 *
 * Builds a plain container (header, key records, folder table, file table,
 * stored folder data) and encrypts it by applying the regions in the
 * reverse of the order the decryptor walks them, so every key record is
 * read in the same state the decryptor will see it.
 */

#pragma once

#include "xcp360/types.h"
#include "container/xcp_format.h"
#include "crypto/region_cipher.h"

#include <cstring>
#include <string>
#include <vector>

namespace xcp360 {
namespace test {

struct TestMember {
    std::string name;
    std::vector<u8> data;
};

class XcpTestBuilder {
public:
    /**
     * Add a folder; its members are stored back to back, uncompressed
     */
    void add_folder(std::vector<TestMember> members) {
        folders_.push_back(std::move(members));
    }

    /**
     * Override the magic written into the header
     */
    void set_magic(u32 magic) { magic_ = magic; }

    u32 files_offset() const { return files_offset_; }

    /**
     * Plain container, as the decryptor should leave it (before renaming)
     */
    std::vector<u8> build_plain() {
        data_offsets_.clear();

        u32 folder_count = static_cast<u32>(folders_.size());
        u32 file_count = 0;
        for (const auto& folder : folders_) {
            file_count += static_cast<u32>(folder.size());
        }

        u32 files_offset = xcp::FOLDER_TABLE_OFFSET + folder_count * xcp::FOLDER_STRIDE;
        files_offset_ = files_offset;
        u32 offset = files_offset;
        for (const auto& folder : folders_) {
            for (const auto& member : folder) {
                offset += sizeof(CabEntry) + static_cast<u32>(member.name.size()) + 1;
            }
        }
        files_end_ = offset;

        // Folder data follows the file table
        for (const auto& folder : folders_) {
            data_offsets_.push_back(offset);
            for (const auto& member : folder) {
                offset += static_cast<u32>(member.data.size());
            }
        }

        std::vector<u8> out(offset, 0);

        CabHeader header;
        memset(&header, 0, sizeof(header));
        header.magic = magic_;
        header.cabinet_size = offset;
        header.files_offset = files_offset;
        header.version = 0x0103;
        header.folder_count = static_cast<u16>(folder_count);
        header.file_count = static_cast<u16>(file_count);
        header.flags = 0x0004;
        memcpy(out.data(), &header, sizeof(header));

        write_key_record(out, xcp::FOLDER_TABLE_KEY_OFFSET, 0x11);
        write_key_record(out, xcp::FILE_TABLE_KEY_OFFSET, 0x22);
        write_key_record(out, xcp::HEADER_KEY_OFFSET, 0x33);

        // Folder table
        for (u32 i = 0; i < folder_count; i++) {
            u32 entry = xcp::FOLDER_TABLE_OFFSET + i * xcp::FOLDER_STRIDE;
            CabFolder folder;
            folder.data_offset = data_offsets_[i];
            folder.data_block_count = 1;
            folder.compression_type = 0;
            memcpy(out.data() + entry, &folder, sizeof(folder));
            write_key_record(out, entry + sizeof(CabFolder), static_cast<u8>(0x40 + i));
        }

        // File table and folder data
        offset = files_offset;
        for (u32 i = 0; i < folder_count; i++) {
            u32 in_folder = 0;
            for (const auto& member : folders_[i]) {
                CabEntry entry;
                entry.uncompressed_size = static_cast<u32>(member.data.size());
                entry.folder_offset = in_folder;
                entry.folder_index = static_cast<u16>(i);
                entry.date = 0x3A21;
                entry.time = 0x6000;
                entry.attributes = 0x20;
                memcpy(out.data() + offset, &entry, sizeof(entry));
                offset += sizeof(entry);

                memcpy(out.data() + offset, member.name.data(), member.name.size());
                offset += static_cast<u32>(member.name.size()) + 1;

                if (!member.data.empty()) {
                    memcpy(out.data() + data_offsets_[i] + in_folder,
                           member.data.data(), member.data.size());
                }
                in_folder += static_cast<u32>(member.data.size());
            }
        }
        return out;
    }

    /**
     * Encrypted container for the given master key
     */
    std::vector<u8> build_encrypted(const std::vector<u8>& key) {
        return encrypt(build_plain(), key);
    }

    /**
     * Encrypt a (possibly tampered) result of build_plain() using the
     * layout of the last build
     */
    std::vector<u8> encrypt(std::vector<u8> out, const std::vector<u8>& key) const {
        u32 folder_count = static_cast<u32>(folders_.size());

        // Folder data, each with the record after its descriptor
        for (u32 i = 0; i < folder_count; i++) {
            u32 record_offset = xcp::FOLDER_TABLE_OFFSET + i * xcp::FOLDER_STRIDE + sizeof(CabFolder);
            u32 end = (i + 1 == folder_count) ? static_cast<u32>(out.size()) : data_offsets_[i + 1];
            apply(out, key, record_offset, data_offsets_[i], end - data_offsets_[i]);
        }

        // File table, one keystream for all entries and names
        apply(out, key, xcp::FILE_TABLE_KEY_OFFSET, files_offset_, files_end_ - files_offset_);

        apply(out, key, xcp::FOLDER_TABLE_KEY_OFFSET, xcp::FOLDER_TABLE_OFFSET,
              folder_count * xcp::FOLDER_STRIDE);
        apply(out, key, xcp::HEADER_KEY_OFFSET, xcp::HEADER_OFFSET, xcp::HEADER_REGION_SIZE);
        return out;
    }

private:
    std::vector<std::vector<TestMember>> folders_;
    std::vector<u32> data_offsets_;
    u32 files_offset_ = 0;
    u32 files_end_ = 0;
    u32 magic_ = static_cast<u32>(CabMagic::MSCF);

    static void write_key_record(std::vector<u8>& out, u32 offset, u8 seed) {
        KeyRecord record;
        for (u32 i = 0; i < sizeof(record.checksum); i++) {
            record.checksum[i] = static_cast<u8>(seed * 7 + i * 13);
        }
        for (u32 i = 0; i < sizeof(record.confounder); i++) {
            record.confounder[i] = static_cast<u8>(seed ^ (i * 29));
        }
        memcpy(out.data() + offset, &record, sizeof(record));
    }

    static void apply(std::vector<u8>& out, const std::vector<u8>& key,
                      u32 record_offset, u32 data_offset, u32 size) {
        KeyRecord record;
        memcpy(&record, out.data() + record_offset, sizeof(record));
        RegionCipher cipher(key, record);
        cipher.apply(out.data() + data_offset, size);
    }
};

inline std::vector<u8> bytes_of(const std::string& text) {
    return std::vector<u8>(text.begin(), text.end());
}

} // namespace test
} // namespace xcp360
