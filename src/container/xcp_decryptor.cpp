/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XCP decryptor implementation
 */

#include "xcp_decryptor.h"
#include "decrypting_reader.h"
#include "filename_normalizer.h"
#include "crypto/region_cipher.h"
#include "core/log_buffer.h"
#include "xcp360/feature_flags.h"

namespace xcp360 {

static unsigned long long ull(u64 v) {
    return static_cast<unsigned long long>(v);
}

void XcpDecryptor::set_key(const std::vector<u8>& master_key) {
    master_key_ = master_key;
    key_set_ = !master_key_.empty();
}

Status XcpDecryptor::decrypt(ContainerBuffer& buffer, ParsedContainer& out) {
    if (!key_set_) {
        XCP360_LOG_E(LogComponent::Container, "XCP key not set");
        return Status::InvalidArgument;
    }

    XCP360_LOG_I(LogComponent::Container, "Decrypting CAB header...");
    Status status = decrypt_header(buffer, out.header);
    if (status != Status::Ok) {
        return status;
    }
    XCP360_LOG_I(LogComponent::Container, "Key appears to be OK!");

    if (out.header.cabinet_size != buffer.size()) {
        XCP360_LOG_W(LogComponent::Container,
                     "Header declares 0x%x bytes but the file has 0x%zx",
                     static_cast<u32>(out.header.cabinet_size), buffer.size());
    }

    XCP360_LOG_I(LogComponent::Container, "Decrypting folder data...");
    status = decrypt_folder_table(buffer, out.header);
    if (status != Status::Ok) {
        return status;
    }

    XCP360_LOG_I(LogComponent::Container, "Decrypting filenames...");
    status = decrypt_file_table(buffer, out.header, out.files);
    if (status != Status::Ok) {
        return status;
    }

    XCP360_LOG_I(LogComponent::Container, "Parsing folders...");
    status = parse_folders(buffer, out.header, out.folders);
    if (status != Status::Ok) {
        return status;
    }

    XCP360_LOG_I(LogComponent::Container, "Decrypting folders...");
    status = decrypt_folders(buffer, out.folders);
    if (status != Status::Ok) {
        return status;
    }

    XCP360_LOG_I(LogComponent::Container, "Decrypted %zu folder(s), %zu file(s)",
                 out.folders.size(), out.files.size());
    return Status::Ok;
}

Status XcpDecryptor::decrypt_region(ContainerBuffer& buffer, u64 key_offset,
                                    u64 data_offset, u64 size, const char* label) {
    KeyRecord record;
    if (buffer.read(key_offset, record) != Status::Ok) {
        XCP360_LOG_E(LogComponent::Container, "%s key record at 0x%llx outside container",
                     label, ull(key_offset));
        return Status::CorruptContainer;
    }

    XCP360_TRACE_IF(trace_regions, LogComponent::Crypto,
                    "%s: key 0x%llx, data 0x%llx+0x%llx",
                    label, ull(key_offset), ull(data_offset), ull(size));

    RegionCipher cipher(master_key_, record);
    return buffer.decrypt_range(cipher, data_offset, size);
}

Status XcpDecryptor::decrypt_header(ContainerBuffer& buffer, CabHeader& header) {
    Status status = decrypt_region(buffer, xcp::HEADER_KEY_OFFSET, xcp::HEADER_OFFSET,
                                   xcp::HEADER_REGION_SIZE, "header");
    if (status != Status::Ok) {
        return status;
    }

    status = buffer.read(xcp::HEADER_OFFSET, header);
    if (status != Status::Ok) {
        return status;
    }

    if (!is_valid_cab_magic(header.magic)) {
        XCP360_LOG_E(LogComponent::Container, "Invalid key specified (magic %08X)",
                     static_cast<u32>(header.magic));
        return Status::InvalidKey;
    }
    return Status::Ok;
}

Status XcpDecryptor::decrypt_folder_table(ContainerBuffer& buffer, const CabHeader& header) {
    u64 table_size = static_cast<u64>(header.folder_count) * xcp::FOLDER_STRIDE;
    return decrypt_region(buffer, xcp::FOLDER_TABLE_KEY_OFFSET, xcp::FOLDER_TABLE_OFFSET,
                          table_size, "folder table");
}

Status XcpDecryptor::decrypt_file_table(ContainerBuffer& buffer, const CabHeader& header,
                                        std::vector<FileRecord>& files) {
    u32 file_count = header.file_count;
    if (file_count > FilenameNormalizer::MAX_ENTRIES) {
        XCP360_LOG_E(LogComponent::Container, "File count %u exceeds %u ordinal names",
                     file_count, FilenameNormalizer::MAX_ENTRIES);
        return Status::CorruptContainer;
    }

    KeyRecord record;
    if (buffer.read(xcp::FILE_TABLE_KEY_OFFSET, record) != Status::Ok) {
        return Status::CorruptContainer;
    }

    u64 files_offset = header.files_offset;
    if (!buffer.contains(files_offset, 0)) {
        XCP360_LOG_E(LogComponent::Container, "File table offset 0x%llx outside container",
                     ull(files_offset));
        return Status::CorruptContainer;
    }

    DecryptingReader reader(buffer, RegionCipher(master_key_, record), files_offset);
    FilenameNormalizer normalizer(buffer);

    files.clear();
    files.reserve(file_count);

    for (u32 i = 0; i < file_count; i++) {
        FileRecord file;
        file.entry_offset = reader.offset();

        Status status = reader.decrypt_next(sizeof(CabEntry));
        if (status != Status::Ok) {
            XCP360_LOG_E(LogComponent::Container, "File entry %u outside container", i);
            return status;
        }
        status = buffer.read(file.entry_offset, file.entry);
        if (status != Status::Ok) {
            return status;
        }

        file.name_offset = reader.offset();
        u32 name_length = 0;
        status = reader.decrypt_until_terminator(name_length);
        if (status != Status::Ok) {
            return status;
        }

        status = normalizer.normalize(file.name_offset, name_length,
                                      file.original_name, file.name);
        if (status != Status::Ok) {
            return status;
        }

        XCP360_TRACE_IF(trace_entries, LogComponent::Container,
                        "entry %u: \"%s\" -> \"%s\" (%u bytes, folder %u)",
                        i, file.original_name.c_str(), file.name.c_str(),
                        static_cast<u32>(file.entry.uncompressed_size),
                        static_cast<u32>(file.entry.folder_index));

        files.push_back(std::move(file));
    }
    return Status::Ok;
}

Status XcpDecryptor::parse_folders(const ContainerBuffer& buffer, const CabHeader& header,
                                   std::vector<FolderRegion>& folders) {
    u32 folder_count = header.folder_count;
    folders.clear();
    folders.reserve(folder_count);

    u64 offset = xcp::FOLDER_TABLE_OFFSET;
    for (u32 i = 0; i < folder_count; i++) {
        FolderRegion region;
        if (buffer.read(offset, region.folder) != Status::Ok) {
            return Status::CorruptContainer;
        }
        region.key_offset = offset + sizeof(CabFolder);
        region.data_offset = region.folder.data_offset;
        region.data_size = 0;
        folders.push_back(region);

        offset += xcp::FOLDER_STRIDE;
    }

    // Each folder runs up to the next one, the last one to the end of the file
    for (u32 i = 0; i < folder_count; i++) {
        FolderRegion& region = folders[i];
        u64 end = (i + 1 == folder_count) ? buffer.size() : folders[i + 1].data_offset;

        if (region.data_offset > end || !buffer.contains(region.data_offset, end - region.data_offset)) {
            XCP360_LOG_E(LogComponent::Container,
                         "Folder %u data 0x%llx..0x%llx is not inside the container",
                         i, ull(region.data_offset), ull(end));
            return Status::CorruptContainer;
        }
        region.data_size = end - region.data_offset;
    }
    return Status::Ok;
}

Status XcpDecryptor::decrypt_folders(ContainerBuffer& buffer,
                                     const std::vector<FolderRegion>& folders) {
    for (const auto& region : folders) {
        Status status = decrypt_region(buffer, region.key_offset, region.data_offset,
                                       region.data_size, "folder");
        if (status != Status::Ok) {
            return status;
        }
    }
    return Status::Ok;
}

} // namespace xcp360
