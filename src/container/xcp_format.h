/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * XCP container layout
 *
 * An XCP file is a Microsoft cabinet whose header, folder table,
 * file table and folder data are RC4 encrypted region by region.
 * Each region has a key record (checksum + confounder) at a fixed
 * location used to derive its session key.
 */

#pragma once

#include "xcp360/types.h"

namespace xcp360 {

// Cabinet magic, accepted in both byte orders
enum class CabMagic : u32 {
    MSCF        = 0x4643534D,  // 'M' 'S' 'C' 'F' read little-endian
    MSCFSwapped = 0x4D534346,
};

#pragma pack(push, 1)

/**
 * Cabinet header
 */
struct CabHeader {
    le_u32 magic;                    // CabMagic
    le_u32 header_checksum;
    le_u32 cabinet_size;             // Declared container size
    le_u32 folders_checksum;
    le_u32 files_offset;             // Absolute offset of the file table
    le_u32 files_checksum;
    le_u16 version;
    le_u16 folder_count;
    le_u16 file_count;
    le_u16 flag_count;
    le_u16 flags;
    le_u16 set_id;
    le_u16 cabinet_index;
};
static_assert(sizeof(CabHeader) == 0x26);

/**
 * Folder descriptor, followed on disk by XENON_DATA_SIZE bytes
 */
struct CabFolder {
    le_u32 data_offset;              // Absolute offset of the first data block
    le_u16 data_block_count;
    le_u16 compression_type;
};
static_assert(sizeof(CabFolder) == 8);

/**
 * File entry, followed on disk by a null terminated name
 */
struct CabEntry {
    le_u32 uncompressed_size;
    le_u32 folder_offset;            // Uncompressed offset inside the folder
    le_u16 folder_index;
    le_u16 date;
    le_u16 time;
    le_u16 attributes;
};
static_assert(sizeof(CabEntry) == 16);

/**
 * RC4/SHA key record
 */
struct KeyRecord {
    u8 checksum[0x14];               // HMAC message for the session key
    u8 confounder[8];                // Discarded keystream prefix
};
static_assert(sizeof(KeyRecord) == 0x1C);

#pragma pack(pop)

namespace xcp {
    // Header region
    constexpr u32 HEADER_KEY_OFFSET = 0x60;
    constexpr u32 HEADER_OFFSET = 0x00;
    constexpr u32 HEADER_REGION_SIZE = 0x60;

    // Folder table region
    constexpr u32 FOLDER_TABLE_KEY_OFFSET = 0x28;
    constexpr u32 FOLDER_TABLE_OFFSET = 0x180;

    // File table region (keystream shared by all entries)
    constexpr u32 FILE_TABLE_KEY_OFFSET = 0x44;

    // Platform data after each folder descriptor; holds the folder's key record
    constexpr u32 XENON_DATA_SIZE = 0x1C;
    constexpr u32 FOLDER_STRIDE = sizeof(CabFolder) + XENON_DATA_SIZE;
}

inline bool is_valid_cab_magic(u32 magic) {
    return magic == static_cast<u32>(CabMagic::MSCF) ||
           magic == static_cast<u32>(CabMagic::MSCFSwapped);
}

} // namespace xcp360
