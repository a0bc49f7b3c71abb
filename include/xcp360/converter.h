/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Main converter interface
 */

#pragma once

#include "xcp360/types.h"
#include <memory>
#include <string>
#include <vector>

namespace xcp360 {

class CabExtractor;

/**
 * Converter configuration
 */
struct ConverterConfig {
    // Key as given by the user: even length = hex, otherwise raw bytes
    std::string key;

    // Copy the input to <STEM>.bak before converting
    bool backup = true;

    // Extraction settings
    std::string extractor_program = "cabextract";
    u32 extractor_timeout_ms = 300000;

    // Scratch space; empty = system temp directory
    std::string work_dir;
    bool keep_work_dir = false;
};

/**
 * Outcome of a successful conversion
 */
struct ConversionResult {
    std::string output_path;
    std::string backup_path;      // Empty when backups are disabled
    u32 folder_count = 0;
    u32 file_count = 0;
    u64 output_size = 0;

    // Member names as stored in the package, in table order
    std::vector<std::string> original_names;
};

/**
 * XCP to LIVE converter
 *
 * Decrypts an XCP file in memory, extracts the resulting cabinet into a
 * scratch directory and merges the members into <dir>/<STEM>. The input
 * file stays untouched until the output has been written; it is removed
 * at the end.
 */
class XcpConverter {
public:
    XcpConverter();
    ~XcpConverter();

    // Disable copy
    XcpConverter(const XcpConverter&) = delete;
    XcpConverter& operator=(const XcpConverter&) = delete;

    /**
     * Parse the key and (re)build the default extractor from config.
     * An extractor given to set_extractor() is kept.
     */
    Status initialize(const ConverterConfig& config);

    /**
     * Replace the extraction backend; nullptr restores the default one
     */
    void set_extractor(std::unique_ptr<CabExtractor> extractor);

    /**
     * Run the whole pipeline on one XCP file
     */
    Status convert(const std::string& input_path, ConversionResult& result);

    /**
     * <dir>/<STEM uppercased>
     */
    static std::string output_path_for(const std::string& input_path);

    /**
     * <dir>/<STEM uppercased>.bak
     */
    static std::string backup_path_for(const std::string& input_path);

private:
    ConverterConfig config_;
    std::vector<u8> master_key_;
    std::unique_ptr<CabExtractor> extractor_;
    bool custom_extractor_ = false;
    bool initialized_ = false;
};

} // namespace xcp360
