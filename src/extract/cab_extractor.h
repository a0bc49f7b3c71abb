/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Cabinet extraction
 *
 * The decrypted container is a plain Microsoft cabinet. Unpacking it
 * (LZX/MSZIP decompression) is delegated to an extractor backend.
 */

#pragma once

#include "xcp360/types.h"
#include <string>

namespace xcp360 {

/**
 * Abstract cabinet extractor
 */
class CabExtractor {
public:
    virtual ~CabExtractor() = default;

    /**
     * Extract every member of archive_path into dest_dir.
     * @param output Receives any diagnostics the backend produced
     */
    virtual Status extract(const std::string& archive_path, const std::string& dest_dir,
                           std::string& output) = 0;

    virtual const std::string& get_type() const = 0;
};

/**
 * Runs an external cabextract-compatible program:
 *   <program> -d <dest_dir> -F * <archive>
 *
 * stdout and stderr are captured together. A non-zero exit, a signal,
 * a missing program or an expired timeout are all ExtractionFailed.
 */
class SubprocessCabExtractor : public CabExtractor {
public:
    static constexpr u32 DEFAULT_TIMEOUT_MS = 300000;

    explicit SubprocessCabExtractor(std::string program = "cabextract",
                                    u32 timeout_ms = DEFAULT_TIMEOUT_MS);

    Status extract(const std::string& archive_path, const std::string& dest_dir,
                   std::string& output) override;

    const std::string& get_type() const override { return type_; }

    const std::string& program() const { return program_; }
    u32 timeout_ms() const { return timeout_ms_; }

private:
    // Exit code used by the child when exec fails
    static constexpr int EXEC_FAILED = 127;

    std::string program_;
    u32 timeout_ms_;
    std::string type_ = "subprocess";
};

} // namespace xcp360
