/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Converter pipeline: backup, decrypt, extract, merge, publish.
 */

#include "xcp360/converter.h"
#include "core/log_buffer.h"
#include "core/master_key.h"
#include "container/container_buffer.h"
#include "container/xcp_decryptor.h"
#include "extract/cab_extractor.h"
#include "merge/package_merger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace xcp360 {

namespace fs = std::filesystem;

static constexpr const char* TMP_CAB_FILE = "tmp.cab";
static constexpr const char* CACHE_DIR = "cache";

static std::string upper_stem(const fs::path& path) {
    std::string stem = path.stem().string();
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return stem;
}

/**
 * Scratch directory removed on scope exit unless kept
 */
class ScopedWorkDir {
public:
    ScopedWorkDir() = default;
    ~ScopedWorkDir() {
        if (path_.empty()) {
            return;
        }
        if (keep_) {
            XCP360_LOG_I(LogComponent::Core, "Keeping work directory %s", path_.string().c_str());
            return;
        }
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            XCP360_LOG_W(LogComponent::Core, "Could not remove %s: %s",
                         path_.string().c_str(), ec.message().c_str());
        }
    }

    ScopedWorkDir(const ScopedWorkDir&) = delete;
    ScopedWorkDir& operator=(const ScopedWorkDir&) = delete;

    Status create(const std::string& base, const std::string& stem, bool keep) {
        std::error_code ec;
        fs::path root = base.empty() ? fs::temp_directory_path(ec) : fs::path(base);
        if (ec) {
            XCP360_LOG_E(LogComponent::Core, "No temp directory: %s", ec.message().c_str());
            return Status::IoError;
        }
        fs::create_directories(root, ec);
        if (ec) {
            XCP360_LOG_E(LogComponent::Core, "Cannot create %s: %s",
                         root.string().c_str(), ec.message().c_str());
            return Status::IoError;
        }

        std::string name_template = (root / (stem + "_XCP_XXXXXX")).string();
        std::vector<char> name(name_template.begin(), name_template.end());
        name.push_back('\0');
        if (!mkdtemp(name.data())) {
            XCP360_LOG_E(LogComponent::Core, "mkdtemp(%s) failed: %s",
                         name_template.c_str(), strerror(errno));
            return Status::IoError;
        }

        path_ = name.data();
        keep_ = keep;
        return Status::Ok;
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    bool keep_ = false;
};

XcpConverter::XcpConverter() = default;
XcpConverter::~XcpConverter() = default;

Status XcpConverter::initialize(const ConverterConfig& config) {
    Status status = parse_master_key(config.key, master_key_);
    if (status != Status::Ok) {
        return status;
    }

    if (config.extractor_timeout_ms == 0) {
        XCP360_LOG_E(LogComponent::Core, "Extractor timeout must be positive");
        return Status::InvalidArgument;
    }

    config_ = config;
    if (!custom_extractor_) {
        extractor_ = std::make_unique<SubprocessCabExtractor>(config_.extractor_program,
                                                              config_.extractor_timeout_ms);
    }
    initialized_ = true;
    return Status::Ok;
}

void XcpConverter::set_extractor(std::unique_ptr<CabExtractor> extractor) {
    extractor_ = std::move(extractor);
    custom_extractor_ = extractor_ != nullptr;
    if (!extractor_ && initialized_) {
        extractor_ = std::make_unique<SubprocessCabExtractor>(config_.extractor_program,
                                                              config_.extractor_timeout_ms);
    }
}

std::string XcpConverter::output_path_for(const std::string& input_path) {
    fs::path input(input_path);
    return (input.parent_path() / upper_stem(input)).string();
}

std::string XcpConverter::backup_path_for(const std::string& input_path) {
    fs::path input(input_path);
    return (input.parent_path() / (upper_stem(input) + ".bak")).string();
}

Status XcpConverter::convert(const std::string& input_path, ConversionResult& result) {
    if (!initialized_ || !extractor_) {
        XCP360_LOG_E(LogComponent::Core, "Converter not initialized");
        return Status::Error;
    }

    result = ConversionResult{};
    std::error_code ec;

    if (!fs::is_regular_file(input_path, ec)) {
        XCP360_LOG_E(LogComponent::Core, "The specified input file doesn't exist: %s",
                     input_path.c_str());
        return Status::NotFound;
    }

    fs::path input(input_path);
    std::string stem = upper_stem(input);
    fs::path output = output_path_for(input_path);

    if (config_.backup) {
        XCP360_LOG_I(LogComponent::Core, "Backing up the input file...");
        result.backup_path = backup_path_for(input_path);
        fs::copy_file(input, result.backup_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            XCP360_LOG_E(LogComponent::Core, "Backup to %s failed: %s",
                         result.backup_path.c_str(), ec.message().c_str());
            return Status::IoError;
        }
    } else {
        XCP360_LOG_I(LogComponent::Core, "Skipping backup...");
    }

    // Decrypt a scratch copy held in memory
    XCP360_LOG_I(LogComponent::Core, "Decrypting XCP file...");
    ContainerBuffer container;
    Status status = container.load(input_path);
    if (status != Status::Ok) {
        return status;
    }

    XcpDecryptor decryptor;
    decryptor.set_key(master_key_);
    ParsedContainer parsed;
    status = decryptor.decrypt(container, parsed);
    if (status != Status::Ok) {
        return status;
    }

    result.folder_count = parsed.header.folder_count;
    result.file_count = parsed.header.file_count;
    for (const auto& file : parsed.files) {
        result.original_names.push_back(file.original_name);
    }

    ScopedWorkDir work;
    status = work.create(config_.work_dir, stem, config_.keep_work_dir);
    if (status != Status::Ok) {
        return status;
    }

    fs::path cab_path = work.path() / TMP_CAB_FILE;
    fs::path cache_dir = work.path() / CACHE_DIR;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        XCP360_LOG_E(LogComponent::Core, "Cannot create %s: %s",
                     cache_dir.string().c_str(), ec.message().c_str());
        return Status::IoError;
    }

    status = container.save(cab_path.string());
    if (status != Status::Ok) {
        return status;
    }

    XCP360_LOG_I(LogComponent::Core, "Extracting CAB file...");
    std::string extractor_output;
    status = extractor_->extract(cab_path.string(), cache_dir.string(), extractor_output);
    if (status != Status::Ok) {
        XCP360_LOG_E(LogComponent::Core, "CAB extraction failed!");
        return Status::ExtractionFailed;
    }

    // Merge next to the output so the final rename stays on one filesystem
    fs::path partial = output.parent_path() / ("." + stem + ".partial");
    PackageMerger merger;
    MergeResult merged;
    status = merger.merge(cache_dir.string(), partial.string(), merged);
    if (status != Status::Ok) {
        fs::remove(partial, ec);
        return status;
    }

    XCP360_LOG_I(LogComponent::Core, "Moving file...");
    fs::rename(partial, output, ec);
    if (ec) {
        XCP360_LOG_E(LogComponent::Core, "Cannot move package to %s: %s",
                     output.string().c_str(), ec.message().c_str());
        fs::remove(partial, ec);
        return Status::IoError;
    }

    result.output_path = output.string();
    result.output_size = merged.output_size;

    // The package replaces the XCP file
    if (!fs::equivalent(input, output, ec)) {
        fs::remove(input, ec);
        if (ec) {
            XCP360_LOG_E(LogComponent::Core, "Cannot remove %s: %s",
                         input_path.c_str(), ec.message().c_str());
            return Status::IoError;
        }
    }

    XCP360_LOG_I(LogComponent::Core, "Done! %s (%llu bytes)", result.output_path.c_str(),
                 static_cast<unsigned long long>(result.output_size));
    return Status::Ok;
}

} // namespace xcp360
