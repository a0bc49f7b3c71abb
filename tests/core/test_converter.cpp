/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Converter Pipeline Tests
 */

#include <gtest/gtest.h>
#include "xcp360/converter.h"
#include "extract/cab_extractor.h"
#include "container/xcp_test_builder.h"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace xcp360 {
namespace test {

namespace fs = std::filesystem;

static std::vector<u8> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<u8>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static void write_file(const fs::path& path, const std::vector<u8>& data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

/**
 * Unpacks the stored (uncompressed) cabinets built by XcpTestBuilder,
 * the way cabextract would, and records what it was asked to do.
 */
class StoredCabExtractor : public CabExtractor {
public:
    Status extract(const std::string& archive_path, const std::string& dest_dir,
                   std::string& output) override {
        calls++;
        archive = archive_path;

        std::vector<u8> cab = read_file(archive_path);
        CabHeader header;
        if (cab.size() < sizeof(header)) {
            return Status::ExtractionFailed;
        }
        memcpy(&header, cab.data(), sizeof(header));
        if (!is_valid_cab_magic(header.magic)) {
            output = "not a cabinet";
            return Status::ExtractionFailed;
        }

        usize offset = header.files_offset;
        for (u32 i = 0; i < header.file_count; i++) {
            CabEntry entry;
            memcpy(&entry, cab.data() + offset, sizeof(entry));
            offset += sizeof(entry);

            std::string name(reinterpret_cast<const char*>(cab.data() + offset));
            offset += name.size() + 1;

            CabFolder folder;
            memcpy(&folder, cab.data() + xcp::FOLDER_TABLE_OFFSET +
                   entry.folder_index * xcp::FOLDER_STRIDE, sizeof(folder));
            const u8* begin = cab.data() + folder.data_offset + entry.folder_offset;
            write_file(fs::path(dest_dir) / name,
                       std::vector<u8>(begin, begin + entry.uncompressed_size));
            names.push_back(name);
        }
        return Status::Ok;
    }

    const std::string& get_type() const override { return type_; }

    int calls = 0;
    std::string archive;
    std::vector<std::string> names;

private:
    std::string type_ = "stored";
};

class ConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "xcp360_converter_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_ / "work");

        key_hex_ = "000102030405060708090a0b0c0d0e0f";
        for (u8 i = 0; i < 16; i++) {
            key_.push_back(i);
        }

        builder_.add_folder({
            { "default.xex", bytes_of("HEADpayload-one") },
            { "media.bin", bytes_of("-two") },
        });
        builder_.add_folder({ { "content.dat", bytes_of("-three") } });

        input_ = test_dir_ / "game.xcp";
        encrypted_ = builder_.build_encrypted(key_);
        write_file(input_, encrypted_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    ConverterConfig make_config() const {
        ConverterConfig config;
        config.key = key_hex_;
        config.work_dir = (test_dir_ / "work").string();
        return config;
    }

    // Stand-in for cabextract writing a single member "XXXX<payload>"
    std::string write_extractor_script(const std::string& name, const std::string& payload) const {
        fs::path script = test_dir_ / name;
        {
            std::ofstream file(script);
            file << "#!/bin/sh\nprintf 'XXXX" << payload << "' > \"$2/000\"\n";
        }
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
        return script.string();
    }

    bool work_dir_empty() const {
        return fs::is_empty(test_dir_ / "work");
    }

    fs::path test_dir_;
    fs::path input_;
    std::string key_hex_;
    std::vector<u8> key_;
    std::vector<u8> encrypted_;
    XcpTestBuilder builder_;
};

// ============================================================================
// Paths
// ============================================================================

TEST_F(ConverterTest, OutputPaths) {
    EXPECT_EQ(XcpConverter::output_path_for("/data/dlc/map_pack.xcp"), "/data/dlc/MAP_PACK");
    EXPECT_EQ(XcpConverter::backup_path_for("/data/dlc/map_pack.xcp"), "/data/dlc/MAP_PACK.bak");
    EXPECT_EQ(XcpConverter::output_path_for("title"), "TITLE");
}

// ============================================================================
// Initialization
// ============================================================================

TEST_F(ConverterTest, RejectsBadConfig) {
    XcpConverter converter;
    ConverterConfig config = make_config();

    config.key = "";
    EXPECT_EQ(converter.initialize(config), Status::InvalidArgument);

    config.key = "0g";
    EXPECT_EQ(converter.initialize(config), Status::InvalidArgument);

    config.key = key_hex_;
    config.extractor_timeout_ms = 0;
    EXPECT_EQ(converter.initialize(config), Status::InvalidArgument);
}

TEST_F(ConverterTest, NotInitialized) {
    XcpConverter converter;
    ConversionResult result;
    EXPECT_EQ(converter.convert(input_.string(), result), Status::Error);
    EXPECT_TRUE(fs::exists(input_));
}

TEST_F(ConverterTest, MissingInput) {
    XcpConverter converter;
    ASSERT_EQ(converter.initialize(make_config()), Status::Ok);

    ConversionResult result;
    EXPECT_EQ(converter.convert((test_dir_ / "missing.xcp").string(), result), Status::NotFound);
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_F(ConverterTest, ConvertsToLivePackage) {
    XcpConverter converter;
    ASSERT_EQ(converter.initialize(make_config()), Status::Ok);
    auto extractor = std::make_unique<StoredCabExtractor>();
    StoredCabExtractor* fake = extractor.get();
    converter.set_extractor(std::move(extractor));

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);

    EXPECT_EQ(fake->calls, 1);
    EXPECT_EQ(fs::path(fake->archive).filename().string(), "tmp.cab");
    EXPECT_EQ(fake->names, (std::vector<std::string>{ "default.000", "media.001", "content.002" }));

    EXPECT_EQ(result.folder_count, 2u);
    EXPECT_EQ(result.file_count, 3u);
    EXPECT_EQ(result.original_names,
              (std::vector<std::string>{ "default.xex", "media.bin", "content.dat" }));

    fs::path output = test_dir_ / "GAME";
    EXPECT_EQ(result.output_path, output.string());
    std::string expected = "LIVEpayload-one-two-three";
    EXPECT_EQ(read_file(output), bytes_of(expected));
    EXPECT_EQ(result.output_size, expected.size());

    // Input replaced, backup holds the original bytes, scratch space gone
    EXPECT_FALSE(fs::exists(input_));
    EXPECT_EQ(result.backup_path, (test_dir_ / "GAME.bak").string());
    EXPECT_EQ(read_file(result.backup_path), encrypted_);
    EXPECT_FALSE(fs::exists(test_dir_ / ".GAME.partial"));
    EXPECT_TRUE(work_dir_empty());
}

TEST_F(ConverterTest, NoBackupAndKeepWorkDir) {
    ConverterConfig config = make_config();
    config.backup = false;
    config.keep_work_dir = true;

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(config), Status::Ok);
    converter.set_extractor(std::make_unique<StoredCabExtractor>());

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);
    EXPECT_TRUE(result.backup_path.empty());
    EXPECT_FALSE(fs::exists(test_dir_ / "GAME.bak"));

    // GAME_XCP_XXXXXX/{tmp.cab,cache/}
    ASSERT_FALSE(work_dir_empty());
    fs::path kept = fs::directory_iterator(test_dir_ / "work")->path();
    EXPECT_EQ(kept.filename().string().rfind("GAME_XCP_", 0), 0u);
    EXPECT_TRUE(fs::exists(kept / "cache" / "default.000"));

    std::vector<u8> cab = read_file(kept / "tmp.cab");
    ASSERT_GE(cab.size(), 4u);
    EXPECT_EQ(memcmp(cab.data(), "MSCF", 4), 0);
}

TEST_F(ConverterTest, SubprocessExtractor) {
    ConverterConfig config = make_config();
    config.extractor_program = write_extractor_script("fake_cabextract.sh", "stfs");
    config.extractor_timeout_ms = 10000;

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(config), Status::Ok);

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);
    EXPECT_EQ(read_file(test_dir_ / "GAME"), bytes_of("LIVEstfs"));
}

TEST_F(ConverterTest, ReinitializeRebuildsExtractor) {
    ConverterConfig first = make_config();
    first.extractor_program = write_extractor_script("first.sh", "from_first");

    ConverterConfig second = make_config();
    second.extractor_program = write_extractor_script("second.sh", "from_second");

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(first), Status::Ok);
    ASSERT_EQ(converter.initialize(second), Status::Ok);

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);
    EXPECT_EQ(read_file(test_dir_ / "GAME"), bytes_of("LIVEfrom_second"));
}

TEST_F(ConverterTest, ReinitializeKeepsCustomExtractor) {
    XcpConverter converter;
    auto extractor = std::make_unique<StoredCabExtractor>();
    StoredCabExtractor* fake = extractor.get();
    converter.set_extractor(std::move(extractor));

    ConverterConfig config = make_config();
    config.extractor_program = write_extractor_script("unused.sh", "unused");
    ASSERT_EQ(converter.initialize(config), Status::Ok);
    ASSERT_EQ(converter.initialize(config), Status::Ok);

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);
    EXPECT_EQ(fake->calls, 1);
    EXPECT_EQ(read_file(test_dir_ / "GAME"), bytes_of("LIVEpayload-one-two-three"));
}

TEST_F(ConverterTest, ClearingCustomExtractorRestoresDefault) {
    ConverterConfig config = make_config();
    config.extractor_program = write_extractor_script("default.sh", "from_default");

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(config), Status::Ok);
    converter.set_extractor(std::make_unique<StoredCabExtractor>());
    converter.set_extractor(nullptr);

    ConversionResult result;
    ASSERT_EQ(converter.convert(input_.string(), result), Status::Ok);
    EXPECT_EQ(read_file(test_dir_ / "GAME"), bytes_of("LIVEfrom_default"));
}

TEST_F(ConverterTest, WrongKeyLeavesInput) {
    ConverterConfig config = make_config();
    config.key = "ff0102030405060708090a0b0c0d0e0f";

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(config), Status::Ok);
    auto extractor = std::make_unique<StoredCabExtractor>();
    StoredCabExtractor* fake = extractor.get();
    converter.set_extractor(std::move(extractor));

    ConversionResult result;
    EXPECT_EQ(converter.convert(input_.string(), result), Status::InvalidKey);

    EXPECT_EQ(fake->calls, 0);
    EXPECT_EQ(read_file(input_), encrypted_);
    EXPECT_FALSE(fs::exists(test_dir_ / "GAME"));
    EXPECT_TRUE(work_dir_empty());
}

TEST_F(ConverterTest, ExtractionFailureLeavesInput) {
    ConverterConfig config = make_config();
    config.extractor_program = (test_dir_ / "no_such_cabextract").string();

    XcpConverter converter;
    ASSERT_EQ(converter.initialize(config), Status::Ok);

    ConversionResult result;
    EXPECT_EQ(converter.convert(input_.string(), result), Status::ExtractionFailed);

    EXPECT_EQ(read_file(input_), encrypted_);
    EXPECT_FALSE(fs::exists(test_dir_ / "GAME"));
    EXPECT_FALSE(fs::exists(test_dir_ / ".GAME.partial"));
    EXPECT_TRUE(work_dir_empty());
}

} // namespace test
} // namespace xcp360
