/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Package merger implementation
 */

#include "package_merger.h"
#include "core/log_buffer.h"
#include "xcp360/feature_flags.h"

#include <algorithm>
#include <cstdio>
#include <system_error>

namespace xcp360 {

namespace fs = std::filesystem;

s32 PackageMerger::parse_ordinal(const std::string& filename) {
    if (filename.size() < 3) {
        return -1;
    }

    s32 value = 0;
    for (usize i = filename.size() - 3; i < filename.size(); i++) {
        char c = filename[i];
        if (c < '0' || c > '9') {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

Status PackageMerger::collect(const std::string& member_dir, std::vector<MergeMember>& members) {
    members.clear();

    std::error_code ec;
    if (!fs::is_directory(member_dir, ec)) {
        XCP360_LOG_E(LogComponent::Merge, "Member directory not found: %s", member_dir.c_str());
        return Status::NotFound;
    }

    fs::recursive_directory_iterator it(member_dir, ec);
    if (ec) {
        XCP360_LOG_E(LogComponent::Merge, "Cannot list %s: %s", member_dir.c_str(), ec.message().c_str());
        return Status::IoError;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            XCP360_LOG_E(LogComponent::Merge, "Cannot list %s: %s", member_dir.c_str(), ec.message().c_str());
            return Status::IoError;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        MergeMember member;
        member.path = it->path();
        member.ordinal = parse_ordinal(member.path.filename().string());
        member.size = it->file_size(ec);
        if (ec) {
            return Status::IoError;
        }
        if (member.ordinal < 0) {
            XCP360_LOG_W(LogComponent::Merge, "Member %s has no ordinal, appending it last",
                         member.path.string().c_str());
        }
        members.push_back(std::move(member));
    }
    if (ec) {
        return Status::IoError;
    }

    std::sort(members.begin(), members.end(), [](const MergeMember& a, const MergeMember& b) {
        bool a_ordered = a.ordinal >= 0;
        bool b_ordered = b.ordinal >= 0;
        if (a_ordered != b_ordered) return a_ordered;
        if (a.ordinal != b.ordinal) return a.ordinal < b.ordinal;
        return a.path < b.path;
    });

    for (usize i = 1; i < members.size(); i++) {
        if (members[i].ordinal >= 0 && members[i].ordinal == members[i - 1].ordinal) {
            XCP360_LOG_W(LogComponent::Merge, "Ordinal %03d appears more than once", members[i].ordinal);
        }
    }

    if (members.empty()) {
        XCP360_LOG_E(LogComponent::Merge, "No members found in %s", member_dir.c_str());
        return Status::NotFound;
    }
    return Status::Ok;
}

Status PackageMerger::merge(const std::string& member_dir, const std::string& output_path,
                            MergeResult& result) {
    result = MergeResult{};

    Status status = collect(member_dir, result.members);
    if (status != Status::Ok) {
        return status;
    }

    FILE* out = fopen(output_path.c_str(), "wb+");
    if (!out) {
        XCP360_LOG_E(LogComponent::Merge, "Failed to create %s", output_path.c_str());
        return Status::IoError;
    }

    XCP360_LOG_I(LogComponent::Merge, "Merging %zu extracted file(s)...", result.members.size());
    for (const auto& member : result.members) {
        status = append_file(out, member, result.output_size);
        if (status != Status::Ok) {
            fclose(out);
            return status;
        }
    }

    XCP360_LOG_I(LogComponent::Merge, "Converting to a LIVE package...");
    status = write_magic(out);
    if (fclose(out) != 0 && status == Status::Ok) {
        status = Status::IoError;
    }
    if (status != Status::Ok) {
        XCP360_LOG_E(LogComponent::Merge, "Failed to finish %s", output_path.c_str());
        return status;
    }

    result.output_size = std::max<u64>(result.output_size, 4);
    return Status::Ok;
}

Status PackageMerger::append_file(FILE* out, const MergeMember& member, u64& written) {
    FILE* in = fopen(member.path.string().c_str(), "rb");
    if (!in) {
        XCP360_LOG_E(LogComponent::Merge, "Failed to open %s", member.path.string().c_str());
        return Status::IoError;
    }

    u8 chunk[CHUNK_SIZE];
    u64 copied = 0;
    for (;;) {
        usize n = fread(chunk, 1, sizeof(chunk), in);
        if (n > 0 && fwrite(chunk, 1, n, out) != n) {
            fclose(in);
            XCP360_LOG_E(LogComponent::Merge, "Write failed while appending %s",
                         member.path.string().c_str());
            return Status::IoError;
        }
        copied += n;
        if (n < sizeof(chunk)) {
            break;
        }
    }

    bool read_error = ferror(in) != 0;
    fclose(in);
    if (read_error) {
        XCP360_LOG_E(LogComponent::Merge, "Read failed on %s", member.path.string().c_str());
        return Status::IoError;
    }

    XCP360_TRACE_IF(trace_merge, LogComponent::Merge, "appended %s (%llu bytes)",
                    member.path.filename().string().c_str(),
                    static_cast<unsigned long long>(copied));
    written += copied;
    return Status::Ok;
}

Status PackageMerger::write_magic(FILE* out) {
    u32 magic = static_cast<u32>(StfsMagic::LIVE);
    u8 tag[4] = {
        static_cast<u8>(magic >> 24), static_cast<u8>(magic >> 16),
        static_cast<u8>(magic >> 8), static_cast<u8>(magic),
    };

    if (fflush(out) != 0 || fseek(out, 0, SEEK_SET) != 0) {
        return Status::IoError;
    }
    if (fwrite(tag, 1, sizeof(tag), out) != sizeof(tag)) {
        return Status::IoError;
    }
    return Status::Ok;
}

} // namespace xcp360
