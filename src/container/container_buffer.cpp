/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Container buffer implementation
 */

#include "container_buffer.h"
#include "crypto/region_cipher.h"
#include "core/log_buffer.h"

#include <cstdio>

namespace xcp360 {

Status ContainerBuffer::load(const std::string& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        XCP360_LOG_E(LogComponent::Container, "Failed to open container: %s", path.c_str());
        return Status::NotFound;
    }

    if (fseek(file, 0, SEEK_END) != 0) {
        fclose(file);
        return Status::IoError;
    }
    long length = ftell(file);
    if (length < 0 || fseek(file, 0, SEEK_SET) != 0) {
        fclose(file);
        return Status::IoError;
    }

    std::vector<u8> data(static_cast<usize>(length));
    if (!data.empty() && fread(data.data(), 1, data.size(), file) != data.size()) {
        XCP360_LOG_E(LogComponent::Container, "Short read on container: %s", path.c_str());
        fclose(file);
        return Status::IoError;
    }
    fclose(file);

    data_ = std::move(data);
    XCP360_LOG_D(LogComponent::Container, "Loaded %s (%zu bytes)", path.c_str(), data_.size());
    return Status::Ok;
}

Status ContainerBuffer::save(const std::string& path) const {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        XCP360_LOG_E(LogComponent::Container, "Failed to create %s", path.c_str());
        return Status::IoError;
    }

    bool ok = data_.empty() || fwrite(data_.data(), 1, data_.size(), file) == data_.size();
    if (fclose(file) != 0) {
        ok = false;
    }
    if (!ok) {
        XCP360_LOG_E(LogComponent::Container, "Failed to write %s", path.c_str());
        return Status::IoError;
    }
    return Status::Ok;
}

Status ContainerBuffer::write(u64 offset, const void* src, usize size) {
    if (!contains(offset, size)) {
        return Status::CorruptContainer;
    }
    memcpy(data_.data() + offset, src, size);
    return Status::Ok;
}

Status ContainerBuffer::decrypt_range(RegionCipher& cipher, u64 offset, u64 size) {
    if (!contains(offset, size)) {
        XCP360_LOG_E(LogComponent::Container,
                     "Region 0x%llx+0x%llx outside container (0x%zx bytes)",
                     static_cast<unsigned long long>(offset),
                     static_cast<unsigned long long>(size), data_.size());
        return Status::CorruptContainer;
    }
    cipher.apply(data_.data() + offset, static_cast<usize>(size));
    return Status::Ok;
}

} // namespace xcp360
