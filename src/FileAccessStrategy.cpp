/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "FileAccessStrategy.h"
#include <errno.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds msSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string quoted(const std::string& filename) {
    return "'" + filename + "'";
}

std::string systemError() {
    return std::strerror(errno);
}

/// Closes a descriptor when leaving scope
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ != -1) {
            ::close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};
}  // namespace

std::unique_ptr<FileAccessStrategy> FileAccessStrategy::create(const std::string& filename,
                                                               const FileAccessConfig& config) {
    const size_t size = regularFileSize(filename);
    if (size == 0) {
        throw FileAccessException("Executable " + quoted(filename) + " is empty");
    }

    if (size < config.mmap_threshold) {
        return std::make_unique<InMemoryFile>(filename, config);
    }

    try {
        return std::make_unique<MemoryMappedFile>(filename);
    } catch (const FileAccessException& e) {
        if (!config.enable_fallback || size > config.max_in_memory_size) {
            throw;
        }
        std::cerr << "Warning: " << e.what() << ", reading the file instead\n";
    }

    auto fallback = std::make_unique<InMemoryFile>(filename, config);
    fallback->markFallback();
    return fallback;
}

size_t FileAccessStrategy::regularFileSize(const std::string& filename) {
    if (filename.empty()) {
        throw FileAccessException("No input file given");
    }

    std::error_code ec;
    const auto status = std::filesystem::status(filename, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw FileAccessException("Executable " + quoted(filename) + " not found" +
                                  (ec ? ": " + ec.message() : ""));
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw FileAccessException(quoted(filename) + " is not a regular file");
    }

    const auto size = std::filesystem::file_size(filename, ec);
    if (ec) {
        throw FileAccessException("Cannot stat " + quoted(filename) + ": " + ec.message());
    }
    if (size > static_cast<uintmax_t>(SIZE_MAX)) {
        throw FileAccessException(quoted(filename) + " does not fit in the address space");
    }
    return static_cast<size_t>(size);
}

// ============================================================================
// InMemoryFile
// ============================================================================

InMemoryFile::InMemoryFile(const std::string& filename, const FileAccessConfig& config) {
    const auto start = Clock::now();

    const size_t size = regularFileSize(filename);
    if (size > config.max_in_memory_size) {
        throw FileAccessException(quoted(filename) + " is " + std::to_string(size) +
                                  " bytes, more than the in-memory limit of " +
                                  std::to_string(config.max_in_memory_size));
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw FileAccessException("Cannot open " + quoted(filename) + ": " + systemError());
    }

    bytes_.resize(size);
    in.read(reinterpret_cast<char*>(bytes_.data()), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(in.gcount()) != size) {
        throw FileAccessException("Short read on " + quoted(filename) + ": got " +
                                  std::to_string(in.gcount()) + " of " + std::to_string(size) +
                                  " bytes");
    }

    metrics_.load_time = msSince(start);
    metrics_.memory_usage_bytes = bytes_.capacity();
    metrics_.strategy_used = getStrategyName();
}

// ============================================================================
// MemoryMappedFile
// ============================================================================

MemoryMappedFile::MemoryMappedFile(const std::string& filename) {
    const auto start = Clock::now();

    FdGuard fd(::open(filename.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() == -1) {
        throw FileAccessException("Cannot open " + quoted(filename) + ": " + systemError());
    }

    const size_t length = regularFileSize(filename);
    if (length == 0) {
        throw FileAccessException("Cannot map empty file " + quoted(filename));
    }

    void* mapping = ::mmap(nullptr, length, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (mapping == MAP_FAILED) {
        throw FileAccessException("Cannot map " + quoted(filename) + ": " + systemError());
    }

    mapping_ = mapping;
    length_ = length;

    metrics_.load_time = msSince(start);
    metrics_.strategy_used = getStrategyName();
}

MemoryMappedFile::~MemoryMappedFile() {
    unmap();
}

MemoryMappedFile::MemoryMappedFile(MemoryMappedFile&& other) noexcept
    : mapping_(std::exchange(other.mapping_, nullptr)),
      length_(std::exchange(other.length_, 0)),
      metrics_(std::move(other.metrics_)) {}

MemoryMappedFile& MemoryMappedFile::operator=(MemoryMappedFile&& other) noexcept {
    if (this != &other) {
        unmap();
        mapping_ = std::exchange(other.mapping_, nullptr);
        length_ = std::exchange(other.length_, 0);
        metrics_ = std::move(other.metrics_);
    }
    return *this;
}

void MemoryMappedFile::unmap() noexcept {
    if (mapping_) {
        ::munmap(mapping_, length_);
        mapping_ = nullptr;
        length_ = 0;
    }
}
