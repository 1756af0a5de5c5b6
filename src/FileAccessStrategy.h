/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file FileAccessStrategy.h
 * @brief Loading an executable into a byte buffer for analysis
 *
 * The analysis engine only sees a pointer and a length. Small executables are
 * read into a vector; executables that carry full debug information can be
 * hundreds of megabytes and are mapped read-only instead.
 */

/**
 * @brief Configuration for file access strategies
 */
struct FileAccessConfig {
    static constexpr size_t DEFAULT_MMAP_THRESHOLD = 10 * 1024 * 1024;               ///< 10MB
    static constexpr size_t DEFAULT_MAX_IN_MEMORY_SIZE = 2ULL * 1024 * 1024 * 1024;  ///< 2GB

    size_t mmap_threshold = DEFAULT_MMAP_THRESHOLD;          ///< Map files at least this large
    bool enable_fallback = true;                             ///< Read into memory if mapping fails
    size_t max_in_memory_size = DEFAULT_MAX_IN_MEMORY_SIZE;  ///< Refuse to read larger files
};

/**
 * @brief How the executable was loaded, reported with --verbose
 */
struct AccessMetrics {
    std::chrono::milliseconds load_time{0};
    size_t memory_usage_bytes = 0;  ///< Heap bytes held (0 for mappings)
    bool fallback_used = false;     ///< Mapping failed and the file was read instead
    std::string strategy_used;
};

/**
 * @brief Missing, unreadable, empty or oversized input file
 */
class FileAccessException : public std::runtime_error {
public:
    explicit FileAccessException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class FileAccessStrategy
 * @brief Read-only view of an executable's bytes
 *
 * @code
 * auto file = FileAccessStrategy::create("firmware.elf");
 * Functions functions = StackUsageAnalyzer::analyzeExecutable(file->data(), file->size());
 * @endcode
 */
class FileAccessStrategy {
public:
    virtual ~FileAccessStrategy() = default;

    /// @brief First byte of the file, valid for the lifetime of this object
    virtual const uint8_t* data() const = 0;

    virtual size_t size() const = 0;

    virtual bool isMemoryMapped() const = 0;

    /// @brief "In-memory" or "Memory-mapped"
    virtual std::string getStrategyName() const = 0;

    virtual AccessMetrics getMetrics() const = 0;

    /**
     * @brief Open an executable with the strategy suited to its size
     *
     * Files below config.mmap_threshold are read. Larger files are mapped,
     * and read after all if mapping fails and config.enable_fallback is set.
     *
     * @throws FileAccessException if the path is not a non-empty regular file
     *         or cannot be loaded
     */
    static std::unique_ptr<FileAccessStrategy> create(const std::string& filename,
                                                      const FileAccessConfig& config = {});

    /**
     * @brief Size of a regular file
     * @throws FileAccessException if the path does not name a regular file
     */
    static size_t regularFileSize(const std::string& filename);
};

/**
 * @class InMemoryFile
 * @brief Whole file copied into a std::vector<uint8_t>
 */
class InMemoryFile : public FileAccessStrategy {
public:
    /**
     * @throws FileAccessException if the file is larger than
     *         config.max_in_memory_size or a read comes up short
     */
    explicit InMemoryFile(const std::string& filename, const FileAccessConfig& config = {});

    const uint8_t* data() const override { return bytes_.data(); }
    size_t size() const override { return bytes_.size(); }
    bool isMemoryMapped() const override { return false; }
    std::string getStrategyName() const override { return "In-memory"; }
    AccessMetrics getMetrics() const override { return metrics_; }

    void markFallback() { metrics_.fallback_used = true; }

private:
    std::vector<uint8_t> bytes_;
    AccessMetrics metrics_;
};

/**
 * @class MemoryMappedFile
 * @brief Private read-only mapping of the whole file
 *
 * The descriptor is closed as soon as the mapping exists; only the mapping is
 * owned. Movable, not copyable.
 */
class MemoryMappedFile : public FileAccessStrategy {
public:
    /**
     * @throws FileAccessException if the file cannot be opened or mapped
     */
    explicit MemoryMappedFile(const std::string& filename);

    ~MemoryMappedFile() override;

    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;

    MemoryMappedFile(MemoryMappedFile&& other) noexcept;
    MemoryMappedFile& operator=(MemoryMappedFile&& other) noexcept;

    const uint8_t* data() const override { return static_cast<const uint8_t*>(mapping_); }
    size_t size() const override { return length_; }
    bool isMemoryMapped() const override { return true; }
    std::string getStrategyName() const override { return "Memory-mapped"; }
    AccessMetrics getMetrics() const override { return metrics_; }

private:
    void unmap() noexcept;

    void* mapping_ = nullptr;
    size_t length_ = 0;
    AccessMetrics metrics_;
};
