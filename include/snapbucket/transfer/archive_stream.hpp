#pragma once

#include "snapbucket/system/subprocess.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace snapbucket {

/// A stream of archive bytes consumed by the upload loop.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fills `buf` with up to `n` bytes. Returns fewer than `n` only at end
    // of stream (0 once exhausted).
    virtual size_t read(uint8_t* buf, size_t n) = 0;

    // Releases the producer after end of stream. Throws SourceFailure when
    // the producer did not exit cleanly.
    virtual void finish() = 0;
};

/// A consumer of archive bytes on the restore side.
class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Throws TransferCorruption when the consumer stopped accepting input
    virtual void write(std::span<const uint8_t> data) = 0;

    // Signals end of input and waits for the consumer
    virtual void finish() = 0;
};

/// `tar --create` of a directory tree, optionally piped through `gzip -6`.
class ArchiveSource : public ByteSource {
public:
    // Throws CommandFailed when a stage cannot be started
    static std::unique_ptr<ArchiveSource> open(const std::filesystem::path& root, bool gzip);

    size_t read(uint8_t* buf, size_t n) override;
    void finish() override;

    uint64_t bytes_read() const { return bytes_read_; }

private:
    ArchiveSource() = default;

    std::unique_ptr<Subprocess> tar_;
    std::unique_ptr<Subprocess> gzip_;
    Subprocess* tail_ = nullptr;
    uint64_t bytes_read_ = 0;
    bool eof_ = false;
    bool finished_ = false;
};

/// One long-lived `tar --extract` fed through its stdin.
class ArchiveExtractor : public ByteSink {
public:
    static std::unique_ptr<ArchiveExtractor> open(const std::filesystem::path& root, bool gzip);

    void write(std::span<const uint8_t> data) override;
    void finish() override;

    uint64_t bytes_written() const { return bytes_written_; }

private:
    ArchiveExtractor() = default;

    std::unique_ptr<Subprocess> tar_;
    uint64_t bytes_written_ = 0;
    bool finished_ = false;
};

class ChunkSizer;

/// Copies a file into `sink` in blocks sized by `sizer`. Returns bytes copied.
uint64_t copy_file_to_sink(const std::filesystem::path& path, ByteSink& sink,
                           const ChunkSizer& sizer);

}  // namespace snapbucket
