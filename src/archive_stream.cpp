#include "snapbucket/transfer/archive_stream.hpp"
#include "snapbucket/core/errors.hpp"
#include "snapbucket/core/log.hpp"
#include "snapbucket/transfer/chunk_sizer.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace snapbucket {

// ============================================================================
// ArchiveSource
// ============================================================================

std::unique_ptr<ArchiveSource> ArchiveSource::open(const std::filesystem::path& root, bool gzip) {
    std::unique_ptr<ArchiveSource> source(new ArchiveSource());

    SubprocessOptions tar_options;
    tar_options.capture_stdout = true;
    source->tar_ = std::make_unique<Subprocess>(
        std::vector<std::string>{"tar", "--directory", root.string(), "--create",
                                 "--preserve-permissions", "--file", "-", "."},
        tar_options);
    source->tail_ = source->tar_.get();

    if (gzip) {
        SubprocessOptions gzip_options;
        gzip_options.capture_stdout = true;
        gzip_options.stdin_fd = source->tar_->release_stdout();
        source->gzip_ = std::make_unique<Subprocess>(
            std::vector<std::string>{"gzip", "--to-stdout", "-6"}, gzip_options);
        source->tail_ = source->gzip_.get();
    }

    log_debug(2, "Archiving %s%s", root.c_str(), gzip ? " (gzip)" : "");
    return source;
}

size_t ArchiveSource::read(uint8_t* buf, size_t n) {
    size_t filled = 0;
    while (filled < n && !eof_) {
        size_t got = tail_->read(buf + filled, n - filled);
        if (got == 0) {
            eof_ = true;
            break;
        }
        filled += got;
    }
    bytes_read_ += filled;
    return filled;
}

void ArchiveSource::finish() {
    if (finished_) return;
    finished_ = true;

    int gzip_status = gzip_ ? gzip_->wait() : 0;
    int tar_status = tar_->wait();
    if (tar_status != 0) {
        throw SourceFailure("tar exited with " + std::to_string(tar_status), tar_->command());
    }
    if (gzip_status != 0) {
        throw SourceFailure("gzip exited with " + std::to_string(gzip_status), gzip_->command());
    }
}

// ============================================================================
// ArchiveExtractor
// ============================================================================

std::unique_ptr<ArchiveExtractor> ArchiveExtractor::open(const std::filesystem::path& root,
                                                         bool gzip) {
    std::unique_ptr<ArchiveExtractor> extractor(new ArchiveExtractor());

    std::vector<std::string> argv = {"tar", "--extract", "--directory", root.string(),
                                     "--preserve-permissions", "--preserve-order",
                                     "--file", "-"};
    if (gzip) argv.push_back("--gzip");

    SubprocessOptions options;
    options.pipe_stdin = true;
    extractor->tar_ = std::make_unique<Subprocess>(std::move(argv), options);
    log_debug(2, "Extracting into %s%s", root.c_str(), gzip ? " (gzip)" : "");
    return extractor;
}

void ArchiveExtractor::write(std::span<const uint8_t> data) {
    if (finished_) {
        throw TransferCorruption("write after extractor was closed", tar_->command());
    }
    if (!tar_->write(data)) {
        int status = tar_->wait();
        finished_ = true;
        throw TransferCorruption("tar stopped reading its input (exit " +
                                 std::to_string(status) + ")", tar_->command());
    }
    bytes_written_ += data.size();
}

void ArchiveExtractor::finish() {
    if (finished_) return;
    finished_ = true;
    tar_->close_stdin();
    int status = tar_->wait();
    if (status != 0) {
        throw TransferCorruption("tar exited with " + std::to_string(status), tar_->command());
    }
}

uint64_t copy_file_to_sink(const std::filesystem::path& path, ByteSink& sink,
                           const ChunkSizer& sizer) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot open downloaded file " + path.string(), path.string());
    }

    uint64_t remaining = std::filesystem::file_size(path);
    uint64_t copied = 0;
    std::vector<uint8_t> buffer;
    while (remaining > 0) {
        uint64_t block = std::min(sizer.next(), remaining);
        buffer.resize(static_cast<size_t>(block));
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(block));
        auto got = static_cast<uint64_t>(in.gcount());
        if (got == 0) {
            throw StorageError("Short read from " + path.string(), path.string());
        }
        sink.write({buffer.data(), static_cast<size_t>(got)});
        copied += got;
        remaining -= std::min(remaining, got);
    }
    return copied;
}

}  // namespace snapbucket
