#include "destination_sink.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

FileSink::FileSink(std::string path) : path_(std::move(path)) {}

FileSink::~FileSink() {
    if (out_.is_open()) {
        out_.close();
    }
}

std::uint64_t FileSink::Open(std::uint64_t resume_offset) {
    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw InternalError("Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    const std::string part = PartPath();
    std::uint64_t offset = 0;
    if (resume_offset > 0 && fs::exists(part, ec)) {
        std::uint64_t existing = fs::file_size(part, ec);
        if (!ec && existing >= resume_offset) {
            // Bytes past the last committed chunk were never acknowledged.
            fs::resize_file(part, resume_offset, ec);
            if (!ec) {
                offset = resume_offset;
            }
        }
    }

    if (offset > 0) {
        out_.open(part, std::ios::binary | std::ios::app);
    } else {
        out_.open(part, std::ios::binary | std::ios::trunc);
    }
    if (!out_.is_open()) {
        throw InternalError("Failed to open " + part + " for writing");
    }
    return offset;
}

void FileSink::Write(const std::string& data) {
    out_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out_) {
        throw InternalError("Write to " + PartPath() + " failed");
    }
}

void FileSink::Flush() {
    out_.flush();
    if (!out_) {
        throw InternalError("Flush of " + PartPath() + " failed");
    }
}

std::string FileSink::Checksum() {
    Flush();
    return Md5HexOfFile(PartPath());
}

void FileSink::Commit() {
    out_.close();
    std::error_code ec;
    fs::rename(PartPath(), path_, ec);
    if (ec) {
        throw InternalError("Failed to move " + PartPath() + " to " + path_ + ": " + ec.message());
    }
}

void FileSink::Discard() {
    if (out_.is_open()) {
        out_.close();
    }
    std::error_code ec;
    fs::remove(PartPath(), ec);
    if (ec) {
        Logger::Warn("Could not remove " + PartPath() + ": " + ec.message(), "Transfer");
    }
}

void FileSink::Release() {
    if (out_.is_open()) {
        out_.close();
    }
}

std::uint64_t MemorySink::Open(std::uint64_t) {
    data_.clear();
    return 0;
}

void MemorySink::Write(const std::string& data) {
    data_.append(data);
}

std::string MemorySink::Checksum() {
    return Md5Hex(data_);
}

void MemorySink::Discard() {
    data_.clear();
    data_.shrink_to_fit();
}
