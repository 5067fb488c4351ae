#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <expected>
#include <filesystem>
#include "crypto.hpp"
#include "errors.hpp"

namespace ferry {

    using crypto::Bytes;

    constexpr std::string_view DEFAULT_MIME = "application/octet-stream";

    // A file selected for sending. Chunks are pulled one at a time so a
    // transfer never holds more than one chunk of plaintext.
    class FileSource {
    public:
        virtual ~FileSource() = default;

        virtual const std::string& name() const = 0;
        virtual const std::string& mime() const = 0;
        virtual uint64_t size() const = 0;

        // Read [offset, offset + length). Short reads are errors.
        virtual std::expected<Bytes, TransferError> read(uint64_t offset, size_t length) = 0;
    };

    class DiskFile : public FileSource {
    public:
        // InvalidInput when the path is missing, not a regular file or unreadable
        static std::expected<std::unique_ptr<DiskFile>, TransferError> open(const std::filesystem::path& path);

        // Takes over a stream already opened in binary mode
        DiskFile(std::ifstream file, std::string name, std::string mime, uint64_t size);

        const std::string& name() const override { return name_; }
        const std::string& mime() const override { return mime_; }
        uint64_t size() const override { return size_; }

        std::expected<Bytes, TransferError> read(uint64_t offset, size_t length) override;

    private:
        std::ifstream file_;
        std::string name_;
        std::string mime_;
        uint64_t size_ = 0;
    };

    // Bytes handed over by another component instead of picked from disk
    class MemoryFile : public FileSource {
    public:
        MemoryFile(Bytes data, std::string name, std::string mime = std::string(DEFAULT_MIME));

        const std::string& name() const override { return name_; }
        const std::string& mime() const override { return mime_; }
        uint64_t size() const override { return data_.size(); }

        std::expected<Bytes, TransferError> read(uint64_t offset, size_t length) override;

    private:
        Bytes data_;
        std::string name_;
        std::string mime_;
    };

    // Best-effort guess from the extension
    std::string mime_for_path(const std::filesystem::path& path);

} // namespace ferry
