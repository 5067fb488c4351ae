#include "file_source.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace ferry {

std::string mime_for_path(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"}
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : std::string(DEFAULT_MIME);
}

// --- DiskFile ---

std::expected<std::unique_ptr<DiskFile>, TransferError> DiskFile::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::unexpected(TransferError::InvalidInput);

    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::unexpected(TransferError::InvalidInput);

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::unexpected(TransferError::InvalidInput);

    return std::make_unique<DiskFile>(std::move(in), path.filename().string(), mime_for_path(path), size);
}

DiskFile::DiskFile(std::ifstream file, std::string name, std::string mime, uint64_t size)
    : file_(std::move(file)), name_(std::move(name)), mime_(std::move(mime)), size_(size) {}

std::expected<Bytes, TransferError> DiskFile::read(uint64_t offset, size_t length) {
    if (offset + length > size_) return std::unexpected(TransferError::ReadFailed);
    if (length == 0) return Bytes{};

    file_.clear(); // Clear EOF flags
    file_.seekg(static_cast<std::streamoff>(offset));

    Bytes buffer(length);
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (file_.gcount() != static_cast<std::streamsize>(length)) return std::unexpected(TransferError::ReadFailed);

    return buffer;
}

// --- MemoryFile ---

MemoryFile::MemoryFile(Bytes data, std::string name, std::string mime)
    : data_(std::move(data)), name_(std::move(name)), mime_(std::move(mime)) {
    if (name_.empty()) name_ = "file.bin";
    if (mime_.empty()) mime_ = std::string(DEFAULT_MIME);
}

std::expected<Bytes, TransferError> MemoryFile::read(uint64_t offset, size_t length) {
    if (offset + length > data_.size()) return std::unexpected(TransferError::ReadFailed);
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
}

} // namespace ferry
