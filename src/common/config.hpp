#pragma once
#include <string>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace ferry {

    constexpr uint32_t MIN_CHUNK_SIZE = 512;
    constexpr uint32_t MAX_CHUNK_SIZE = 32'768;
    constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024;
    constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 1ull << 30; // 1 GiB

    enum class ConfigError {
        OpenFailed,
        ParseFailed
    };

    // Owned by whoever embeds the engine; the engine only reads it.
    struct TransferConfig {
        uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
        std::string default_key;  // passphrase used when none is given explicitly
        std::string prefer_route;
        bool auto_accept = true;
        uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE; // incoming transfers beyond this are refused
    };

    // 0 means "unset" and falls back to the default before clamping
    uint32_t clamp_chunk_size(int64_t requested);

    // Most chunks a file of `size` bytes can honestly be split into
    uint64_t max_chunk_count(uint64_t size);

    // Missing file -> defaults. Unknown keys are ignored.
    std::expected<TransferConfig, ConfigError> load_config(const std::filesystem::path& path);

    std::expected<TransferConfig, ConfigError> parse_config(const std::string& text);

} // namespace ferry
