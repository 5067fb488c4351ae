#include "config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <print>
#include <nlohmann/json.hpp>

namespace ferry {

using json = nlohmann::json;

uint32_t clamp_chunk_size(int64_t requested) {
    if (requested <= 0) requested = DEFAULT_CHUNK_SIZE;
    return static_cast<uint32_t>(std::clamp<int64_t>(requested, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE));
}

uint64_t max_chunk_count(uint64_t size) {
    return size / MIN_CHUNK_SIZE + 1;
}

std::expected<TransferConfig, ConfigError> parse_config(const std::string& text) {
    TransferConfig cfg;
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected(ConfigError::ParseFailed);

        cfg.chunk_size = clamp_chunk_size(j.value("chunkSize", static_cast<int64_t>(DEFAULT_CHUNK_SIZE)));
        cfg.default_key = j.value("defaultKey", "");
        cfg.prefer_route = j.value("preferRoute", "");
        cfg.auto_accept = j.value("autoAccept", true);

        auto max_size = j.value("maxFileSize", static_cast<int64_t>(DEFAULT_MAX_FILE_SIZE));
        cfg.max_file_size = max_size > 0 ? static_cast<uint64_t>(max_size) : DEFAULT_MAX_FILE_SIZE;
    } catch (const json::exception& e) {
        std::println(stderr, "[Config] Parse Error: {}", e.what());
        return std::unexpected(ConfigError::ParseFailed);
    }

    // Trimmed like the UI fields they come from
    auto trim = [](std::string& s) {
        auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) { s.clear(); return; }
        s = s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
    };
    trim(cfg.default_key);
    trim(cfg.prefer_route);

    return cfg;
}

std::expected<TransferConfig, ConfigError> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        std::println("[Config] {} not found, using defaults.", path.string());
        return TransferConfig{};
    }

    std::ifstream in(path);
    if (!in.is_open()) return std::unexpected(ConfigError::OpenFailed);

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

} // namespace ferry
