#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qrdrop::server
{

    constexpr std::uint16_t kDefaultPort = 1082;
    constexpr std::uint64_t kDefaultMaxUploadBytes = 100ULL << 20;
    constexpr std::chrono::seconds kDefaultIdleTimeout{30};

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{kDefaultPort};
        std::filesystem::path upload_dir;
        std::optional<std::string> advertised_host;
        std::uint64_t max_upload_bytes{kDefaultMaxUploadBytes};
        // Longest a connection may go without delivering a byte before it is dropped.
        std::chrono::seconds idle_timeout{kDefaultIdleTimeout};
        std::vector<std::filesystem::path> catalog_files;
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
        bool headless{false};
    };

} // namespace qrdrop::server
