#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace qrdrop::server
{

    struct DownloadFile
    {
        std::string display_name;
        std::filesystem::path absolute_path;
        std::uint64_t size_kb{};
    };

    // Resolves and stats a selected file. Throws TransferError(NotFound / InvalidRequest).
    DownloadFile make_download_file(const std::filesystem::path &path);

    // Files offered for download, in the order the operator added them.
    class DownloadCatalog
    {
    public:
        // Throws TransferError(AlreadyExists) when the display name is taken.
        void add(DownloadFile file);

        std::vector<DownloadFile> list() const;

        // Exact, case-sensitive match on display_name.
        std::optional<DownloadFile> find(std::string_view display_name) const;

        bool empty() const;
        std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::vector<DownloadFile> files_;
    };

} // namespace qrdrop::server
