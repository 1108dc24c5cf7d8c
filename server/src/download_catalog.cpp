#include "qrdrop/server/download_catalog.hpp"

#include <algorithm>
#include <mutex>

#include "qrdrop/error_codes.hpp"

namespace qrdrop::server
{

    DownloadFile make_download_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Cannot resolve path " + path.string() + ": " + ec.message());
        }

        const auto status = std::filesystem::status(absolute, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw TransferError(ErrorCode::NotFound, "File does not exist: " + absolute.string());
        }
        if (std::filesystem::is_directory(status))
        {
            throw TransferError(ErrorCode::InvalidRequest, "Select a file, not a directory: " + absolute.string());
        }

        const auto bytes = std::filesystem::file_size(absolute, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "Cannot read size of " + absolute.string() + ": " + ec.message());
        }

        return DownloadFile{
            .display_name = absolute.filename().string(),
            .absolute_path = absolute.lexically_normal(),
            .size_kb = (bytes + 1023) / 1024,
        };
    }

    void DownloadCatalog::add(DownloadFile file)
    {
        std::unique_lock lock(mutex_);
        const auto duplicate = std::any_of(files_.begin(), files_.end(), [&](const DownloadFile &existing)
                                           { return existing.display_name == file.display_name; });
        if (duplicate)
        {
            throw TransferError(ErrorCode::AlreadyExists, "A file named " + file.display_name + " is already offered");
        }
        files_.push_back(std::move(file));
    }

    std::vector<DownloadFile> DownloadCatalog::list() const
    {
        std::shared_lock lock(mutex_);
        return files_;
    }

    std::optional<DownloadFile> DownloadCatalog::find(std::string_view display_name) const
    {
        std::shared_lock lock(mutex_);
        auto it = std::find_if(files_.begin(), files_.end(), [&](const DownloadFile &file)
                               { return file.display_name == display_name; });
        if (it != files_.end())
        {
            return *it;
        }
        return std::nullopt;
    }

    bool DownloadCatalog::empty() const
    {
        std::shared_lock lock(mutex_);
        return files_.empty();
    }

    std::size_t DownloadCatalog::size() const
    {
        std::shared_lock lock(mutex_);
        return files_.size();
    }

} // namespace qrdrop::server
