#include "qrdrop/server/upload_registry.hpp"

#include <algorithm>

namespace qrdrop::server
{

    bool UploadRegistry::begin(const std::string &upload_id, std::uint64_t total_size)
    {
        std::lock_guard lock(mutex_);
        const auto [it, inserted] = uploads_.try_emplace(upload_id, UploadProgress{.total_size = total_size, .uploaded = 0});
        return inserted;
    }

    void UploadRegistry::advance(const std::string &upload_id, std::uint64_t delta)
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
        {
            return;
        }
        auto &progress = it->second;
        const auto room = progress.total_size - progress.uploaded;
        progress.uploaded += std::min(room, delta);
    }

    std::optional<UploadProgress> UploadRegistry::snapshot(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it != uploads_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    void UploadRegistry::end(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        uploads_.erase(upload_id);
    }

    std::size_t UploadRegistry::active_count() const
    {
        std::lock_guard lock(mutex_);
        return uploads_.size();
    }

    UploadSessionGuard::UploadSessionGuard(UploadRegistry &registry, std::string upload_id)
        : registry_(registry), upload_id_(std::move(upload_id)) {}

    UploadSessionGuard::~UploadSessionGuard()
    {
        registry_.end(upload_id_);
    }

} // namespace qrdrop::server
