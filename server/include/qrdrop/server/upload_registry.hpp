#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace qrdrop::server
{

    struct UploadProgress
    {
        std::uint64_t total_size{};
        std::uint64_t uploaded{};
    };

    // In-flight uploads keyed by the client's upload id. Every operation holds the same mutex,
    // so the upload copy loop and progress polls may interleave freely.
    class UploadRegistry
    {
    public:
        // Returns false and leaves the existing entry alone when the id is already in use.
        bool begin(const std::string &upload_id, std::uint64_t total_size);

        // Clamped to total_size. Unknown ids are ignored.
        void advance(const std::string &upload_id, std::uint64_t delta);

        std::optional<UploadProgress> snapshot(const std::string &upload_id) const;

        // Idempotent.
        void end(const std::string &upload_id);

        std::size_t active_count() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadProgress> uploads_;
    };

    // Ends the session when the upload handler leaves scope, whatever the outcome.
    class UploadSessionGuard
    {
    public:
        UploadSessionGuard(UploadRegistry &registry, std::string upload_id);
        ~UploadSessionGuard();

        UploadSessionGuard(const UploadSessionGuard &) = delete;
        UploadSessionGuard &operator=(const UploadSessionGuard &) = delete;

        const std::string &upload_id() const noexcept { return upload_id_; }

    private:
        UploadRegistry &registry_;
        std::string upload_id_;
    };

} // namespace qrdrop::server
