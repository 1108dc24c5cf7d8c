#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

#include <httplib.h>

#include "qrdrop/server/config.hpp"
#include "qrdrop/server/download_catalog.hpp"
#include "qrdrop/server/route_handlers.hpp"
#include "qrdrop/server/session_url.hpp"
#include "qrdrop/server/upload_registry.hpp"

namespace qrdrop::server
{

    enum class ServerState
    {
        Stopped,
        Starting,
        Running
    };

    std::string_view to_string(ServerState state) noexcept;

    // What one successful start() produced. Fixed until the next start.
    struct ServiceRound
    {
        std::uint16_t port{};
        SessionUrl url;
    };

    class TransferServer
    {
    public:
        TransferServer(ServerConfig config, DownloadCatalog &catalog, UploadRegistry &registry,
                       SessionUrlBuilder url_builder);
        TransferServer(const TransferServer &) = delete;
        TransferServer &operator=(const TransferServer &) = delete;
        ~TransferServer();

        // Closes a running listener first. Port 0 binds an ephemeral port.
        // Throws TransferError(BindFailed) and stays stopped when the port cannot be bound.
        ServiceRound start(std::uint16_t port);

        // Returns false when nothing was running.
        bool stop();

        ServerState state() const noexcept { return state_.load(); }
        std::optional<ServiceRound> current_round() const;

        const ServerConfig &config() const noexcept { return config_; }

    private:
        void configure_transport();
        void close_listener_locked();

        ServerConfig config_;
        DownloadCatalog &catalog_;
        UploadRegistry &registry_;
        SessionUrlBuilder url_builder_;
        httplib::Server http_;
        RouteHandlers handlers_;

        mutable std::mutex lifecycle_mutex_;
        std::atomic<ServerState> state_{ServerState::Stopped};
        std::optional<ServiceRound> round_;
        // Runs listen_after_bind() for the current round.
        std::thread listen_thread_;
    };

} // namespace qrdrop::server
