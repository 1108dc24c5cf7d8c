#include "qrdrop/server/transfer_server.hpp"

#include <algorithm>
#include <ctime>
#include <exception>

#include <spdlog/spdlog.h>

#include "qrdrop/error_codes.hpp"

namespace qrdrop::server
{

    namespace
    {

        constexpr std::time_t kKeepAliveSeconds = 5;

        void log_failure(const httplib::Request &request, ErrorCode code, std::string_view message)
        {
            if (http_status(code) >= 500)
            {
                spdlog::error("{}: {} {}: {} ({})", describe_remote(request), request.method, request.path, message,
                              to_string(code));
            }
            else
            {
                spdlog::warn("{}: {} {}: {} ({})", describe_remote(request), request.method, request.path, message,
                             to_string(code));
            }
        }

    } // namespace

    std::string_view to_string(ServerState state) noexcept
    {
        switch (state)
        {
        case ServerState::Stopped:
            return "stopped";
        case ServerState::Starting:
            return "starting";
        case ServerState::Running:
            return "running";
        }
        return "unknown";
    }

    TransferServer::TransferServer(ServerConfig config, DownloadCatalog &catalog, UploadRegistry &registry,
                                   SessionUrlBuilder url_builder)
        : config_(std::move(config)),
          catalog_(catalog),
          registry_(registry),
          url_builder_(std::move(url_builder)),
          handlers_(HandlerServices{catalog_, registry_, config_.upload_dir, config_.max_upload_bytes})
    {
        configure_transport();
        handlers_.register_routes(http_);
    }

    TransferServer::~TransferServer()
    {
        stop();
    }

    void TransferServer::configure_transport()
    {
        const auto idle = static_cast<std::time_t>(config_.idle_timeout.count());
        http_.set_payload_max_length(static_cast<std::size_t>(config_.max_upload_bytes));
        http_.set_read_timeout(idle, 0);
        http_.set_write_timeout(idle, 0);
        http_.set_keep_alive_timeout(std::min(idle, kKeepAliveSeconds));

        // Clients that wait for "100 Continue" get a bad upload rejected before they send the body.
        http_.set_expect_100_continue_handler(
            [this](const httplib::Request &request, httplib::Response &response)
            {
                if (request.method != "POST" || request.path != routes::kUpload)
                {
                    return 100;
                }
                try
                {
                    handlers_.check_upload_head(request);
                }
                catch (const TransferError &error)
                {
                    log_failure(request, error.code(), error.what());
                    set_error(response, error.code(), error.what());
                    return response.status;
                }
                return 100;
            });

        http_.set_exception_handler(
            [](const httplib::Request &request, httplib::Response &response, std::exception_ptr failure)
            {
                try
                {
                    std::rethrow_exception(failure);
                }
                catch (const TransferError &error)
                {
                    log_failure(request, error.code(), error.what());
                    set_error(response, error.code(), error.what());
                }
                catch (const std::exception &ex)
                {
                    log_failure(request, ErrorCode::InternalError, ex.what());
                    set_error(response, ErrorCode::InternalError, ex.what());
                }
                catch (...)
                {
                    log_failure(request, ErrorCode::InternalError, "unknown exception");
                    set_error(response, ErrorCode::InternalError, "Internal error");
                }
            });

        http_.set_error_handler(
            [](const httplib::Request &request, httplib::Response &response)
            {
                if (!response.body.empty())
                {
                    return;
                }
                if (response.status == 404)
                {
                    set_error(response, ErrorCode::NotFound, "Not found: " + request.path);
                }
                else
                {
                    response.set_content("Request failed", "text/plain; charset=utf-8");
                }
            });

        http_.set_logger([](const httplib::Request &request, const httplib::Response &response)
                         { spdlog::debug("{} {} {} -> {}", describe_remote(request), request.method, request.path,
                                         response.status); });
    }

    ServiceRound TransferServer::start(std::uint16_t port)
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (listen_thread_.joinable())
        {
            spdlog::info("Restarting: closing listener on port {}", round_ ? round_->port : 0);
            close_listener_locked();
        }

        state_ = ServerState::Starting;
        int bound = -1;
        if (port == 0)
        {
            bound = http_.bind_to_any_port(config_.address);
        }
        else if (http_.bind_to_port(config_.address, port))
        {
            bound = port;
        }
        if (bound <= 0)
        {
            state_ = ServerState::Stopped;
            throw TransferError(ErrorCode::BindFailed,
                                "Cannot listen on " + config_.address + ":" + std::to_string(port));
        }

        const auto bound_port = static_cast<std::uint16_t>(bound);
        ServiceRound round{bound_port, url_builder_.build(bound_port, !catalog_.empty())};
        listen_thread_ = std::thread([this, bound_port]
                                     {
                                         if (!http_.listen_after_bind())
                                         {
                                             spdlog::error("Listener on port {} failed", bound_port);
                                         }
                                     });
        http_.wait_until_ready();

        round_ = round;
        state_ = ServerState::Running;
        spdlog::info("Serving on {}:{} ({}), session URL {}", config_.address, round.port, to_string(round.url.page),
                     round.url.url);
        return round;
    }

    bool TransferServer::stop()
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (!listen_thread_.joinable())
        {
            return false;
        }
        const auto port = round_ ? round_->port : 0;
        close_listener_locked();
        spdlog::info("Service on port {} stopped", port);
        return true;
    }

    std::optional<ServiceRound> TransferServer::current_round() const
    {
        std::lock_guard lock(lifecycle_mutex_);
        return round_;
    }

    // Closes the listening socket, then waits for the worker pool: open connections end once
    // their request finishes or their read times out.
    void TransferServer::close_listener_locked()
    {
        http_.stop();
        listen_thread_.join();
        round_.reset();
        state_ = ServerState::Stopped;
    }

} // namespace qrdrop::server
