#include "qrdrop/server/route_handlers.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "qrdrop/protocol.hpp"
#include "qrdrop/server/pages.hpp"

namespace qrdrop::server
{

    namespace
    {

        // Answers 405 for every method on `path` except `allowed`.
        void reject_other_methods(httplib::Server &server, const std::string &path, std::string_view allowed)
        {
            const auto handler = [allow = std::string(allowed)](const httplib::Request &request,
                                                                httplib::Response &response)
            {
                response.set_header("Allow", allow);
                set_error(response, ErrorCode::MethodNotAllowed, request.method + " is not allowed on " + request.path);
            };
            if (allowed != "GET")
            {
                server.Get(path, handler);
            }
            if (allowed != "POST")
            {
                server.Post(path, handler);
            }
            server.Put(path, handler);
            server.Patch(path, handler);
            server.Delete(path, handler);
        }

    } // namespace

    std::string describe_remote(const httplib::Request &request)
    {
        return request.remote_addr + ":" + std::to_string(request.remote_port);
    }

    void set_error(httplib::Response &response, ErrorCode code, std::string_view message)
    {
        response.status = http_status(code);
        response.set_content(std::string(message), "text/plain; charset=utf-8");
    }

    RouteHandlers::RouteHandlers(HandlerServices services)
        : services_(std::move(services)) {}

    void RouteHandlers::register_routes(httplib::Server &server)
    {
        server.Get(std::string(routes::kIndex), [this](const httplib::Request &request, httplib::Response &response)
                   { handle_index(request, response); });
        server.Get(std::string(routes::kDownloadPage),
                   [this](const httplib::Request &request, httplib::Response &response)
                   { handle_download_page(request, response); });
        server.Post(std::string(routes::kUpload),
                    [this](const httplib::Request &request, httplib::Response &response,
                           const httplib::ContentReader &content_reader)
                    { handle_upload(request, response, content_reader); });
        server.Get(std::string(routes::kProgress), [this](const httplib::Request &request, httplib::Response &response)
                   { handle_progress(request, response); });
        server.Get(std::string(routes::kDownload), [this](const httplib::Request &request, httplib::Response &response)
                   { handle_download(request, response); });

        reject_other_methods(server, std::string(routes::kIndex), "GET");
        reject_other_methods(server, std::string(routes::kDownloadPage), "GET");
        reject_other_methods(server, std::string(routes::kUpload), "POST");
        reject_other_methods(server, std::string(routes::kProgress), "GET");
        reject_other_methods(server, std::string(routes::kDownload), "GET");
    }

    void RouteHandlers::handle_index(const httplib::Request &, httplib::Response &response)
    {
        response.set_content(pages::render_upload_page(), "text/html; charset=utf-8");
    }

    void RouteHandlers::handle_download_page(const httplib::Request &, httplib::Response &response)
    {
        response.set_content(pages::render_download_page(services_.catalog.list()), "text/html; charset=utf-8");
    }

    void RouteHandlers::handle_progress(const httplib::Request &request, httplib::Response &response)
    {
        const auto upload_id = request.get_param_value(std::string(routes::kUploadIdParam));
        if (upload_id.empty())
        {
            throw TransferError(ErrorCode::MissingParameter, "Missing uploadId parameter");
        }

        // Unknown ids are not an error: the upload may not have started yet or may be finished.
        protocol::ProgressReport report{};
        if (const auto progress = services_.registry.snapshot(upload_id))
        {
            report.total = progress->total_size;
            report.uploaded = progress->uploaded;
        }
        const nlohmann::json payload = report;
        response.set_header("Cache-Control", "no-store");
        response.set_content(payload.dump(), "application/json");
    }

} // namespace qrdrop::server
