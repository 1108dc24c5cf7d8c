#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <httplib.h>

#include "qrdrop/error_codes.hpp"
#include "qrdrop/server/download_catalog.hpp"
#include "qrdrop/server/upload_registry.hpp"

namespace qrdrop::server
{

    namespace routes
    {
        constexpr std::string_view kIndex = "/";
        constexpr std::string_view kDownloadPage = "/download-page";
        constexpr std::string_view kUpload = "/upload";
        constexpr std::string_view kProgress = "/progress";
        constexpr std::string_view kDownload = "/download";

        constexpr std::string_view kUploadIdParam = "uploadId";
        constexpr std::string_view kFileParam = "file";
        constexpr std::string_view kFileField = "file";
    } // namespace routes

    struct HandlerServices
    {
        DownloadCatalog &catalog;
        UploadRegistry &registry;
        std::filesystem::path upload_dir;
        std::uint64_t max_upload_bytes;
    };

    // What an acceptable upload request head carries.
    struct UploadHead
    {
        std::string upload_id;
        std::uint64_t content_length{};
        std::string boundary;
    };

    // "address:port" of the peer, for log lines.
    std::string describe_remote(const httplib::Request &request);

    // Plain-text error answer with the status `code` maps to.
    void set_error(httplib::Response &response, ErrorCode code, std::string_view message);

    class RouteHandlers
    {
    public:
        explicit RouteHandlers(HandlerServices services);

        // Wires the five endpoints plus 405 answers for the other methods on their paths.
        void register_routes(httplib::Server &server);

        // Rejects an upload from its head alone. Throws TransferError.
        UploadHead check_upload_head(const httplib::Request &request) const;

        void handle_index(const httplib::Request &request, httplib::Response &response);
        void handle_download_page(const httplib::Request &request, httplib::Response &response);
        void handle_upload(const httplib::Request &request, httplib::Response &response,
                           const httplib::ContentReader &content_reader);
        void handle_download(const httplib::Request &request, httplib::Response &response);
        void handle_progress(const httplib::Request &request, httplib::Response &response);

    private:
        HandlerServices services_;
    };

} // namespace qrdrop::server
