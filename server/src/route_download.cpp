#include "qrdrop/server/route_handlers.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "qrdrop/encoding.hpp"
#include "qrdrop/server/progress_stream.hpp"

namespace qrdrop::server
{

    namespace
    {

        std::string content_disposition(const std::string &name)
        {
            std::string fallback;
            fallback.reserve(name.size());
            for (const char ch : name)
            {
                const auto c = static_cast<unsigned char>(ch);
                fallback.push_back((c < 0x20 || c >= 0x7F || ch == '"' || ch == '\\') ? '_' : ch);
            }
            return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + encoding::percent_encode(name);
        }

        // Open file plus one copy buffer, owned by the response for as long as it streams.
        struct DownloadSource
        {
            std::ifstream in;
            std::vector<char> buffer;
        };

    } // namespace

    void RouteHandlers::handle_download(const httplib::Request &request, httplib::Response &response)
    {
        const auto name = request.get_param_value(std::string(routes::kFileParam));
        if (name.empty())
        {
            throw TransferError(ErrorCode::MissingParameter, "Missing file parameter");
        }

        const auto file = services_.catalog.find(name);
        if (!file)
        {
            throw TransferError(ErrorCode::NotFound, "File not found: " + name);
        }

        auto source = std::make_shared<DownloadSource>();
        source->in.open(file->absolute_path, std::ios::binary);
        if (!source->in)
        {
            throw TransferError(ErrorCode::IoError, "Cannot open " + file->display_name);
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(file->absolute_path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "Cannot read size of " + file->display_name + ": " + ec.message());
        }
        source->buffer.resize(kCopyBufferSize);

        response.set_header("Content-Disposition", content_disposition(file->display_name));

        // Headers go out before the first chunk: from here failures are only logged.
        const auto remote = describe_remote(request);
        response.set_content_provider(
            static_cast<std::size_t>(size), "application/octet-stream",
            [source, path = file->absolute_path, remote](std::size_t offset, std::size_t length,
                                                         httplib::DataSink &sink)
            {
                auto &in = source->in;
                in.seekg(static_cast<std::streamoff>(offset));
                const auto wanted = static_cast<std::streamsize>(std::min(length, source->buffer.size()));
                in.read(source->buffer.data(), wanted);
                const auto got = in.gcount();
                if (got <= 0)
                {
                    spdlog::error("{}: reading {} failed at offset {}", remote, path.string(), offset);
                    return false;
                }
                return sink.write(source->buffer.data(), static_cast<std::size_t>(got));
            },
            [display_name = file->display_name, remote, size](bool success)
            {
                if (success)
                {
                    spdlog::info("{}: sent {} ({} bytes)", remote, display_name, size);
                }
                else
                {
                    spdlog::warn("{}: download of {} aborted", remote, display_name);
                }
            });
    }

} // namespace qrdrop::server
