#include "qrdrop/server/route_handlers.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

#include <spdlog/spdlog.h>

#include "qrdrop/multipart.hpp"
#include "qrdrop/server/progress_stream.hpp"

namespace qrdrop::server
{

    namespace
    {

        std::uint64_t parse_content_length(const std::string &value)
        {
            std::uint64_t length = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size())
            {
                throw TransferError(ErrorCode::InvalidRequest, "Invalid Content-Length");
            }
            return length;
        }

        // Reads and drops the body of a rejected upload so the client is not reset while it is
        // still sending. Bodies over the size limit are skipped by the transport itself.
        void discard_body(const httplib::Request &request, const httplib::ContentReader &content_reader,
                          std::uint64_t limit)
        {
            if (!request.has_header("Content-Length") && !request.has_header("Transfer-Encoding"))
            {
                return;
            }
            std::uint64_t seen = 0;
            const auto drained = content_reader([&seen, limit](const char *, std::size_t size)
                                                {
                                                    seen += size;
                                                    return seen <= limit;
                                                });
            if (!drained)
            {
                spdlog::debug("{}: rejected request body not fully read", describe_remote(request));
            }
        }

        void remove_partial(const std::filesystem::path &target)
        {
            std::error_code ec;
            std::filesystem::remove(target, ec);
            if (ec)
            {
                spdlog::warn("Could not remove partial upload {}: {}", target.string(), ec.message());
            }
        }

    } // namespace

    UploadHead RouteHandlers::check_upload_head(const httplib::Request &request) const
    {
        UploadHead head;
        head.upload_id = request.get_param_value(std::string(routes::kUploadIdParam));
        if (head.upload_id.empty())
        {
            throw TransferError(ErrorCode::MissingParameter, "Missing uploadId parameter");
        }

        if (request.has_header("Transfer-Encoding"))
        {
            throw TransferError(ErrorCode::LengthRequired, "Chunked request bodies are not supported");
        }
        if (!request.has_header("Content-Length"))
        {
            throw TransferError(ErrorCode::LengthRequired, "Content-Length is required");
        }
        head.content_length = parse_content_length(request.get_header_value("Content-Length"));
        if (head.content_length > services_.max_upload_bytes)
        {
            throw TransferError(ErrorCode::PayloadTooLarge,
                                "Upload exceeds the limit of " + std::to_string(services_.max_upload_bytes) + " bytes");
        }

        auto boundary = multipart::boundary_from_content_type(request.get_header_value("Content-Type"));
        if (!boundary)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Expected a multipart/form-data body with a boundary");
        }
        head.boundary = std::move(*boundary);
        return head;
    }

    void RouteHandlers::handle_upload(const httplib::Request &request, httplib::Response &response,
                                      const httplib::ContentReader &content_reader)
    {
        const auto remote = describe_remote(request);
        UploadHead head;
        try
        {
            head = check_upload_head(request);
        }
        catch (const TransferError &)
        {
            discard_body(request, content_reader, services_.max_upload_bytes);
            throw;
        }

        std::optional<UploadSessionGuard> session;
        std::optional<TransferError> failure;
        std::string filename;
        std::filesystem::path target;
        std::ofstream out;
        bool file_seen = false;
        bool receiving = false;

        ProgressTrackingStream tracked(out, [this, &id = head.upload_id](std::size_t bytes)
                                       { services_.registry.advance(id, bytes); });

        // A rejected part keeps the reader going, so the whole body is consumed before the answer.
        const auto on_part = [&](const httplib::MultipartFormData &part)
        {
            receiving = false;
            if (file_seen || part.name != routes::kFileField || part.filename.empty())
            {
                return true;
            }
            file_seen = true;
            try
            {
                filename = multipart::sanitize_filename(part.filename);
            }
            catch (const TransferError &error)
            {
                failure = error;
                return true;
            }

            const auto overhead =
                multipart::single_file_overhead(head.boundary, part.name, part.filename, part.content_type);
            const auto declared_size = head.content_length > overhead ? head.content_length - overhead : 0;
            if (!services_.registry.begin(head.upload_id, declared_size))
            {
                failure.emplace(ErrorCode::Conflict, "Upload id " + head.upload_id + " is already in use");
                return true;
            }
            session.emplace(services_.registry, head.upload_id);
            spdlog::info("{}: receiving {} ({} bytes, upload {})", remote, filename, declared_size, head.upload_id);

            target = services_.upload_dir / filename;
            out.open(target, std::ios::binary | std::ios::trunc);
            if (!out)
            {
                failure.emplace(ErrorCode::IoError, "Cannot create " + filename);
                target.clear();
                return true;
            }
            receiving = true;
            return true;
        };
        const auto on_data = [&](const char *data, std::size_t size)
        {
            if (receiving && !tracked(data, size))
            {
                failure.emplace(ErrorCode::IoError, "Failed to write " + filename);
                receiving = false;
            }
            return true;
        };

        const auto complete = content_reader(on_part, on_data);
        if (!complete && !failure)
        {
            if (file_seen)
            {
                failure.emplace(ErrorCode::IoError, "Upload of " + filename + " interrupted after " +
                                                        std::to_string(tracked.bytes_written()) + " bytes");
            }
            else
            {
                failure.emplace(ErrorCode::InvalidRequest, "Malformed multipart body");
            }
        }
        if (!failure && !file_seen)
        {
            failure.emplace(ErrorCode::InvalidRequest, "Multipart body has no file field");
        }
        if (out.is_open())
        {
            out.close();
            if (!out && !failure)
            {
                failure.emplace(ErrorCode::IoError, "Failed to finish writing " + filename);
            }
        }

        if (failure)
        {
            if (!target.empty())
            {
                remove_partial(target);
            }
            throw *failure;
        }

        // The session must be gone before the response leaves, so a poll after the 200 already
        // sees the finished state.
        session.reset();
        spdlog::info("{}: saved {} ({} bytes)", remote, target.string(), tracked.bytes_written());
        response.set_content("Uploaded: " + filename, "text/plain; charset=utf-8");
    }

} // namespace qrdrop::server
