/**
 * QRDrop - multipart/form-data helpers for the upload endpoint.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qrdrop::multipart
{

    constexpr std::size_t kMaxBoundarySize = 70;

    std::optional<std::string> boundary_from_content_type(std::string_view content_type);

    // Reduces a client-supplied name to its basename. Throws TransferError(InvalidRequest).
    std::string sanitize_filename(std::string_view client_name);

    // Bytes a body carrying one file part spends outside the file content: the opening
    // delimiter, the part headers as browsers write them and the closing delimiter.
    std::uint64_t single_file_overhead(std::string_view boundary, std::string_view field, std::string_view filename,
                                       std::string_view content_type);

} // namespace qrdrop::multipart
