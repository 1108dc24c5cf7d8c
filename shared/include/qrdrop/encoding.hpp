/**
 * QRDrop - Output encoding for URLs, headers and HTML.
 */
#pragma once

#include <string>
#include <string_view>

namespace qrdrop::encoding
{

    // RFC 3986 unreserved characters pass, everything else becomes %XX.
    std::string percent_encode(std::string_view text);

    std::string html_escape(std::string_view text);

} // namespace qrdrop::encoding
