#pragma once

#include <string>
#include <vector>

#include "qrdrop/server/download_catalog.hpp"

namespace qrdrop::server::pages
{

    std::string render_upload_page();

    // An empty list renders an explicit "nothing to download" notice instead of an empty table.
    std::string render_download_page(const std::vector<DownloadFile> &files);

} // namespace qrdrop::server::pages
