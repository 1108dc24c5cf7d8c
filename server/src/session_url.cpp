#include "qrdrop/server/session_url.hpp"

#include <spdlog/spdlog.h>

#include "qrdrop/server/lan_address.hpp"
#include "qrdrop/server/route_handlers.hpp"

namespace qrdrop::server
{

    std::string_view to_string(LandingPage page) noexcept
    {
        switch (page)
        {
        case LandingPage::Upload:
            return "upload page";
        case LandingPage::Download:
            return "download page";
        }
        return "unknown";
    }

    SessionUrlBuilder::SessionUrlBuilder(HostResolver resolver)
        : resolver_(std::move(resolver)) {}

    SessionUrl SessionUrlBuilder::build(std::uint16_t port, bool catalog_has_files) const
    {
        SessionUrl result;
        std::optional<std::string> host;
        if (resolver_)
        {
            host = resolver_();
        }
        if (!host || host->empty())
        {
            spdlog::warn("Could not determine a LAN address, advertising {}", kLoopbackLabel);
            host = std::string(kLoopbackLabel);
        }
        result.host = *host;
        result.port = port;
        result.page = catalog_has_files ? LandingPage::Download : LandingPage::Upload;

        const auto path = result.page == LandingPage::Download ? routes::kDownloadPage : routes::kIndex;
        result.url = "http://" + result.host + ":" + std::to_string(port) + std::string(path);
        return result;
    }

    SessionUrlBuilder make_url_builder(const ServerConfig &config)
    {
        if (config.advertised_host)
        {
            return SessionUrlBuilder([host = *config.advertised_host]() -> std::optional<std::string>
                                     { return host; });
        }
        return SessionUrlBuilder(&discover_lan_address);
    }

} // namespace qrdrop::server
