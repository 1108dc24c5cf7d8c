#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "qrdrop/server/config.hpp"

namespace qrdrop::server
{

    enum class LandingPage
    {
        Upload,
        Download
    };

    std::string_view to_string(LandingPage page) noexcept;

    // The address handed to clients for one service round, usually as a QR code.
    struct SessionUrl
    {
        std::string host;
        std::uint16_t port{};
        LandingPage page{LandingPage::Upload};
        std::string url;
    };

    using HostResolver = std::function<std::optional<std::string>()>;

    class SessionUrlBuilder
    {
    public:
        explicit SessionUrlBuilder(HostResolver resolver);

        // Download page when the catalog has files at start time, upload page otherwise.
        SessionUrl build(std::uint16_t port, bool catalog_has_files) const;

    private:
        HostResolver resolver_;
    };

    // Uses the configured advertised host, or LAN discovery when there is none.
    SessionUrlBuilder make_url_builder(const ServerConfig &config);

} // namespace qrdrop::server
