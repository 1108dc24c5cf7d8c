#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qrdrop::server
{

    constexpr std::string_view kLoopbackLabel = "localhost";

    // IPv4 values are in host byte order.
    struct InterfaceAddress
    {
        std::string name;
        std::uint32_t address{};
        std::uint32_t netmask{};
        bool up{};
        bool loopback{};
    };

    // Gateway of the first default route in a /proc/net/route table.
    std::optional<std::uint32_t> parse_default_gateway(std::string_view route_table);

    // First up, non-loopback interface whose subnet contains `gateway`.
    std::optional<std::string> select_lan_address(const std::vector<InterfaceAddress> &interfaces,
                                                  std::uint32_t gateway);

    std::string format_ipv4(std::uint32_t address);

    // Address other devices on the gateway's subnet can reach, if one can be determined.
    std::optional<std::string> discover_lan_address();

} // namespace qrdrop::server
