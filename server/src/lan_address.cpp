#include "qrdrop/server/lan_address.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <net/route.h>
#include <netinet/in.h>

#include <charconv>
#include <fstream>
#include <memory>
#include <sstream>

#include <asio/ip/address_v4.hpp>
#include <spdlog/spdlog.h>

namespace qrdrop::server
{

    namespace
    {

        constexpr auto kRouteTablePath = "/proc/net/route";

        std::vector<std::string_view> split_fields(std::string_view line)
        {
            std::vector<std::string_view> fields;
            std::size_t offset = 0;
            while (offset < line.size())
            {
                const auto begin = line.find_first_not_of(" \t", offset);
                if (begin == std::string_view::npos)
                {
                    break;
                }
                auto end = line.find_first_of(" \t", begin);
                if (end == std::string_view::npos)
                {
                    end = line.size();
                }
                fields.push_back(line.substr(begin, end - begin));
                offset = end;
            }
            return fields;
        }

        std::optional<std::uint32_t> parse_hex(std::string_view text)
        {
            std::uint32_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        std::vector<InterfaceAddress> list_interfaces()
        {
            ifaddrs *raw = nullptr;
            if (::getifaddrs(&raw) != 0)
            {
                spdlog::debug("getifaddrs failed");
                return {};
            }
            const std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> addresses(raw, &::freeifaddrs);

            std::vector<InterfaceAddress> interfaces;
            for (const auto *entry = addresses.get(); entry != nullptr; entry = entry->ifa_next)
            {
                if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET || entry->ifa_netmask == nullptr)
                {
                    continue;
                }
                const auto *address = reinterpret_cast<const sockaddr_in *>(entry->ifa_addr);
                const auto *netmask = reinterpret_cast<const sockaddr_in *>(entry->ifa_netmask);
                interfaces.push_back(InterfaceAddress{
                    .name = entry->ifa_name,
                    .address = ntohl(address->sin_addr.s_addr),
                    .netmask = ntohl(netmask->sin_addr.s_addr),
                    .up = (entry->ifa_flags & IFF_UP) != 0,
                    .loopback = (entry->ifa_flags & IFF_LOOPBACK) != 0,
                });
            }
            return interfaces;
        }

    } // namespace

    std::optional<std::uint32_t> parse_default_gateway(std::string_view route_table)
    {
        std::size_t offset = 0;
        bool header = true;
        while (offset < route_table.size())
        {
            auto end = route_table.find('\n', offset);
            if (end == std::string_view::npos)
            {
                end = route_table.size();
            }
            const auto line = route_table.substr(offset, end - offset);
            offset = end + 1;
            if (header)
            {
                header = false;
                continue;
            }

            // Iface Destination Gateway Flags ...
            const auto fields = split_fields(line);
            if (fields.size() < 4)
            {
                continue;
            }
            const auto destination = parse_hex(fields[1]);
            const auto gateway = parse_hex(fields[2]);
            const auto flags = parse_hex(fields[3]);
            if (!destination || !gateway || !flags)
            {
                continue;
            }
            if (*destination != 0 || (*flags & RTF_UP) == 0 || (*flags & RTF_GATEWAY) == 0)
            {
                continue;
            }
            // The kernel prints the raw network-order word.
            return ntohl(*gateway);
        }
        return std::nullopt;
    }

    std::optional<std::string> select_lan_address(const std::vector<InterfaceAddress> &interfaces,
                                                  std::uint32_t gateway)
    {
        for (const auto &iface : interfaces)
        {
            if (!iface.up || iface.loopback || iface.netmask == 0)
            {
                continue;
            }
            if ((iface.address & iface.netmask) == (gateway & iface.netmask))
            {
                return format_ipv4(iface.address);
            }
        }
        return std::nullopt;
    }

    std::string format_ipv4(std::uint32_t address)
    {
        return asio::ip::address_v4(address).to_string();
    }

    std::optional<std::string> discover_lan_address()
    {
        std::ifstream in(kRouteTablePath);
        if (!in.is_open())
        {
            spdlog::debug("Cannot read {}", kRouteTablePath);
            return std::nullopt;
        }
        std::ostringstream table;
        table << in.rdbuf();

        const auto gateway = parse_default_gateway(table.str());
        if (!gateway)
        {
            spdlog::debug("No default gateway found");
            return std::nullopt;
        }
        auto address = select_lan_address(list_interfaces(), *gateway);
        if (!address)
        {
            spdlog::debug("No interface shares a subnet with gateway {}", format_ipv4(*gateway));
        }
        return address;
    }

} // namespace qrdrop::server
