/**
 * QRDrop - JSON payloads exchanged with the browser.
 */
#pragma once

#include <cstdint>

#include <nlohmann/json.hpp>

namespace qrdrop::protocol
{

    struct ProgressReport
    {
        std::uint64_t total{};
        std::uint64_t uploaded{};

        bool operator==(const ProgressReport &) const = default;
    };

    void to_json(nlohmann::json &json, const ProgressReport &report);
    void from_json(const nlohmann::json &json, ProgressReport &report);

} // namespace qrdrop::protocol
