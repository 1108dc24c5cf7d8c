#include "qrdrop/protocol.hpp"

namespace qrdrop::protocol
{

    void to_json(nlohmann::json &json, const ProgressReport &report)
    {
        json = nlohmann::json{
            {"total", report.total},
            {"uploaded", report.uploaded},
        };
    }

    void from_json(const nlohmann::json &json, ProgressReport &report)
    {
        report.total = json.value("total", std::uint64_t{0});
        report.uploaded = json.value("uploaded", std::uint64_t{0});
    }

} // namespace qrdrop::protocol
