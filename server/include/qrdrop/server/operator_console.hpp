#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qrdrop/server/download_catalog.hpp"
#include "qrdrop/server/transfer_server.hpp"
#include "qrdrop/server/upload_registry.hpp"

namespace qrdrop::server
{

    // Accepts 0..65535; anything else, signs and trailing junk included, is rejected.
    std::optional<std::uint16_t> parse_port(std::string_view text);

    // One "N. name (K KB)" line per file, or "No files selected".
    std::string describe_catalog(const std::vector<DownloadFile> &files);

    // Line-oriented operator shell driving the catalog and the server lifecycle.
    class OperatorConsole
    {
    public:
        OperatorConsole(TransferServer &server, DownloadCatalog &catalog, const UploadRegistry &registry,
                        std::istream &in, std::ostream &out);

        // Reads commands until quit or end of input.
        void run();

        // Returns false when the command asks to leave.
        bool execute(std::string_view line);

    private:
        void handle_add(const std::string &path);
        void handle_list();
        void handle_start(const std::vector<std::string> &args);
        void handle_stop();
        void handle_status();
        void handle_url();
        void print_help();
        void print_round(const ServiceRound &round);

        TransferServer &server_;
        DownloadCatalog &catalog_;
        const UploadRegistry &registry_;
        std::istream &in_;
        std::ostream &out_;
    };

} // namespace qrdrop::server
