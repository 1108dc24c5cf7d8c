#include "qrdrop/server/operator_console.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "qrdrop/error_codes.hpp"

namespace qrdrop::server
{

    namespace
    {

        std::string_view trim(std::string_view text)
        {
            const auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(std::string_view text)
        {
            std::vector<std::string> tokens;
            std::istringstream iss{std::string(text)};
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        // Everything after the command word, so paths may contain spaces.
        std::string argument_text(std::string_view line)
        {
            const auto command_end = line.find_first_of(" \t");
            if (command_end == std::string_view::npos)
            {
                return {};
            }
            return std::string(trim(line.substr(command_end)));
        }

    } // namespace

    std::optional<std::uint16_t> parse_port(std::string_view text)
    {
        if (text.empty() || text.size() > 5)
        {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || value > 65535)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(value);
    }

    std::string describe_catalog(const std::vector<DownloadFile> &files)
    {
        if (files.empty())
        {
            return "No files selected\n";
        }
        std::ostringstream oss;
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            oss << (i + 1) << ". " << files[i].display_name << " (" << files[i].size_kb << " KB)\n";
        }
        return oss.str();
    }

    OperatorConsole::OperatorConsole(TransferServer &server, DownloadCatalog &catalog, const UploadRegistry &registry,
                                     std::istream &in, std::ostream &out)
        : server_(server), catalog_(catalog), registry_(registry), in_(in), out_(out) {}

    void OperatorConsole::run()
    {
        out_ << "Type 'help' for the list of commands." << std::endl;
        while (true)
        {
            out_ << "qrdrop> " << std::flush;
            std::string line;
            if (!std::getline(in_, line))
            {
                out_ << std::endl;
                break;
            }
            if (!execute(line))
            {
                break;
            }
        }
    }

    bool OperatorConsole::execute(std::string_view line)
    {
        line = trim(line);
        if (line.empty())
        {
            return true;
        }
        const auto tokens = split_tokens(line);
        const auto command = to_lower(tokens[0]);
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
        spdlog::debug("Console command: {}", line);

        if (command == "quit" || command == "exit")
        {
            return false;
        }

        try
        {
            if (command == "add")
            {
                handle_add(argument_text(line));
            }
            else if (command == "list")
            {
                handle_list();
            }
            else if (command == "start")
            {
                handle_start(args);
            }
            else if (command == "stop")
            {
                handle_stop();
            }
            else if (command == "status")
            {
                handle_status();
            }
            else if (command == "url")
            {
                handle_url();
            }
            else if (command == "help")
            {
                print_help();
            }
            else
            {
                out_ << "ERROR: unknown command '" << tokens[0] << "'. Type 'help'." << std::endl;
            }
        }
        catch (const TransferError &error)
        {
            out_ << "ERROR: " << to_string(error.code()) << std::endl;
            out_ << error.what() << std::endl;
        }
        catch (const std::exception &ex)
        {
            out_ << "ERROR: internal_error" << std::endl;
            out_ << ex.what() << std::endl;
            spdlog::error("Console command '{}' failed: {}", line, ex.what());
        }
        return true;
    }

    void OperatorConsole::handle_add(const std::string &path)
    {
        if (path.empty())
        {
            out_ << "Usage: add <path>" << std::endl;
            return;
        }
        auto file = make_download_file(path);
        const auto name = file.display_name;
        const auto size_kb = file.size_kb;
        catalog_.add(std::move(file));
        out_ << "Added " << name << " (" << size_kb << " KB)" << std::endl;
        if (server_.state() == ServerState::Running)
        {
            out_ << "Restart the service to advertise the download page." << std::endl;
        }
    }

    void OperatorConsole::handle_list()
    {
        out_ << describe_catalog(catalog_.list()) << std::flush;
    }

    void OperatorConsole::handle_start(const std::vector<std::string> &args)
    {
        auto port = server_.config().port;
        if (args.size() > 1)
        {
            out_ << "Usage: start [port]" << std::endl;
            return;
        }
        if (args.size() == 1)
        {
            const auto parsed = parse_port(args[0]);
            if (!parsed)
            {
                out_ << "ERROR: invalid port '" << args[0] << "'" << std::endl;
                return;
            }
            port = *parsed;
        }
        print_round(server_.start(port));
    }

    void OperatorConsole::handle_stop()
    {
        out_ << (server_.stop() ? "Service stopped" : "No service is running") << std::endl;
    }

    void OperatorConsole::handle_status()
    {
        const auto round = server_.current_round();
        out_ << "State: " << to_string(server_.state()) << std::endl;
        if (round)
        {
            out_ << "Port: " << round->port << std::endl;
            out_ << "URL: " << round->url.url << std::endl;
        }
        out_ << "Active uploads: " << registry_.active_count() << std::endl;
        out_ << "Files offered: " << catalog_.size() << std::endl;
    }

    void OperatorConsole::handle_url()
    {
        const auto round = server_.current_round();
        if (!round)
        {
            throw TransferError(ErrorCode::NotRunning, "No service is running");
        }
        out_ << round->url.url << std::endl;
    }

    void OperatorConsole::print_help()
    {
        out_ << "Available commands:" << std::endl;
        out_ << "  add <path>      Offer a file for download" << std::endl;
        out_ << "  list            List offered files" << std::endl;
        out_ << "  start [port]    Start or restart the service" << std::endl;
        out_ << "  stop            Stop the service" << std::endl;
        out_ << "  status          Show service state" << std::endl;
        out_ << "  url             Show the URL of the running service" << std::endl;
        out_ << "  help            Show this help" << std::endl;
        out_ << "  quit | exit     Stop the service and leave" << std::endl;
    }

    void OperatorConsole::print_round(const ServiceRound &round)
    {
        out_ << "Service running on port " << round.port << " (" << to_string(round.url.page) << ")" << std::endl;
        out_ << "Scan or open: " << round.url.url << std::endl;
    }

} // namespace qrdrop::server
