#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "qrdrop/error_codes.hpp"
#include "qrdrop/server/config.hpp"
#include "qrdrop/server/download_catalog.hpp"
#include "qrdrop/server/operator_console.hpp"
#include "qrdrop/server/session_url.hpp"
#include "qrdrop/server/transfer_server.hpp"
#include "qrdrop/server/upload_registry.hpp"
#include "qrdrop/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "QRDrop " << qrdrop::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--address <ADDRESS>] [--upload-dir <DIR>] [--host <HOST>]"
                     " [--max-upload <BYTES>] [--idle-timeout <SECONDS>] [--file <PATH>]... [--log <FILE>] [--verbose] [--headless]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::uint64_t> parse_size(const std::string &text)
    {
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    void configure_logging(const qrdrop::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("qrdrop", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    // Serves until SIGINT or SIGTERM.
    void run_headless(qrdrop::server::TransferServer &server)
    {
        const auto round = server.start(server.config().port);
        std::cout << round.url.url << std::endl;

        asio::io_context io_context;
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([](const std::error_code &ec, int signal)
                           {
            if (!ec)
            {
                spdlog::info("Signal {} received, shutting down", signal);
            } });
        io_context.run();
        server.stop();
    }

} // namespace

int main(int argc, char *argv[])
{
    using qrdrop::server::DownloadCatalog;
    using qrdrop::server::OperatorConsole;
    using qrdrop::server::ServerConfig;
    using qrdrop::server::TransferServer;
    using qrdrop::server::UploadRegistry;

    ServerConfig config;
    config.upload_dir = std::filesystem::current_path();

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--verbose")
        {
            config.verbose = true;
            continue;
        }
        if (arg == "--headless")
        {
            config.headless = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg != "--port" && arg != "--address" && arg != "--upload-dir" && arg != "--host" &&
            arg != "--max-upload" && arg != "--idle-timeout" && arg != "--file" && arg != "--log")
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (arg == "--port")
        {
            const auto port = qrdrop::server::parse_port(*value);
            if (!port)
            {
                std::cerr << "Invalid port: " << *value << std::endl;
                return EXIT_FAILURE;
            }
            config.port = *port;
        }
        else if (arg == "--address")
        {
            config.address = *value;
        }
        else if (arg == "--upload-dir")
        {
            config.upload_dir = std::filesystem::path(*value);
        }
        else if (arg == "--host")
        {
            config.advertised_host = *value;
        }
        else if (arg == "--max-upload")
        {
            const auto limit = parse_size(*value);
            if (!limit)
            {
                std::cerr << "Invalid size: " << *value << std::endl;
                return EXIT_FAILURE;
            }
            config.max_upload_bytes = *limit;
        }
        else if (arg == "--idle-timeout")
        {
            const auto seconds = parse_size(*value);
            if (!seconds || *seconds == 0)
            {
                std::cerr << "Invalid timeout: " << *value << std::endl;
                return EXIT_FAILURE;
            }
            config.idle_timeout = std::chrono::seconds(*seconds);
        }
        else if (arg == "--file")
        {
            config.catalog_files.emplace_back(*value);
        }
        else if (arg == "--log")
        {
            config.log_file = std::filesystem::path(*value);
        }
    }

    try
    {
        configure_logging(config);
        spdlog::info("QRDrop {} storing uploads in {}", qrdrop::version(), config.upload_dir.string());

        std::error_code ec;
        if (!std::filesystem::is_directory(config.upload_dir, ec))
        {
            std::cerr << "Upload directory does not exist: " << config.upload_dir.string() << std::endl;
            return EXIT_FAILURE;
        }

        DownloadCatalog catalog;
        for (const auto &path : config.catalog_files)
        {
            catalog.add(qrdrop::server::make_download_file(path));
        }
        UploadRegistry registry;

        auto url_builder = qrdrop::server::make_url_builder(config);
        const bool headless = config.headless;
        TransferServer server(std::move(config), catalog, registry, std::move(url_builder));

        if (headless)
        {
            run_headless(server);
        }
        else
        {
            OperatorConsole console(server, catalog, registry, std::cin, std::cout);
            console.run();
            server.stop();
        }
    }
    catch (const qrdrop::TransferError &error)
    {
        std::cerr << "QRDrop failed: " << error.what() << std::endl;
        spdlog::error("Fatal error ({}): {}", qrdrop::to_string(error.code()), error.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "QRDrop failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
