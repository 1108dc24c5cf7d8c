#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

#include "qrdrop/error_codes.hpp"
#include "qrdrop/protocol.hpp"
#include "qrdrop/server/download_catalog.hpp"
#include "qrdrop/server/operator_console.hpp"
#include "qrdrop/server/session_url.hpp"
#include "qrdrop/server/transfer_server.hpp"
#include "qrdrop/server/upload_registry.hpp"

using namespace qrdrop;
using namespace qrdrop::server;
using asio::ip::tcp;

namespace
{

    struct HttpReply
    {
        int status{};
        std::map<std::string, std::string> headers;
        std::string body;
    };

    std::string lower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return text;
    }

    HttpReply parse_reply(const std::string &raw)
    {
        const auto head_end = raw.find("\r\n\r\n");
        assert(head_end != std::string::npos);
        assert(raw.rfind("HTTP/1.1 ", 0) == 0);

        HttpReply reply;
        reply.status = std::stoi(raw.substr(9, 3));
        std::size_t offset = raw.find("\r\n") + 2;
        while (offset < head_end)
        {
            const auto end = raw.find("\r\n", offset);
            const auto line = raw.substr(offset, end - offset);
            const auto colon = line.find(':');
            reply.headers[lower(line.substr(0, colon))] = line.substr(colon + 2);
            offset = end + 2;
        }
        reply.body = raw.substr(head_end + 4);
        return reply;
    }

    tcp::socket connect_to(asio::io_context &io_context, std::uint16_t port)
    {
        tcp::socket socket(io_context);
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
        return socket;
    }

    HttpReply read_reply(tcp::socket &socket)
    {
        std::string raw;
        std::error_code ec;
        asio::read(socket, asio::dynamic_buffer(raw), ec);
        assert(ec == asio::error::eof);
        return parse_reply(raw);
    }

    // Reads until the server closes, whether cleanly or with a reset.
    std::error_code drain_until_closed(tcp::socket &socket)
    {
        std::string ignored;
        std::error_code ec;
        asio::read(socket, asio::dynamic_buffer(ignored), ec);
        return ec;
    }

    // Asks the server to close after answering so the reply ends at eof.
    std::string with_close(const std::string &request)
    {
        const auto line_end = request.find("\r\n");
        if (line_end == std::string::npos || request.find("Connection: close") != std::string::npos)
        {
            return request;
        }
        return request.substr(0, line_end + 2) + "Connection: close\r\n" + request.substr(line_end + 2);
    }

    HttpReply send_request(std::uint16_t port, const std::string &request)
    {
        asio::io_context io_context;
        auto socket = connect_to(io_context, port);
        asio::write(socket, asio::buffer(with_close(request)));
        return read_reply(socket);
    }

    HttpReply get(std::uint16_t port, const std::string &target)
    {
        return send_request(port, "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");
    }

    std::string multipart_body(const std::string &boundary, const std::string &filename, const std::string &content)
    {
        std::string body = "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + filename + "\"\r\n";
        body += "Content-Type: application/octet-stream\r\n\r\n";
        body += content;
        body += "\r\n--" + boundary + "--\r\n";
        return body;
    }

    std::string upload_head(const std::string &upload_id, const std::string &boundary, std::size_t content_length)
    {
        return "POST /upload?uploadId=" + upload_id + " HTTP/1.1\r\n"
               "Host: 127.0.0.1\r\n"
               "Connection: close\r\n"
               "Content-Type: multipart/form-data; boundary=" + boundary + "\r\n"
               "Content-Length: " + std::to_string(content_length) + "\r\n\r\n";
    }

    HttpReply upload(std::uint16_t port, const std::string &upload_id, const std::string &filename,
                     const std::string &content)
    {
        const std::string boundary = "----qrdropTestBoundary";
        const auto body = multipart_body(boundary, filename, content);
        return send_request(port, upload_head(upload_id, boundary, body.size()) + body);
    }

    protocol::ProgressReport poll_progress(std::uint16_t port, const std::string &upload_id)
    {
        const auto reply = get(port, "/progress?uploadId=" + upload_id);
        assert(reply.status == 200);
        assert(reply.headers.at("content-type") == "application/json");
        assert(reply.headers.at("cache-control") == "no-store");
        return nlohmann::json::parse(reply.body).get<protocol::ProgressReport>();
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    std::string patterned_content(std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>('a' + (i * 7) % 26);
        }
        return content;
    }

    std::filesystem::path prepare_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root / "uploads");
        return root;
    }

    ServerConfig make_config(const std::filesystem::path &root)
    {
        ServerConfig config;
        config.address = "127.0.0.1";
        config.upload_dir = root / "uploads";
        config.max_upload_bytes = 1 << 20;
        config.idle_timeout = std::chrono::seconds(1);
        return config;
    }

    SessionUrlBuilder loopback_urls()
    {
        return SessionUrlBuilder([]() -> std::optional<std::string>
                                 { return std::string("127.0.0.1"); });
    }

    struct ServerFixture
    {
        explicit ServerFixture(const std::string &name)
            : root(prepare_root(name)), server(make_config(root), catalog, registry, loopback_urls()) {}

        ~ServerFixture()
        {
            server.stop();
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        std::filesystem::path root;
        DownloadCatalog catalog;
        UploadRegistry registry;
        TransferServer server;
    };

    void test_pages_and_routing()
    {
        ServerFixture fixture("qrdrop_routes_test");
        const auto port = fixture.server.start(0).port;

        const auto index = get(port, "/");
        assert(index.status == 200);
        assert(index.headers.at("content-type") == "text/html; charset=utf-8");
        assert(index.headers.at("connection") == "close");
        assert(index.body.find("<h1>Upload files</h1>") != std::string::npos);

        const auto downloads = get(port, "/download-page");
        assert(downloads.status == 200);
        assert(downloads.body.find("No files available for download") != std::string::npos);

        assert(get(port, "/nope").status == 404);
        assert(get(port, "/upload/extra").status == 404);

        const auto wrong_method = send_request(port, "POST / HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
        assert(wrong_method.status == 405);
        assert(wrong_method.headers.at("allow") == "GET");
        const auto get_upload = get(port, "/upload");
        assert(get_upload.status == 405);
        assert(get_upload.headers.at("allow") == "POST");

        asio::io_context io_context;
        auto garbage = connect_to(io_context, port);
        asio::write(garbage, asio::buffer(std::string("NONSENSE\r\n\r\n")));
        assert(read_reply(garbage).status == 400);
    }

    void test_upload_then_progress_is_cleared()
    {
        ServerFixture fixture("qrdrop_upload_test");
        const auto port = fixture.server.start(0).port;

        const auto content = patterned_content(150 * 1024);
        const auto reply = upload(port, "session-1", "../../holiday.jpg", content);
        assert(reply.status == 200);
        assert(reply.body == "Uploaded: holiday.jpg");

        const auto saved = fixture.root / "uploads" / "holiday.jpg";
        assert(read_file(saved) == content);
        assert(!std::filesystem::exists(fixture.root / "holiday.jpg"));
        assert(fixture.registry.active_count() == 0);
        assert(poll_progress(port, "session-1") == protocol::ProgressReport{});

        // An existing file is replaced.
        assert(upload(port, "session-2", "holiday.jpg", "short").status == 200);
        assert(read_file(saved) == "short");
    }

    void test_empty_upload()
    {
        ServerFixture fixture("qrdrop_empty_upload_test");
        const auto port = fixture.server.start(0).port;

        const auto reply = upload(port, "zero", "empty.txt", "");
        assert(reply.status == 200);
        const auto saved = fixture.root / "uploads" / "empty.txt";
        assert(std::filesystem::exists(saved));
        assert(std::filesystem::file_size(saved) == 0);
        assert(poll_progress(port, "zero") == protocol::ProgressReport{});
    }

    void test_upload_rejections()
    {
        ServerFixture fixture("qrdrop_upload_reject_test");
        const auto port = fixture.server.start(0).port;
        const std::string boundary = "b1";

        assert(send_request(port, "POST /upload HTTP/1.1\r\nContent-Length: 0\r\n\r\n").status == 400);
        assert(send_request(port, "POST /upload?uploadId= HTTP/1.1\r\nContent-Length: 0\r\n\r\n").status == 400);

        const auto no_length = send_request(port, "POST /upload?uploadId=a HTTP/1.1\r\n"
                                                  "Content-Type: multipart/form-data; boundary=b1\r\n\r\n");
        assert(no_length.status == 411);

        const auto chunked = send_request(port, "POST /upload?uploadId=a HTTP/1.1\r\n"
                                                "Transfer-Encoding: chunked\r\n"
                                                "Content-Type: multipart/form-data; boundary=b1\r\n\r\n"
                                                "4\r\ndata\r\n0\r\n\r\n");
        assert(chunked.status == 411);

        // The client waits for "100 Continue": only the head is sent and the server answers it.
        auto expect_head = upload_head("big", boundary, (1 << 20) + 1);
        expect_head.insert(expect_head.size() - 2, "Expect: 100-continue\r\n");
        const auto too_large = send_request(port, expect_head);
        assert(too_large.status == 413);
        assert(too_large.body.find("limit") != std::string::npos);

        auto bad_expect = "POST /upload HTTP/1.1\r\nExpect: 100-continue\r\nContent-Length: 10\r\n\r\n";
        assert(send_request(port, bad_expect).status == 400);

        const auto not_multipart = send_request(port, "POST /upload?uploadId=a HTTP/1.1\r\n"
                                                      "Content-Type: application/json\r\n"
                                                      "Content-Length: 2\r\n\r\n{}");
        assert(not_multipart.status == 400);

        const auto body = multipart_body(boundary, "..", "data");
        assert(send_request(port, upload_head("dots", boundary, body.size()) + body).status == 400);

        assert(fixture.registry.begin("busy", 10));
        const auto conflict = upload(port, "busy", "clash.txt", "payload");
        assert(conflict.status == 409);
        assert(fixture.registry.snapshot("busy")->total_size == 10);
        assert(!std::filesystem::exists(fixture.root / "uploads" / "clash.txt"));
        fixture.registry.end("busy");

        assert(get(port, "/progress").status == 400);
        assert(poll_progress(port, "never-started") == protocol::ProgressReport{});
    }

    void test_rejection_reaches_client_sending_a_body()
    {
        ServerFixture fixture("qrdrop_reject_body_test");
        const auto port = fixture.server.start(0).port;
        const std::string boundary = "----rejected";
        const auto body = multipart_body(boundary, "big.bin", patterned_content(768 * 1024));

        // No uploadId: refused from the head, yet the whole body is read so the answer survives.
        auto head = upload_head("x", boundary, body.size());
        head.replace(head.find("?uploadId=x"), 11, "");
        const auto missing_id = send_request(port, head + body);
        assert(missing_id.status == 400);
        assert(missing_id.body == "Missing uploadId parameter");

        assert(fixture.registry.begin("taken", 1));
        const auto conflict = send_request(port, upload_head("taken", boundary, body.size()) + body);
        assert(conflict.status == 409);
        assert(conflict.body == "Upload id taken is already in use");
        fixture.registry.end("taken");
        assert(!std::filesystem::exists(fixture.root / "uploads" / "big.bin"));
    }

    void test_download()
    {
        ServerFixture fixture("qrdrop_download_test");
        const auto source = fixture.root / "report final.pdf";
        const auto content = patterned_content(200 * 1024 + 3);
        {
            std::ofstream out(source, std::ios::binary);
            out << content;
        }
        fixture.catalog.add(make_download_file(source));
        const auto port = fixture.server.start(0).port;

        const auto listing = get(port, "/download-page");
        assert(listing.body.find("report final.pdf") != std::string::npos);
        assert(listing.body.find("/download?file=report%20final.pdf") != std::string::npos);
        assert(listing.body.find(">201<") != std::string::npos);

        const auto reply = get(port, "/download?file=report%20final.pdf");
        assert(reply.status == 200);
        assert(reply.headers.at("content-type") == "application/octet-stream");
        assert(reply.headers.at("content-length") == std::to_string(content.size()));
        assert(reply.headers.at("content-disposition") ==
               "attachment; filename=\"report final.pdf\"; filename*=UTF-8''report%20final.pdf");
        assert(reply.body == content);

        assert(get(port, "/download?file=Report%20final.pdf").status == 404);
        assert(get(port, "/download").status == 400);
    }

    void test_progress_during_upload()
    {
        ServerFixture fixture("qrdrop_progress_test");
        const auto port = fixture.server.start(0).port;

        const std::string boundary = "----slowUpload";
        const auto content = patterned_content(96 * 1024);
        const auto body = multipart_body(boundary, "slow.bin", content);
        const auto request = upload_head("slow", boundary, body.size()) + body;
        const auto split = request.size() / 2;

        asio::io_context io_context;
        auto socket = connect_to(io_context, port);
        asio::write(socket, asio::buffer(request.data(), split));

        protocol::ProgressReport seen{};
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (std::chrono::steady_clock::now() < deadline)
        {
            const auto report = poll_progress(port, "slow");
            if (report.total != 0)
            {
                assert(report.total == content.size());
                assert(report.uploaded <= report.total);
                assert(report.uploaded >= seen.uploaded);
                seen = report;
                if (report.uploaded > 0)
                {
                    break;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        assert(seen.total == content.size());
        assert(seen.uploaded > 0 && seen.uploaded < seen.total);
        assert(fixture.registry.active_count() == 1);

        asio::write(socket, asio::buffer(request.data() + split, request.size() - split));
        const auto reply = read_reply(socket);
        assert(reply.status == 200);
        assert(poll_progress(port, "slow") == protocol::ProgressReport{});
        assert(read_file(fixture.root / "uploads" / "slow.bin") == content);
    }

    void test_aborted_upload_is_cleaned_up()
    {
        ServerFixture fixture("qrdrop_abort_test");
        const auto port = fixture.server.start(0).port;

        const std::string boundary = "----abort";
        const auto body = multipart_body(boundary, "partial.bin", patterned_content(64 * 1024));
        const auto request = upload_head("gone", boundary, body.size()) + body;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        {
            asio::io_context io_context;
            auto socket = connect_to(io_context, port);
            asio::write(socket, asio::buffer(request.data(), request.size() / 2));
            while (!fixture.registry.snapshot("gone") && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            assert(fixture.registry.snapshot("gone"));
        }

        while (fixture.registry.active_count() > 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        assert(fixture.registry.active_count() == 0);
        assert(!std::filesystem::exists(fixture.root / "uploads" / "partial.bin"));
    }

    void test_lifecycle()
    {
        ServerFixture fixture("qrdrop_lifecycle_test");
        auto &server = fixture.server;
        assert(server.state() == ServerState::Stopped);
        assert(!server.stop());
        assert(!server.current_round());

        const auto first = server.start(0);
        assert(server.state() == ServerState::Running);
        assert(first.port != 0);
        assert(first.url.url == "http://127.0.0.1:" + std::to_string(first.port) + "/");
        assert(get(first.port, "/").status == 200);

        const auto source = fixture.root / "offer.txt";
        {
            std::ofstream out(source);
            out << "offer";
        }
        fixture.catalog.add(make_download_file(source));
        // The URL is frozen for the running round.
        assert(server.current_round()->url.url == first.url.url);

        const auto second = server.start(0);
        assert(server.state() == ServerState::Running);
        assert(second.url.page == LandingPage::Download);
        assert(second.url.url == "http://127.0.0.1:" + std::to_string(second.port) + "/download-page");
        assert(get(second.port, "/download-page").status == 200);
        if (second.port != first.port)
        {
            asio::io_context io_context;
            tcp::socket socket(io_context);
            std::error_code ec;
            socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), first.port), ec);
            assert(ec == asio::error::connection_refused);
        }

        assert(server.stop());
        assert(server.state() == ServerState::Stopped);
        assert(!server.stop());
        assert(!server.current_round());
    }

    void test_bind_failure()
    {
        ServerFixture fixture("qrdrop_bind_test");

        asio::io_context io_context;
        tcp::acceptor occupant(io_context, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        const auto taken = occupant.local_endpoint().port();

        std::optional<ErrorCode> failure;
        try
        {
            fixture.server.start(taken);
        }
        catch (const TransferError &error)
        {
            failure = error.code();
        }
        assert(failure == ErrorCode::BindFailed);
        assert(fixture.server.state() == ServerState::Stopped);
        assert(!fixture.server.current_round());

        // The process keeps going: a free port still works.
        const auto round = fixture.server.start(0);
        assert(get(round.port, "/").status == 200);
    }

    void test_stalled_upload_times_out()
    {
        ServerFixture fixture("qrdrop_stall_test");
        const auto port = fixture.server.start(0).port;

        const std::string boundary = "----stall";
        const auto body = multipart_body(boundary, "stalled.bin", patterned_content(64 * 1024));
        const auto request = upload_head("stuck", boundary, body.size()) + body;

        asio::io_context io_context;
        auto socket = connect_to(io_context, port);
        asio::write(socket, asio::buffer(request.data(), request.size() / 2));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!fixture.registry.snapshot("stuck") && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(fixture.registry.snapshot("stuck"));

        // The client stays connected and silent: the idle timeout ends the upload.
        const auto stalled_at = std::chrono::steady_clock::now();
        while (fixture.registry.active_count() > 0 && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        assert(fixture.registry.active_count() == 0);
        assert(std::chrono::steady_clock::now() - stalled_at >= std::chrono::milliseconds(500));
        assert(!std::filesystem::exists(fixture.root / "uploads" / "stalled.bin"));

        const auto ec = drain_until_closed(socket);
        assert(ec == asio::error::eof || ec == asio::error::connection_reset);
    }

    void test_restart_on_same_port()
    {
        ServerFixture fixture("qrdrop_restart_test");
        const auto port = fixture.server.start(0).port;
        assert(get(port, "/").status == 200);

        asio::io_context io_context;
        auto lingering = connect_to(io_context, port);
        asio::write(lingering, asio::buffer(std::string("GET / HTTP/1.1\r\n")));

        const auto again = fixture.server.start(port);
        assert(again.port == port);
        assert(fixture.server.state() == ServerState::Running);
        assert(fixture.server.current_round()->port == port);
        assert(get(port, "/").status == 200);

        // The connection from the first round did not survive the restart.
        const auto ec = drain_until_closed(lingering);
        assert(ec == asio::error::eof || ec == asio::error::connection_reset);
    }

    void test_stop_closes_open_connections()
    {
        ServerFixture fixture("qrdrop_stop_test");
        const auto port = fixture.server.start(0).port;

        asio::io_context io_context;
        auto idle = connect_to(io_context, port);
        asio::write(idle, asio::buffer(std::string("GET / HTTP/1.1\r\n")));

        assert(fixture.server.stop());
        assert(fixture.server.state() == ServerState::Stopped);
        const auto ec = drain_until_closed(idle);
        assert(ec == asio::error::eof || ec == asio::error::connection_reset);
    }

    void test_operator_console()
    {
        assert(parse_port("0") == 0);
        assert(parse_port("65535") == 65535);
        assert(!parse_port("65536"));
        assert(!parse_port("-1"));
        assert(!parse_port("80a"));
        assert(!parse_port(""));

        ServerFixture fixture("qrdrop_console_test");
        const auto source = fixture.root / "notes.txt";
        {
            std::ofstream out(source);
            out << std::string(1500, 'n');
        }

        std::istringstream in;
        std::ostringstream out;
        OperatorConsole console(fixture.server, fixture.catalog, fixture.registry, in, out);
        const auto run = [&](const std::string &line)
        {
            out.str("");
            const bool keep_going = console.execute(line);
            return std::make_pair(keep_going, out.str());
        };

        assert(run("list").second == "No files selected\n");
        assert(run("ADD " + source.string()).second.find("Added notes.txt (2 KB)") != std::string::npos);
        assert(run("list").second == "1. notes.txt (2 KB)\n");
        assert(run("add " + source.string()).second.find("ERROR: already_exists") != std::string::npos);
        assert(run("add " + (fixture.root / "missing").string()).second.find("ERROR: not_found") != std::string::npos);

        assert(run("url").second.find("ERROR: not_running") != std::string::npos);
        assert(run("start 99999").second.find("invalid port") != std::string::npos);
        assert(fixture.server.state() == ServerState::Stopped);

        const auto started = run("start 0").second;
        assert(started.find("Service running on port") != std::string::npos);
        assert(started.find("(download page)") != std::string::npos);
        const auto round = fixture.server.current_round();
        assert(round);
        assert(run("url").second == round->url.url + "\n");

        const auto status = run("status").second;
        assert(status.find("State: running") != std::string::npos);
        assert(status.find("Files offered: 1") != std::string::npos);
        assert(status.find("Active uploads: 0") != std::string::npos);

        assert(run("stop").second == "Service stopped\n");
        assert(run("stop").second == "No service is running\n");
        assert(run("frobnicate").second.find("ERROR: unknown command") != std::string::npos);
        assert(run("  ").first);
        assert(!run("Quit").first);
        assert(!run("exit").first);
    }

} // namespace

void run_transfer_server_tests()
{
    test_pages_and_routing();
    test_upload_then_progress_is_cleared();
    test_empty_upload();
    test_upload_rejections();
    test_rejection_reaches_client_sending_a_body();
    test_download();
    test_progress_during_upload();
    test_aborted_upload_is_cleaned_up();
    test_lifecycle();
    test_bind_failure();
    test_stalled_upload_times_out();
    test_restart_on_same_port();
    test_stop_closes_open_connections();
    test_operator_console();
}
