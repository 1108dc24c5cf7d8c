#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "qrdrop/error_codes.hpp"
#include "qrdrop/encoding.hpp"
#include "qrdrop/multipart.hpp"
#include "qrdrop/protocol.hpp"

using namespace qrdrop;

void run_server_component_tests();
void run_transfer_server_tests();

namespace
{

    template <typename Fn>
    std::optional<ErrorCode> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &error)
        {
            return error.code();
        }
        return std::nullopt;
    }

    void test_output_encoding()
    {
        assert(encoding::percent_encode("résumé 1.pdf") == "r%C3%A9sum%C3%A9%201.pdf");
        assert(encoding::percent_encode("a-b_c.d~e") == "a-b_c.d~e");
        assert(encoding::percent_encode("a/b&c=d") == "a%2Fb%26c%3Dd");
        assert(encoding::html_escape("<a href=\"x\">&'</a>") == "&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;");
        assert(encoding::html_escape("plain") == "plain");
    }

    void test_boundary_from_content_type()
    {
        assert(multipart::boundary_from_content_type("multipart/form-data; boundary=----WebKitFormBoundary7MA") ==
               "----WebKitFormBoundary7MA");
        assert(multipart::boundary_from_content_type("Multipart/Form-Data; charset=utf-8; BOUNDARY=\"a;b\"") == "a;b");
        assert(!multipart::boundary_from_content_type("application/json"));
        assert(!multipart::boundary_from_content_type("multipart/form-data"));
        assert(!multipart::boundary_from_content_type("multipart/form-data; boundary="));
        assert(!multipart::boundary_from_content_type("multipart/form-data; boundary=" + std::string(71, 'x')));
    }

    void test_single_file_overhead()
    {
        const std::string boundary = "----WebKitFormBoundary7MA";
        const std::string head = "--" + boundary + "\r\n"
                                 "Content-Disposition: form-data; name=\"file\"; filename=\"photo.jpg\"\r\n"
                                 "Content-Type: image/jpeg\r\n\r\n";
        const std::string tail = "\r\n--" + boundary + "--\r\n";
        assert(multipart::single_file_overhead(boundary, "file", "photo.jpg", "image/jpeg") == head.size() + tail.size());

        const std::string bare = "--b\r\nContent-Disposition: form-data; name=\"f\"; filename=\"x\"\r\n\r\n\r\n--b--\r\n";
        assert(multipart::single_file_overhead("b", "f", "x", "") == bare.size());
    }

    void test_sanitize_filename()
    {
        assert(multipart::sanitize_filename("report.pdf") == "report.pdf");
        assert(multipart::sanitize_filename("../../etc/passwd") == "passwd");
        assert(multipart::sanitize_filename("C:\\Users\\me\\photo.png") == "photo.png");

        for (const auto *name : {"", "dir/", "..", "a/..", ".", "bad\nname"})
        {
            assert(error_of([name]
                            { multipart::sanitize_filename(name); }) == ErrorCode::InvalidRequest);
        }
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::PayloadTooLarge) == "payload_too_large");
        assert(http_status(ErrorCode::MissingParameter) == 400);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::MethodNotAllowed) == 405);
        assert(http_status(ErrorCode::Conflict) == 409);
        assert(http_status(ErrorCode::LengthRequired) == 411);
        assert(http_status(ErrorCode::PayloadTooLarge) == 413);
        assert(http_status(ErrorCode::IoError) == 500);

        const TransferError error(ErrorCode::Conflict, "Upload id x is already in use");
        assert(error.code() == ErrorCode::Conflict);
        assert(std::string(error.what()) == "Upload id x is already in use");
    }

    void test_progress_report_json()
    {
        const protocol::ProgressReport report{.total = 2048, .uploaded = 512};
        const nlohmann::json json = report;
        assert(json.dump() == R"({"total":2048,"uploaded":512})");

        const auto parsed = nlohmann::json::parse(R"({"uploaded":0,"total":0})").get<protocol::ProgressReport>();
        assert(parsed == protocol::ProgressReport{});
    }

} // namespace

int main()
{
    try
    {
        test_output_encoding();
        test_boundary_from_content_type();
        test_single_file_overhead();
        test_sanitize_filename();
        test_error_codes();
        test_progress_report_json();
        run_server_component_tests();
        run_transfer_server_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
