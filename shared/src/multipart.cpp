#include "qrdrop/multipart.hpp"

#include <cctype>
#include <vector>

#include "qrdrop/error_codes.hpp"

namespace qrdrop::multipart
{

    namespace
    {

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return value.substr(begin, end - begin + 1);
        }

        // Splits on ';' outside of quoted strings.
        std::vector<std::string_view> split_parameters(std::string_view value)
        {
            std::vector<std::string_view> parts;
            bool quoted = false;
            std::size_t start = 0;
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                const char ch = value[i];
                if (ch == '\\' && quoted)
                {
                    ++i;
                    continue;
                }
                if (ch == '"')
                {
                    quoted = !quoted;
                }
                else if (ch == ';' && !quoted)
                {
                    parts.push_back(trim(value.substr(start, i - start)));
                    start = i + 1;
                }
            }
            parts.push_back(trim(value.substr(start)));
            return parts;
        }

        std::string to_lower(std::string_view value)
        {
            std::string output(value);
            for (auto &ch : output)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return output;
        }

        std::string unquote(std::string_view value)
        {
            value = trim(value);
            if (value.size() < 2 || value.front() != '"' || value.back() != '"')
            {
                return std::string(value);
            }
            value = value.substr(1, value.size() - 2);
            std::string output;
            output.reserve(value.size());
            for (std::size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] == '\\' && i + 1 < value.size())
                {
                    ++i;
                }
                output.push_back(value[i]);
            }
            return output;
        }

    } // namespace

    std::optional<std::string> boundary_from_content_type(std::string_view content_type)
    {
        const auto parameters = split_parameters(content_type);
        if (parameters.empty() || to_lower(parameters.front()) != "multipart/form-data")
        {
            return std::nullopt;
        }
        for (std::size_t i = 1; i < parameters.size(); ++i)
        {
            const auto eq = parameters[i].find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }
            if (to_lower(trim(parameters[i].substr(0, eq))) != "boundary")
            {
                continue;
            }
            auto boundary = unquote(parameters[i].substr(eq + 1));
            if (boundary.empty() || boundary.size() > kMaxBoundarySize)
            {
                return std::nullopt;
            }
            return boundary;
        }
        return std::nullopt;
    }

    std::string sanitize_filename(std::string_view client_name)
    {
        const auto slash = client_name.find_last_of("/\\");
        auto base = slash == std::string_view::npos ? client_name : client_name.substr(slash + 1);
        base = trim(base);
        if (base.empty() || base == "." || base == "..")
        {
            throw TransferError(ErrorCode::InvalidRequest, "Invalid upload filename");
        }
        for (const char ch : base)
        {
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                throw TransferError(ErrorCode::InvalidRequest, "Invalid upload filename");
            }
        }
        return std::string(base);
    }

    std::uint64_t single_file_overhead(std::string_view boundary, std::string_view field, std::string_view filename,
                                       std::string_view content_type)
    {
        // --B\r\n
        std::uint64_t size = boundary.size() + 4;
        // Content-Disposition: form-data; name="F"; filename="N"\r\n
        size += std::string_view("Content-Disposition: form-data; name=\"\"; filename=\"\"\r\n").size() + field.size() +
                filename.size();
        if (!content_type.empty())
        {
            size += std::string_view("Content-Type: \r\n").size() + content_type.size();
        }
        // Blank line, then \r\n--B--\r\n after the content.
        size += 2 + boundary.size() + 8;
        return size;
    }

} // namespace qrdrop::multipart
