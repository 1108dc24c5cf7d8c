#include "qrdrop/encoding.hpp"

#include <cctype>

namespace qrdrop::encoding
{

    std::string percent_encode(std::string_view text)
    {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string output;
        output.reserve(text.size());
        for (const char ch : text)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '~')
            {
                output.push_back(ch);
            }
            else
            {
                output.push_back('%');
                output.push_back(kHex[c >> 4]);
                output.push_back(kHex[c & 0x0F]);
            }
        }
        return output;
    }

    std::string html_escape(std::string_view text)
    {
        std::string output;
        output.reserve(text.size());
        for (const char ch : text)
        {
            switch (ch)
            {
            case '&':
                output += "&amp;";
                break;
            case '<':
                output += "&lt;";
                break;
            case '>':
                output += "&gt;";
                break;
            case '"':
                output += "&quot;";
                break;
            case '\'':
                output += "&#39;";
                break;
            default:
                output.push_back(ch);
                break;
            }
        }
        return output;
    }

} // namespace qrdrop::encoding
