#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace mailview
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] inline std::string to_lower_ascii(std::string_view s)
    {
        std::string out(s);
        for (auto& c : out)
            c = ascii_tolower(c);
        return out;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    // RFC 5322 WSP.
    [[nodiscard]] constexpr bool is_wsp(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    // Drops a trailing CR left over from a CRLF line ending.
    [[nodiscard]] inline std::string_view chomp_cr(std::string_view line) noexcept
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        return line;
    }

    // RFC 5322: field-name = 1*ftext; ftext = %d33-57 / %d59-126 (printable US-ASCII except ":")
    [[nodiscard]] inline bool is_valid_header_name(std::string_view name) noexcept
    {
        if (name.empty())
            return false;

        for (char ch : name)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            const bool ok = ((c >= 33 && c <= 57) || (c >= 59 && c <= 126));
            if (!ok)
                return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    // Replaces control characters so that a line can be painted as is.
    [[nodiscard]] inline std::string printable_copy(std::string_view line)
    {
        std::string out;
        out.reserve(line.size());
        for (char ch : line)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            if (ch == '\t')
                out.append("    ");
            else if (c < 32 || c == 127)
                out.push_back('.');
            else
                out.push_back(ch);
        }
        return out;
    }
}
}
