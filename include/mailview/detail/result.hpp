/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
File level failures are returned via result<T>; nothing in the parsing core throws.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mailview
{

/// Error categories for mailview operations
enum class errc : std::uint16_t
{
    success = 0,

    // Mailbox file errors (100-199)
    not_found = 100,
    io_error = 101,

    // Content errors (200-299), recovered locally and only reported through logging
    parse_anomaly = 200,

    // Input validation (700-799)
    invalid_argument = 700,
};

/// Convert error code to string
[[nodiscard]] constexpr std::string_view to_string(errc ec) noexcept
{
    switch (ec)
    {
        case errc::success: return "Success";
        case errc::not_found: return "Not found";
        case errc::io_error: return "I/O error";
        case errc::parse_anomaly: return "Parse anomaly";
        case errc::invalid_argument: return "Invalid argument";
    }
    return "Unknown error";
}

/// Error value carried by result<T>
struct error_info
{
    errc code = errc::success;
    std::string message;
    std::string detail;
    std::error_code sys;
    std::source_location where;

    [[nodiscard]] bool is(errc ec) const noexcept { return code == ec; }

    /// Format error for display
    [[nodiscard]] std::string to_string() const
    {
        std::string out = std::format("[{}] {}", static_cast<int>(code),
            message.empty() ? std::string(mailview::to_string(code)) : message);
        if (!detail.empty())
            out += std::format(": {}", detail);
        if (sys)
            out += std::format(" ({})", sys.message());
        return out;
    }
};

template<typename T>
using result = std::expected<T, error_info>;

[[nodiscard]] inline error_info make_error(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info err)
{
    return std::unexpected<error_info>(std::move(err));
}

} // namespace detail

template<typename T = void>
[[nodiscard]] std::expected<T, error_info> fail(errc code, std::string message, std::string detail = {},
    std::error_code sys = {}, std::source_location where = std::source_location::current())
{
    return std::unexpected(make_error(code, std::move(message), std::move(detail), sys, where));
}

} // namespace mailview
