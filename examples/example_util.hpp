#pragma once

#include <iostream>
#include <string_view>
#include <mailview/detail/result.hpp>

inline void print_error(std::string_view program, const mailview::error_info& err)
{
    std::cerr << program << ": " << mailview::to_string(err.code);
    if (!err.message.empty())
        std::cerr << " - " << err.message;
    if (!err.detail.empty())
        std::cerr << ": " << err.detail;
    if (err.sys)
        std::cerr << " (" << err.sys.message() << ")";
    std::cerr << "\n";
}
