#pragma once

#include <string>
#include <mailview/config.hpp>

#if MAILVIEW_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace mailview::detail
{
#if MAILVIEW_USE_STD_REGEX
using regex = std::regex;
using smatch = std::smatch;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return std::regex_match(input, matches, pattern);
}
#else
using regex = boost::regex;
using smatch = boost::smatch;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_match(input, matches, pattern);
}
#endif
} // namespace mailview::detail
