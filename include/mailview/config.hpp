/*

config.hpp
----------

Global build configuration for mailview.

Define MAILVIEW_NO_EXCEPTIONS to disable exception-based wrappers.
Define MAILVIEW_USE_STD_REGEX to use std::regex instead of Boost.Regex.

*/

#pragma once

#if defined(MAILVIEW_NO_EXCEPTIONS)
#define MAILVIEW_THROWING_ENABLED 0
#else
#define MAILVIEW_THROWING_ENABLED 1
#endif

#if !defined(MAILVIEW_USE_STD_REGEX)
#define MAILVIEW_USE_STD_REGEX 0
#endif
