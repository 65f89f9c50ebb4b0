/*

viewer_config.hpp
-----------------

Run time configuration of the viewer and its command line.

*/

#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <mailview/detail/log.hpp>
#include <mailview/detail/result.hpp>
#include <mailview/storage/spool.hpp>

namespace mailview::view
{

/**
Configuration of one viewer run.
**/
struct viewer_config
{
    /// Directory holding one mbox file per user
    std::filesystem::path spool_dir = storage::spool::DEFAULT_ROOT;

    /// Which mailboxes to browse
    storage::spool_selection selection;

    /// Print users and message counts instead of browsing
    bool list_only = false;

    /// Print usage and exit
    bool show_help = false;

    log::level log_level = log::level::warn;

    /// Log destination while browsing; buffered and written to stderr on exit if empty
    std::optional<std::filesystem::path> log_file;

    /// Usage text, filled by the command line parser
    std::string usage;
};

/**
Parses `mailview [options] [user]`.

@return The configuration, or `errc::invalid_argument` with the usage text as detail.
**/
[[nodiscard]] inline result<viewer_config> parse_command_line(int argc, const char* const argv[])
{
    namespace program_options = boost::program_options;

    viewer_config config;
    std::string spool_dir = config.spool_dir.string();
    std::string user;
    std::vector<std::string> exclude;
    std::string log_level(log::level_to_string(config.log_level));
    std::string log_file;

    program_options::options_description options_description("mailview [options] [user]");
    auto desc_init = options_description.add_options()
        ("help,h", "Print this help message and exit.")
        ("directory,d", program_options::value<std::string>(&spool_dir),
                    "mail spool directory (default /var/mail)")
        ("user,u", program_options::value<std::string>(&user),
                    "browse only this user's mailbox")
        ("exclude,x", program_options::value<std::vector<std::string>>(&exclude)->composing(),
                    "user to skip, may be repeated")
        ("list,l", "list users and message counts, then exit")
        ("log-level", program_options::value<std::string>(&log_level),
                    "trace, debug, info, warn, error, fatal or off (default warn)")
        ("log-file", program_options::value<std::string>(&log_file),
                    "write log entries to this file");
    (void)(desc_init);

    program_options::positional_options_description positional;
    positional.add("user", 1);

    std::stringstream usage;
    usage << options_description;
    config.usage = usage.str();

    try
    {
        program_options::variables_map options;
        program_options::store(
                    program_options::command_line_parser(argc, argv)
                        .options(options_description)
                        .positional(positional)
                        .run(),
                    options);
        program_options::notify(options);

        config.show_help = options.count("help") > 0;
        config.list_only = options.count("list") > 0;
    }
    catch (const program_options::error& ex)
    {
        return fail<viewer_config>(errc::invalid_argument, ex.what(), config.usage);
    }

    auto lvl = log::level_from_string(log_level);
    if (!lvl)
        return fail<viewer_config>(errc::invalid_argument, "unknown log level `" + log_level + "`", config.usage);
    config.log_level = *lvl;

    if (spool_dir.empty())
        return fail<viewer_config>(errc::invalid_argument, "empty spool directory", config.usage);
    config.spool_dir = spool_dir;

    if (!user.empty())
    {
        if (user.find('/') != std::string::npos || user == "." || user == "..")
            return fail<viewer_config>(errc::invalid_argument, "bad user name `" + user + "`", config.usage);
        config.selection.user = user;
    }
    config.selection.exclude.insert(exclude.begin(), exclude.end());
    if (!log_file.empty())
        config.log_file = log_file;

    return config;
}

} // namespace mailview::view
