/*

mailview.cpp
------------

Terminal browser of the mbox files of a mail spool.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <mailview/detail/log.hpp>
#include <mailview/storage/mailbox.hpp>
#include <mailview/storage/spool.hpp>
#include <mailview/term/session.hpp>
#include <mailview/term/terminal.hpp>
#include <mailview/view/navigation.hpp>
#include <mailview/view/viewer_config.hpp>
#include "example_util.hpp"


using std::cout;
using std::cerr;
using std::string;
using mailview::log::logger;
using mailview::storage::mailbox;
using mailview::storage::spool;
using mailview::term::session_outcome;
using mailview::view::viewer_config;


namespace
{

constexpr const char* PROGRAM = "mailview";

enum exit_status : int
{
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_UNAVAILABLE = 2
};


/**
Keeps log entries away from the screen while a session owns it, and writes them to stderr afterwards.
**/
class deferred_log
{
public:
    deferred_log()
    {
        logger::instance().set_callback([this](const mailview::log::entry& e) {
            lines_.push_back(mailview::log::format_entry(e));
        });
    }

    deferred_log(const deferred_log&) = delete;
    deferred_log& operator=(const deferred_log&) = delete;

    ~deferred_log()
    {
        logger::instance().clear_callback();
        for (const auto& line : lines_)
            cerr << line << '\n';
    }

private:
    std::vector<string> lines_;
};


session_outcome browse(const mailbox& box, bool more_mailboxes)
{
    mailview::view::navigation_state nav(box);
    mailview::term::fd_key_source keys;
    mailview::term::signal_restore_guard signals;
    mailview::term::raw_mode_guard raw;
    mailview::term::alt_screen_guard alt;
    mailview::term::session s(nav, keys, cout, &mailview::term::terminal_size, more_mailboxes);
    return s.run();
}


int list_mailboxes(const std::vector<std::filesystem::path>& paths)
{
    bool any = false;
    for (const auto& path : paths)
    {
        auto box = mailbox::load(path);
        if (!box)
        {
            print_error(PROGRAM, box.error());
            continue;
        }
        any = true;
        cout << box->user() << "\t" << box->size() << "\n";
    }
    return any ? EXIT_OK : EXIT_UNAVAILABLE;
}


int browse_mailboxes(const std::vector<std::filesystem::path>& paths, const viewer_config& config)
{
    bool any = false;
    for (std::size_t i = 0; i < paths.size(); ++i)
    {
        auto box = mailbox::load(paths[i]);
        const bool more_mailboxes = i + 1 < paths.size();
        if (!box)
        {
            print_error(PROGRAM, box.error());
            if (config.selection.user)
                return EXIT_UNAVAILABLE;
            continue;
        }
        any = true;

        session_outcome outcome;
        if (config.log_file)
            outcome = browse(*box, more_mailboxes);
        else
        {
            deferred_log deferred;
            outcome = browse(*box, more_mailboxes);
        }
        if (outcome != session_outcome::leave)
            break;
    }
    return any ? EXIT_OK : EXIT_UNAVAILABLE;
}

} // namespace


int main(int argc, char* argv[])
{
    auto config = mailview::view::parse_command_line(argc, argv);
    if (!config)
    {
        print_error(PROGRAM, mailview::make_error(config.error().code, config.error().message));
        cerr << config.error().detail;
        return EXIT_USAGE;
    }
    if (config->show_help)
    {
        cout << config->usage;
        return EXIT_OK;
    }

    logger::instance().set_level(config->log_level);
    std::ofstream log_out;
    if (config->log_file)
    {
        log_out.open(*config->log_file, std::ios::app);
        if (!log_out)
        {
            cerr << PROGRAM << ": cannot open log file " << config->log_file->string() << "\n";
            return EXIT_USAGE;
        }
        logger::instance().set_callback([&log_out](const mailview::log::entry& e) {
            log_out << mailview::log::format_entry(e) << std::endl;
        });
    }

    spool sp(config->spool_dir);
    std::vector<std::filesystem::path> candidates;
    if (!config->selection.user)
    {
        auto listed = sp.list();
        if (!listed)
        {
            print_error(PROGRAM, listed.error());
            return EXIT_UNAVAILABLE;
        }
        candidates = std::move(*listed);
    }

    auto paths = sp.select(candidates, config->selection);
    if (paths.empty())
    {
        cerr << PROGRAM << ": no mailbox under " << sp.root().string() << "\n";
        return EXIT_UNAVAILABLE;
    }

    int status = config->list_only ? list_mailboxes(paths) : browse_mailboxes(paths, *config);
    logger::instance().clear_callback();
    return status;
}
