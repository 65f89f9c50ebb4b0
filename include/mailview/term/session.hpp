/*

session.hpp
-----------

Synchronous browse loop over one mailbox: paint, wait for keys, apply them, repeat.

*/

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <utility>

#include <mailview/detail/log.hpp>
#include <mailview/term/keys.hpp>
#include <mailview/term/screen.hpp>
#include <mailview/term/terminal.hpp>
#include <mailview/view/navigation.hpp>
#include <mailview/view/render.hpp>

namespace mailview::term
{

enum class session_outcome : std::uint8_t
{
    leave,          ///< User asked for the next mailbox
    quit,           ///< User asked to stop browsing
    input_closed    ///< No more input
};

class session
{
public:
    using size_provider_t = std::function<screen_size()>;

    /**
    @param more_mailboxes True if `q` moves on to another mailbox instead of ending the program;
                          only changes the help line.
    **/
    session(view::navigation_state& nav, key_source& keys, std::ostream& out, size_provider_t size_provider,
        bool more_mailboxes = false)
        : nav_(&nav), keys_(&keys), screen_(out, more_mailboxes ? screen::HELP_MORE_MAILBOXES : screen::HELP),
          size_provider_(std::move(size_provider))
    {
    }

    [[nodiscard]] session_outcome run()
    {
        while (true)
        {
            const auto size = size_provider_();
            const auto page_rows = size.rows > view::render_view::HEADER_ROWS
                ? size.rows - view::render_view::HEADER_ROWS : 1;
            screen_.paint(view::make_render_view(*nav_, size.rows), size.cols, bindings_.pending_number());

            auto input = keys_->read();
            if (!input)
            {
                MAILVIEW_DEBUG("input closed");
                return session_outcome::input_closed;
            }

            for (const auto& key : decode_keys(*input))
            {
                auto action = bindings_.feed(key, page_rows);
                switch (action.kind)
                {
                    case action_kind::none:
                        break;
                    case action_kind::navigate:
                        nav_->apply(action.cmd);
                        break;
                    case action_kind::leave:
                        return session_outcome::leave;
                    case action_kind::quit:
                        return session_outcome::quit;
                }
            }
        }
    }

private:
    view::navigation_state* nav_;
    key_source* keys_;
    screen screen_;
    key_bindings bindings_;
    size_provider_t size_provider_;
};

} // namespace mailview::term
