/*

test_navigation.cpp
-------------------

Checks message and line moves over a loaded mailbox.

*/

#define BOOST_TEST_MODULE navigation_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mailview/storage/mailbox.hpp>
#include <mailview/view/navigation.hpp>

using mailview::storage::mailbox;
using mailview::view::command;
using mailview::view::command_kind;
using mailview::view::navigation_state;

static mailbox make_mailbox(std::size_t count, std::size_t body_lines = 1)
{
    std::string text;
    for (std::size_t i = 0; i < count; ++i)
    {
        text += "From sender Mon Jan 1 00:00:00 2024\nSubject: " + std::to_string(i) + "\n\n";
        for (std::size_t line = 0; line < body_lines; ++line)
            text += "line " + std::to_string(line) + "\n";
    }
    return mailbox::parse(text, "test");
}

BOOST_AUTO_TEST_CASE(navigation_empty_mailbox)
{
    auto box = make_mailbox(0);
    navigation_state nav(box);
    BOOST_TEST(nav.current() == nullptr);
    BOOST_TEST(!nav.current_index().has_value());

    nav.next();
    nav.previous();
    nav.first();
    nav.last();
    nav.jump_to(4);
    nav.line_down();
    nav.line_up();
    BOOST_TEST(nav.current() == nullptr);
    BOOST_TEST(nav.top_line() == 0u);
}

BOOST_AUTO_TEST_CASE(navigation_starts_at_first_message)
{
    auto box = make_mailbox(3);
    navigation_state nav(box);
    BOOST_REQUIRE(nav.current() != nullptr);
    BOOST_TEST(*nav.current_index() == 0u);
    BOOST_TEST(nav.current()->subject() == "0");
}

BOOST_AUTO_TEST_CASE(navigation_next_and_previous_saturate)
{
    auto box = make_mailbox(3);
    navigation_state nav(box);

    nav.previous();
    BOOST_TEST(*nav.current_index() == 0u);

    nav.next();
    nav.next();
    BOOST_TEST(*nav.current_index() == 2u);
    nav.next();
    BOOST_TEST(*nav.current_index() == 2u);

    nav.previous();
    BOOST_TEST(*nav.current_index() == 1u);
}

BOOST_AUTO_TEST_CASE(navigation_first_and_last)
{
    auto box = make_mailbox(5);
    navigation_state nav(box);
    nav.last();
    BOOST_TEST(*nav.current_index() == 4u);
    BOOST_TEST(nav.current()->subject() == "4");
    nav.first();
    BOOST_TEST(*nav.current_index() == 0u);
}

BOOST_AUTO_TEST_CASE(navigation_jump_to_clamps)
{
    auto box = make_mailbox(3);
    navigation_state nav(box);
    nav.jump_to(1000);
    BOOST_TEST(*nav.current_index() == 2u);
    nav.jump_to(-5);
    BOOST_TEST(*nav.current_index() == 0u);
    nav.jump_to(1);
    BOOST_TEST(*nav.current_index() == 1u);
}

BOOST_AUTO_TEST_CASE(navigation_single_message)
{
    auto box = make_mailbox(1);
    navigation_state nav(box);
    nav.next();
    BOOST_TEST(*nav.current_index() == 0u);
    nav.previous();
    BOOST_TEST(*nav.current_index() == 0u);
}

BOOST_AUTO_TEST_CASE(navigation_line_scroll_clamps)
{
    auto box = make_mailbox(2, 4);
    navigation_state nav(box);

    nav.line_up();
    BOOST_TEST(nav.top_line() == 0u);

    nav.line_down();
    nav.line_down();
    BOOST_TEST(nav.top_line() == 2u);
    nav.line_down(10);
    BOOST_TEST(nav.top_line() == 3u);

    nav.line_up(2);
    BOOST_TEST(nav.top_line() == 1u);
    nav.line_up(5);
    BOOST_TEST(nav.top_line() == 0u);
}

BOOST_AUTO_TEST_CASE(navigation_message_change_resets_scroll)
{
    auto box = make_mailbox(2, 4);
    navigation_state nav(box);
    nav.line_down(2);
    BOOST_TEST(nav.top_line() == 2u);

    // Staying on the same message keeps the position.
    nav.first();
    BOOST_TEST(nav.top_line() == 2u);

    nav.next();
    BOOST_TEST(nav.top_line() == 0u);
}

BOOST_AUTO_TEST_CASE(navigation_apply_commands)
{
    auto box = make_mailbox(4, 30);
    navigation_state nav(box);

    nav.apply({command_kind::last});
    BOOST_TEST(*nav.current_index() == 3u);
    nav.apply({command_kind::previous});
    BOOST_TEST(*nav.current_index() == 2u);
    nav.apply({command_kind::jump_to, 0});
    BOOST_TEST(*nav.current_index() == 0u);
    nav.apply({command_kind::next});
    BOOST_TEST(*nav.current_index() == 1u);
    nav.apply({command_kind::first});
    BOOST_TEST(*nav.current_index() == 0u);

    nav.apply({command_kind::page_down, 19});
    BOOST_TEST(nav.top_line() == 19u);
    nav.apply({command_kind::line_down});
    BOOST_TEST(nav.top_line() == 20u);
    nav.apply({command_kind::page_down, 19});
    BOOST_TEST(nav.top_line() == 29u);
    nav.apply({command_kind::line_up});
    BOOST_TEST(nav.top_line() == 28u);
    nav.apply({command_kind::page_up, 19});
    BOOST_TEST(nav.top_line() == 9u);
    nav.apply({command_kind::page_up, 19});
    BOOST_TEST(nav.top_line() == 0u);
}
