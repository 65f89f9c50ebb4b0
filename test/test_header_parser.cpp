/*

test_header_parser.cpp
----------------------

Checks header folding, case insensitive names, duplicates and malformed lines.

*/

#define BOOST_TEST_MODULE header_parser_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mailview/mime/header_parser.hpp>

using mailview::mime::header_map;
using mailview::mime::header_parser;

BOOST_AUTO_TEST_CASE(header_folding_joins_with_one_space)
{
    auto block = header_parser::parse("Subject: Hello\n world\n\nbody\n");
    BOOST_TEST(*block.headers.get("subject") == "Hello world");
    BOOST_TEST(block.terminated);
    BOOST_TEST(block.skipped_lines == 0u);
}

BOOST_AUTO_TEST_CASE(header_folding_multiple_lines_and_tabs)
{
    auto block = header_parser::parse(
        "To: a@example.com,\n"
        "\t b@example.com,\n"
        "    c@example.com   \n"
        "\n");
    BOOST_TEST(*block.headers.get("to") == "a@example.com, b@example.com, c@example.com");
}

BOOST_AUTO_TEST_CASE(header_folding_of_empty_value)
{
    auto block = header_parser::parse("Subject:\n  Hello\n \n\n");
    BOOST_TEST(*block.headers.get("Subject") == "Hello");
}

BOOST_AUTO_TEST_CASE(header_names_are_case_insensitive)
{
    auto block = header_parser::parse("CONTENT-Type: text/plain\n\n");
    BOOST_TEST(block.headers.contains("content-type"));
    BOOST_TEST(block.headers.contains("Content-Type"));
    BOOST_TEST(block.headers.begin()->first == "content-type");
    BOOST_TEST(block.headers.value_or_empty("cOnTeNt-TyPe") == "text/plain");
}

BOOST_AUTO_TEST_CASE(header_duplicates_last_wins)
{
    auto block = header_parser::parse(
        "Subject: first\n"
        "subject: second\n"
        " continued\n"
        "\n");
    BOOST_TEST(block.headers.size() == 1u);
    BOOST_TEST(*block.headers.get("Subject") == "second continued");
}

BOOST_AUTO_TEST_CASE(header_garbage_line_is_skipped)
{
    auto block = header_parser::parse(
        "From: a@b.com\n"
        "garbage line\n"
        "Subject: Hi\n"
        "Date: Mon, 1 Jan 2024 00:00:00 +0000\n"
        "\n"
        "Hello\n");
    BOOST_TEST(block.skipped_lines == 1u);
    BOOST_TEST(block.headers.size() == 3u);
    BOOST_TEST(*block.headers.get("from") == "a@b.com");
    BOOST_TEST(*block.headers.get("subject") == "Hi");
    BOOST_TEST(*block.headers.get("date") == "Mon, 1 Jan 2024 00:00:00 +0000");
}

BOOST_AUTO_TEST_CASE(header_continuation_of_garbage_is_skipped)
{
    auto block = header_parser::parse(
        "Subject: kept\n"
        "no colon here\n"
        " belongs to the garbage\n"
        "\n");
    BOOST_TEST(*block.headers.get("subject") == "kept");
    BOOST_TEST(block.skipped_lines == 2u);
}

BOOST_AUTO_TEST_CASE(header_leading_continuation_is_skipped)
{
    auto block = header_parser::parse(" orphan\nSubject: x\n\n");
    BOOST_TEST(block.skipped_lines == 1u);
    BOOST_TEST(*block.headers.get("subject") == "x");
}

BOOST_AUTO_TEST_CASE(header_invalid_name_is_skipped)
{
    auto block = header_parser::parse("Bad Name: x\n: empty name\nGood: y\n\n");
    BOOST_TEST(block.skipped_lines == 2u);
    BOOST_TEST(block.headers.size() == 1u);
    BOOST_TEST(*block.headers.get("good") == "y");
}

BOOST_AUTO_TEST_CASE(header_value_keeps_inner_colons)
{
    auto block = header_parser::parse("Date: Mon, 1 Jan 2024 10:20:30 +0100\n\n");
    BOOST_TEST(*block.headers.get("date") == "Mon, 1 Jan 2024 10:20:30 +0100");
}

BOOST_AUTO_TEST_CASE(header_crlf_block)
{
    const std::string text = "Subject: Hi\r\n there\r\n\r\nbody\r\n";
    auto block = header_parser::parse(text);
    BOOST_TEST(*block.headers.get("subject") == "Hi there");
    BOOST_TEST(block.terminated);
    BOOST_TEST(text.substr(block.body_offset) == "body\r\n");
}

BOOST_AUTO_TEST_CASE(header_block_without_blank_line)
{
    const std::string text = "Subject: only headers\nFrom: x@y";
    auto block = header_parser::parse(text);
    BOOST_TEST(!block.terminated);
    BOOST_TEST(block.body_offset == text.size());
    BOOST_TEST(*block.headers.get("from") == "x@y");
}

BOOST_AUTO_TEST_CASE(header_map_missing_name)
{
    header_map headers;
    headers.set("X-Test", "1");
    BOOST_TEST(!headers.get("subject").has_value());
    BOOST_TEST(headers.value_or_empty("subject").empty());
    headers.set("x-test", "2");
    BOOST_TEST(headers.size() == 1u);
    BOOST_TEST(*headers.get("X-TEST") == "2");
}
