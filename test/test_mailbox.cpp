/*

test_mailbox.cpp
----------------

Validates loading mbox files from disk: message order, error codes, and the exception bridge.

*/

#define BOOST_TEST_MODULE mailbox_test

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>
#include <boost/test/unit_test.hpp>
#include <mailview/storage/mailbox.hpp>
#include <mailview/throwing.hpp>

using mailview::errc;
using mailview::storage::mailbox;

static std::filesystem::path make_temp_dir()
{
    auto base = std::filesystem::temp_directory_path() / "mailview_mailbox_test";
    std::filesystem::create_directories(base);
    auto dir = base / std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    std::filesystem::create_directories(dir);
    return dir;
}

static void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream ofs(path, std::ios::binary);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

static const std::string TWO_MESSAGES =
    "From user@host Mon Jan 1 00:00:00 2024\n"
    "From: a@b.com\n"
    "Subject: Hi\n"
    "\n"
    "Hello\n"
    "From user@host Mon Jan 1 00:00:00 2024\n"
    "From: c@d.com\n"
    "Subject: Second\n"
    "\n"
    "World\n";

BOOST_AUTO_TEST_CASE(mailbox_load_two_messages)
{
    auto tmp = make_temp_dir();
    write_file(tmp / "alice", TWO_MESSAGES);

    auto box = mailbox::load(tmp / "alice");
    BOOST_REQUIRE(box.has_value());
    BOOST_REQUIRE_EQUAL(box->size(), 2u);
    BOOST_TEST(box->user() == "alice");
    BOOST_TEST((*box)[0].sender() == "a@b.com");
    BOOST_TEST((*box)[0].subject() == "Hi");
    BOOST_TEST(((*box)[0].body() == std::vector<std::string>{"Hello"}));
    BOOST_TEST((*box)[1].sender() == "c@d.com");
    BOOST_TEST(((*box)[1].body() == std::vector<std::string>{"World"}));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(mailbox_load_keeps_file_order)
{
    std::string text;
    for (int i = 0; i < 25; ++i)
        text += "From sender Mon Jan 1 00:00:00 2024\nSubject: " + std::to_string(i) + "\n\nbody\n\n";

    auto box = mailbox::parse(text, "memory");
    BOOST_REQUIRE_EQUAL(box.size(), 25u);
    for (std::size_t i = 0; i < box.size(); ++i)
        BOOST_TEST(box[i].subject() == std::to_string(i));
}

BOOST_AUTO_TEST_CASE(mailbox_load_empty_file)
{
    auto tmp = make_temp_dir();
    write_file(tmp / "empty", "");

    auto box = mailbox::load(tmp / "empty");
    BOOST_REQUIRE(box.has_value());
    BOOST_TEST(box->empty());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(mailbox_load_discards_preamble)
{
    auto box = mailbox::parse("leading junk\n\n" + TWO_MESSAGES);
    BOOST_TEST(box.size() == 2u);
    BOOST_TEST(box[0].subject() == "Hi");
}

BOOST_AUTO_TEST_CASE(mailbox_malformed_message_is_kept)
{
    const std::string text =
        "From x Mon Jan 1 00:00:00 2024\n"
        "this is not a header\n"
        "\n"
        "still shown\n"
        "From y Mon Jan 1 00:00:00 2024\n"
        "Subject: fine\n"
        "\n"
        "ok\n";
    auto box = mailbox::parse(text);
    BOOST_REQUIRE_EQUAL(box.size(), 2u);
    BOOST_TEST(box[0].subject().empty());
    BOOST_TEST(box[0].sender().empty());
    BOOST_TEST(box[0].body().front() == "still shown");
    BOOST_TEST(box[1].subject() == "fine");
}

BOOST_AUTO_TEST_CASE(mailbox_load_missing_file)
{
    auto tmp = make_temp_dir();
    auto box = mailbox::load(tmp / "nobody");
    BOOST_REQUIRE(!box.has_value());
    BOOST_TEST(box.error().is(errc::not_found));
    BOOST_TEST(box.error().detail == (tmp / "nobody").string());

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(mailbox_load_directory_is_not_found)
{
    auto tmp = make_temp_dir();
    auto box = mailbox::load(tmp);
    BOOST_REQUIRE(!box.has_value());
    BOOST_TEST(box.error().is(errc::not_found));

    std::filesystem::remove_all(tmp);
}

// Permission bits do not apply to root.
static boost::test_tools::assertion_result not_root(boost::unit_test::test_unit_id)
{
    boost::test_tools::assertion_result res(::geteuid() != 0);
    if (!res)
        res.message() << "running as root";
    return res;
}

static boost::test_tools::assertion_result has_proc_mem(boost::unit_test::test_unit_id)
{
    return std::filesystem::exists("/proc/self/mem");
}

BOOST_AUTO_TEST_CASE(mailbox_load_unreadable_file, *boost::unit_test::precondition(not_root))
{
    auto tmp = make_temp_dir();
    write_file(tmp / "locked", TWO_MESSAGES);
    std::filesystem::permissions(tmp / "locked", std::filesystem::perms::none);

    auto box = mailbox::load(tmp / "locked");
    BOOST_REQUIRE(!box.has_value());
    BOOST_TEST(box.error().is(errc::io_error));
    BOOST_TEST(static_cast<bool>(box.error().sys));

    std::filesystem::permissions(tmp / "locked", std::filesystem::perms::owner_all);
    std::filesystem::remove_all(tmp);
}

// The process memory file opens as a regular file, but reading at offset 0 fails with EIO.
BOOST_AUTO_TEST_CASE(mailbox_load_read_failure, *boost::unit_test::precondition(has_proc_mem))
{
    auto box = mailbox::load("/proc/self/mem");
    BOOST_REQUIRE(!box.has_value());
    BOOST_TEST(box.error().is(errc::io_error));
    BOOST_TEST(box.error().message == "cannot read mailbox");
    BOOST_TEST(box.error().detail == "/proc/self/mem");
    BOOST_TEST((box.error().sys == std::errc::io_error));
}

BOOST_AUTO_TEST_CASE(mailbox_load_does_not_modify_file)
{
    auto tmp = make_temp_dir();
    write_file(tmp / "bob", TWO_MESSAGES);
    auto before = std::filesystem::last_write_time(tmp / "bob");

    auto box = mailbox::load(tmp / "bob");
    BOOST_REQUIRE(box.has_value());

    std::ifstream ifs(tmp / "bob", std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    BOOST_TEST(content == TWO_MESSAGES);
    BOOST_TEST((std::filesystem::last_write_time(tmp / "bob") == before));

    std::filesystem::remove_all(tmp);
}

BOOST_AUTO_TEST_CASE(mailbox_unwrap_throws_on_error)
{
    auto tmp = make_temp_dir();
    try
    {
        auto box = mailview::unwrap(mailbox::load(tmp / "nobody"));
        BOOST_FAIL("unwrap should throw");
    }
    catch (const mailview::exception& exc)
    {
        BOOST_TEST(exc.info().is(errc::not_found));
    }

    write_file(tmp / "carol", TWO_MESSAGES);
    auto box = mailview::unwrap(mailbox::load(tmp / "carol"));
    BOOST_TEST(box.size() == 2u);

    std::filesystem::remove_all(tmp);
}
