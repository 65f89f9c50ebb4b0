/*

terminal.hpp
------------

Terminal state guards and blocking key input on the controlling terminal.

*/

#pragma once

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace mailview::term
{

struct screen_size
{
    std::size_t rows = 24;
    std::size_t cols = 80;
};

[[nodiscard]] inline bool tty_stdout() noexcept
{
    return ::isatty(STDOUT_FILENO) == 1;
}

/**
Size of the terminal on stdout, falling back to LINES/COLUMNS and then to 24x80.
**/
[[nodiscard]] inline screen_size terminal_size() noexcept
{
    screen_size size;
    struct winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0)
    {
        size.rows = ws.ws_row;
        size.cols = ws.ws_col;
        return size;
    }
    if (const char* env = std::getenv("LINES"); env != nullptr)
    {
        int r = std::atoi(env);
        if (r > 0)
            size.rows = static_cast<std::size_t>(r);
    }
    if (const char* env = std::getenv("COLUMNS"); env != nullptr)
    {
        int c = std::atoi(env);
        if (c > 0)
            size.cols = static_cast<std::size_t>(c);
    }
    return size;
}

inline void best_effort_write(int fd, const char* buf, std::size_t len) noexcept
{
    while (len > 0)
    {
        auto n = ::write(fd, buf, len);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return;
        buf += n;
        len -= static_cast<std::size_t>(n);
    }
}

inline constexpr char ALT_SCREEN_ENTER[] = "\x1B[?1049h\x1B[?25l";
inline constexpr char ALT_SCREEN_LEAVE[] = "\x1B[0m\x1B[?25h\x1B[?1049l";

/// Terminal state the guards changed, read by the signal handler.
struct saved_terminal
{
    inline static termios mode{};
    inline static volatile std::sig_atomic_t raw_active = 0;
    inline static volatile std::sig_atomic_t alt_active = 0;
};

/**
Puts the terminal back as the guards found it. Async-signal-safe.
**/
inline void restore_terminal_minimal() noexcept
{
    if (saved_terminal::alt_active != 0)
        best_effort_write(STDOUT_FILENO, ALT_SCREEN_LEAVE, sizeof(ALT_SCREEN_LEAVE) - 1);
    if (saved_terminal::raw_active != 0)
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_terminal::mode);
}

/**
Restores the terminal, then lets the signal take its default action.
**/
inline void on_terminating_signal(int sig) noexcept
{
    restore_terminal_minimal();
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

/**
Restores the terminal on SIGINT, SIGTERM, SIGHUP and SIGQUIT while alive.
**/
class signal_restore_guard
{
public:
    signal_restore_guard() noexcept
    {
        struct sigaction action{};
        action.sa_handler = &on_terminating_signal;
        sigemptyset(&action.sa_mask);
        for (std::size_t i = 0; i < SIGNAL_COUNT; ++i)
            ::sigaction(SIGNALS[i], &action, &previous_[i]);
    }

    signal_restore_guard(const signal_restore_guard&) = delete;
    signal_restore_guard& operator=(const signal_restore_guard&) = delete;

    ~signal_restore_guard()
    {
        for (std::size_t i = 0; i < SIGNAL_COUNT; ++i)
            ::sigaction(SIGNALS[i], &previous_[i], nullptr);
    }

private:
    static constexpr std::size_t SIGNAL_COUNT = 4;
    static constexpr int SIGNALS[SIGNAL_COUNT] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

    struct sigaction previous_[SIGNAL_COUNT]{};
};

/**
Puts stdin in non-canonical, no-echo mode with blocking one-byte reads. Ctrl-C is read as a byte
instead of raising SIGINT.
**/
class raw_mode_guard
{
public:
    raw_mode_guard() noexcept
    {
        if (::isatty(STDIN_FILENO) != 1 || ::tcgetattr(STDIN_FILENO, &old_) != 0)
            return;
        termios raw = old_;
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        saved_terminal::mode = old_;
        saved_terminal::raw_active = 1;
        active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
        if (!active_)
            saved_terminal::raw_active = 0;
    }

    raw_mode_guard(const raw_mode_guard&) = delete;
    raw_mode_guard& operator=(const raw_mode_guard&) = delete;

    ~raw_mode_guard()
    {
        if (!active_)
            return;
        saved_terminal::raw_active = 0;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    }

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    termios old_{};
    bool active_ = false;
};

/**
Switches to the alternate screen and hides the cursor while alive.
**/
class alt_screen_guard
{
public:
    alt_screen_guard() noexcept
    {
        if (!tty_stdout())
            return;
        best_effort_write(STDOUT_FILENO, ALT_SCREEN_ENTER, sizeof(ALT_SCREEN_ENTER) - 1);
        active_ = true;
        saved_terminal::alt_active = 1;
    }

    alt_screen_guard(const alt_screen_guard&) = delete;
    alt_screen_guard& operator=(const alt_screen_guard&) = delete;

    ~alt_screen_guard()
    {
        if (!active_)
            return;
        saved_terminal::alt_active = 0;
        best_effort_write(STDOUT_FILENO, ALT_SCREEN_LEAVE, sizeof(ALT_SCREEN_LEAVE) - 1);
    }

private:
    bool active_ = false;
};

/**
Source of raw input bytes for the session loop.
**/
class key_source
{
public:
    virtual ~key_source() = default;

    /**
    Blocks until input is available.

    @return The bytes read, or nothing once input is closed.
    **/
    virtual std::optional<std::string> read() = 0;
};

/**
Reads the keys typed on a terminal file descriptor.
**/
class fd_key_source : public key_source
{
public:
    explicit fd_key_source(int fd = STDIN_FILENO) noexcept : fd_(fd) {}

    std::optional<std::string> read() override
    {
        char buf[32];
        while (true)
        {
            auto n = ::read(fd_, buf, sizeof(buf));
            if (n > 0)
                return std::string(buf, static_cast<std::size_t>(n));
            if (n < 0 && errno == EINTR)
                continue;
            return std::nullopt;
        }
    }

private:
    int fd_;
};

} // namespace mailview::term
