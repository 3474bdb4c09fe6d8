#include <catch2/catch.hpp>
#include "../stream-capture.hpp"
#include "../stream_capture_sys.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <future>
#include <stdexcept>
#include <stdio_ext.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

// Failure injection through the sc::sys seam. Each test arms one failing call
// (counted from 1) and the fixture puts the real implementations back.

namespace {
int flush_calls = 0;
int fail_flush_on = 0;
int swap_calls = 0;
int fail_swap_on = 0;

int failing_flush(FILE* file) {
    if (++flush_calls == fail_flush_on) {
        errno = EIO;
        return EOF;
    }
    return ::fflush(file);
}

// Failing swap-before leaves everything as it was.
// Failing swap-back still restores the stream, working on a duplicate so the
// caller keeps ownership of `fd`, but reports the failure.
int failing_swap(FILE* file, int fd) {
    if (++swap_calls != fail_swap_on) {
        return sc::sys::default_swap_fd(file, fd);
    }
    if (fail_swap_on > 1) {
        int active = sc::sys::default_swap_fd(file, ::dup(fd));
        if (active >= 0) ::close(active);
    }
    errno = fail_swap_on == 1 ? EMFILE : EIO;
    return -1;
}

struct SeamFixture {
    SeamFixture() {
        flush_calls = fail_flush_on = swap_calls = fail_swap_on = 0;
        sc::sys::flush_impl = failing_flush;
        sc::sys::swap_fd_impl = failing_swap;
    }
    ~SeamFixture() {
        sc::sys::reset_to_defaults();
        sc::clear_poison(sc::StreamId::Stdout);
    }
};

bool same_file(int a, int b) {
    struct stat sa{};
    struct stat sb{};
    if (::fstat(a, &sa) != 0 || ::fstat(b, &sb) != 0) return false;
    return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
}
} // namespace

TEST_CASE_METHOD(SeamFixture, "flush failure before the swap changes nothing", "[stream_capture][failure][flush]") {
    fail_flush_on = 1;
    bool ran = false;
    const int original = ::dup(STDOUT_FILENO);
    REQUIRE(original >= 0);

    try {
        (void)sc::capture_text(sc::StreamId::Stdout, [&] { ran = true; });
        FAIL("expected FlushFailure");
    } catch (const sc::FlushFailure& e) {
        CHECK(e.kind() == sc::ErrorKind::FlushFailure);
        CHECK(e.stage() == sc::Stage::BeforeCallback);
        CHECK(e.os_error() == EIO);
        CHECK(e.code() == std::errc::io_error);
    }

    REQUIRE_FALSE(ran);
    REQUIRE(swap_calls == 0);
    REQUIRE(same_file(original, STDOUT_FILENO));
    REQUIRE_FALSE(sc::is_poisoned(sc::StreamId::Stdout));
    ::close(original);
}

TEST_CASE_METHOD(SeamFixture, "flush failure after the callback discards callback bytes and restores", "[stream_capture][failure][flush]") {
    fail_flush_on = 2;
    const int original = ::dup(STDOUT_FILENO);
    REQUIRE(original >= 0);

    try {
        (void)sc::capture_text(sc::StreamId::Stdout, [] { std::printf("never delivered"); });
        FAIL("expected FlushFailure");
    } catch (const sc::FlushFailure& e) {
        CHECK(e.stage() == sc::Stage::AfterCallback);
        CHECK(e.os_error() == EIO);
    }

    REQUIRE(swap_calls == 2);
    REQUIRE(__fpending(stdout) == 0);
    REQUIRE(same_file(original, STDOUT_FILENO));
    REQUIRE_FALSE(sc::is_poisoned(sc::StreamId::Stdout));
    ::close(original);
}

TEST_CASE_METHOD(SeamFixture, "swap failure before the callback skips the callback", "[stream_capture][failure][swap]") {
    fail_swap_on = 1;
    bool ran = false;

    try {
        (void)sc::capture_text(sc::StreamId::Stdout, [&] { ran = true; });
        FAIL("expected SwapFailure");
    } catch (const sc::SwapFailure& e) {
        CHECK(e.kind() == sc::ErrorKind::SwapFailure);
        CHECK(e.stage() == sc::Stage::BeforeCallback);
        CHECK(e.os_error() == EMFILE);
    }

    REQUIRE_FALSE(ran);
    REQUIRE_FALSE(sc::is_poisoned(sc::StreamId::Stdout));
}

TEST_CASE_METHOD(SeamFixture, "swap-back failure poisons the stream", "[stream_capture][failure][swap][poison]") {
    fail_swap_on = 2;

    try {
        sc::LentStream out = sc::lend_stdout();
        out.capture_into(sc::make_pipe().write_end, [] { std::printf("x"); });
        FAIL("expected SwapFailure");
    } catch (const sc::SwapFailure& e) {
        CHECK(e.stage() == sc::Stage::AfterCallback);
        CHECK(e.os_error() == EIO);
    }

    REQUIRE(sc::is_poisoned(sc::StreamId::Stdout));
    REQUIRE_THROWS_AS(sc::lend_stdout(), sc::LockPoisoned);
    sc::clear_poison(sc::StreamId::Stdout);
    REQUIRE_FALSE(sc::is_poisoned(sc::StreamId::Stdout));
}

// The text layer's reader thread must not outlive a failed capture.
TEST_CASE_METHOD(SeamFixture, "capture_text reports a swap-back failure without hanging", "[stream_capture][failure][swap]") {
    fail_swap_on = 2;

    auto attempt = std::async(std::launch::async, [] {
        try {
            (void)sc::capture_text(sc::StreamId::Stdout, [] { std::printf("lost"); });
        } catch (const sc::SwapFailure& e) {
            return e.stage() == sc::Stage::AfterCallback;
        }
        return false;
    });
    REQUIRE(attempt.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(attempt.get());
    REQUIRE(sc::is_poisoned(sc::StreamId::Stdout));
}

TEST_CASE_METHOD(SeamFixture, "callback exception wins over a failing cleanup flush", "[stream_capture][failure][poison]") {
    fail_flush_on = 2;
    const int original = ::dup(STDOUT_FILENO);
    REQUIRE(original >= 0);

    REQUIRE_THROWS_AS(sc::capture_text(sc::StreamId::Stdout, [] {
                          std::printf("half written");
                          throw std::logic_error("callback failed");
                      }),
                      std::logic_error);

    REQUIRE(__fpending(stdout) == 0);
    REQUIRE(same_file(original, STDOUT_FILENO));
    REQUIRE(sc::is_poisoned(sc::StreamId::Stdout));
    ::close(original);
}

TEST_CASE("default_swap_fd rejects the stream's own descriptor", "[stream_capture][failure][swap]") {
    errno = 0;
    REQUIRE(sc::sys::default_swap_fd(stdout, STDOUT_FILENO) == -1);
    REQUIRE(errno == EINVAL);
    REQUIRE(sc::sys::default_swap_fd(stdout, -1) == -1);
}
