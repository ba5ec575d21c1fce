#include "util/unique_fd.hpp"

#include <catch2/catch_test_macros.hpp>
#include <fcntl.h>
#include <sys/eventfd.h>
#include <unistd.h>

using namespace scape::util;

namespace {

auto is_open(int fd) -> bool {
    return fcntl(fd, F_GETFD) != -1;
}

} // namespace

TEST_CASE("UniqueFd owns and closes its descriptor", "[unique_fd]") {
    int raw = eventfd(0, EFD_CLOEXEC);
    REQUIRE(raw >= 0);
    {
        UniqueFd fd(raw);
        REQUIRE(fd.valid());
        REQUIRE(static_cast<bool>(fd));
        REQUIRE(fd.get() == raw);
    }
    REQUIRE_FALSE(is_open(raw));

    UniqueFd empty;
    REQUIRE_FALSE(empty.valid());
    REQUIRE(empty.get() == -1);
}

TEST_CASE("UniqueFd moves transfer ownership", "[unique_fd]") {
    int raw_a = eventfd(0, EFD_CLOEXEC);
    int raw_b = eventfd(0, EFD_CLOEXEC);
    REQUIRE(raw_a >= 0);
    REQUIRE(raw_b >= 0);

    UniqueFd a(raw_a);
    UniqueFd b(std::move(a));
    REQUIRE_FALSE(a.valid());
    REQUIRE(b.get() == raw_a);

    UniqueFd c(raw_b);
    c = std::move(b);
    REQUIRE_FALSE(is_open(raw_b));
    REQUIRE(c.get() == raw_a);
    REQUIRE(is_open(raw_a));
}

TEST_CASE("UniqueFd dup, reset and release", "[unique_fd]") {
    UniqueFd fd(eventfd(0, EFD_CLOEXEC));
    REQUIRE(fd.valid());

    UniqueFd copy = fd.dup();
    REQUIRE(copy.valid());
    REQUIRE(copy.get() != fd.get());
    REQUIRE((fcntl(copy.get(), F_GETFD) & FD_CLOEXEC) != 0);
    REQUIRE_FALSE(UniqueFd{}.dup().valid());

    const int original = fd.get();
    fd.reset();
    REQUIRE_FALSE(fd.valid());
    REQUIRE_FALSE(is_open(original));

    int raw = copy.release();
    REQUIRE_FALSE(copy.valid());
    REQUIRE(is_open(raw));
    ::close(raw);
}
