#include "util/error.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace scape;

namespace {

auto parse_positive(int value) -> Result<int> {
    if (value <= 0) {
        return make_error<int>(ErrorCode::invalid_data, "not positive");
    }
    return value;
}

auto doubled_positive(int value) -> Result<int> {
    int checked = SCAPE_TRY(parse_positive(value));
    return checked * 2;
}

auto require_positive(int value) -> Result<void> {
    SCAPE_TRY(parse_positive(value));
    return {};
}

} // namespace

TEST_CASE("error_code_name returns the enumerator spelling", "[error]") {
    REQUIRE(std::string(error_code_name(ErrorCode::ok)) == "ok");
    REQUIRE(std::string(error_code_name(ErrorCode::file_not_found)) == "file_not_found");
    REQUIRE(std::string(error_code_name(ErrorCode::grab_conflict)) == "grab_conflict");
    REQUIRE(std::string(error_code_name(ErrorCode::protocol_violation)) == "protocol_violation");
    REQUIRE(std::string(error_code_name(ErrorCode::script_error)) == "script_error");
    REQUIRE(std::string(error_code_name(ErrorCode::unknown_error)) == "unknown_error");
}

TEST_CASE("Error struct construction", "[error]") {
    SECTION("Basic construction") {
        Error error{ErrorCode::window_not_found, "Test message"};
        REQUIRE(error.code == ErrorCode::window_not_found);
        REQUIRE(error.message == "Test message");
        REQUIRE(error.location.file_name() != nullptr);
    }

    SECTION("Construction with custom source location") {
        auto loc = std::source_location::current();
        Error error{ErrorCode::parse_error, "Parse failed", loc};
        REQUIRE(error.code == ErrorCode::parse_error);
        REQUIRE(error.location.line() == loc.line());
    }
}

TEST_CASE("make_error captures the call site", "[error]") {
    auto line_before = static_cast<uint32_t>(__LINE__);
    auto error_result = make_error<int>(ErrorCode::unknown_error, "Test");
    auto line_after = static_cast<uint32_t>(__LINE__);

    REQUIRE(!error_result.has_value());
    REQUIRE(error_result.error().location.line() > line_before);
    REQUIRE(error_result.error().location.line() < line_after);
}

TEST_CASE("SCAPE_TRY propagates errors and unwraps values", "[error]") {
    SECTION("Value is unwrapped on success") {
        auto result = doubled_positive(21);
        REQUIRE(result);
        REQUIRE(*result == 42);
    }

    SECTION("Error returns early with the original error") {
        auto result = doubled_positive(-1);
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::invalid_data);
        REQUIRE(result.error().message == "not positive");
    }

    SECTION("Works inside functions returning Result<void>") {
        REQUIRE(require_positive(3));
        auto failed = require_positive(0);
        REQUIRE(!failed);
        REQUIRE(failed.error().code == ErrorCode::invalid_data);
    }
}

TEST_CASE("make_result_ptr wraps ownership", "[error]") {
    auto ok = make_result_ptr(std::make_unique<int>(7));
    REQUIRE(ok);
    REQUIRE(**ok == 7);

    auto failed = make_result_ptr_error<int>(ErrorCode::resource_exhausted, "full");
    REQUIRE(!failed);
    REQUIRE(failed.error().code == ErrorCode::resource_exhausted);
}

TEST_CASE("Result<T> chaining operations", "[error]") {
    SECTION("and_then success case") {
        auto chained = Result<int>{5}.and_then([](int value) -> Result<std::string> {
            return std::to_string(value);
        });
        REQUIRE(chained.value() == "5");
    }

    SECTION("and_then error propagation") {
        auto chained = make_error<int>(ErrorCode::parse_error, "Bad input")
                           .and_then([](int value) -> Result<std::string> {
                               return std::to_string(value);
                           });
        REQUIRE(!chained.has_value());
        REQUIRE(chained.error().code == ErrorCode::parse_error);
    }
}
