#include <catch2/catch_test_macros.hpp>

#include <toolpipe/core/result.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace toolpipe;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    REQUIRE(r.IsOk());
    auto owned = std::move(r).Value();
    REQUIRE(owned);
    CHECK(*owned == 7);
}

TEST_CASE("Result: ValueOr falls back only on Err", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

// ===========================================================================
// AndThen / Map
// ===========================================================================

TEST_CASE("Result: AndThen chains on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(10);
    auto r2 = r.AndThen([](int v) {
        return Result<std::string, std::string>::Ok(std::to_string(v * 2));
    });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "20");
}

TEST_CASE("Result: AndThen short-circuits on Err", "[result]") {
    auto r = Result<int, std::string>::Err("bad");
    bool called = false;
    auto r2 = r.AndThen([&called](int v) {
        called = true;
        return Result<int, std::string>::Ok(v);
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "bad");
}

TEST_CASE("Result: Map transforms the value", "[result]") {
    auto r = Result<int, std::string>::Ok(3).Map([](int v) { return v * v; });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == 9);
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("broken");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "broken");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: kind names match the wire taxonomy", "[result][error]") {
    CHECK(Error::Make(ErrorCategory::Framing, "op", "m").KindName() == "FramingError");
    CHECK(Error::Make(ErrorCategory::ProtocolSequence, "op", "m").KindName() ==
          "ProtocolSequenceError");
    CHECK(Error::Make(ErrorCategory::VersionMismatch, "op", "m").KindName() ==
          "VersionMismatchError");
    CHECK(Error::Make(ErrorCategory::UnknownTool, "op", "m").KindName() ==
          "UnknownToolError");
    CHECK(Error::Make(ErrorCategory::ArgumentValidation, "op", "m").KindName() ==
          "ArgumentValidationError");
    CHECK(Error::Make(ErrorCategory::Domain, "op", "m").KindName() == "DomainError");
    CHECK(Error::Make(ErrorCategory::DuplicateTool, "op", "m").KindName() ==
          "DuplicateToolError");
}

TEST_CASE("Error: session-ending categories are fatal", "[result][error]") {
    CHECK(Error::Make(ErrorCategory::Framing, "", "").IsFatal());
    CHECK(Error::Make(ErrorCategory::ProtocolSequence, "", "").IsFatal());
    CHECK(Error::Make(ErrorCategory::VersionMismatch, "", "").IsFatal());
    CHECK(Error::Make(ErrorCategory::Transport, "", "").IsFatal());

    CHECK_FALSE(Error::Make(ErrorCategory::UnknownTool, "", "").IsFatal());
    CHECK_FALSE(Error::Make(ErrorCategory::ArgumentValidation, "", "").IsFatal());
    CHECK_FALSE(Error::Make(ErrorCategory::Domain, "", "").IsFatal());
}

TEST_CASE("Error: exit codes per category", "[result][error]") {
    CHECK(Error::Make(ErrorCategory::Transport, "", "").ExitCode() == 1);
    CHECK(Error::Make(ErrorCategory::Framing, "", "").ExitCode() == 2);
    CHECK(Error::Make(ErrorCategory::ProtocolSequence, "", "").ExitCode() == 3);
    CHECK(Error::Make(ErrorCategory::VersionMismatch, "", "").ExitCode() == 4);
    CHECK(Error::Make(ErrorCategory::Config, "", "").ExitCode() == 5);
    CHECK(Error::Make(ErrorCategory::Database, "", "").ExitCode() == 6);
    CHECK(Error::Make(ErrorCategory::Internal, "", "").ExitCode() == 99);
}

TEST_CASE("Error: ToString includes operation, id, kind and message", "[result][error]") {
    auto error = Error::Make(ErrorCategory::UnknownTool, "Dispatch", "no such tool");
    CHECK(error.ToString() == "Dispatch (UnknownToolError): no such tool");

    error.correlation_id = "7";
    CHECK(error.ToString() == "Dispatch [id 7] (UnknownToolError): no such tool");

    std::ostringstream oss;
    oss << error;
    CHECK(oss.str() == error.ToString());
}

TEST_CASE("Error: equality compares every field", "[result][error]") {
    auto a = Error::Make(ErrorCategory::Domain, "op", "msg");
    auto b = a;
    CHECK(a == b);
    b.correlation_id = "1";
    CHECK(a != b);
}
