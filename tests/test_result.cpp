#include <catch2/catch.hpp>
#include <seanet/result.hpp>
#include <memory>
#include <string>

using namespace seanet;

// Helper function that uses SEANET_TRY
static Result<int> try_double(Result<int> input) {
    SEANET_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(SeanetError{SeanetError::Parse, "first failed"})
        : Result<int>::ok(10);
    SEANET_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    SEANET_TRY(second);
    return Result<int>::ok(second.value());
}

static Result<std::unique_ptr<int>> make_boxed(bool fail) {
    if (fail) return SeanetError{SeanetError::Parse, "no box"};
    return Result<std::unique_ptr<int>>::ok(std::make_unique<int>(3));
}

static Result<int> unbox_plus_one(bool fail) {
    SEANET_TRY_ASSIGN(std::unique_ptr<int> boxed, make_boxed(fail));
    return Result<int>::ok(*boxed + 1);
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(SeanetError{SeanetError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == SeanetError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(SeanetError{SeanetError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(SeanetError{SeanetError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return x * 2; });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == 10);
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Result<int>::err(SeanetError{SeanetError::Parse, "bad input"});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return x * 2; });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().message == "bad input");
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(SeanetError{SeanetError::Config, "bad level"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == SeanetError::Config);
}

TEST_CASE("or_else() on Err calls recovery", "[result]") {
    auto r = Result<int>::err(SeanetError{SeanetError::IO, "disk full"});
    auto recovered = r.or_else([](SeanetError&) {
        return Result<int>::ok(0);
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("or_else() keeps a move-only Ok value", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    auto kept = r.or_else([](SeanetError&) {
        return Result<std::unique_ptr<int>>::ok(nullptr);
    });
    REQUIRE(kept.is_ok());
    REQUIRE(*kept.value() == 7);
}

TEST_CASE("SEANET_TRY propagates errors", "[result]") {
    auto input = Result<int>::err(SeanetError{SeanetError::Parse, "syntax error"});
    auto output = try_double(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == SeanetError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("SEANET_TRY passes through Ok", "[result]") {
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
    REQUIRE(try_chain(false).value() == 15);
    REQUIRE(try_chain(true).error().message == "first failed");
}

TEST_CASE("SEANET_TRY_ASSIGN binds a move-only value", "[result]") {
    auto ok = unbox_plus_one(false);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 4);

    auto err = unbox_plus_one(true);
    REQUIRE(err.is_err());
    REQUIRE(err.error().message == "no box");
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(SeanetError{SeanetError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == SeanetError::Config);
}

TEST_CASE("SeanetError format() output", "[error]") {
    SeanetError e{SeanetError::IO, "file not found", "check the path", "main.sn", 42};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("file not found") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> main.sn:42") != std::string::npos);
}

TEST_CASE("SeanetError format() without hint or file", "[error]") {
    SeanetError e{SeanetError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Parse]: unexpected token");
}

TEST_CASE("SeanetError code_name() for all codes", "[error]") {
    REQUIRE(std::string(SeanetError::code_name(SeanetError::IO)) == "IO");
    REQUIRE(std::string(SeanetError::code_name(SeanetError::Lex)) == "Lex");
    REQUIRE(std::string(SeanetError::code_name(SeanetError::Parse)) == "Parse");
    REQUIRE(std::string(SeanetError::code_name(SeanetError::Config)) == "Config");
    REQUIRE(std::string(SeanetError::code_name(SeanetError::NotFound)) == "NotFound");
    REQUIRE(std::string(SeanetError::code_name(SeanetError::InvalidArg)) == "InvalidArg");
}
