#include "blitz/fire/ledger.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace blitz;

TEST_CASE("Ledger slug flattens path and query separators", "[ledger]")
{
    REQUIRE(TargetLedger::slug("https://chat.example.com/c/42?x=1") == "https__chat.example.com_c_42x=1");
    REQUIRE(TargetLedger::slug("plain") == "plain");
    REQUIRE(TargetLedger::slug("") == "_");
}

TEST_CASE("Ledger header is written only on creation", "[ledger]")
{
    test::TempDir dir;
    TargetLedger ledger(dir.path());
    std::string url = "https://example.com/a";

    REQUIRE(ledger.ensure_exists(url, "# target: " + url));
    REQUIRE(ledger.ensure_exists(url, "# target: " + url));

    auto lines = test::read_lines(ledger.path_for(url));
    REQUIRE(lines == std::vector<std::string>{ "# target: https://example.com/a" });
}

TEST_CASE("Ledger without header starts empty", "[ledger]")
{
    test::TempDir dir;
    TargetLedger ledger(dir.path());

    REQUIRE(ledger.ensure_exists("https://example.com/b", std::nullopt));
    REQUIRE(std::filesystem::exists(ledger.path_for("https://example.com/b")));
    REQUIRE(test::read_lines(ledger.path_for("https://example.com/b")).empty());
}

TEST_CASE("Ledger appends rounds after existing lines", "[ledger]")
{
    test::TempDir dir;
    TargetLedger ledger(dir.path());
    std::string url = "https://example.com/a";

    ledger.ensure_exists(url, "# target: " + url);
    REQUIRE(ledger.append_round(url, "first"));
    REQUIRE(ledger.append_round(url, "second"));
    ledger.ensure_exists(url, "# target: " + url);

    auto lines = test::read_lines(ledger.path_for(url));
    REQUIRE(lines == std::vector<std::string>{ "# target: https://example.com/a", "first", "second" });
}

TEST_CASE("Ledger creates its directory on first append", "[ledger]")
{
    test::TempDir dir;
    TargetLedger ledger(dir / "nested" / "records");

    REQUIRE(ledger.append_round("u", "line"));
    REQUIRE(test::read_lines(ledger.path_for("u")) == std::vector<std::string>{ "line" });
}
