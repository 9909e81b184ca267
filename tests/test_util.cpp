#include <catch2/catch.hpp>
#include "util.hpp"
#include <set>

using namespace chatrelay;

// ── trim / to_lower ──────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\n hi \r\n") == "hi");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("to_lower: ASCII letters lowered", "[util]") {
    REQUIRE(to_lower("DashScope") == "dashscope");
    REQUIRE(to_lower("abc-123") == "abc-123");
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: normal delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("split: empty parts preserved", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: empty string", "[util]") {
    REQUIRE(split("", ',').empty());
}

// ── generate_uuid ────────────────────────────────────────────────

TEST_CASE("generate_uuid: version 4 layout", "[util]") {
    std::string id = generate_uuid();
    REQUIRE(id.size() == 36);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    REQUIRE(id[14] == '4');
    char variant = id[19];
    REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
}

TEST_CASE("generate_uuid: values do not repeat", "[util]") {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) seen.insert(generate_uuid());
    REQUIRE(seen.size() == 200);
}

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC with milliseconds", "[util]") {
    std::string ts = timestamp_now();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts[19] == '.');
    REQUIRE(ts.back() == 'Z');
}

// ── strip_trailing_slashes / is_truthy ───────────────────────────

TEST_CASE("strip_trailing_slashes: removes every trailing slash", "[util]") {
    REQUIRE(strip_trailing_slashes("https://api.openai.com/v1///") == "https://api.openai.com/v1");
    REQUIRE(strip_trailing_slashes("https://x/v1") == "https://x/v1");
    REQUIRE(strip_trailing_slashes("").empty());
}

TEST_CASE("is_truthy: accepts 1, true, yes in any case", "[util]") {
    REQUIRE(is_truthy("1"));
    REQUIRE(is_truthy("TRUE"));
    REQUIRE(is_truthy("Yes"));
    REQUIRE_FALSE(is_truthy("0"));
    REQUIRE_FALSE(is_truthy("on"));
    REQUIRE_FALSE(is_truthy(""));
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.front() == '/');
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/Documents").size());
}
