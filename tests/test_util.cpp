#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace npcmem;

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: lowercases ASCII letters", "[util]") {
    REQUIRE(to_lower("Door OPEN 42") == "door open 42");
}

TEST_CASE("to_lower: folds Latin-1 capitals", "[util]") {
    REQUIRE(to_lower("CAF\xC3\x89") == "caf\xC3\xA9");
    REQUIRE(to_lower("K\xC3\x96NIG") == "k\xC3\xB6nig");
    REQUIRE(to_lower("\xC3\x84pfel") == "\xC3\xA4pfel");
}

TEST_CASE("to_lower: leaves other non-ASCII bytes untouched", "[util]") {
    REQUIRE(to_lower("2\xC3\x97" "3") == "2\xC3\x97" "3");  // multiplication sign
    REQUIRE(to_lower("\xC3\x9F") == "\xC3\x9F");          // sharp s has no capital here
    REQUIRE(to_lower("\xC5\x81\xC3\xB3" "d\xC5\xBA") == "\xC5\x81\xC3\xB3" "d\xC5\xBA");
    REQUIRE(to_lower("\xC3") == "\xC3");                    // truncated sequence
}

// ── utf8_length ──────────────────────────────────────────────────

TEST_CASE("utf8_length: counts code points, not bytes", "[util]") {
    REQUIRE(utf8_length("") == 0);
    REQUIRE(utf8_length("door") == 4);
    REQUIRE(utf8_length("f\xC3\xBCr") == 3);
    REQUIRE(utf8_length("\xE7\x8C\xAB") == 1);
}

// ── case-insensitive helpers ─────────────────────────────────────

TEST_CASE("contains_ignore_case: finds mixed-case needle", "[util]") {
    REQUIRE(contains_ignore_case("The Door is open", "door"));
    REQUIRE(contains_ignore_case("the door", "DOOR"));
    REQUIRE_FALSE(contains_ignore_case("the gate", "door"));
}

TEST_CASE("contains_ignore_case: empty needle matches", "[util]") {
    REQUIRE(contains_ignore_case("anything", ""));
}

TEST_CASE("equals_ignore_case: compares ASCII case-insensitively", "[util]") {
    REQUIRE(equals_ignore_case("Door", "dOOR"));
    REQUIRE_FALSE(equals_ignore_case("Door", "Doors"));
    REQUIRE(equals_ignore_case("caf\xC3\xA9", "CAF\xC3\x89"));
    REQUIRE_FALSE(equals_ignore_case("caf\xC3\xA9", "cafe"));
}

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t\n hello \r\n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── split_any ────────────────────────────────────────────────────

TEST_CASE("split_any: splits on every delimiter and drops empties", "[util]") {
    auto parts = split_any("Hello, world! How are you?", " ,!?");
    REQUIRE(parts == std::vector<std::string>{"Hello", "world", "How", "are", "you"});
}

TEST_CASE("split_any: only delimiters yields nothing", "[util]") {
    REQUIRE(split_any(" .,!? ", " .,!?").empty());
    REQUIRE(split_any("", " ").empty());
}

// ── replace_all ──────────────────────────────────────────────────

TEST_CASE("replace_all: multiple replacements", "[util]") {
    REQUIRE(replace_all("a is b is c", " is ", " is not ") == "a is not b is not c");
}

TEST_CASE("replace_all: empty from returns original", "[util]") {
    REQUIRE(replace_all("hello", "", "x") == "hello");
}

// ── ids and hex ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 lowercase hex chars, distinct", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(a != b);
}

TEST_CASE("to_hex: encodes bytes", "[util]") {
    const unsigned char data[] = {0x00, 0x0f, 0xab, 0xff};
    REQUIRE(to_hex(data, sizeof(data)) == "000fabff");
    REQUIRE(to_hex(data, 0).empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/tmp/state.json") == "/tmp/state.json");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/npc.json") == std::string(home) + "/npc.json");
    }
}
