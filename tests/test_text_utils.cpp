#include <catch2/catch_test_macros.hpp>

#include "call_bridge/utils/text.hpp"

#include <string>
#include <vector>

TEST_CASE("remove_emojis strips emoji codepoints") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string input = "Hello " + emoji + " world";
    const std::string expected = "Hello  world";
    REQUIRE(call_bridge::utils::remove_emojis(input) == expected);
}

TEST_CASE("remove_emojis leaves plain ASCII untouched") {
    const std::string input = "Plain text only.";
    REQUIRE(call_bridge::utils::remove_emojis(input) == input);
}

TEST_CASE("normalize_text lowercases and trims whitespace") {
    const std::string input = "  Hello\tWORLD  ";
    const std::string expected = "hello world";
    REQUIRE(call_bridge::utils::normalize_text(input) == expected);
}

TEST_CASE("split_words lowercases and drops punctuation") {
    const std::vector<std::string> expected = {"wait", "i'm", "not", "done"};
    REQUIRE(call_bridge::utils::split_words("Wait, I'm NOT done!") == expected);
    REQUIRE(call_bridge::utils::split_words("  ...  ").empty());
}

TEST_CASE("trim_copy removes surrounding whitespace only") {
    REQUIRE(call_bridge::utils::trim_copy("\t order 42 \n") == "order 42");
    REQUIRE(call_bridge::utils::trim_copy("   ").empty());
}

TEST_CASE("starts_with compares prefixes") {
    REQUIRE(call_bridge::utils::starts_with("wss://host", "wss://"));
    REQUIRE_FALSE(call_bridge::utils::starts_with("ws", "wss://"));
    REQUIRE_FALSE(call_bridge::utils::starts_with("ws://host", "wss://"));
}
