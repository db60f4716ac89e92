#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "call_bridge/turn/transcript_validator.hpp"

#include <chrono>
#include <string>

using call_bridge::turn::TranscriptValidator;

TEST_CASE("similarity weighs word overlap and length") {
    REQUIRE(TranscriptValidator::similarity("I need a refund", "i need a REFUND!") ==
            Catch::Approx(1.0));
    REQUIRE(TranscriptValidator::similarity("red blue", "green yellow") == Catch::Approx(0.3));
    REQUIRE(TranscriptValidator::similarity("", "anything") == Catch::Approx(0.0));
    // jaccard 2/4, length ratio 3/3
    REQUIRE(TranscriptValidator::similarity("where is it", "where is mine") ==
            Catch::Approx(0.5 * 0.7 + 0.3));
}

TEST_CASE("short and empty transcripts") {
    TranscriptValidator validator;
    REQUIRE(validator.is_too_short(""));
    REQUIRE(validator.is_too_short(" a "));
    REQUIRE_FALSE(validator.is_too_short(" ok "));

    REQUIRE(validator.is_short_phrase("yes please"));
    REQUIRE(validator.is_short_phrase("Sure, go ahead."));
    REQUIRE_FALSE(validator.is_short_phrase("I need a refund now"));
}

TEST_CASE("phrase classes match whole words") {
    TranscriptValidator validator;

    SECTION("interruptions") {
        REQUIRE(validator.is_interruption_phrase("Oh wait, hold on."));
        REQUIRE(validator.is_interruption_phrase("Sorry?"));
        REQUIRE_FALSE(validator.is_interruption_phrase("I need a refund for my order"));
        REQUIRE_FALSE(validator.is_interruption_phrase("The waiter was rude"));
        REQUIRE(validator.is_interruption_phrase("Actually, the address changed"));
        REQUIRE_FALSE(validator.is_interruption_phrase("I want to know what happened"));
        REQUIRE_FALSE(validator.is_interruption_phrase("I'm sorry but it arrived broken"));
    }

    SECTION("greetings and politeness") {
        REQUIRE(validator.is_greeting_phrase("Hello, thank you for calling Acme."));
        REQUIRE_FALSE(validator.is_greeting_phrase("Shipping takes three days"));
        REQUIRE(validator.is_polite_phrase("Thank you for your time."));
        REQUIRE_FALSE(validator.is_polite_phrase("Thank you."));
    }

    SECTION("introductions") {
        REQUIRE(validator.is_introduction("Hi, my name is Sarah and I'm calling about an order."));
        REQUIRE_FALSE(validator.is_introduction("Let me look that up."));
    }

    SECTION("voicemail prompts") {
        REQUIRE(validator.is_non_conversational("Please leave a message after the tone."));
        REQUIRE(validator.is_non_conversational("The person you are calling is unavailable"));
        REQUIRE_FALSE(validator.is_non_conversational("How can I help you today?"));
    }
}

TEST_CASE("closing phrases count only near the end of long text") {
    TranscriptValidator validator;
    REQUIRE(validator.is_closing_phrase("Thank you, goodbye!"));
    REQUIRE(validator.is_closing_phrase("Okay. Have a great day."));
    REQUIRE(validator.is_closing_phrase("Thank you so much, bye"));
    REQUIRE_FALSE(validator.is_closing_phrase("Can you check my order?"));

    const std::string early_farewell =
        "Goodbye is not what I want to hear yet, because I still need to know when the "
        "replacement part for my order will actually ship to me.";
    REQUIRE_FALSE(validator.is_closing_phrase(early_farewell));
    REQUIRE(validator.is_closing_phrase(early_farewell + " Anyway, thanks, goodbye."));
}

TEST_CASE("contains_question detects marks and question words") {
    TranscriptValidator validator;
    REQUIRE(validator.contains_question("It shipped?"));
    REQUIRE(validator.contains_question("Can you check the status"));
    REQUIRE(validator.contains_question("When will it arrive"));
    REQUIRE_FALSE(validator.contains_question("I need a refund"));
    REQUIRE_FALSE(validator.contains_question("   "));
}

TEST_CASE("is_duplicate compares similarity and leading words") {
    TranscriptValidator validator;
    REQUIRE(validator.is_duplicate("Hi, my name is Sarah.", "hi my name is sarah"));
    REQUIRE_FALSE(validator.is_duplicate("Where is my package", "I need a refund"));
    REQUIRE_FALSE(validator.is_duplicate("", "I need a refund"));

    SECTION("identical openings with different endings") {
        const std::string opening = "hello my name is sarah and i am calling about order ";
        REQUIRE(validator.is_duplicate(
            opening + "one two three four five six seven eight nine ten eleven twelve",
            opening + "alpha beta gamma delta epsilon zeta eta theta iota kappa lambda mu"));
    }
}

TEST_CASE("cross_check flags replies that answer a misheard request") {
    TranscriptValidator validator;
    REQUIRE(validator.cross_check("I'd like a phone refund", "I'll process a full refund") ==
            std::string("full refund"));
    REQUIRE(validator.cross_check("I want a phone response", "A refund is on the way") ==
            std::string("refund"));
    REQUIRE_FALSE(validator.cross_check("I want a full refund", "A full refund it is")
                      .has_value());
    REQUIRE_FALSE(validator.cross_check("", "A full refund").has_value());
}

TEST_CASE("resolved pairs expire after the ttl") {
    TranscriptValidator validator;
    const auto start = call_bridge::turn::Clock::time_point{} + std::chrono::hours(1);

    const auto& first = validator.resolve("I want a phone refund", "Full refund issued", start);
    REQUIRE(first.suggested_correction == std::string("full refund"));
    validator.resolve("Where is my order", "It ships tomorrow", start + std::chrono::seconds(10));

    REQUIRE(validator.recent_pairs(start + std::chrono::seconds(20)).size() == 2);

    const auto remaining = validator.recent_pairs(start + std::chrono::seconds(35));
    REQUIRE(remaining.size() == 1);
    REQUIRE(remaining.front().user_transcript == "Where is my order");
    REQUIRE_FALSE(remaining.front().suggested_correction.has_value());
}
