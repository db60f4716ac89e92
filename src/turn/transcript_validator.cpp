#include "call_bridge/turn/transcript_validator.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/text.hpp"

namespace call_bridge {
namespace turn {

namespace {

using Words = std::vector<std::string>;

const std::vector<std::string> kInterruptionPhrases = {
    "oh wait", "wait", "stop", "hold on", "hang on", "no wait",
    "wait a minute", "hold up", "excuse me", "pardon",
    "can you repeat", "say that again",
};

// Common inside ordinary sentences, so they only count as the first word.
const std::vector<std::string> kLeadingInterruptionWords = {
    "actually", "sorry", "what", "huh",
};

const std::vector<std::string> kGreetingPhrases = {
    "hello", "hi", "good morning", "good afternoon", "good evening",
    "how can i help", "how may i help", "thank you for calling",
    "thanks for calling", "this is", "speaking",
};

const std::vector<std::string> kPolitePhrases = {
    "thank you for your time", "thanks for your time", "thank you for calling",
    "thanks for calling", "i appreciate your time", "appreciate your time",
};

const std::vector<std::string> kClosingPhrases = {
    "thank you goodbye", "thanks goodbye", "goodbye thank you", "thank you bye",
    "thanks bye", "have a great day", "have a good day", "goodbye", "bye", "good bye",
};

const std::vector<std::string> kIntroductionPhrases = {
    "my name is", "i'm calling", "calling because", "need help with", "order number is",
};

const std::vector<std::string> kNonConversationalPhrases = {
    "leave your message", "leave a message", "after the tone", "after the beep",
    "voicemail", "mailbox", "unavailable", "not available", "please call back",
    "call back later",
};

const std::vector<std::string> kQuestionPhrases = {
    "could you", "can you", "would you", "will you", "may i", "should i", "what",
    "when", "where", "why", "how", "who", "which", "is there", "are there", "do you",
    "does", "did",
};

struct Mismatch {
    const char* heard;
    const char* understood;
};

const Mismatch kKnownMismatches[] = {
    {"phone response", "full refund"},
    {"phone refund", "full refund"},
    {"partial refund", "full refund"},
    {"no refund", "full refund"},
};

bool contains_words(const Words& words, const Words& phrase) {
    if (phrase.empty() || phrase.size() > words.size()) {
        return false;
    }
    return std::search(words.begin(), words.end(), phrase.begin(), phrase.end()) != words.end();
}

bool contains_any(const Words& words, const std::vector<std::string>& phrases) {
    return std::any_of(phrases.begin(), phrases.end(), [&](const std::string& phrase) {
        return contains_words(words, utils::split_words(phrase));
    });
}

std::string lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

}

TranscriptValidator::TranscriptValidator(ValidatorConfig cfg)
    : cfg_(cfg) {}

double TranscriptValidator::similarity(const std::string& first, const std::string& second) {
    const auto words_a = utils::split_words(first);
    const auto words_b = utils::split_words(second);
    if (words_a.empty() || words_b.empty()) {
        return 0.0;
    }
    const std::set<std::string> set_a(words_a.begin(), words_a.end());
    const std::set<std::string> set_b(words_b.begin(), words_b.end());

    std::vector<std::string> common;
    std::set_intersection(set_a.begin(), set_a.end(), set_b.begin(), set_b.end(),
                          std::back_inserter(common));
    const size_t union_size = set_a.size() + set_b.size() - common.size();
    const double jaccard = static_cast<double>(common.size()) / static_cast<double>(union_size);

    const auto shorter = std::min(words_a.size(), words_b.size());
    const auto longer = std::max(words_a.size(), words_b.size());
    const double length_ratio = static_cast<double>(shorter) / static_cast<double>(longer);

    return jaccard * 0.7 + length_ratio * 0.3;
}

size_t TranscriptValidator::word_count(const std::string& text) {
    return utils::split_words(text).size();
}

bool TranscriptValidator::is_too_short(const std::string& text) const {
    return utils::trim_copy(text).size() < cfg_.min_transcript_chars;
}

bool TranscriptValidator::is_short_phrase(const std::string& text) const {
    return word_count(text) <= cfg_.short_phrase_max_words;
}

bool TranscriptValidator::is_non_conversational(const std::string& text) const {
    return contains_any(utils::split_words(text), kNonConversationalPhrases);
}

bool TranscriptValidator::is_interruption_phrase(const std::string& text) const {
    const auto words = utils::split_words(text);
    if (!words.empty() && std::find(kLeadingInterruptionWords.begin(),
                                    kLeadingInterruptionWords.end(),
                                    words.front()) != kLeadingInterruptionWords.end()) {
        return true;
    }
    return contains_any(words, kInterruptionPhrases);
}

bool TranscriptValidator::is_greeting_phrase(const std::string& text) const {
    return contains_any(utils::split_words(text), kGreetingPhrases);
}

bool TranscriptValidator::is_polite_phrase(const std::string& text) const {
    return contains_any(utils::split_words(text), kPolitePhrases);
}

bool TranscriptValidator::is_introduction(const std::string& text) const {
    return contains_any(utils::split_words(text), kIntroductionPhrases);
}

bool TranscriptValidator::is_closing_phrase(const std::string& text) const {
    const auto trimmed = utils::trim_copy(text);
    // Long replies only count when the farewell sits at the end.
    const auto portion = trimmed.size() < cfg_.closing_short_text_chars
                             ? trimmed
                             : trimmed.substr(trimmed.size() - std::min(trimmed.size(),
                                                                        cfg_.closing_tail_chars));
    const auto words = utils::split_words(portion);
    if (contains_any(words, kClosingPhrases)) {
        return true;
    }
    return contains_words(words, {"thank", "you"}) &&
           (contains_words(words, {"goodbye"}) || contains_words(words, {"bye"}));
}

bool TranscriptValidator::contains_question(const std::string& text) const {
    if (utils::trim_copy(text).empty()) {
        return false;
    }
    if (text.find('?') != std::string::npos) {
        return true;
    }
    return contains_any(utils::split_words(text), kQuestionPhrases);
}

bool TranscriptValidator::is_duplicate(const std::string& utterance,
                                       const std::string& previous) const {
    if (utils::trim_copy(utterance).empty() || utils::trim_copy(previous).empty()) {
        return false;
    }
    if (similarity(utterance, previous) > cfg_.duplicate_similarity) {
        return true;
    }
    auto words_a = utils::split_words(utterance);
    auto words_b = utils::split_words(previous);
    words_a.resize(std::min(words_a.size(), cfg_.duplicate_prefix_words));
    words_b.resize(std::min(words_b.size(), cfg_.duplicate_prefix_words));
    return words_a == words_b;
}

std::optional<std::string> TranscriptValidator::cross_check(const std::string& transcript,
                                                            const std::string& reply) const {
    if (utils::trim_copy(transcript).empty() || utils::trim_copy(reply).empty()) {
        return std::nullopt;
    }
    const auto heard = lower(transcript);
    const auto answered = lower(reply);

    for (const auto& mismatch : kKnownMismatches) {
        if (contains(heard, mismatch.heard) && contains(answered, mismatch.understood)) {
            return std::string(mismatch.understood);
        }
    }
    if (contains(answered, "refund") && !contains(heard, "refund") &&
        (contains(heard, "response") || contains(heard, "phone"))) {
        return std::string("refund");
    }
    return std::nullopt;
}

const ResolvedTranscriptPair& TranscriptValidator::resolve(const std::string& transcript,
                                                           const std::string& reply,
                                                           Clock::time_point now) {
    prune(now);
    ResolvedTranscriptPair pair;
    pair.user_transcript = transcript;
    pair.ai_reply = reply;
    pair.resolved_at = now;
    pair.suggested_correction = cross_check(transcript, reply);
    if (pair.suggested_correction) {
        logging::warn(
            "Transcript may be inaccurate",
            {kv_text("transcript", transcript),
             kv_text("reply", reply),
             kv("understood", *pair.suggested_correction)});
    }
    pairs_.push_back(std::move(pair));
    return pairs_.back();
}

std::vector<ResolvedTranscriptPair> TranscriptValidator::recent_pairs(Clock::time_point now) {
    prune(now);
    return {pairs_.begin(), pairs_.end()};
}

void TranscriptValidator::prune(Clock::time_point now) {
    while (!pairs_.empty() && now - pairs_.front().resolved_at > cfg_.pair_ttl) {
        pairs_.pop_front();
    }
}

}
}
