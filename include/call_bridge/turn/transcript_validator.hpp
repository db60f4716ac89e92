#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "call_bridge/turn/types.hpp"

namespace call_bridge {
namespace turn {

struct ValidatorConfig {
    size_t min_transcript_chars = 2;
    size_t short_phrase_max_words = 3;
    double duplicate_similarity = 0.6;
    size_t duplicate_prefix_words = 10;
    size_t closing_short_text_chars = 50;
    size_t closing_tail_chars = 100;
    std::chrono::seconds pair_ttl{30};
};

struct ResolvedTranscriptPair {
    std::string user_transcript;
    std::string ai_reply;
    Clock::time_point resolved_at;
    std::optional<std::string> suggested_correction;
};

class TranscriptValidator {
public:
    explicit TranscriptValidator(ValidatorConfig cfg = {});

    // Jaccard on word sets weighted 0.7, word count ratio weighted 0.3.
    static double similarity(const std::string& first, const std::string& second);
    static size_t word_count(const std::string& text);

    bool is_too_short(const std::string& text) const;
    bool is_short_phrase(const std::string& text) const;
    bool is_non_conversational(const std::string& text) const;
    bool is_interruption_phrase(const std::string& text) const;
    bool is_greeting_phrase(const std::string& text) const;
    bool is_polite_phrase(const std::string& text) const;
    bool is_introduction(const std::string& text) const;
    bool is_closing_phrase(const std::string& text) const;
    bool contains_question(const std::string& text) const;

    bool is_duplicate(const std::string& utterance, const std::string& previous) const;

    std::optional<std::string> cross_check(const std::string& transcript,
                                           const std::string& reply) const;

    // Records the pair, runs the cross-check and prunes pairs past the TTL.
    const ResolvedTranscriptPair& resolve(const std::string& transcript,
                                          const std::string& reply,
                                          Clock::time_point now);
    std::vector<ResolvedTranscriptPair> recent_pairs(Clock::time_point now);

    const ValidatorConfig& config() const { return cfg_; }

private:
    void prune(Clock::time_point now);

    ValidatorConfig cfg_;
    std::deque<ResolvedTranscriptPair> pairs_;
};

}
}
