#pragma once

#include <string>
#include <vector>

namespace storyline {

// ─── Raw Alignment Input ────────────────────────────────────────────────────

// One word as reported by the forced aligner.
struct RawWord {
    std::string word;
    bool success = false; // aligner found the word in the audio
    int start_offset = 0; // transcript character offsets [start, end)
    int end_offset = 0;
    double start = 0.0; // seconds
    double end = 0.0;   // seconds
};

struct AlignmentInput {
    std::string transcript;
    std::vector<RawWord> words;
};

// Seconds → milliseconds, rounded to the nearest millisecond.
int seconds_to_ms(double seconds);

// ─── Timed Text ─────────────────────────────────────────────────────────────

enum class WordCase {
    Aligned,
    Unaligned,
    Interpolated,
    NoNarration,
};

const char *word_case_name(WordCase c);

struct TimedText {
    std::string text;
    WordCase word_case = WordCase::Unaligned;

    int offset_start = 0; // paragraph-relative once formatted
    int offset_end = 0;

    // Transcript offsets the span was created with.
    int original_start = 0;
    int original_end = 0;

    int time_start = 0; // ms
    int time_end = 0;   // ms

    int duration() const { return time_end - time_start; }
    int length() const { return offset_end - offset_start; }

    bool operator==(const TimedText &) const = default;
};

// ─── Paragraphs ─────────────────────────────────────────────────────────────

struct AlignedParagraph {
    int original_start = 0; // range in the full transcript
    int original_end = 0;
    std::string text; // cleaned display text
    std::vector<TimedText> words;

    int duration() const {
        if (words.empty())
            return 0;
        return words.back().time_end - words.front().time_start;
    }
    int length() const { return static_cast<int>(text.size()); }

    bool operator==(const AlignedParagraph &) const = default;
};

struct FormattedAlignment {
    static constexpr const char *NO_NARRATION_TEXT = "(no narration)";

    std::string transcript; // truncated if trailing words were dropped
    std::vector<AlignedParagraph> paragraphs;

    bool is_no_narration() const {
        return paragraphs.size() == 1 && paragraphs[0].words.size() == 1 &&
               paragraphs[0].words[0].word_case == WordCase::NoNarration;
    }

    bool operator==(const FormattedAlignment &) const = default;
};

} // namespace storyline
