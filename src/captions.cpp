#include "storyline/captions.hpp"

#include "storyline/alignment.hpp"
#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <climits>

namespace storyline {

// ─── Caption Types ──────────────────────────────────────────────────────────

int CueText::length() const {
    int len = 0;
    for (const auto &w : words)
        len += static_cast<int>(w.text.size());
    return len;
}

std::string CueText::text() const {
    std::string out;
    for (const auto &w : words)
        out += w.text;
    return trim(out);
}

int CaptionCue::time_start() const {
    int start = INT_MAX;
    for (const auto &line : lines) {
        if (!line.words.empty())
            start = std::min(start, line.time_start());
    }
    return start == INT_MAX ? 0 : start;
}

int CaptionCue::time_end() const {
    int end = INT_MIN;
    for (const auto &line : lines) {
        if (!line.words.empty())
            end = std::max(end, line.time_end());
    }
    return end == INT_MIN ? 0 : end;
}

int CaptionCue::transcript_start() const {
    if (lines.empty() || lines.front().words.empty())
        return 0;
    return lines.front().words.front().original_start;
}

int CaptionCue::transcript_end() const {
    if (lines.empty() || lines.back().words.empty())
        return 0;
    return lines.back().words.back().original_end;
}

// ─── Pass 1: Cue Generation ─────────────────────────────────────────────────

SpeakerOrder
determine_speaker_order(const std::vector<AlignedParagraph> &paragraphs,
                        double speaker1_to_speaker2_char_ratio) {
    int char_count[2] = {0, 0};
    for (size_t i = 0; i < paragraphs.size(); ++i)
        char_count[i % 2] += paragraphs[i].length();

    // Integer division before widening.
    double ratio = (char_count[1] == 0)
                       ? 0.0
                       : static_cast<double>(char_count[0] / char_count[1]);

    if (ratio < speaker1_to_speaker2_char_ratio)
        return {"S1", "S2"};
    return {"S2", "S1"};
}

namespace {

bool is_no_narration(const AlignedParagraph &para) {
    return para.words.size() == 1 &&
           para.words[0].word_case == WordCase::NoNarration;
}

int span_duration(const std::vector<TimedText> &words, size_t from) {
    if (from >= words.size())
        return 0;
    return words.back().time_end - words[from].time_start;
}

void split_paragraph(const AlignedParagraph &para, const std::string &speaker,
                     const CaptionConfig &config,
                     std::vector<CueText> &lines) {
    const auto &words = para.words;
    size_t next = 0;
    CueText line{speaker, {}};

    while (next < words.size()) {
        line.words.push_back(words[next++]);

        bool done = next == words.size();
        if (line.length() >= config.target_length ||
            line.duration() >= config.target_duration || done) {
            // Fold a short tail into this line rather than leave it alone.
            int tail = span_duration(words, next);
            if (!done && tail < config.min_cue_duration &&
                tail + line.duration() < config.max_cue_duration) {
                line.words.insert(line.words.end(),
                                  words.begin() + static_cast<long>(next),
                                  words.end());
                next = words.size();
            }
            lines.push_back(std::move(line));
            line = CueText{speaker, {}};
        }
    }
}

} // namespace

std::vector<CaptionCue> generate_cues(const FormattedAlignment &alignment,
                                      const SpeakerOrder &speakers,
                                      const CaptionConfig &config) {
    std::vector<CueText> lines;
    const auto &paragraphs = alignment.paragraphs;

    for (size_t i = 0; i < paragraphs.size(); ++i) {
        const auto &para = paragraphs[i];
        const auto &speaker = speakers[i % 2];

        if (is_no_narration(para)) {
            lines.push_back(CueText{"", para.words});
        } else if (para.words.empty()) {
            log_info("Captioner: paragraph[" + std::to_string(i) +
                     "] has no words, skipped");
        } else if (para.duration() > config.max_cue_duration ||
                   para.length() > config.max_cue_length) {
            split_paragraph(para, speaker, config, lines);
        } else {
            lines.push_back(CueText{speaker, para.words});
        }
    }

    std::vector<CaptionCue> cues;
    cues.reserve(lines.size());
    for (auto &line : lines) {
        CaptionCue cue;
        cue.lines.push_back(std::move(line));
        cues.push_back(std::move(cue));
    }
    return cues;
}

// ─── Pass 2: Coalescing ─────────────────────────────────────────────────────

void combine_cues(CaptionCue &target, const CaptionCue &source) {
    for (const auto &line : source.lines)
        target.lines.push_back(line);

    // One left-to-right sweep; a merged line is not compared again.
    auto &lines = target.lines;
    for (size_t i = 0; i + 1 < lines.size(); ++i) {
        if (lines[i].speaker == lines[i + 1].speaker) {
            auto &words = lines[i].words;
            const auto &more = lines[i + 1].words;
            words.insert(words.end(), more.begin(), more.end());
            lines.erase(lines.begin() + static_cast<long>(i) + 1);
        }
    }
}

void coalesce_cues(std::vector<CaptionCue> &cues, const CaptionConfig &config) {
    for (size_t i = 0; i < cues.size(); ++i) {
        int duration = cues[i].duration();
        if (duration >= config.min_cue_duration)
            continue;

        auto eligible = [&](const CaptionCue &neighbor) {
            return neighbor.duration() + duration < config.max_cue_duration &&
                   neighbor.line_count() < config.max_cue_line_count;
        };
        bool prev = i > 0 && eligible(cues[i - 1]);
        bool next = i + 1 < cues.size() && eligible(cues[i + 1]);

        if (prev && next) {
            if (cues[i - 1].duration() <= cues[i + 1].duration())
                next = false;
            else
                prev = false;
        }

        if (prev) {
            log_info("CoalescingPass: cue[" + std::to_string(i) +
                     "] combining with prev cue.");
            combine_cues(cues[i - 1], cues[i]);
            cues.erase(cues.begin() + static_cast<long>(i));
            --i;
        } else if (next) {
            log_info("CoalescingPass: cue[" + std::to_string(i) +
                     "] combining with next cue.");
            combine_cues(cues[i], cues[i + 1]);
            cues.erase(cues.begin() + static_cast<long>(i) + 1);
        } else {
            log_warning("CoalescingPass: cue[" + std::to_string(i) +
                        "] too short but no suitable neighbors for combining.");
        }
    }
}

// ─── Pass 3: Validation ─────────────────────────────────────────────────────

ValidationReport validate_cues(const std::vector<CaptionCue> &cues,
                               const CaptionConfig &config) {
    ValidationReport report;
    log_info("Validating " + std::to_string(cues.size()) + " cues...");

    for (size_t i = 0; i < cues.size(); ++i) {
        const auto &cue = cues[i];
        std::string tag = "cue[" + std::to_string(i) + "]: ";

        if (cue.duration() < config.min_cue_duration) {
            report.too_short++;
            log_warning(tag + "duration " + std::to_string(cue.duration()) +
                        "ms less than allowed minimum " +
                        std::to_string(config.min_cue_duration) + "ms.");
        }
        if (cue.duration() > config.max_cue_duration) {
            report.too_long++;
            log_warning(tag + "duration " + std::to_string(cue.duration()) +
                        "ms greater than allowed maximum " +
                        std::to_string(config.max_cue_duration) + "ms.");
        }
        if (cue.line_count() < 1) {
            report.too_few_lines++;
            log_warning(tag + "has no lines.");
        }
        if (cue.line_count() > config.max_cue_line_count) {
            report.too_many_lines++;
            log_warning(tag + std::to_string(cue.line_count()) +
                        " lines exceeds allowed maximum " +
                        std::to_string(config.max_cue_line_count) + ".");
        }
        for (size_t j = 0; j < cue.lines.size(); ++j) {
            const auto &line = cue.lines[j];
            std::string line_tag = tag + "line[" + std::to_string(j) + "] ";
            if (line.text().empty()) {
                report.empty_text++;
                log_warning(line_tag + "has no text.");
            }
            if (line.length() > config.max_cue_length) {
                report.line_too_long++;
                log_warning(line_tag + "length " +
                            std::to_string(line.length()) +
                            " exceeds allowed maximum " +
                            std::to_string(config.max_cue_length) + ".");
            }
        }
    }

    log_info("Validation complete: " + std::to_string(report.total()) +
             " issues (" + std::to_string(report.too_short) + " short, " +
             std::to_string(report.too_long) + " long, " +
             std::to_string(report.too_few_lines + report.too_many_lines) +
             " line count, " + std::to_string(report.empty_text) +
             " empty, " + std::to_string(report.line_too_long) +
             " line length)");
    return report;
}

// ─── Entry Points ───────────────────────────────────────────────────────────

TextCaptions caption_paragraphs(const FormattedAlignment &alignment,
                                const CaptionConfig &config) {
    TextCaptions captions;
    captions.speakers = determine_speaker_order(
        alignment.paragraphs, config.speaker1_to_speaker2_char_ratio);

    log_info("Captioner: Initial Pass ...");
    captions.cues = generate_cues(alignment, captions.speakers, config);

    log_info("Captioner: Combining Pass ...");
    coalesce_cues(captions.cues, config);

    log_info("Captioner: Validation Pass ...");
    captions.report = validate_cues(captions.cues, config);
    return captions;
}

Result<TextCaptions> caption_text(const AlignmentInput &input, int duration_ms,
                                  const CaptionConfig &config) {
    auto formatted = format_alignment(input, duration_ms, config.alignment);
    if (!formatted)
        return Result<TextCaptions>::failure_from(formatted);
    return Result<TextCaptions>::success(
        caption_paragraphs(formatted.value, config));
}

} // namespace storyline
