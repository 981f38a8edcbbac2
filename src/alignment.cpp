#include "storyline/alignment.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace storyline {

int seconds_to_ms(double seconds) {
    return static_cast<int>(std::lround(seconds * 1000.0));
}

const char *word_case_name(WordCase c) {
    switch (c) {
    case WordCase::Aligned:
        return "aligned";
    case WordCase::Unaligned:
        return "unaligned";
    case WordCase::Interpolated:
        return "interpolated";
    case WordCase::NoNarration:
        return "no-narration";
    }
    return "unknown";
}

namespace {

FormattedAlignment make_no_narration(int duration_ms) {
    FormattedAlignment out;
    out.transcript = FormattedAlignment::NO_NARRATION_TEXT;
    int len = static_cast<int>(out.transcript.size());

    TimedText word;
    word.text = out.transcript;
    word.word_case = WordCase::NoNarration;
    word.offset_start = word.original_start = 0;
    word.offset_end = word.original_end = len;
    word.time_start = 0;
    word.time_end = duration_ms;

    AlignedParagraph para;
    para.original_start = 0;
    para.original_end = len;
    para.text = out.transcript;
    para.words.push_back(word);
    out.paragraphs.push_back(std::move(para));
    return out;
}

std::vector<AlignedParagraph>
split_paragraphs(const std::string &transcript,
                 const std::vector<TimedText> &words) {
    std::vector<AlignedParagraph> paragraphs;
    int start = 0;
    size_t w = 0;
    for (auto &text : split(transcript, "\n\n")) {
        AlignedParagraph para;
        para.original_start = start;
        para.original_end = start + static_cast<int>(text.size());
        para.text = std::move(text);

        // Words arrive in transcript order; one pointer walks them all.
        while (w < words.size() &&
               words[w].offset_end <= para.original_end) {
            if (words[w].offset_start >= para.original_start)
                para.words.push_back(words[w]);
            ++w;
        }

        start = para.original_end + 2;
        paragraphs.push_back(std::move(para));
    }
    return paragraphs;
}

// Point each word at its first unconsumed match in the cleaned text.
bool relocate_words(AlignedParagraph &para, std::string &error) {
    size_t prior_end = 0;
    for (auto &word : para.words) {
        size_t pos = para.text.find(word.text, prior_end);
        if (pos == std::string::npos) {
            error = "No match found for '" + word.text + "' in paragraph text";
            return false;
        }
        word.offset_start = static_cast<int>(pos);
        word.offset_end = static_cast<int>(pos + word.text.size());
        prior_end = pos + word.text.size();
    }
    return true;
}

void expand_word_boundaries(AlignedParagraph &para) {
    auto &words = para.words;
    const auto &text = para.text;

    // Leading quotes belong to the word they open.
    for (auto &word : words) {
        if (word.offset_start > 0 && text[word.offset_start - 1] == '"')
            --word.offset_start;
    }

    // Hyphenated compounds become one word.
    size_t i = 0;
    while (i + 1 < words.size()) {
        auto &cur = words[i];
        const auto &next = words[i + 1];
        if (next.offset_start - cur.offset_end == 1 &&
            text[cur.offset_end] == '-') {
            cur.offset_end = next.offset_end;
            cur.time_end = std::max(cur.time_end, next.time_end);
            words.erase(words.begin() + static_cast<long>(i) + 1);
        } else {
            ++i;
        }
    }

    // Contiguous spans: whitespace and punctuation trail the word before.
    int len = para.length();
    for (size_t k = 0; k < words.size(); ++k) {
        if (k == 0)
            words[k].offset_start = 0;
        words[k].offset_end =
            (k + 1 < words.size()) ? words[k + 1].offset_start : len;
        words[k].text = text.substr(words[k].offset_start,
                                    words[k].offset_end -
                                        words[k].offset_start);
    }
}

} // namespace

std::vector<TimedText> to_timed_words(const std::vector<RawWord> &words) {
    std::vector<TimedText> out;
    out.reserve(words.size());
    for (const auto &w : words) {
        TimedText t;
        t.text = w.word;
        t.word_case = w.success ? WordCase::Aligned : WordCase::Unaligned;
        t.offset_start = t.original_start = w.start_offset;
        t.offset_end = t.original_end = w.end_offset;
        t.time_start = seconds_to_ms(w.start);
        t.time_end = seconds_to_ms(w.end);
        out.push_back(std::move(t));
    }
    return out;
}

void interpolate_range(const std::vector<TimedText *> &words, int start_ms,
                       int end_ms, WordCase word_case) {
    if (words.empty())
        return;
    int word_duration = (end_ms - start_ms) / static_cast<int>(words.size());
    int t = start_ms;
    for (auto *w : words) {
        w->time_start = t;
        t += word_duration;
        w->time_end = t;
        w->word_case = word_case;
    }
}

void repair_alignment_bugs(std::vector<TimedText> &words, int duration_ms) {
    std::vector<TimedText *> aligned;
    for (auto &w : words) {
        if (w.word_case == WordCase::Aligned)
            aligned.push_back(&w);
    }
    size_t n = aligned.size();

    if (n > 1) {
        // Monotonicity: positions out of time order take the sorted times.
        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return aligned[a]->time_start < aligned[b]->time_start;
        });
        std::vector<std::pair<int, int>> sorted_times;
        sorted_times.reserve(n);
        for (size_t k : order)
            sorted_times.emplace_back(aligned[k]->time_start,
                                      aligned[k]->time_end);
        for (size_t k = 0; k < n; ++k) {
            if (order[k] != k) {
                aligned[k]->time_start = sorted_times[k].first;
                aligned[k]->time_end = sorted_times[k].second;
            }
        }

        // Overlap: every adjacent pair but the last.
        for (size_t k = 0; k + 2 < n; ++k) {
            if (aligned[k]->time_end > aligned[k + 1]->time_start)
                std::swap(aligned[k]->time_end, aligned[k + 1]->time_start);
        }
        // A swapped-in start never passes the word's own end.
        for (auto *w : aligned)
            w->time_start = std::min(w->time_start, w->time_end);
    }

    if (n > 0) {
        size_t last_good = 0;
        for (size_t k = n; k-- > 0;) {
            if (aligned[k]->time_start <= duration_ms &&
                aligned[k]->time_end <= duration_ms) {
                last_good = k;
                break;
            }
        }
        if (last_good != n - 1) {
            log_warning("Re-interpolating " + std::to_string(n - last_good) +
                        " aligned words past the clip end");
            std::vector<TimedText *> tail(aligned.begin() +
                                              static_cast<long>(last_good),
                                          aligned.end());
            int start = std::min(aligned[last_good]->time_start, duration_ms);
            interpolate_range(tail, start, duration_ms, WordCase::Aligned);
        }
    }
}

void interpolate_unaligned_words(std::vector<TimedText> &words,
                                 std::string &transcript, int duration_ms,
                                 int max_trailing) {
    int start_time = 0; // end of the last aligned word seen
    bool in_run = false;
    size_t run_start = 0;

    auto run_pointers = [&](size_t first, size_t last) {
        std::vector<TimedText *> run;
        for (size_t k = first; k < last; ++k)
            run.push_back(&words[k]);
        return run;
    };

    for (size_t i = 0; i < words.size(); ++i) {
        if (words[i].word_case == WordCase::Aligned) {
            if (in_run) {
                interpolate_range(run_pointers(run_start, i), start_time,
                                  words[i].time_start,
                                  WordCase::Interpolated);
                in_run = false;
            }
            start_time = words[i].time_end;
        } else if (!in_run) {
            in_run = true;
            run_start = i;
        }
    }

    if (!in_run)
        return;

    size_t count = words.size() - run_start;
    if (static_cast<int>(count) > max_trailing) {
        log_warning("Truncating " + std::to_string(count) +
                    " unaligned words");
        size_t cut = static_cast<size_t>(
            std::max(0, words[run_start].original_start));
        if (cut < transcript.size())
            transcript.resize(cut);
        words.erase(words.begin() + static_cast<long>(run_start), words.end());
    } else {
        interpolate_range(run_pointers(run_start, words.size()), start_time,
                          duration_ms, WordCase::Interpolated);
    }
}

std::string clean_paragraph_text(std::string_view text) {
    // Bracketed annotations; the matching closer ends the span.
    std::string stripped;
    stripped.reserve(text.size());
    char closer = 0;
    for (char c : text) {
        if (closer) {
            if (c == closer)
                closer = 0;
            continue;
        }
        if (c == '[') {
            closer = ']';
        } else if (c == '(') {
            closer = ')';
        } else {
            stripped += c;
        }
    }

    std::string collapsed;
    collapsed.reserve(stripped.size());
    for (char c : stripped) {
        if (is_space(c)) {
            if (collapsed.empty() || collapsed.back() != ' ')
                collapsed += ' ';
        } else {
            if ((c == '.' || c == '?' || c == ',' || c == ';' || c == '!') &&
                !collapsed.empty() && collapsed.back() == ' ')
                collapsed.pop_back();
            collapsed += c;
        }
    }
    return trim(collapsed);
}

Result<FormattedAlignment> format_alignment(const AlignmentInput &input,
                                            int duration_ms,
                                            const AlignmentConfig &config) {
    using R = Result<FormattedAlignment>;

    if (input.words.empty())
        return R::success(make_no_narration(duration_ms));

    auto words = to_timed_words(input.words);
    repair_alignment_bugs(words, duration_ms);

    FormattedAlignment out;
    out.transcript = input.transcript;
    interpolate_unaligned_words(words, out.transcript, duration_ms,
                                config.max_unaligned_trailing_words);

    out.paragraphs = split_paragraphs(out.transcript, words);
    for (auto &para : out.paragraphs) {
        para.text = clean_paragraph_text(para.text);
        std::string error;
        if (!relocate_words(para, error)) {
            log_error(error);
            return R::failure(Status::OffsetMismatch, error);
        }
        expand_word_boundaries(para);
    }
    return R::success(std::move(out));
}

} // namespace storyline
