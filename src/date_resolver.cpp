#include "storyline/date_resolver.hpp"

#include "storyline/log.hpp"
#include "storyline/spacy_merger.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <unordered_map>

namespace storyline {

namespace {

constexpr int BELIEVABLE_FIRST_YEAR = 1500;
constexpr int BELIEVABLE_LAST_YEAR = 2199;
constexpr int STRONG_FIRST_YEAR = 1900;

bool digit_at(std::string_view s, size_t i) {
    return i < s.size() && s[i] >= '0' && s[i] <= '9';
}

bool digit_or_quote_at(std::string_view s, size_t i) {
    return i < s.size() && (s[i] == '\'' || digit_at(s, i));
}

// 'xx" is a height (5'11"), not a year.
bool digit_or_any_quote_at(std::string_view s, size_t i) {
    return i < s.size() && (s[i] == '"' || digit_or_quote_at(s, i));
}

bool digits_at(std::string_view s, size_t i, size_t n) {
    for (size_t k = 0; k < n; ++k) {
        if (!digit_at(s, i + k))
            return false;
    }
    return true;
}

int number_at(std::string_view s, size_t i, size_t n) {
    int value = 0;
    std::from_chars(s.data() + i, s.data() + i + n, value);
    return value;
}

bool believable(int year) {
    return year >= BELIEVABLE_FIRST_YEAR && year <= BELIEVABLE_LAST_YEAR;
}

int year_confidence(int year, int latest_year) {
    return year >= STRONG_FIRST_YEAR && year <= latest_year ? 4 : 3;
}

// "0s" right at `i`: the decade form of the digits ending there.
bool decade_at(std::string_view s, size_t i) {
    return i + 1 < s.size() && s[i] == '0' && s[i + 1] == 's';
}

bool starts_with_street(std::string_view s) {
    for (const char *street : {"St.", "Street", "Ave.", "Avenue", "Boulevard",
                               "Blvd", "Road", "Lane"}) {
        if (s.starts_with(street))
            return true;
    }
    return false;
}

// Drop the first word; false when no word follows it.
bool next_word(std::string &text) {
    size_t space = text.find(' ');
    if (space == std::string::npos || space == 0 || space + 1 >= text.size())
        return false;
    text = trim(std::string_view(text).substr(space + 1));
    return true;
}

int current_year() {
    using namespace std::chrono;
    year_month_day today{floor<days>(system_clock::now())};
    return static_cast<int>(today.year());
}

} // namespace

// ─── Year Evidence ──────────────────────────────────────────────────────────

bool parses_to_address(std::string_view text) {
    bool give_up = text.size() <= 1;

    if (!give_up) {
        size_t i = 0;
        while (i < text.size() && !digit_or_quote_at(text, i))
            ++i;
        size_t end = i;
        while (end < text.size() && digit_or_quote_at(text, end))
            ++end;

        // A lone number, or a decade like '60s or 1960s.
        if (end >= text.size() ||
            (end > 0 && text[end - 1] == '0' && text[end] == 's'))
            give_up = true;

        if (!give_up) {
            size_t space = text.find(' ', end);
            if (space == std::string_view::npos) {
                give_up = true;
            } else if (end < space) {
                // Punctuation glued to the number ends it: "1959], East".
                for (; end < space && !give_up; ++end) {
                    char c = text[end];
                    give_up = c == ',' || c == ']' || c == '.' || c == ';' ||
                              c == ':' || c == ')' || c == '?';
                }
            } else {
                auto rest = trim(text.substr(space));
                if (rest.starts_with("in ") || rest.starts_with("at ") ||
                    rest.starts_with("from "))
                    give_up = true;
                // "'87 [1987] well Lane Tech"
                else if (rest.starts_with("[") &&
                         ((rest.size() >= 6 && digits_at(rest, 1, 4) &&
                           rest[5] == ']') ||
                          (rest.size() >= 7 && digits_at(rest, 1, 3) &&
                           rest[4] == '0' && rest[5] == 's' && rest[6] == ']')))
                    give_up = true;
            }
        }
    }
    if (give_up)
        return false;

    std::string words(text);
    std::replace(words.begin(), words.end(), '[', ' ');
    std::replace(words.begin(), words.end(), ']', ' ');
    words = replace_all(words, "  ", " ");

    if (!next_word(words))
        return false;
    if (words.starts_with("South ") || words.starts_with("North ") ||
        words.starts_with("East ") || words.starts_with("West "))
        return true;
    // Street word two or three words after the number.
    for (int k = 0; k < 2; ++k) {
        if (!next_word(words))
            return false;
        if (starts_with_street(words))
            return true;
    }
    return false;
}

YearEvidence find_year_evidence(std::string_view text, int latest_year) {
    YearEvidence ev;
    std::string s = trim(text);
    size_t n = s.size();

    ev.is_address = parses_to_address(s);
    if (ev.is_address)
        return ev;

    // yyyy or yyy0s up front.
    if (digits_at(s, 0, 4) && !digit_at(s, 4) && believable(number_at(s, 0, 4))) {
        int year = number_at(s, 0, 4);
        ev.found = true;
        ev.confidence = year_confidence(year, latest_year);
        ev.value = s.substr(0, decade_at(s, 3) ? 5 : 4);
        return ev;
    }

    // 'xx or xx, ideally qualified later on: "'57 [1957]".
    std::string piece;
    size_t from = 0;
    if (n > 0 && s[0] == '\'' && digits_at(s, 1, 2) &&
        !digit_or_any_quote_at(s, 3)) {
        piece = s.substr(1, 2);
        from = 3;
    } else if (digits_at(s, 0, 2) && !digit_at(s, 2)) {
        piece = s.substr(0, 2);
        from = 2;
    }

    if (from > 0) {
        int two_digits = number_at(piece, 0, 2);
        size_t at = s.find(piece, from);
        if (at != std::string::npos && at >= from + 2 && !digit_at(s, at + 2)) {
            if (digits_at(s, at - 2, 2) && !digit_at(s, at - 3)) {
                int year = number_at(s, at - 2, 2) * 100 + two_digits;
                ev.found = true;
                ev.confidence = believable(year) ? 5 : 3;
                ev.value = s.substr(at - 2, decade_at(s, at + 1) ? 5 : 4);
                return ev;
            }
        } else if (from == 3) {
            int year = 1900 + two_digits;
            ev.found = true;
            ev.confidence = 2;
            ev.value = std::to_string(year);
            if (from < n && s[from] == 's')
                ev.value += 's';
            return ev;
        }
    }

    // Any believable yyyy further in.
    size_t start = from;
    while (start + 4 < n) {
        size_t at = s.find_first_of("12", start);
        if (at == std::string::npos || at + 4 > n)
            break;
        if (digits_at(s, at, 4) && !digit_at(s, at + 4) &&
            believable(number_at(s, at, 4))) {
            int year = number_at(s, at, 4);
            ev.found = true;
            ev.confidence = year_confidence(year, latest_year);
            ev.value = s.substr(at, at + 4 < n && s[at + 4] == 's' ? 5 : 4);
            break;
        }
        start = at + 1;
    }
    return ev;
}

bool next_transcript_year(std::string_view transcript, size_t from,
                          int latest_year, YearEvidence &out, size_t &next) {
    const auto &s = transcript;
    size_t n = s.size();
    out = YearEvidence{};

    size_t start = from;
    while (start + 3 <= n) {
        size_t at = s.find_first_of("'12", start);
        if (at == std::string_view::npos || at + 3 > n)
            break;

        if (s[at] == '\'') {
            if (digits_at(s, at + 1, 2) && !digit_or_any_quote_at(s, at + 3)) {
                auto piece = s.substr(at + 1, 2);
                int two_digits = number_at(piece, 0, 2);
                next = at + 3;

                // Qualified later in the text: "'57, you know, 1957".
                size_t again = s.find(piece, at + 3);
                if (again != std::string_view::npos && !digit_at(s, again + 2) &&
                    digits_at(s, again - 2, 2) && !digit_at(s, again - 3)) {
                    int year = number_at(s, again - 2, 2) * 100 + two_digits;
                    out.found = true;
                    out.confidence = believable(year) ? 4 : 3;
                    out.value = std::string(
                        s.substr(again - 2, again + 2 < n && s[again + 2] == 's'
                                                ? 5
                                                : 4));
                    return true;
                }

                out.found = true;
                out.confidence = 2;
                out.value = std::to_string(1900 + two_digits);
                if (at + 3 < n && s[at + 3] == 's')
                    out.value += 's';
                return true;
            }
        } else if (digits_at(s, at, 4) && !digit_at(s, at + 4) &&
                   believable(number_at(s, at, 4))) {
            if (!parses_to_address(s.substr(at))) {
                int year = number_at(s, at, 4);
                out.found = true;
                out.confidence = year_confidence(year, latest_year);
                next = at + 4;
                if (at + 4 < n && s[at + 4] == 's') {
                    out.value = std::string(s.substr(at, 5));
                    ++next;
                } else {
                    out.value = std::string(s.substr(at, 4));
                }
                return true;
            }
            // Skip the street number and the first character after it.
            at += 5;
        }
        start = at + 1;
    }
    return false;
}

// ─── Resolution ─────────────────────────────────────────────────────────────

std::vector<DateReference> resolve_dates(const std::vector<std::string> &spacy_lines,
                                         const std::string &transcript,
                                         const ResolverConfig &config) {
    int latest_year = config.latest_year > 0 ? config.latest_year : current_year();
    const int slack = config.spacy_offset_slack;

    std::vector<DateReference> refs;
    std::unordered_map<std::string, size_t> index;
    auto record = [&](const std::string &value, int confidence,
                      bool transcript_only) {
        auto [it, inserted] = index.emplace(value, refs.size());
        if (inserted) {
            refs.push_back(DateReference{value, confidence, 1, transcript_only});
            return;
        }
        auto &ref = refs[it->second];
        ref.count++;
        ref.confidence = std::max(ref.confidence, confidence);
    };

    // Header row first.
    for (size_t row = 1; row < spacy_lines.size(); ++row) {
        const auto &line = spacy_lines[row];
        if (trim(line).empty())
            continue;
        auto cols = split(line, ',');
        if (cols.size() != 4 || cols[0].empty()) {
            log_warning("Skipping malformed input line: " + line);
            continue;
        }
        const auto &target = cols[0];
        if (contains(target, "\"")) {
            log_warning("Skipping entry with double quote issue: " + target);
            continue;
        }
        if (contains(target, "\t")) {
            log_warning("Skipping entry with tab: " + target);
            continue;
        }
        if (spacy_entity_type(cols[3]) != EntityType::YearPerhaps)
            continue;

        int start = 0;
        int end = 0;
        auto parse = [](const std::string &s, int &out) {
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc() && ptr == s.data() + s.size();
        };
        if (!parse(cols[1], start) || !parse(cols[2], end) || end <= start ||
            start < 0) {
            log_warning("Skipping malformed input line: " + line);
            continue;
        }

        size_t found = transcript.find(target, static_cast<size_t>(start));
        if (found != static_cast<size_t>(start)) {
            found = transcript.find(target,
                                    static_cast<size_t>(std::max(0, start - slack)));
            int shift = found == std::string::npos
                            ? slack + 1
                            : static_cast<int>(found) - start;
            if (shift == 0 || std::abs(shift) > slack) {
                log_warning("Transcript did not have spaCy text at offset " +
                            std::to_string(start) + ": " + target);
                continue;
            }
            log_warning("Resetting entry of '" + target + "' to offset " +
                        std::to_string(found) + " rather than " +
                        std::to_string(start) + ".");
            start += shift;
            end += shift;
        }

        // Context: one character back (for '57) through a short look ahead,
        // cut at the first line break.
        size_t from = found > 0 ? found - 1 : 0;
        size_t to = std::min(static_cast<size_t>(end + config.date_context_chars),
                             transcript.size() - 1);
        std::string context = transcript.substr(from, to - from + 1);
        size_t newline = context.find('\n');
        if (newline == 0) {
            context.erase(0, 1);
            newline = context.find('\n');
        }
        if (newline == 0)
            context.clear();
        else if (newline != std::string::npos)
            context.resize(newline);

        auto ev = find_year_evidence(context, latest_year);
        if (ev.is_address)
            continue;
        std::string value = ev.found ? ev.value : trim(target);
        int confidence = ev.found ? ev.confidence : 1;
        // spaCy tagged it as a date.
        confidence = std::min(confidence + 1, DATE_CONFIDENCE_CEILING);
        record(value, confidence, false);
    }

    size_t from = 0;
    YearEvidence ev;
    size_t next = 0;
    while (from < transcript.size() &&
           next_transcript_year(transcript, from, latest_year, ev, next)) {
        from = next;
        record(ev.value, ev.confidence, true);
    }

    for (auto &ref : refs) {
        if (ref.count > 1)
            ref.confidence = std::min(ref.confidence + 1, DATE_CONFIDENCE_CEILING);
    }

    log_info("DateResolver: " + std::to_string(refs.size()) +
             " date references.");
    return refs;
}

} // namespace storyline
