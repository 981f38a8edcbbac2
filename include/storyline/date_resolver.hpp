#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "storyline/config.hpp"

namespace storyline {

// ─── Date Resolver ──────────────────────────────────────────────────────────

constexpr int DATE_CONFIDENCE_CEILING = 6;

// One distinct date mention of a story: "1957", "1950s" or, for a spaCy
// date without year evidence, the mention text itself.
struct DateReference {
    std::string value;
    int confidence = 1; // 1..DATE_CONFIDENCE_CEILING
    int count = 1;
    bool from_transcript_only = false; // never tagged by spaCy

    bool operator==(const DateReference &) const = default;
};

struct YearEvidence {
    bool found = false;
    bool is_address = false; // "1900 South Michigan"
    std::string value;
    int confidence = 1;
};

// Number leading a street address rather than a year: "1900 South
// Michigan", "1500 Pennsylvania Ave.". Decades, bracketed years and
// "in"/"at"/"from" after the number rule it out.
bool parses_to_address(std::string_view text);

// Year at the front of a spaCy date mention plus its trailing context:
// "1957", "1950s", "'57 [1957]" or a bare "'57" (read as 1957). Years from
// 1900 to latest_year score 4, the rest of 1500..2199 score 3.
YearEvidence find_year_evidence(std::string_view text, int latest_year);

// Next "'xx", "'xxs", "yyyy" or "yyyys" in the transcript at or after
// `from`. On success `next` is where scanning resumes.
bool next_transcript_year(std::string_view transcript, size_t from,
                          int latest_year, YearEvidence &out, size_t &next);

// Distinct date references of a story from spaCy DATE, CARDINAL and EVENT
// rows ("text,start,end,label" CSV with a header line) plus years mined
// directly from the transcript. Repeated references gain one confidence
// point.
std::vector<DateReference>
resolve_dates(const std::vector<std::string> &spacy_lines,
              const std::string &transcript,
              const ResolverConfig &config = ResolverConfig{});

} // namespace storyline
