#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "storyline/named_entity.hpp"
#include "storyline/result.hpp"

namespace storyline {

// ─── spaCy NER Merger ───────────────────────────────────────────────────────

// spaCy label to entity type; unknown labels are Unset.
EntityType spacy_entity_type(std::string_view label);

// First plausible year (1500..2199) written as four digits, or 0.
int find_year(std::string_view text);

// Merges spaCy output ("text,start,end,label" CSV with a header line) into
// the polished Stanford candidates. Agreement between the two taggers
// raises confidence; either tagger alone yields Some.
Result<std::vector<NamedEntity>>
merge_spacy(const std::vector<std::string> &lines,
            const std::string &transcript,
            const std::vector<NamedEntity> &stanford);

} // namespace storyline
