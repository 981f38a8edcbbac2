#include "storyline/spacy_merger.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <charconv>

namespace storyline {

EntityType spacy_entity_type(std::string_view label) {
    if (label == "PERSON")
        return EntityType::Person;
    if (label == "LOC" || label == "GPE" || label == "FAC")
        return EntityType::Loc;
    if (label == "ORG" || label == "NORP")
        return EntityType::Org;
    if (label == "EVENT" || label == "DATE" || label == "CARDINAL")
        return EntityType::YearPerhaps;
    if (label == "PRODUCT" || label == "WORK_OF_ART" || label == "LAW" ||
        label == "LANGUAGE" || label == "TIME")
        return EntityType::SomethingElse;
    if (label == "PERCENT" || label == "MONEY" || label == "QUANTITY" ||
        label == "ORDINAL")
        return EntityType::SomethingToIgnore;
    return EntityType::Unset;
}

int find_year(std::string_view text) {
    for (size_t i = 0; i + 4 <= text.size(); ++i) {
        if (text[i] != '1' && text[i] != '2')
            continue;
        int year = 0;
        auto [ptr, ec] = std::from_chars(text.data() + i, text.data() + i + 4, year);
        if (ec == std::errc() && ptr == text.data() + i + 4 && year >= 1500 &&
            year <= 2199)
            return year;
    }
    return 0;
}

namespace {

bool parse_offset(const std::string &s, int &out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool is_resolvable(EntityType type) {
    return type == EntityType::Person || type == EntityType::Loc ||
           type == EntityType::Org;
}

} // namespace

Result<std::vector<NamedEntity>>
merge_spacy(const std::vector<std::string> &lines,
            const std::string &transcript,
            const std::vector<NamedEntity> &stanford) {
    using R = Result<std::vector<NamedEntity>>;

    std::vector<NamedEntity> entries;
    std::vector<bool> covered(stanford.size(), false);
    size_t active = 0;

    auto flush_stanford = [&](size_t k) {
        if (covered[k])
            return;
        NamedEntity e = stanford[k];
        e.source_type.clear();
        e.confidence = static_cast<int>(Confidence::Some);
        entries.push_back(std::move(e));
    };

    // Header row first.
    for (size_t row = 1; row < lines.size(); ++row) {
        const auto &line = lines[row];
        if (trim(line).empty())
            continue;
        auto cols = split(line, ',');
        if (cols.size() != 4 || cols[0].empty()) {
            log_warning("SpacyMerger: skipping row without four fields: " + line);
            continue;
        }

        const auto &text = cols[0];
        const auto &label = cols[3];
        EntityType type = spacy_entity_type(label);
        if (type == EntityType::Unset || type == EntityType::SomethingToIgnore)
            continue;

        int start = 0;
        int end = 0;
        if (!parse_offset(cols[1], start) || !parse_offset(cols[2], end) ||
            start < 0 || end <= start) {
            auto msg = "SpacyMerger: offsets could not be parsed: " + line;
            log_error(msg);
            return R::failure(Status::OffsetMismatch, msg);
        }

        if (static_cast<size_t>(start) > transcript.size() ||
            transcript.compare(start, text.size(), text) != 0) {
            if (contains(text, "\"") || !is_resolvable(type)) {
                log_warning("SpacyMerger: skipping '" + text +
                            "' not found at offset " + std::to_string(start));
                continue;
            }
            auto msg = "SpacyMerger: transcript does not have this text at offset " +
                       std::to_string(start) + ": " + text;
            log_error(msg);
            return R::failure(Status::OffsetMismatch, msg);
        }
        if (contains(text, "\t")) {
            log_warning("SpacyMerger: skipping entry with tab in: '" + text + "'");
            continue;
        }

        NamedEntity spacy;
        spacy.text = text;
        spacy.contextual_text = text;
        spacy.start_offset = start;
        spacy.length = end - start;
        spacy.type = type;
        spacy.source_type = label;
        spacy.confidence = static_cast<int>(Confidence::Some);

        bool keep = true;
        while (active < stanford.size()) {
            const auto &s = stanford[active];
            int s_end = s.start_offset + s.length;
            if (s_end <= start) {
                flush_stanford(active++);
                continue;
            }
            if (s.start_offset >= end)
                break; // spaCy alone

            spacy.contextual_text = s.contextual_text;
            if (s.type != type) {
                spacy.confidence = static_cast<int>(Confidence::Good);
                break;
            }

            // Both taggers agree on the type.
            covered[active] = true;
            keep = false;
            bool use_spacy = true;
            auto confidence = Confidence::Better;
            if (start >= s.start_offset && end <= s_end) {
                use_spacy = true;
            } else if (s.start_offset >= start && s_end <= end) {
                use_spacy = false;
            } else {
                confidence = Confidence::Good;
                bool s_note = contains(s.text, "[");
                bool spacy_note = contains(text, "[");
                if (s_note != spacy_note)
                    use_spacy = s_note;
                else
                    use_spacy = end - start >= s.length;
            }

            NamedEntity merged = use_spacy ? spacy : s;
            merged.contextual_text = s.contextual_text;
            merged.source_type = label;
            merged.dual_coverage = true;
            merged.confidence = static_cast<int>(confidence);
            entries.push_back(std::move(merged));
            break;
        }

        if (!keep)
            continue;
        if (type == EntityType::YearPerhaps) {
            int year = find_year(text);
            if (year == 0)
                continue;
            spacy.text = std::to_string(year);
            spacy.type = EntityType::Year;
        }
        if (type == EntityType::SomethingElse)
            continue;
        entries.push_back(std::move(spacy));
    }

    while (active < stanford.size())
        flush_stanford(active++);

    log_info("SpacyMerger: " + std::to_string(entries.size()) +
             " merged entities.");
    return R::success(std::move(entries));
}

} // namespace storyline
