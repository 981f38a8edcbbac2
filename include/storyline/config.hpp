#pragma once

#include <string>

namespace storyline {

// ─── Alignment Config ───────────────────────────────────────────────────────

struct AlignmentConfig {
    // Longer unaligned tails are dropped instead of interpolated.
    int max_unaligned_trailing_words = 5;
};

// ─── Caption Config ─────────────────────────────────────────────────────────

struct CaptionConfig {
    AlignmentConfig alignment;

    // Even/odd paragraph character ratio below which S1 (interviewer) leads.
    double speaker1_to_speaker2_char_ratio = 1.0;

    int max_cue_length = 84; // characters per line
    int target_length = 60;
    int min_cue_duration = 1500; // ms
    int max_cue_duration = 7000; // ms
    double target_duration = 4000.0;
    int max_cue_line_count = 2;
};

// ─── NER Polisher Config ────────────────────────────────────────────────────

struct PolisherConfig {
    bool bracket_hinting = true;       // "[" starts a candidate
    bool hard_paragraph_breaks = true; // "\n\n" ends a candidate
};

// ─── Resolver Config ────────────────────────────────────────────────────────

struct ResolverConfig {
    std::string data_dir = "data";
    std::string places_file = "USGS_Places_Table.txt";
    std::string city_hints_file = "DefaultStatesForSomeLocations.txt";
    std::string corporate_names_file = "CorporateNameLookup.txt";
    std::string corporate_synonyms_file = "AlternateCorporateNames.txt";

    // Max characters between two mentions treated as one split entity.
    int adjacency_epsilon = 4;

    // Mentions per story above which a place / at which an organization
    // earns one more confidence point.
    int frequent_place_count = 3;
    int frequent_organization_count = 2;

    // Dates: how far a spaCy offset may slide, and how much text after a
    // mention is searched for a "[1957]" style qualifier.
    int spacy_offset_slack = 2;
    int date_context_chars = 40;
    // Latest year scored as strongly believable; 0 means the current year.
    int latest_year = 0;
};

// ─── Presets ────────────────────────────────────────────────────────────────

// Two 42-character lines, 1.5 to 7 seconds on screen.
inline CaptionConfig make_broadcast_caption_config() {
    CaptionConfig cfg;
    cfg.max_cue_length = 84;
    cfg.target_length = 60;
    cfg.min_cue_duration = 1500;
    cfg.max_cue_duration = 7000;
    cfg.target_duration = 4000.0;
    cfg.max_cue_line_count = 2;
    return cfg;
}

// Single short lines for narrow displays.
inline CaptionConfig make_compact_caption_config() {
    CaptionConfig cfg;
    cfg.max_cue_length = 42;
    cfg.target_length = 32;
    cfg.min_cue_duration = 1000;
    cfg.max_cue_duration = 4000;
    cfg.target_duration = 2500.0;
    cfg.max_cue_line_count = 1;
    return cfg;
}

} // namespace storyline
