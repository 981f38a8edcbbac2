#pragma once

#include <string>

namespace storyline {

// ─── Named Entity ───────────────────────────────────────────────────────────

enum class EntityType {
    Unset,
    Person,
    Loc,
    Org,
    Year,
    YearPerhaps,       // needs 4-digit evidence to become a Year
    SomethingToIgnore, // money, percentages, quantities, ordinals
    SomethingElse,
};

// Evidence strength; resolvers may push the stored value past Better.
enum class Confidence : int {
    None = 0,
    Some = 1,
    Good = 2,
    Better = 3,
};

const char *entity_type_name(EntityType type);

struct NamedEntity {
    std::string text;
    std::string contextual_text; // mention plus transcriber annotation
    int start_offset = 0;        // into the transcript
    int length = 0;
    EntityType type = EntityType::Unset;
    std::string source_type; // label from the tool that produced it
    bool dual_coverage = false;
    int confidence = static_cast<int>(Confidence::None);

    bool has_context() const {
        return !contextual_text.empty() && contextual_text != text;
    }

    bool operator==(const NamedEntity &) const = default;
};

// ─── Resolved Entities ──────────────────────────────────────────────────────

constexpr int US_COUNTRY_CODE = 840;

struct LocationEntity {
    NamedEntity entity;
    int country_code = US_COUNTRY_CODE;
    int state_code = 0; // USGS state ID, 0 when unresolved
    int place_id = 0;   // USGS place ID, 0 when unresolved
    int count = 1;

    bool resolved() const { return state_code != 0; }

    bool operator==(const LocationEntity &) const = default;
};

struct OrganizationEntity {
    NamedEntity entity;
    std::string authority_id; // LOC name authority ID, empty when unresolved
    int count = 1;

    bool resolved() const { return !authority_id.empty(); }

    bool operator==(const OrganizationEntity &) const = default;
};

} // namespace storyline
