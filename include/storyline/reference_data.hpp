#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "storyline/config.hpp"

namespace storyline {

// ─── US States ──────────────────────────────────────────────────────────────

constexpr int DC_STATE_ID = 11;
constexpr int VA_STATE_ID = 51;
constexpr int WA_STATE_ID = 53;
constexpr int WV_STATE_ID = 54;

struct StateInfo {
    int id;      // USGS state numeric code
    int usgs_id; // USGS feature ID of the state itself
    std::string alpha;
    std::vector<std::string> names; // accepted spellings
};

// States ordered by ID; lookups scan in that order.
class StateTable {
  public:
    StateTable() = default;
    explicit StateTable(std::vector<StateInfo> states);

    // State ID for a name, alpha code or variant; 0 if none.
    // The two-letter code must always match exactly. Inexact lookups also
    // accept a variant contained in the name (never the bare "Washington"),
    // and a later state's variant overrides an earlier one.
    int look_up(std::string_view name, bool exact = true) const;

    const StateInfo *find(int id) const;
    bool contains(int id) const { return find(id) != nullptr; }

    // Two-letter code, or "unknown".
    std::string alpha(int id) const;

    const std::vector<StateInfo> &states() const { return states_; }

  private:
    std::vector<StateInfo> states_;
};

// The 50 states plus the District of Columbia.
StateTable default_us_states();

// ─── Gazetteer ──────────────────────────────────────────────────────────────

struct CityHint {
    int state_id;
    int place_id;
};

using PlaceIndex = std::unordered_map<std::string, int>; // name → place ID

struct LocationTables {
    StateTable states;
    std::unordered_map<int, PlaceIndex> places; // keyed by state ID
    std::unordered_map<std::string, CityHint> city_hints;

    // Place ID of name within the state; 0 if unknown.
    int find_place(int state_id, const std::string &name) const;
};

// ─── Corporate Names ────────────────────────────────────────────────────────

struct OrganizationTables {
    std::unordered_map<std::string, std::string> authorities; // name → ID
    std::unordered_map<std::string, std::string> synonyms;    // synonym → ID
};

// ─── Loaders ────────────────────────────────────────────────────────────────
//
// Tab-separated, one header line. Bad or repeated rows are logged and
// skipped; a missing or empty file throws std::runtime_error.

// place ID, name, state ID (state must exist in the table)
std::unordered_map<int, PlaceIndex> load_places(const std::string &path,
                                                const StateTable &states);

// name, state alpha, state ID, place ID
std::unordered_map<std::string, CityHint>
load_city_hints(const std::string &path);

// name, authority ID
std::unordered_map<std::string, std::string>
load_corporate_names(const std::string &path);

// synonym, canonical name, authority ID
std::unordered_map<std::string, std::string>
load_corporate_synonyms(const std::string &path);

LocationTables load_location_tables(const ResolverConfig &config);
OrganizationTables load_organization_tables(const ResolverConfig &config);

} // namespace storyline
