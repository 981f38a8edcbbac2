#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "storyline/config.hpp"
#include "storyline/named_entity.hpp"
#include "storyline/reference_data.hpp"

namespace storyline {

// ─── Domestic Location Resolver ─────────────────────────────────────────────

struct LocationResult {
    std::vector<LocationEntity> resolved;   // one per place, first-seen order
    std::vector<LocationEntity> unresolved; // country/state/place zeroed
};

// Resolves Loc candidates of one story to USGS state and place IDs.
// Holds only immutable tables; resolve() may run on several threads.
class LocationResolver {
  public:
    explicit LocationResolver(std::shared_ptr<const LocationTables> tables,
                              const ResolverConfig &config = ResolverConfig{});

    LocationResult resolve(const std::vector<NamedEntity> &candidates) const;

    // Per-candidate passes without the aggregation step.
    std::vector<LocationEntity>
    resolve_mentions(const std::vector<NamedEntity> &candidates) const;

    const LocationTables &tables() const { return *tables_; }

  private:
    std::shared_ptr<const LocationTables> tables_;
    ResolverConfig config_;

    void resolve_candidate(std::vector<LocationEntity> &candidates,
                           size_t index) const;
    int usgs_id_of_state(int state_id) const;
};

// ─── Name Heuristics ────────────────────────────────────────────────────────

struct PlaceAndState {
    std::string place; // normalized place name, may be empty
    int state_id = 0;  // 0 if no state recognized
};

// "Place, State" or "Place [State]", state matched inexactly.
PlaceAndState parse_place_and_state(std::string_view text,
                                    const StateTable &states);

// Drop "sic" markers and annotation prefixes ahead of a place name.
std::string trim_place_name(std::string_view candidate);

// Spell a place name the way the USGS gazetteer does.
std::string proper_usgs_place_name(std::string_view candidate);

// Street, river and lake mentions that name no single place.
bool is_general_location(std::string_view text, std::string_view context);

// DC or WA from contextual clues, 0 when the context does not say.
int washington_dc_or_state(std::string_view context);

} // namespace storyline
