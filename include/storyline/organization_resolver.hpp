#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "storyline/config.hpp"
#include "storyline/named_entity.hpp"
#include "storyline/reference_data.hpp"

namespace storyline {

// ─── Organization Resolver ──────────────────────────────────────────────────

struct OrganizationResult {
    std::vector<OrganizationEntity> resolved;   // one per authority ID
    std::vector<OrganizationEntity> unresolved; // authority ID empty

    // Same text resolved to two different IDs; the story produced nothing.
    bool conflict = false;
};

// Resolves Org candidates of one story to Library of Congress name
// authority IDs. Holds only immutable tables.
class OrganizationResolver {
  public:
    explicit OrganizationResolver(
        std::shared_ptr<const OrganizationTables> tables,
        const ResolverConfig &config = ResolverConfig{});

    OrganizationResult resolve(const std::vector<NamedEntity> &candidates) const;

    // Authority ID for one mention, "" if nothing matches.
    std::string parse_organization_name(std::string_view text) const;

    // Exact table lookups plus the corpus spelling conventions.
    std::string look_up_synonym(const std::string &name) const;
    std::string look_up_authority(const std::string &name) const;

    const OrganizationTables &tables() const { return *tables_; }

  private:
    std::shared_ptr<const OrganizationTables> tables_;
    ResolverConfig config_;

    std::string look_up(const std::string &name) const;
    std::string parse_college_mention(std::string_view text,
                                      std::string_view marker) const;
};

// ─── Name Heuristics ────────────────────────────────────────────────────────

// Strip brackets, "sic" markers and trailing punctuation.
std::string trim_organization_name(std::string_view candidate);

// "Cubs (professional National League baseball team)" as
// "Cubs (Baseball team)"; "" when the mention names no team.
std::string recast_sports_team(std::string_view name);

} // namespace storyline
