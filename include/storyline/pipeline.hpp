#pragma once

#include <memory>
#include <string>
#include <vector>

#include "storyline/captions.hpp"
#include "storyline/config.hpp"
#include "storyline/date_resolver.hpp"
#include "storyline/location_resolver.hpp"
#include "storyline/organization_resolver.hpp"
#include "storyline/reference_data.hpp"
#include "storyline/result.hpp"
#include "storyline/spacy_merger.hpp"
#include "storyline/stanford_polisher.hpp"
#include "storyline/timed_text.hpp"

namespace storyline {

// ─── Captioning ─────────────────────────────────────────────────────────────

/// Caption one segment from its forced alignment.
///
///   storyline::Captioner c(storyline::make_broadcast_caption_config());
///   auto result = c.caption(alignment, duration_ms);
///   if (result) std::cout << storyline::to_vtt(result.value);
///
class Captioner {
  public:
    explicit Captioner(const CaptionConfig &config = CaptionConfig{})
        : config_(config) {}

    /// Format the alignment, then build, merge and validate cues.
    Result<TextCaptions> caption(const AlignmentInput &input,
                                 int duration_ms) const {
        return caption_text(input, duration_ms, config_);
    }

    const CaptionConfig &config() const { return config_; }

  private:
    CaptionConfig config_;
};

// ─── Entity Resolution ──────────────────────────────────────────────────────

struct StoryEntities {
    OrganizationResult organizations;
    LocationResult locations;
    std::vector<DateReference> dates;
};

/// Named-entity pipeline for one story: Stanford polish, optional spaCy
/// merge, then organization, location and date resolution.
///
/// Reference tables are loaded once at construction and shared read-only,
/// so one resolver can serve every story of a run.
///
///   storyline::EntityResolver r(config);
///   auto story = r.resolve_story(stanford_lines, transcript);
///
class EntityResolver {
  public:
    /// Load all four reference tables from config.data_dir.
    /// Throws std::runtime_error if a table is missing or empty.
    explicit EntityResolver(const ResolverConfig &config = ResolverConfig{},
                            const PolisherConfig &polisher = PolisherConfig{})
        : EntityResolver(
              std::make_shared<const LocationTables>(load_location_tables(config)),
              std::make_shared<const OrganizationTables>(
                  load_organization_tables(config)),
              config, polisher) {}

    /// Use tables loaded elsewhere.
    EntityResolver(std::shared_ptr<const LocationTables> locations,
                   std::shared_ptr<const OrganizationTables> organizations,
                   const ResolverConfig &config = ResolverConfig{},
                   const PolisherConfig &polisher = PolisherConfig{})
        : polisher_(polisher), config_(config),
          locations_(std::move(locations), config),
          organizations_(std::move(organizations), config) {}

    /// Polish the Stanford output and, when given, merge spaCy output in.
    Result<std::vector<NamedEntity>>
    extract(const std::vector<std::string> &stanford_lines,
            const std::string &transcript,
            const std::vector<std::string> &spacy_lines = {}) const {
        auto polished = polish_stanford(stanford_lines, transcript, polisher_);
        if (!polished || spacy_lines.empty())
            return polished;
        return merge_spacy(spacy_lines, transcript, polished.value);
    }

    /// Resolve candidates that were already extracted.
    StoryEntities
    resolve_candidates(const std::vector<NamedEntity> &candidates) const {
        StoryEntities story;
        story.organizations = organizations_.resolve(candidates);
        story.locations = locations_.resolve(candidates);
        return story;
    }

    /// Full story: extract, then resolve organizations and locations.
    /// Dates come from the spaCy rows and the transcript alone.
    Result<StoryEntities>
    resolve_story(const std::vector<std::string> &stanford_lines,
                  const std::string &transcript,
                  const std::vector<std::string> &spacy_lines = {}) const {
        auto candidates = extract(stanford_lines, transcript, spacy_lines);
        if (!candidates)
            return Result<StoryEntities>::failure_from(candidates);
        auto story = resolve_candidates(candidates.value);
        story.dates = resolve_dates(spacy_lines, transcript, config_);
        return Result<StoryEntities>::success(std::move(story));
    }

    const LocationResolver &locations() const { return locations_; }
    const OrganizationResolver &organizations() const {
        return organizations_;
    }

  private:
    PolisherConfig polisher_;
    ResolverConfig config_;
    LocationResolver locations_;
    OrganizationResolver organizations_;
};

} // namespace storyline
