#include "storyline/organization_resolver.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <unordered_map>

namespace storyline {

// ─── Name Heuristics ────────────────────────────────────────────────────────

std::string trim_organization_name(std::string_view candidate) {
    std::string name(candidate);
    std::replace(name.begin(), name.end(), '[', ' ');
    std::replace(name.begin(), name.end(), ']', ' ');
    name = replace_all(name, "&", " & ");
    name = trim(replace_all(name, "  ", " "));

    if (name.starts_with("sic. "))
        name = name.substr(5);
    else if (name.starts_with("sic "))
        name = name.substr(4);

    while (!name.empty() &&
           (name.back() == ':' || name.back() == ';' || name.back() == ','))
        name = trim(std::string_view(name).substr(0, name.size() - 1));
    return name;
}

namespace {

std::string strip_suffix(const std::string &s, std::string_view suffix) {
    return trim(std::string_view(s).substr(0, s.size() - suffix.size()));
}

// Name following "University of", up to the next annotation delimiter.
std::string potential_name_from_trailer(std::string_view text, size_t from) {
    auto rest = text.substr(from);
    size_t end = rest.find_first_of("[,;(");
    return trim(rest.substr(0, end));
}

// Name ending at `until`, after the last annotation delimiter or "sic".
std::string potential_name(std::string_view text, size_t until) {
    auto head = text.substr(0, until);

    size_t cut = std::string_view::npos;
    auto later = [&](size_t pos) {
        if (pos != std::string_view::npos &&
            (cut == std::string_view::npos || pos > cut))
            cut = pos;
    };
    later(head.rfind('['));
    later(head.rfind(','));
    later(head.rfind(';'));
    later(head.rfind('('));

    size_t sic = head.rfind("sic. ");
    if (sic != std::string_view::npos) {
        later(sic + 4);
    } else if ((sic = head.rfind("sic ")) != std::string_view::npos) {
        later(sic + 3);
    }

    if (cut != std::string_view::npos)
        head = head.substr(cut + 1);
    return trim(head);
}

} // namespace

std::string recast_sports_team(std::string_view name) {
    constexpr size_t MIN_TEAM_NAME = 3;
    constexpr size_t MIN_SPORT_NAME = 6; // "hockey"

    size_t end = 0;
    if (name.ends_with(" team"))
        end = name.size() - 5;
    else if (name.ends_with(" team)"))
        end = name.size() - 6;
    if (end == 0)
        return "";

    std::string work = trim(name.substr(0, end));
    size_t space = work.rfind(' ');
    if (space == std::string::npos || space <= MIN_TEAM_NAME ||
        space + MIN_SPORT_NAME > work.size())
        return "";

    auto sport = to_lower(std::string_view(work).substr(space + 1));
    if (sport.starts_with("("))
        sport.erase(0, 1);
    std::string team = trim(std::string_view(work).substr(0, space));

    std::string label;
    if (sport == "basketball") {
        label = "Basketball";
    } else if (sport == "hockey") {
        label = "Hockey";
    } else if (sport == "football") {
        label = "Football";
        if (team.ends_with("American"))
            team = strip_suffix(team, "American");
    } else if (sport == "baseball") {
        label = "Baseball";
        for (const char *league :
             {"American League", "National League", "Negro League"}) {
            if (team.ends_with(league)) {
                team = strip_suffix(team, league);
                break;
            }
        }
    } else {
        return "";
    }

    if (team.ends_with("professional"))
        team = strip_suffix(team, "professional");
    if (team.ends_with("("))
        team = strip_suffix(team, "(");
    if (team.empty())
        return "";
    return team + " (" + label + " team)";
}

// ─── OrganizationResolver ───────────────────────────────────────────────────

OrganizationResolver::OrganizationResolver(
    std::shared_ptr<const OrganizationTables> tables,
    const ResolverConfig &config)
    : tables_(std::move(tables)), config_(config) {}

std::string OrganizationResolver::look_up_synonym(const std::string &name) const {
    const auto &synonyms = tables_->synonyms;
    auto find = [&](const std::string &key) -> std::string {
        auto it = synonyms.find(key);
        return it == synonyms.end() ? "" : it->second;
    };

    auto it = synonyms.find(name);
    if (it != synonyms.end())
        return it->second;
    // Federal agencies are listed as "U.S. ..." only.
    if (contains(name, "United States"))
        return find(replace_all(name, "United States", "U.S."));
    if (name.starts_with("The ") || name.starts_with("the "))
        return find(name.substr(4));
    if (name.starts_with("later "))
        return find(name.substr(6));
    return "";
}

std::string
OrganizationResolver::look_up_authority(const std::string &name) const {
    const auto &authorities = tables_->authorities;
    auto find = [&](const std::string &key) -> std::string {
        auto it = authorities.find(key);
        return it == authorities.end() ? "" : it->second;
    };

    auto it = authorities.find(name);
    if (it != authorities.end())
        return it->second;
    if (name.starts_with("The ") || name.starts_with("the "))
        return find(name.substr(4));
    if (name.starts_with("later "))
        return find(name.substr(6));
    if (name.starts_with("UC "))
        return find("University of California, " + name.substr(3));
    auto team = recast_sports_team(name);
    return team.empty() ? "" : find(team);
}

std::string OrganizationResolver::look_up(const std::string &name) const {
    auto id = look_up_synonym(name);
    return id.empty() ? look_up_authority(name) : id;
}

std::string
OrganizationResolver::parse_college_mention(std::string_view text,
                                            std::string_view marker) const {
    std::string id;
    std::string_view suffix = text;

    if (!marker.empty()) {
        size_t at = text.find(marker);
        if (at != std::string_view::npos && at >= 2 && at + 1 < text.size()) {
            std::string prefix = trim(text.substr(0, at));
            suffix = text.substr(at + 1);
            if (!contains(prefix, "College") && !contains(prefix, "University")) {
                // "Morehouse [College]"
                std::string name;
                if (suffix.starts_with("University"))
                    name = trim_organization_name(prefix) + " University";
                else if (suffix.starts_with("College"))
                    name = trim_organization_name(prefix) + " College";
                if (!name.empty())
                    id = look_up(name);

                if (id.empty()) {
                    name.clear();
                    if (contains(suffix, prefix + " University"))
                        name = prefix + " University";
                    else if (contains(suffix, "University of " + prefix))
                        name = "University of " + prefix;
                    else if (contains(suffix, prefix + " College"))
                        name = prefix + " College";
                    if (!name.empty())
                        id = look_up(name);
                }
            }
        }
    }
    if (!id.empty())
        return id;

    // Any "University of X", "X University" or "X College" in the text.
    std::string name;
    size_t at = suffix.find("University of");
    if (at != std::string_view::npos && at > 0 && at + 13 < suffix.size())
        name = "University of " + potential_name_from_trailer(suffix, at + 13);
    at = suffix.find(" University");
    if (at != std::string_view::npos && at > 0) {
        name = potential_name(suffix, at) + " University";
    } else if ((at = suffix.find(" College")) != std::string_view::npos &&
               at > 0) {
        name = potential_name(suffix, at) + " College";
    }
    return name.empty() ? "" : look_up(name);
}

std::string
OrganizationResolver::parse_organization_name(std::string_view text) const {
    auto id = look_up(trim_organization_name(text));
    if (!id.empty())
        return id;

    bool bracketed = false;
    bool parenthesized = false;

    // "ORGa [ORGb]": either half on its own.
    size_t at = text.find('[');
    if (at != std::string_view::npos && at >= 2 && at + 1 < text.size()) {
        bracketed = true;
        id = look_up(trim_organization_name(text.substr(0, at)));
        if (id.empty())
            id = look_up(trim_organization_name(text.substr(at + 1)));
    }

    // "ORGc (ORGd)", closing parenthesis optional.
    if (id.empty()) {
        at = text.find('(');
        if (at != std::string_view::npos && at >= 2 && at + 1 < text.size()) {
            parenthesized = true;
            id = look_up(trim_organization_name(text.substr(0, at)));
            if (id.empty()) {
                auto inner = trim_organization_name(text.substr(at + 1));
                if (inner.ends_with(")"))
                    inner.pop_back();
                id = look_up(inner);
            }
        }
    }

    if (id.empty() && bracketed)
        id = parse_college_mention(text, "[");
    if (id.empty() && parenthesized)
        id = parse_college_mention(text, "(");
    if (id.empty())
        id = parse_college_mention(text, "");
    return id;
}

OrganizationResult
OrganizationResolver::resolve(const std::vector<NamedEntity> &candidates) const {
    std::vector<OrganizationEntity> orgs;
    for (const auto &c : candidates) {
        if (c.type == EntityType::Org)
            orgs.push_back(OrganizationEntity{c});
    }

    for (auto &org : orgs) {
        const auto &text = org.entity.text;
        const auto &context = org.entity.contextual_text;

        auto id = parse_organization_name(text);
        if (id.empty() && org.entity.has_context()) {
            id = parse_organization_name(context);
            if (id.empty()) {
                // "Georgia State [Savannah State University]": the note alone.
                size_t at = context.find(text);
                if (at != std::string::npos &&
                    at + text.size() + 1 < context.size())
                    id = parse_organization_name(
                        trim(std::string_view(context).substr(at + text.size())));
            }
        }
        org.authority_id = id;
        if (!id.empty())
            org.entity.confidence++;
    }

    // One ID per mention text within the story.
    std::unordered_map<std::string, std::string> id_of_text;
    for (const auto &org : orgs) {
        auto [it, inserted] = id_of_text.emplace(org.entity.text, org.authority_id);
        if (inserted || it->second == org.authority_id)
            continue;
        if (it->second.empty()) {
            it->second = org.authority_id;
        } else if (!org.authority_id.empty()) {
            log_error("Two or more entities with the name '" + org.entity.text +
                      "' resolved to different IDs.");
            OrganizationResult aborted;
            aborted.conflict = true;
            return aborted;
        }
    }

    OrganizationResult result;
    std::unordered_map<std::string, size_t> by_id;
    for (auto &org : orgs) {
        org.authority_id = id_of_text[org.entity.text];
        if (!org.resolved()) {
            result.unresolved.push_back(std::move(org));
            continue;
        }
        auto seen = by_id.find(org.authority_id);
        if (seen == by_id.end()) {
            by_id.emplace(org.authority_id, result.resolved.size());
            result.resolved.push_back(std::move(org));
        } else {
            auto &kept = result.resolved[seen->second];
            kept.count++;
            kept.entity.confidence =
                std::max(kept.entity.confidence, org.entity.confidence);
        }
    }

    for (auto &org : result.resolved) {
        if (org.count >= config_.frequent_organization_count)
            org.entity.confidence += 1;
    }

    log_info("OrganizationResolver: " + std::to_string(result.resolved.size()) +
             " organizations resolved, " +
             std::to_string(result.unresolved.size()) + " unresolved.");
    return result;
}

} // namespace storyline
