#include "storyline/location_resolver.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <unordered_map>

namespace storyline {

// ─── Name Heuristics ────────────────────────────────────────────────────────

std::string trim_place_name(std::string_view candidate) {
    std::string name = trim(candidate);

    size_t pos = name.rfind("[sic. ");
    if (pos != std::string::npos) {
        name = name.substr(pos + 6);
    } else if ((pos = name.rfind("[sic ")) != std::string::npos) {
        name = name.substr(pos + 5);
    } else if ((pos = name.rfind(" sic ")) != std::string::npos) {
        name = name.substr(pos + 5);
    }

    // Annotation and list prefixes, e.g. "[St. Joseph Church, Birmingham".
    // Periods stay: they occur inside place names.
    for (char marker : {'[', ':', ';', ','}) {
        pos = name.rfind(marker);
        if (pos != std::string::npos)
            name = name.substr(pos + 1);
    }
    return trim(name);
}

std::string proper_usgs_place_name(std::string_view candidate) {
    std::string name(candidate);
    std::replace(name.begin(), name.end(), '[', ' ');
    std::replace(name.begin(), name.end(), ']', ' ');
    name = trim(replace_all(name, " AFB", " Air Force Base"));

    auto lower = to_lower(name);
    if (lower.starts_with("the city of "))
        name = name.substr(12);
    else if (lower.starts_with("city of "))
        name = name.substr(8);

    if (contains(name, "Ft.") && name.size() > 4)
        name = replace_all(name, "Ft.", "Fort");

    if (name.ends_with(" St.") && name.size() > 4) {
        name = name.substr(0, name.size() - 4) + " Street";
    } else if (contains(name, "St.")) {
        // The gazetteer spells out Saint Louis, Saint Paul and the like.
        name = replace_all(name, "St.", "Saint");
    } else if (name == "Philly" || name == "Phila.") {
        name = "Philadelphia";
    } else if (name == "LA" || name == "L.A." || name == "L.A. Los Angeles") {
        name = "Los Angeles";
    } else if (name == "N.Y. City" || name == "NY City" || name == "NYC") {
        name = "New York City";
    } else if (name == "Pearl Harbor") {
        name = "Naval Station Pearl Harbor";
    } else if (name == "Vegas") {
        name = "Las Vegas";
    }
    return name;
}

PlaceAndState parse_place_and_state(std::string_view text,
                                    const StateTable &states) {
    std::string state_name;
    std::string place_name;

    auto split_at = [&](size_t pos) {
        state_name = trim(text.substr(pos + 1));
        if (state_name.ends_with("]"))
            state_name = trim(state_name.substr(0, state_name.size() - 1));
        place_name = trim_place_name(text.substr(0, pos));
    };

    // Room for a place before the marker and a two-letter code after it.
    auto usable = [&](size_t pos) {
        return pos != std::string_view::npos && pos >= 2 &&
               pos + 2 < text.size();
    };

    size_t comma = text.rfind(',');
    if (usable(comma)) {
        split_at(comma);
    } else {
        size_t bracket = text.rfind('[');
        if (usable(bracket))
            split_at(bracket);
    }

    PlaceAndState result;
    result.place = proper_usgs_place_name(place_name);
    result.state_id = states.look_up(state_name, false);
    return result;
}

bool is_general_location(std::string_view text, std::string_view context) {
    std::string_view source = trim(context).empty() ? text : context;

    std::string work = trim_end(replace_all(source, "]", ""));
    if (!work.empty() && work.back() == '.')
        work.pop_back();

    size_t last = work.find_last_of("[ ");
    std::string final_word =
        (last == std::string::npos) ? work : work.substr(last + 1);

    static const char *const GENERAL_LOCATION_SUFFIXES[] = {
        "Avenue", "Ave",  "Boulevard", "Blvd", "Street",
        "St",     "Road", "Lane",      "Lake", "River",
    };
    for (const char *suffix : GENERAL_LOCATION_SUFFIXES) {
        if (final_word == suffix)
            return true;
    }

    // A bare "Lake X" with nothing around it spans too many states.
    if (text.starts_with("Lake ")) {
        auto bare = trim(replace_all(replace_all(source, "[", ""), "]", ""));
        if (bare.starts_with("Lake ") && bare.size() <= text.size())
            return true;
    }
    return false;
}

int washington_dc_or_state(std::string_view context) {
    auto text = to_lower(context);
    int state = 0;

    for (const char *clue : {"d.c.", "district of columbia",
                             "metro washington", "metro [washington"}) {
        if (contains(text, clue))
            state = DC_STATE_ID;
    }
    for (const char *clue :
         {"king county", "seattle", "spokane", "yakima", "tacoma", "pasco",
          "fort lewis", "mcchord", "fairchild air force base", "kitsap",
          "state of washington", "washington state"}) {
        if (contains(text, clue))
            state = WA_STATE_ID;
    }
    return state;
}

// ─── LocationResolver ───────────────────────────────────────────────────────

LocationResolver::LocationResolver(std::shared_ptr<const LocationTables> tables,
                                   const ResolverConfig &config)
    : tables_(std::move(tables)), config_(config) {}

int LocationResolver::usgs_id_of_state(int state_id) const {
    const auto *state = tables_->states.find(state_id);
    return state ? state->usgs_id : 0;
}

void LocationResolver::resolve_candidate(std::vector<LocationEntity> &candidates,
                                         size_t index) const {
    auto &entry = candidates[index];
    if (entry.state_code != 0)
        return; // settled by the look-ahead of the previous candidate

    const auto &tables = *tables_;
    const auto &text = entry.entity.text;
    const auto &context = entry.entity.contextual_text;

    int state = 0;
    int place = 0;
    int confidence = entry.entity.confidence;

    auto state_only = [&](std::string_view clues) {
        if (state == WA_STATE_ID)
            state = washington_dc_or_state(clues);
        if (state != 0) {
            place = usgs_id_of_state(state);
            confidence += 1;
        }
    };

    auto try_place = [&](const std::string &name) {
        int id = tables.find_place(state, name);
        if (id != 0) {
            place = id;
            confidence += 2;
        }
        return id != 0;
    };

    if (!is_general_location(text, context)) {
        // An explicit "Place, State" in the mention wins over everything.
        size_t comma = text.find(',');
        if (comma != std::string::npos && comma > 0) {
            auto parsed = parse_place_and_state(text, tables.states);
            state = parsed.state_id;
            if (state != 0 && !try_place(parsed.place)) {
                // "Annapolis [U.S. Naval Academy, Maryland]"
                size_t bracket = text.find('[');
                if (bracket != std::string::npos && bracket > 0)
                    try_place(proper_usgs_place_name(
                        trim(text.substr(0, bracket))));
                if (place == 0)
                    state_only(context);
            }
        }

        if (place == 0) {
            if (entry.entity.has_context()) {
                // The words right after the mention, else the last note.
                std::string state_name;
                size_t at = context.find(text);
                if (at != std::string::npos &&
                    at + text.size() + 1 < context.size()) {
                    state_name = trim(context.substr(at + text.size()));
                } else {
                    state_name = context;
                    size_t open = state_name.rfind('[');
                    if (open != std::string::npos)
                        state_name = state_name.substr(open + 1);
                    size_t close = state_name.rfind(']');
                    if (close != std::string::npos)
                        state_name = state_name.substr(0, close);
                }

                state = tables.states.look_up(state_name, false);
                if (state != 0 && !try_place(proper_usgs_place_name(trim(text))))
                    state = 0;

                if (place == 0) {
                    // "Hardeman County [Bolivar, Tennessee]"
                    auto parsed = parse_place_and_state(context, tables.states);
                    state = parsed.state_id;
                    if (state != 0 && !try_place(parsed.place) &&
                        !try_place(proper_usgs_place_name(trim(text))))
                        state_only(context);
                }
            }

            // Split extraction: "Cairo" followed closely by "Illinois".
            if (state == 0 && index + 1 < candidates.size()) {
                auto &next = candidates[index + 1];
                int window = config_.adjacency_epsilon +
                             entry.entity.start_offset + entry.entity.length;
                if (next.entity.start_offset <= window) {
                    state = tables.states.look_up(next.entity.text);
                    if (state != 0) {
                        if (try_place(proper_usgs_place_name(trim(text)))) {
                            next.state_code = state;
                            next.place_id = place;
                            next.entity.confidence += 2;
                        } else {
                            state = 0;
                        }
                    }
                }
            }

            if (state == 0) {
                auto name = proper_usgs_place_name(trim(text));
                auto hint = tables.city_hints.find(name);
                if (hint != tables.city_hints.end()) {
                    state = hint->second.state_id;
                    place = hint->second.place_id;
                    confidence += 2;
                } else {
                    state = tables.states.look_up(name);
                    state_only(context.empty() ? std::string_view(name)
                                               : std::string_view(context));
                    if (state == 0)
                        place = 0;
                }
            }
        }
    }

    entry.state_code = state;
    entry.place_id = place;
    entry.entity.confidence = confidence;
}

std::vector<LocationEntity> LocationResolver::resolve_mentions(
    const std::vector<NamedEntity> &candidates) const {
    std::vector<LocationEntity> locations;
    for (const auto &c : candidates) {
        if (c.type == EntityType::Loc)
            locations.push_back(LocationEntity{c});
    }

    for (size_t i = 0; i < locations.size(); ++i)
        resolve_candidate(locations, i);

    // Repeated mentions inherit the first resolution of the same text.
    for (size_t i = 0; i < locations.size(); ++i) {
        auto &entry = locations[i];
        if (entry.state_code != 0)
            continue;
        for (size_t j = 0; j < locations.size(); ++j) {
            const auto &other = locations[j];
            if (j != i && other.state_code != 0 &&
                other.entity.text == entry.entity.text) {
                entry.state_code = other.state_code;
                entry.place_id = other.place_id;
                entry.entity.confidence = other.entity.confidence;
                break;
            }
        }
    }
    return locations;
}

LocationResult
LocationResolver::resolve(const std::vector<NamedEntity> &candidates) const {
    LocationResult result;
    std::unordered_map<int, size_t> by_place;

    for (auto &entry : resolve_mentions(candidates)) {
        if (!entry.resolved()) {
            entry.country_code = entry.state_code = entry.place_id = 0;
            result.unresolved.push_back(std::move(entry));
            continue;
        }
        auto seen = by_place.find(entry.place_id);
        if (seen == by_place.end()) {
            by_place.emplace(entry.place_id, result.resolved.size());
            result.resolved.push_back(std::move(entry));
        } else {
            auto &kept = result.resolved[seen->second];
            kept.count++;
            kept.entity.confidence =
                std::max(kept.entity.confidence, entry.entity.confidence);
        }
    }

    for (auto &loc : result.resolved) {
        if (loc.count > config_.frequent_place_count)
            loc.entity.confidence += 1;
    }

    log_info("LocationResolver: " + std::to_string(result.resolved.size()) +
             " places resolved, " + std::to_string(result.unresolved.size()) +
             " unresolved.");
    return result;
}

} // namespace storyline
