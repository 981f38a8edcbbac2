#include "storyline/reference_data.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace storyline {

// ─── US States ──────────────────────────────────────────────────────────────

StateTable::StateTable(std::vector<StateInfo> states)
    : states_(std::move(states)) {
    std::stable_sort(states_.begin(), states_.end(),
                     [](const StateInfo &a, const StateInfo &b) {
                         return a.id < b.id;
                     });
}

int StateTable::look_up(std::string_view name, bool exact) const {
    if (name.size() <= 1)
        return 0;

    int found = 0;
    for (const auto &state : states_) {
        if (name == state.alpha)
            return state.id;
        for (const auto &variant : state.names) {
            bool partial = !exact && variant != "Washington" &&
                           storyline::contains(name, variant);
            if (name == variant || partial) {
                found = state.id;
                if (!exact && state.id == VA_STATE_ID &&
                    storyline::contains(name, "West Virginia"))
                    found = WV_STATE_ID;
                break;
            }
        }
    }
    return found;
}

const StateInfo *StateTable::find(int id) const {
    auto it = std::lower_bound(
        states_.begin(), states_.end(), id,
        [](const StateInfo &s, int value) { return s.id < value; });
    if (it == states_.end() || it->id != id)
        return nullptr;
    return &*it;
}

std::string StateTable::alpha(int id) const {
    const auto *state = find(id);
    return state ? state->alpha : "unknown";
}

StateTable default_us_states() {
    // clang-format off
    return StateTable({
        {1, 1779775, "AL", {"Alabama", "State of Alabama"}},
        {2, 1785533, "AK", {"Alaska", "State of Alaska"}},
        {4, 1779777, "AZ", {"Arizona", "State of Arizona"}},
        {5, 68085, "AR", {"Arkansas", "Ark.", "State of Arkansas"}},
        {6, 1779778, "CA", {"California", "Calif.", "State of California"}},
        {8, 1779779, "CO", {"Colorado", "Colo.", "State of Colorado"}},
        {9, 1779780, "CT", {"Connecticut", "Conn.", "State of Connecticut"}},
        {10, 1779781, "DE", {"Delaware", "Dela.", "Del.", "State of Delaware"}},
        {11, 1702382, "DC", {"District of Columbia", "D.C.", "the District of Columbia"}},
        {12, 294478, "FL", {"Florida", "Fla.", "State of Florida"}},
        {13, 1705317, "GA", {"Georgia", "State of Georgia"}},
        {15, 1779782, "HI", {"Hawaii", "State of Hawaii"}},
        {16, 1779783, "ID", {"Idaho", "State of Idaho"}},
        {17, 1779784, "IL", {"Illinois", "Ill.", "State of Illinois"}},
        {18, 448508, "IN", {"Indiana", "State of Indiana"}},
        {19, 1779785, "IA", {"Iowa", "State of Iowa"}},
        {20, 481813, "KS", {"Kansas", "State of Kansas"}},
        {21, 1779786, "KY", {"Kentucky", "State of Kentucky"}},
        {22, 1629543, "LA", {"Louisiana", "State of Louisiana"}},
        {23, 1779787, "ME", {"Maine", "State of Maine"}},
        {24, 1714934, "MD", {"Maryland", "State of Maryland"}},
        {25, 606926, "MA", {"Massachusetts", "Mass.", "State of Massachusetts"}},
        {26, 1779789, "MI", {"Michigan", "Mich.", "State of Michigan"}},
        {27, 662849, "MN", {"Minnesota", "Minn.", "State of Minnesota"}},
        {28, 1779790, "MS", {"Mississippi", "State of Mississippi"}},
        {29, 1779791, "MO", {"Missouri", "State of Missouri"}},
        {30, 767982, "MT", {"Montana", "State of Montana"}},
        {31, 1779792, "NE", {"Nebraska", "Neb.", "State of Nebraska"}},
        {32, 1779793, "NV", {"Nevada", "Nev.", "State of Nevada"}},
        {33, 1779794, "NH", {"New Hampshire", "N.H.", "State of New Hampshire"}},
        {34, 1779795, "NJ", {"New Jersey", "N.J.", "State of New Jersey"}},
        {35, 897535, "NM", {"New Mexico", "N.M.", "State of New Mexico"}},
        {36, 1779796, "NY", {"New York", "N.Y.", "NY State", "New York State", "N.Y. State", "State of New York"}},
        {37, 1027616, "NC", {"North Carolina", "N.C.", "State of North Carolina"}},
        {38, 1779797, "ND", {"North Dakota", "N.D.", "State of North Dakota"}},
        {39, 1085497, "OH", {"Ohio", "State of Ohio"}},
        {40, 1102857, "OK", {"Oklahoma", "Okla.", "State of Oklahoma"}},
        {41, 1155107, "OR", {"Oregon", "State of Oregon"}},
        {42, 1779798, "PA", {"Pennsylvania", "Penn.", "State of Pennsylvania"}},
        {44, 1219835, "RI", {"Rhode Island", "R.I.", "State of Rhode Island"}},
        {45, 1779799, "SC", {"South Carolina", "S.C.", "State of South Carolina"}},
        {46, 1785534, "SD", {"South Dakota", "S.D.", "State of South Dakota"}},
        {47, 1325873, "TN", {"Tennessee", "Tenn.", "State of Tennessee"}},
        {48, 1779801, "TX", {"Texas", "Tex.", "State of Texas"}},
        {49, 1455989, "UT", {"Utah", "State of Utah"}},
        {50, 1779802, "VT", {"Vermont", "State of Vermont"}},
        {51, 1779803, "VA", {"Virginia", "State of Virginia"}},
        {53, 1779804, "WA", {"Washington", "Washington State", "State of Washington"}},
        {54, 1779805, "WV", {"West Virginia", "W.V.", "State of West Virginia"}},
        {55, 1779806, "WI", {"Wisconsin", "Wisc.", "State of Wisconsin"}},
        {56, 1779807, "WY", {"Wyoming", "State of Wyoming"}},
    });
    // clang-format on
}

int LocationTables::find_place(int state_id, const std::string &name) const {
    auto state = places.find(state_id);
    if (state == places.end())
        return 0;
    auto place = state->second.find(name);
    return place == state->second.end() ? 0 : place->second;
}

// ─── Loaders ────────────────────────────────────────────────────────────────

namespace {

// Opens the file and consumes its header line.
std::ifstream open_table(const std::string &path) {
    std::ifstream file(path);
    std::string header;
    if (!file || !std::getline(file, header)) {
        throw std::runtime_error(
            "Required input file is missing or empty: " + path);
    }
    log_info("Loading reference data from " + path);
    return file;
}

bool next_row(std::ifstream &file, std::string &line) {
    if (!std::getline(file, line))
        return false;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

bool parse_int(const std::string &s, int &out) {
    auto t = trim(s);
    if (t.empty())
        return false;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), out);
    return ec == std::errc() && ptr == t.data() + t.size();
}

} // namespace

std::unordered_map<int, PlaceIndex> load_places(const std::string &path,
                                                const StateTable &states) {
    std::unordered_map<int, PlaceIndex> places;
    for (const auto &state : states.states())
        places[state.id];

    auto file = open_table(path);
    std::string line;
    size_t count = 0;
    while (next_row(file, line)) {
        auto cols = split(line, '\t');
        int place_id = 0;
        int state_id = 0;
        if (cols.size() != 3 || !parse_int(cols[0], place_id) ||
            !parse_int(cols[2], state_id) || !places.count(state_id)) {
            log_warning("load_places: ignoring malformed row: " + line);
            continue;
        }
        if (!places[state_id].emplace(cols[1], place_id).second) {
            log_warning("load_places: ignoring repeated place: " + line);
            continue;
        }
        ++count;
    }
    log_info("load_places: " + std::to_string(count) + " places loaded.");
    return places;
}

std::unordered_map<std::string, CityHint>
load_city_hints(const std::string &path) {
    std::unordered_map<std::string, CityHint> hints;
    auto file = open_table(path);
    std::string line;
    while (next_row(file, line)) {
        auto cols = split(line, '\t');
        CityHint hint{0, 0};
        if (cols.size() != 4 || !parse_int(cols[2], hint.state_id) ||
            !parse_int(cols[3], hint.place_id)) {
            log_warning("load_city_hints: ignoring malformed row: " + line);
            continue;
        }
        if (!hints.emplace(cols[0], hint).second)
            log_warning("load_city_hints: ignoring repeated hint: " + line);
    }
    log_info("load_city_hints: " + std::to_string(hints.size()) +
             " city hints loaded.");
    return hints;
}

std::unordered_map<std::string, std::string>
load_corporate_names(const std::string &path) {
    std::unordered_map<std::string, std::string> names;
    auto file = open_table(path);
    std::string line;
    while (next_row(file, line)) {
        auto cols = split(line, '\t');
        if (cols.size() != 2) {
            log_warning("load_corporate_names: ignoring malformed row: " +
                        line);
            continue;
        }
        auto name = trim(cols[0]);
        auto id = trim(cols[1]);
        if (name.empty() || id.empty()) {
            log_warning("load_corporate_names: ignoring empty row: " + line);
            continue;
        }
        if (!names.emplace(name, id).second)
            log_warning("load_corporate_names: ignoring repeated name: " +
                        line);
    }
    log_info("load_corporate_names: " + std::to_string(names.size()) +
             " organizational names loaded.");
    return names;
}

std::unordered_map<std::string, std::string>
load_corporate_synonyms(const std::string &path) {
    std::unordered_map<std::string, std::string> synonyms;
    auto file = open_table(path);
    std::string line;
    while (next_row(file, line)) {
        auto cols = split(line, '\t');
        if (cols.size() != 3 || cols[0].empty() || cols[2].empty()) {
            log_warning("load_corporate_synonyms: ignoring malformed row: " +
                        line);
            continue;
        }
        if (!synonyms.emplace(cols[0], cols[2]).second)
            log_warning("load_corporate_synonyms: ignoring repeated synonym: " +
                        line);
    }
    log_info("load_corporate_synonyms: " + std::to_string(synonyms.size()) +
             " corporate synonyms loaded.");
    return synonyms;
}

LocationTables load_location_tables(const ResolverConfig &config) {
    namespace fs = std::filesystem;
    fs::path dir(config.data_dir);

    LocationTables tables;
    tables.states = default_us_states();
    tables.places =
        load_places((dir / config.places_file).string(), tables.states);
    tables.city_hints =
        load_city_hints((dir / config.city_hints_file).string());
    return tables;
}

OrganizationTables load_organization_tables(const ResolverConfig &config) {
    namespace fs = std::filesystem;
    fs::path dir(config.data_dir);

    OrganizationTables tables;
    tables.authorities =
        load_corporate_names((dir / config.corporate_names_file).string());
    tables.synonyms = load_corporate_synonyms(
        (dir / config.corporate_synonyms_file).string());
    return tables;
}

} // namespace storyline
