#include "storyline/stanford_polisher.hpp"

#include "storyline/log.hpp"
#include "storyline/text.hpp"

namespace storyline {

namespace {

// UTF-8 encoding of U+FFFD, emitted by the tagger for undecodable input.
constexpr std::string_view REPLACEMENT_CHAR = "\xEF\xBF\xBD";

struct Token {
    std::string text;
    EntityType type;
};

std::vector<Token> tokenize(const std::vector<std::string> &lines) {
    std::vector<Token> tokens;
    tokens.reserve(lines.size());
    for (const auto &line : lines) {
        auto cols = split(line, '\t');
        if (cols.size() != 2 || cols[0].empty())
            continue;
        auto text = stanford_source_form(cols[0]);
        if (text.empty())
            continue;
        tokens.push_back({std::move(text), stanford_entity_type(trim(cols[1]))});
    }
    return tokens;
}

} // namespace

EntityType stanford_entity_type(std::string_view label) {
    if (label == "PERSON")
        return EntityType::Person;
    if (label == "LOCATION")
        return EntityType::Loc;
    if (label == "ORGANIZATION")
        return EntityType::Org;
    return EntityType::Unset;
}

std::string stanford_source_form(std::string_view token) {
    static const std::pair<const char *, const char *> ESCAPES[] = {
        {"-LSB-", "["}, {"-RSB-", "]"}, {"-LRB-", "("},
        {"-RRB-", ")"}, {"-LCB-", "{"}, {"-RCB-", "}"},
    };
    for (const auto &[escape, literal] : ESCAPES) {
        if (token == escape)
            return literal;
    }
    if (token == ",")
        return ",";

    std::string text(token);
    for (const auto &[escape, literal] : ESCAPES)
        text = replace_all(text, escape, literal);

    if (contains(text, REPLACEMENT_CHAR)) {
        log_warning("StanfordPolisher: non-ASCII replacement character in '" +
                    text + "'");
        text = replace_all(text, REPLACEMENT_CHAR, " ");
    }

    if (has_alphanumeric(text))
        return text;
    // The tagger glues brackets onto punctuation, e.g. ":]".
    if (contains(text, "["))
        return "[";
    if (contains(text, "]"))
        return "]";
    return "";
}

Result<std::vector<NamedEntity>>
polish_stanford(const std::vector<std::string> &lines,
                const std::string &transcript, const PolisherConfig &config) {
    using R = Result<std::vector<NamedEntity>>;

    auto tokens = tokenize(lines);
    std::vector<NamedEntity> entries;
    size_t scan = 0;

    auto desync = [&](const Token &tok) {
        auto msg = "StanfordPolisher: transcript at/after offset " +
                   std::to_string(scan) + " does not have this text: " +
                   tok.text;
        log_error(msg);
        return R::failure(Status::TranscriptDesync, msg);
    };

    size_t i = 0;
    while (i < tokens.size()) {
        const auto &first = tokens[i];
        size_t found = transcript.find(first.text, scan);
        if (found == std::string::npos)
            return desync(first);
        scan = found + first.text.size();
        ++i;

        bool opens_bracket = config.bracket_hinting && first.text == "[";
        if (first.type == EntityType::Unset && !opens_bracket)
            continue;

        NamedEntity entry;
        entry.text = first.text;
        entry.start_offset = static_cast<int>(found);
        EntityType type = first.type;

        // A leading "[...]" may only learn its type from what follows.
        bool in_brackets = opens_bracket;
        bool considering_prefix = opens_bracket;
        int depth = 0;
        bool discard = false;

        while (true) {
            if (i == tokens.size()) {
                if (in_brackets) {
                    const char *msg = "StanfordPolisher: square brackets mismatched.";
                    log_error(msg);
                    return R::failure(Status::BracketMismatch, msg);
                }
                break;
            }

            const auto &tok = tokens[i];
            size_t at = transcript.find(tok.text, scan);
            if (at == std::string::npos)
                return desync(tok);
            size_t end = at + tok.text.size();

            if (in_brackets) {
                if (tok.text == "[") {
                    ++depth;
                } else if (tok.text == "]") {
                    if (depth > 0)
                        --depth;
                    else
                        in_brackets = false;
                } else if (considering_prefix && type == EntityType::Unset) {
                    type = tok.type;
                }
                entry.text += " " + tok.text;
                scan = end;
                ++i;
                continue;
            }

            size_t brk = transcript.find("\n\n", entry.start_offset);
            if (config.hard_paragraph_breaks && brk != std::string::npos &&
                brk + 2 <= end)
                break;

            if (config.bracket_hinting && tok.text == "[") {
                in_brackets = true;
                entry.text += " [";
                scan = end;
                ++i;
                continue;
            }

            if (considering_prefix) {
                considering_prefix = false;
                if (tok.type != type) {
                    // An untyped word ends a typed "[...]" on its own.
                    if (tok.type == EntityType::Unset)
                        break;
                    type = tok.type;
                } else if (type == EntityType::Unset) {
                    scan = end;
                    ++i;
                    discard = true;
                    break;
                }
            }

            if (tok.type != type)
                break;
            entry.text += " " + tok.text;
            scan = end;
            ++i;
        }

        if (discard || type == EntityType::Unset)
            continue;
        entry.type = type;
        entry.length = static_cast<int>(scan) - entry.start_offset;
        entry.contextual_text =
            transcript.substr(entry.start_offset, entry.length);
        entries.push_back(std::move(entry));
    }

    log_info("StanfordPolisher: " + std::to_string(entries.size()) +
             " entity candidates.");
    return R::success(std::move(entries));
}

} // namespace storyline
