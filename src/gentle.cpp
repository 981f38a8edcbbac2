#include "storyline/gentle.hpp"

#include "storyline/text.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace storyline {

AlignmentInput parse_gentle_alignment(const std::string &json_text) {
    using json = nlohmann::json;

    AlignmentInput input;
    try {
        auto doc = json::parse(json_text);
        if (!doc.is_object())
            throw std::runtime_error("Invalid alignment JSON: not an object");

        input.transcript = doc.value("transcript", std::string());
        auto words = doc.find("words");
        if (words == doc.end() || !words->is_array())
            return input;

        // Words the aligner could not place carry no start/end.
        for (const auto &w : *words) {
            RawWord word;
            word.word = w.value("word", std::string());
            word.success = w.value("case", std::string()) == "success";
            word.start_offset = w.value("startOffset", 0);
            word.end_offset = w.value("endOffset", 0);
            word.start = w.value("start", 0.0);
            word.end = w.value("end", 0.0);
            input.words.push_back(std::move(word));
        }
    } catch (const json::exception &e) {
        throw std::runtime_error(std::string("Invalid alignment JSON: ") +
                                 e.what());
    }
    return input;
}

AlignmentInput read_gentle_alignment(const std::string &path) {
    return parse_gentle_alignment(read_file(path));
}

} // namespace storyline
