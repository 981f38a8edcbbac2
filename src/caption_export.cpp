#include "storyline/captions.hpp"

#include "storyline/text.hpp"

#include <iomanip>
#include <sstream>

namespace storyline {

std::string format_cue_time(int ms) {
    int minutes = ms / 60000;
    int rest = ms - minutes * 60000;
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << minutes << ':' << std::setw(2)
        << rest / 1000 << '.' << std::setw(3) << rest % 1000;
    return out.str();
}

std::string to_vtt(const TextCaptions &captions) {
    std::ostringstream out;
    out << "WEBVTT\n\nNOTE storyline captioner";
    for (const auto &cue : captions.cues) {
        out << "\n\n"
            << format_cue_time(cue.time_start()) << " --> "
            << format_cue_time(cue.time_end());
        for (const auto &line : cue.lines) {
            auto text = replace_all(line.text(), "&", "&amp;");
            text = replace_all(text, "<", "&lt;");
            text = replace_all(text, ">", "&gt;");
            out << '\n';
            if (!line.speaker.empty())
                out << "<v " << line.speaker << '>';
            out << text;
        }
    }
    out << '\n';
    return out.str();
}

std::vector<SyncPoint> to_tsync(const TextCaptions &captions, int end_offset,
                                int end_time_ms) {
    std::vector<SyncPoint> points;
    points.push_back({0, 0});
    for (const auto &cue : captions.cues)
        points.push_back({cue.transcript_start(), cue.time_start()});
    points.push_back({end_offset, end_time_ms});
    return points;
}

std::string to_plain_text(const TextCaptions &captions) {
    std::ostringstream out;
    out << "DIAGNOSTIC DUMP";
    for (size_t i = 0; i < captions.cues.size(); ++i) {
        const auto &cue = captions.cues[i];
        out << "\n\ncue[" << i << "] - Duration: " << cue.duration() << "ms - "
            << format_cue_time(cue.time_start()) << " --> "
            << format_cue_time(cue.time_end());
        for (size_t j = 0; j < cue.lines.size(); ++j) {
            const auto &line = cue.lines[j];
            out << "\n  line[" << j << "]: " << line.speaker << ':'
                << line.text();
        }
    }
    out << '\n';
    return out.str();
}

} // namespace storyline
