#include "storyline/gentle.hpp"
#include "storyline/log.hpp"
#include "storyline/pipeline.hpp"

#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <alignment.json> <duration_ms> [options]\n"
        << "\nOptions:\n"
        << "  --vtt             Write WebVTT (default)\n"
        << "  --tsync           Write transcript sync points (offset, ms)\n"
        << "  --text            Write a cue-by-cue diagnostic dump\n"
        << "  --compact         Single short lines for narrow displays\n"
        << "  --max-trailing N  Unaligned trailing words to interpolate\n"
        << "  --quiet           Only log warnings and errors\n"
        << std::endl;
}

int main(int argc, char *argv[]) {
    using namespace storyline;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    set_log_sink([](LogLevel level, const std::string &msg) {
        std::cerr << "[" << log_level_name(level) << "] " << msg << std::endl;
    });

    try {

        // Parse arguments
        std::string alignment_path = argv[1];
        int duration_ms = std::stoi(argv[2]);
        enum class Output { VTT, TSync, Text } output = Output::VTT;
        CaptionConfig config = make_broadcast_caption_config();
        int max_trailing = config.alignment.max_unaligned_trailing_words;

        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--vtt") {
                output = Output::VTT;
            } else if (arg == "--tsync") {
                output = Output::TSync;
            } else if (arg == "--text") {
                output = Output::Text;
            } else if (arg == "--compact") {
                config = make_compact_caption_config();
            } else if (arg == "--max-trailing" && i + 1 < argc) {
                max_trailing = std::stoi(argv[++i]);
            } else if (arg == "--quiet") {
                set_log_level(LogLevel::Warning);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        config.alignment.max_unaligned_trailing_words = max_trailing;

        if (duration_ms <= 0) {
            std::cerr << "Error: duration must be positive" << std::endl;
            return 1;
        }

        auto input = read_gentle_alignment(alignment_path);
        log_info("Read " + std::to_string(input.words.size()) +
                 " aligned words from " + alignment_path);

        Captioner captioner(config);
        auto result = captioner.caption(input, duration_ms);
        if (!result) {
            std::cerr << "Error: segment skipped ("
                      << status_name(result.status) << "): " << result.message
                      << std::endl;
            return 2;
        }

        const auto &captions = result.value;
        switch (output) {
        case Output::VTT:
            std::cout << to_vtt(captions);
            break;
        case Output::TSync:
            for (const auto &p : to_tsync(captions,
                                          static_cast<int>(input.transcript.size()),
                                          duration_ms))
                std::cout << p.offset << '\t' << p.time_ms << '\n';
            break;
        case Output::Text:
            std::cout << to_plain_text(captions);
            break;
        }

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
