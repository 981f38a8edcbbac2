#include "storyline/pipeline.hpp"
#include "storyline/log.hpp"
#include "storyline/text.hpp"

#include <chrono>
#include <iostream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <transcript.txt> <stanford.tsv> [options]\n"
        << "\nOptions:\n"
        << "  --spacy PATH   Merge spaCy NER output (CSV) into the candidates\n"
        << "  --data DIR     Reference table directory (default: data)\n"
        << "  --no-brackets  Do not start entities at '[' annotations\n"
        << "  --no-breaks    Let entities run across blank lines\n"
        << "  --quiet        Only log warnings and errors\n"
        << std::endl;
}

static void print_entity(const char *kind, const storyline::NamedEntity &e,
                         const std::string &id, int count) {
    std::cout << kind << '\t' << e.text << '\t' << e.start_offset << '\t'
              << e.length << '\t' << storyline::entity_type_name(e.type)
              << '\t' << e.confidence << '\t' << count << '\t' << id << '\n';
}

int main(int argc, char *argv[]) {
    using namespace storyline;
    using Clock = std::chrono::high_resolution_clock;

    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    // Results go to stdout; keep the log on stderr.
    set_log_sink([](LogLevel level, const std::string &msg) {
        std::cerr << "[" << log_level_name(level) << "] " << msg << std::endl;
    });

    try {

        // Parse arguments
        std::string transcript_path = argv[1];
        std::string stanford_path = argv[2];
        std::string spacy_path;
        ResolverConfig config;
        PolisherConfig polisher;

        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--spacy" && i + 1 < argc) {
                spacy_path = argv[++i];
            } else if (arg == "--data" && i + 1 < argc) {
                config.data_dir = argv[++i];
            } else if (arg == "--no-brackets") {
                polisher.bracket_hinting = false;
            } else if (arg == "--no-breaks") {
                polisher.hard_paragraph_breaks = false;
            } else if (arg == "--quiet") {
                set_log_level(LogLevel::Warning);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        // 1. Load reference tables
        auto t0 = Clock::now();
        EntityResolver resolver(config, polisher);
        auto t1 = Clock::now();
        log_info("Reference tables loaded (" +
                 std::to_string(std::chrono::duration_cast<
                                    std::chrono::milliseconds>(t1 - t0)
                                    .count()) +
                 " ms)");

        // 2. Read story inputs
        auto transcript = read_file(transcript_path);
        auto stanford_lines = read_lines(stanford_path);
        std::vector<std::string> spacy_lines;
        if (!spacy_path.empty())
            spacy_lines = read_lines(spacy_path);

        // 3. Resolve
        auto story =
            resolver.resolve_story(stanford_lines, transcript, spacy_lines);
        if (!story) {
            std::cerr << "Error: story skipped (" << status_name(story.status)
                      << "): " << story.message << std::endl;
            return 2;
        }

        const auto &orgs = story.value.organizations;
        const auto &places = story.value.locations;
        const auto &states = resolver.locations().tables().states;

        if (orgs.conflict)
            std::cerr << "Warning: organizations dropped for this story"
                      << std::endl;

        std::cout << "kind\ttext\tstart\tlength\ttype\tconfidence\tcount\tid\n";
        for (const auto &o : orgs.resolved)
            print_entity("org", o.entity, o.authority_id, o.count);
        for (const auto &o : orgs.unresolved)
            print_entity("org?", o.entity, "n/a", o.count);
        for (const auto &l : places.resolved) {
            print_entity("loc", l.entity,
                         states.alpha(l.state_code) + ":" +
                             std::to_string(l.place_id),
                         l.count);
        }
        for (const auto &l : places.unresolved)
            print_entity("loc?", l.entity, "n/a", l.count);
        for (const auto &d : story.value.dates) {
            std::cout << "date\t" << d.value << "\t\t\t"
                      << (d.from_transcript_only ? "transcript" : "spacy")
                      << '\t' << d.confidence << '\t' << d.count << "\tn/a\n";
        }

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
