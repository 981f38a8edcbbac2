#include "storyline/pipeline.hpp"
#include "storyline/alignment.hpp"
#include "storyline/log.hpp"

#include <benchmark/benchmark.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static std::string flag_data;
static bool flag_markdown = false;
static bool flag_verbose = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--data="))
            flag_data = arg.substr(7);
        else if (arg == "--markdown")
            flag_markdown = true;
        else if (arg == "--verbose")
            flag_verbose = true;
        else if (arg == "--help") {
            std::cerr
                << "Usage: storyline_bench [options] [benchmark flags]\n\n"
                << "Options:\n"
                << "  --data=DIR    Also benchmark resolution against the "
                   "reference tables in DIR\n"
                << "  --markdown    Output as markdown table\n"
                << "  --verbose     Keep info and warning logs\n"
                << "\nGoogle Benchmark flags (passed through):\n"
                << "  --benchmark_filter=REGEX\n"
                << "  --benchmark_repetitions=N\n"
                << "  --benchmark_format={console|json|csv}\n"
                << std::endl;
            std::exit(1);
        } else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Split "captions/2000/real_time" → ("captions", 2000)
static std::pair<std::string, int> parse_stage_size(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return {name, 0};
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    int size = 0;
    for (char c : arg_str) {
        if (c < '0' || c > '9')
            break;
        size = size * 10 + (c - '0');
    }
    return {name.substr(0, first_slash), size};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Stage | Size | Time (ms) | Items/s |\n";
        std::cout << "|-------|------|-----------|---------|\n";

        for (const auto &r : runs_) {
            if (r.error_occurred)
                continue;

            auto [stage, size] = parse_stage_size(r.benchmark_name());
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double rate = time_ms > 0 ? size / (time_ms / 1000.0) : 0;

            std::cout << "| " << stage << " | " << size << " | " << std::fixed
                      << std::setprecision(3) << time_ms << " | "
                      << std::setprecision(0) << rate << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic inputs ───────────────────────────────────────────────────────

static const char *const WORDS[] = {
    "we",     "moved", "to",  "Chicago", "in",   "1948",
    "and",    "my",    "father", "worked", "for", "the",
    "Pullman", "Company", "until", "he",  "retired",
};

constexpr int WORDS_PER_PARAGRAPH = 40;
constexpr int MS_PER_WORD = 300;

// Interview-like transcript; every 17th word unaligned.
static storyline::AlignmentInput make_alignment(int n_words) {
    storyline::AlignmentInput input;
    constexpr int n_vocab = sizeof(WORDS) / sizeof(WORDS[0]);
    for (int i = 0; i < n_words; ++i) {
        if (i > 0)
            input.transcript += (i % WORDS_PER_PARAGRAPH == 0) ? "\n\n" : " ";
        storyline::RawWord w;
        w.word = WORDS[i % n_vocab];
        w.success = (i % 17) != 5;
        w.start_offset = static_cast<int>(input.transcript.size());
        input.transcript += w.word;
        w.end_offset = static_cast<int>(input.transcript.size());
        if (w.success) {
            w.start = i * MS_PER_WORD / 1000.0;
            w.end = (i * MS_PER_WORD + 250) / 1000.0;
        }
        input.words.push_back(std::move(w));
    }
    return input;
}

static int duration_for(int n_words) { return n_words * MS_PER_WORD + 500; }

// Stanford rows for mentions of the form "Cairo, Illinois".
static std::vector<std::string> make_stanford(int n_mentions,
                                              std::string &transcript) {
    static const char *const PLACES[][2] = {
        {"Cairo", "Illinois"},     {"Selma", "Alabama"},
        {"Tulsa", "Oklahoma"},     {"Gary", "Indiana"},
        {"Macon", "Georgia"},
    };
    std::vector<std::string> lines;
    for (int i = 0; i < n_mentions; ++i) {
        const auto &p = PLACES[i % 5];
        transcript += "I grew up in ";
        transcript += p[0];
        transcript += ", ";
        transcript += p[1];
        transcript += ". ";
        for (const char *w : {"I", "grew", "up", "in"})
            lines.push_back(std::string(w) + "\tO");
        lines.push_back(std::string(p[0]) + "\tLOCATION");
        lines.push_back(",\tO");
        lines.push_back(std::string(p[1]) + "\tLOCATION");
        lines.push_back(".\tO");
    }
    return lines;
}

static std::shared_ptr<const storyline::LocationTables> make_location_tables() {
    auto tables = std::make_shared<storyline::LocationTables>();
    tables->states = storyline::default_us_states();
    tables->places[17]["Cairo"] = 2394247;
    tables->places[1]["Selma"] = 2405443;
    tables->places[40]["Tulsa"] = 2412110;
    tables->places[18]["Gary"] = 2394855;
    tables->places[13]["Macon"] = 2404091;
    return tables;
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static void add_size_args(benchmark::internal::Benchmark *b,
                          const std::vector<int64_t> &sizes) {
    for (auto s : sizes)
        b->Arg(s);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    const std::vector<int64_t> word_counts = {200, 2000, 20000};
    const std::vector<int64_t> mention_counts = {10, 100, 1000};

    add_size_args(
        benchmark::RegisterBenchmark(
            "alignment",
            [](benchmark::State &state) {
                int n = static_cast<int>(state.range(0));
                auto input = make_alignment(n);
                for (auto _ : state) {
                    auto out = storyline::format_alignment(input, duration_for(n));
                    benchmark::DoNotOptimize(out);
                }
                state.SetItemsProcessed(state.iterations() * n);
            }),
        word_counts);

    add_size_args(
        benchmark::RegisterBenchmark(
            "captions",
            [](benchmark::State &state) {
                int n = static_cast<int>(state.range(0));
                auto input = make_alignment(n);
                storyline::Captioner captioner(
                    storyline::make_broadcast_caption_config());
                for (auto _ : state) {
                    auto out = captioner.caption(input, duration_for(n));
                    benchmark::DoNotOptimize(out);
                }
                state.SetItemsProcessed(state.iterations() * n);
            }),
        word_counts);

    add_size_args(
        benchmark::RegisterBenchmark(
            "stanford",
            [](benchmark::State &state) {
                int n = static_cast<int>(state.range(0));
                std::string transcript;
                auto lines = make_stanford(n, transcript);
                for (auto _ : state) {
                    auto out = storyline::polish_stanford(lines, transcript);
                    benchmark::DoNotOptimize(out);
                }
                state.SetItemsProcessed(state.iterations() * n);
            }),
        mention_counts);

    add_size_args(
        benchmark::RegisterBenchmark(
            "locations",
            [](benchmark::State &state) {
                int n = static_cast<int>(state.range(0));
                std::string transcript;
                auto lines = make_stanford(n, transcript);
                auto candidates = storyline::polish_stanford(lines, transcript);
                storyline::LocationResolver resolver(make_location_tables());
                for (auto _ : state) {
                    auto out = resolver.resolve(candidates.value);
                    benchmark::DoNotOptimize(out);
                }
                state.SetItemsProcessed(state.iterations() * n);
            }),
        mention_counts);

    // Real gazetteer and name authority tables
    if (!flag_data.empty()) {
        storyline::ResolverConfig config;
        config.data_dir = flag_data;
        auto resolver = std::make_shared<storyline::EntityResolver>(config);
        add_size_args(
            benchmark::RegisterBenchmark(
                "story",
                [resolver](benchmark::State &state) {
                    int n = static_cast<int>(state.range(0));
                    std::string transcript;
                    auto lines = make_stanford(n, transcript);
                    for (auto _ : state) {
                        auto out = resolver->resolve_story(lines, transcript);
                        benchmark::DoNotOptimize(out);
                    }
                    state.SetItemsProcessed(state.iterations() * n);
                }),
            mention_counts);
    }
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    if (!flag_verbose)
        storyline::set_log_level(storyline::LogLevel::Error);

    benchmark::Initialize(&argc, argv);
    try {
        register_benchmarks();
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
