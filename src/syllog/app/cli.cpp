#include "syllog/app/cli.hpp"
#include "syllog/core/executor.hpp"
#include "syllog/input/loader.hpp"
#include "syllog/visualization/relation_exporter.hpp"
#include <charconv>
#include <chrono>
#include <iostream>
#include <memory>
#include <string_view>

namespace syllog::app {

    namespace {

        std::optional<std::size_t> parse_size(std::string_view text) {
            std::size_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (text.empty() || ec != std::errc() || end != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        void print_event(std::ostream &os, const std::vector<logic::Relation> &relations,
                         const logic::DebugInfo &info) {
            os << "[sweep " << info.sweep << "] " << logic::to_string(info.event);
            if (info.target != logic::Saturation::npos)
                os << " target=" << info.target << " " << relations[info.target];
            if (info.source != logic::Saturation::npos)
                os << " source=" << info.source;
            if (info.event == logic::DebugEvent::SWEEP_COMPLETED)
                os << (info.changed ? " changed" : " unchanged");
            os << "\n";
        }

    } // namespace

    void usage(std::ostream &os) {
        os << "usage: syllog [options] < statements\n"
           << "\n"
           << "Reads a statement count followed by that many statements from stdin\n"
           << "and prints whether all, some or no SUBJECT can ABILITY.\n"
           << "\n"
           << "  --subject LABEL    query subject (default PIGS)\n"
           << "  --ability LABEL    query ability (default FLY)\n"
           << "  --threads N        run cascade sweeps on N worker threads\n"
           << "  --max-sweeps N     give up after N cascade sweeps (exit status 3)\n"
           << "  --trace            print saturation events on stderr\n"
           << "  --timing           print load and compute times on stderr\n"
           << "  --dot              print the saturated relation graph as DOT\n"
           << "  --help             show this message\n";
    }

    std::optional<Options> parse_options(const std::vector<std::string> &args, std::ostream &err) {
        Options options;
        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string &arg = args[i];

            auto value = [&]() -> const std::string * {
                if (i + 1 >= args.size()) {
                    err << "syllog: " << arg << " requires a value\n";
                    return nullptr;
                }
                return &args[++i];
            };

            if (arg == "--help" || arg == "-h") {
                options.help = true;
            } else if (arg == "--trace") {
                options.trace = true;
            } else if (arg == "--timing") {
                options.timing = true;
            } else if (arg == "--dot") {
                options.dot = true;
            } else if (arg == "--subject" || arg == "--ability") {
                const std::string *label = value();
                if (!label)
                    return std::nullopt;
                if (label->empty()) {
                    err << "syllog: " << arg << " expects a non-empty label\n";
                    return std::nullopt;
                }
                (arg == "--subject" ? options.query.subject : options.query.ability) = *label;
            } else if (arg == "--threads" || arg == "--max-sweeps") {
                const std::string *text = value();
                if (!text)
                    return std::nullopt;
                auto number = parse_size(*text);
                if (!number) {
                    err << "syllog: " << arg << " expects a non-negative integer, got '" << *text << "'\n";
                    return std::nullopt;
                }
                (arg == "--threads" ? options.threads : options.max_sweeps) = *number;
            } else {
                err << "syllog: unknown option '" << arg << "'\n";
                return std::nullopt;
            }
        }
        return options;
    }

    int run(const Options &options, std::istream &in, std::ostream &out, std::ostream &err) {
        const auto start = std::chrono::steady_clock::now();
        auto elapsed = [&start] {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start)
                .count();
        };

        std::vector<logic::Relation> relations;
        try {
            relations = input::load_relations(in);
        } catch (const input::ParseError &e) {
            err << "syllog: " << e.what() << "\n";
            return kExitParseError;
        }

        if (options.timing)
            err << "loaded " << relations.size() << " relations in " << elapsed() << " us\n";

        std::unique_ptr<core::ThreadPool> pool;
        logic::SaturationConfig config;
        config.max_sweeps = options.max_sweeps;
        if (options.threads > 0) {
            pool = std::make_unique<core::ThreadPool>(options.threads);
            config.pool = pool.get();
        }

        logic::Saturation engine(std::move(relations), config);
        if (options.trace) {
            engine.setDebugCallback(
                [&engine, &err](const logic::DebugInfo &info) { print_event(err, engine.relations(), info); });
        }

        const logic::Verdict verdict = engine.evaluate(options.query);

        if (options.timing) {
            err << "saturated in " << engine.sweeps() << " sweeps, " << engine.extensions() << " extensions, "
                << elapsed() << " us total\n";
        }

        // A state cut short by the sweep guard is not a fixpoint; its verdict
        // could still change, so none is printed.
        if (engine.exhausted()) {
            err << "syllog: stopped after " << engine.sweeps() << " sweeps without reaching a fixpoint"
                << " (--max-sweeps)\n";
            return kExitSweepLimit;
        }

        out << logic::describe(verdict, options.query) << std::endl;
        if (options.dot)
            out << visualization::RelationGraphExporter::toDot(engine.relations(), "Relations", options.query);
        return kExitOk;
    }

    int run_cli(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err) {
        auto options = parse_options(args, err);
        if (!options) {
            usage(err);
            return kExitUsage;
        }
        if (options->help) {
            usage(out);
            return kExitOk;
        }
        return run(*options, in, out, err);
    }

} // namespace syllog::app
