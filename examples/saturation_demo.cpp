#include <syllog/syllog.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace syllog;
using namespace syllog::logic;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void section(const char* title) {
    std::cout << "\n";
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
    std::cout << "  " << title << "\n";
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
}

static void print_relations(const std::vector<Relation>& relations) {
    for (std::size_t i = 0; i < relations.size(); ++i)
        std::cout << "    r" << i << "  " << relations[i] << "\n";
}

// ---------------------------------------------------------------------------
// DEMO 1: The three verdicts
// ---------------------------------------------------------------------------

void demo_verdicts() {
    section("DEMO 1: All, Some and No Pigs");

    const std::vector<std::string> inputs = {
        "2\nPIGS have WINGS\nthings with WINGS can FLY\n",
        "1\nthings with HOOVES are PIGS with FLY\n",
        "1\nCATS have CLAWS\n",
    };

    for (const auto& text : inputs) {
        Saturation engine(input::load_relations(text));
        const Verdict verdict = engine.evaluate();

        std::cout << "  Input:\n";
        print_relations(engine.relations());
        std::cout << "  Sweeps:   " << engine.sweeps() << "\n";
        std::cout << "  Verdict:  " << describe(verdict) << "\n\n";
    }
}

// ---------------------------------------------------------------------------
// DEMO 2: Tracing a cascade chain
// ---------------------------------------------------------------------------
// PIGS -> WINGS -> FEATHERS -> FLY takes one cascade per hop.

void demo_trace() {
    section("DEMO 2: Tracing a Cascade Chain");

    Saturation engine(input::load_relations("3\n"
                                            "PIGS have WINGS\n"
                                            "things with WINGS have FEATHERS\n"
                                            "things with FEATHERS can FLY\n"));

    engine.setDebugCallback([&engine](const DebugInfo& info) {
        if (info.event == DebugEvent::CASCADE_APPLIED) {
            std::cout << "  sweep " << info.sweep + 1 << ": r" << info.target << " absorbs r" << info.source
                      << "  =>  " << engine.relations()[info.target] << "\n";
        } else if (info.event == DebugEvent::TERMINAL_REACHED) {
            std::cout << "  terminal reached on r" << info.target << "\n";
        }
    });

    const bool all = engine.run();
    std::cout << "  All pigs can fly: " << (all ? "yes" : "no") << "\n";
}

// ---------------------------------------------------------------------------
// DEMO 3: Parallel sweeps
// ---------------------------------------------------------------------------

void demo_parallel() {
    section("DEMO 3: Parallel Sweeps on a ThreadPool");

    // A long chain: L0 -> L1 -> ... -> L63, then L63 can FLY.
    std::string text = "66\nPIGS have L0\n";
    for (int i = 0; i < 63; ++i)
        text += "things with L" + std::to_string(i) + " have L" + std::to_string(i + 1) + "\n";
    text += "things with L63 can FLY\n";
    text += "COWS have SPOTS\n";

    core::ThreadPool pool(4);
    SaturationConfig config;
    config.pool = &pool;

    Saturation sequential(input::load_relations(text));
    Saturation parallel(input::load_relations(text), config);

    std::cout << "  Sequential: " << describe(sequential.evaluate()) << " after " << sequential.sweeps()
              << " sweeps\n";
    std::cout << "  Parallel:   " << describe(parallel.evaluate()) << " after " << parallel.sweeps()
              << " sweeps\n";
}

// ---------------------------------------------------------------------------
// DEMO 4: Custom query and DOT export
// ---------------------------------------------------------------------------

void demo_dot() {
    section("DEMO 4: Custom Query and DOT Export");

    Saturation engine(input::load_relations("3\n"
                                            "COWS have HOOVES\n"
                                            "things with HOOVES that can GRAZE can MOO\n"
                                            "COWS can GRAZE\n"));

    Query query{"COWS", "MOO"};
    std::cout << "  " << describe(engine.evaluate(query), query) << "\n\n";
    std::cout << visualization::RelationGraphExporter::toDot(engine.relations(), "Cows", query);
}

int main() {
    demo_verdicts();
    demo_trace();
    demo_parallel();
    demo_dot();
    return 0;
}
