#pragma once

#include "query.hpp"
#include "relation.hpp"
#include "syllog/core/executor.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace syllog::logic {

    // Debug event types
    enum class DebugEvent {
        PREMISES_MERGED,
        CASCADE_APPLIED,
        SWEEP_COMPLETED,
        TERMINAL_REACHED,
        FIXPOINT_REACHED,
        SWEEP_LIMIT_HIT
    };

    const char *to_string(DebugEvent event);

    // Debug information structure
    struct DebugInfo {
        DebugEvent event;
        std::size_t sweep;  // Phase 2 sweeps completed so far (0 during Phase 1)
        std::size_t source; // slot index, or Saturation::npos
        std::size_t target; // slot index, or Saturation::npos
        bool changed;
        std::chrono::steady_clock::time_point timestamp;
    };

    inline constexpr std::size_t kDefaultMaxSweeps = 1'000'000;

    struct SaturationConfig {
        // Non-owning. Phase 2 sweeps run across the pool when set.
        core::ThreadPool *pool = nullptr;
        std::size_t max_sweeps = kDefaultMaxSweeps;
    };

    // -------------------------------------------------------------------------
    // Saturation
    // -------------------------------------------------------------------------
    //
    // Owns the relation collection and grows its conclusion sets in place.
    //
    //   Phase 1 (merge_premises, once):   a.from ⊆ b.from   =>  b.to ∪= a.to
    //   Phase 2 (sweep, to a fixpoint):   b.from ⊆ a.to     =>  a.to ∪= b.to
    //
    // Relations live in one vector and are only mutated by slot index, so a
    // relation is never paired with itself and no slot is written through two
    // views at once.
    //
    // Typical use:
    //   Saturation engine(load_relations(std::cin));
    //   std::cout << describe(engine.evaluate()) << "\n";
    class Saturation {
      public:
        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

        explicit Saturation(std::vector<Relation> relations, SaturationConfig config = {});

        // ---- Phases ---------------------------------------------------------

        // Single pass of the premise-subset rule in collection order.
        // Only the first call has an effect.
        void merge_premises();

        // One full pass of the cascade rule over every ordered pair, after
        // Phase 1 if it has not run yet. Returns true if any conclusion set grew.
        bool sweep();

        // ---- Drivers --------------------------------------------------------

        // Phase 1, then Phase 2 sweeps with the terminal check after each
        // sweep. Stops on the first relation satisfying the query, on a sweep
        // that changes nothing, or when max_sweeps is reached.
        bool run(const Query &query = {}, bool all = true);

        // Phase 1, then Phase 2 to the full fixpoint without early exit.
        void saturate();

        // Saturates once and evaluates the strict, then the loose predicate.
        // Provisional when exhausted() is true afterwards.
        Verdict evaluate(const Query &query = {});

        // Terminal predicate over the current state; no mutation.
        bool holds(const Query &query, bool all) const;

        // ---- Accessors ------------------------------------------------------

        const std::vector<Relation> &relations() const { return relations_; }
        const SaturationConfig &config() const { return config_; }

        std::size_t sweeps() const { return sweeps_; }
        std::size_t extensions() const { return extensions_; }
        bool premises_merged() const { return premises_merged_; }
        bool at_fixpoint() const { return fixpoint_; }
        bool exhausted() const { return exhausted_; }

        // ---- Debugging support ----------------------------------------------

        using DebugCallback = std::function<void(const DebugInfo &)>;
        void setDebugCallback(DebugCallback callback) { debugCallback_ = std::move(callback); }
        void clearDebugCallback() { debugCallback_ = nullptr; }

      private:
        bool sweep_sequential();
        bool sweep_parallel();

        // Runs one sweep and the bookkeeping around it.
        // Returns false without sweeping once max_sweeps is reached.
        bool next_sweep(bool &changed);

        bool check_terminal(const Query &query, bool all);
        std::optional<std::size_t> find_satisfying(const Query &query, bool all) const;
        void notifyDebug(DebugEvent event, std::size_t source = npos, std::size_t target = npos,
                         bool changed = false);

        std::vector<Relation> relations_;
        SaturationConfig config_;

        std::size_t sweeps_ = 0;
        std::size_t extensions_ = 0;
        bool premises_merged_ = false;
        bool fixpoint_ = false;
        bool exhausted_ = false;

        DebugCallback debugCallback_;
    };

} // namespace syllog::logic
