#include "syllog/logic/saturation.hpp"

namespace syllog::logic {

    const char *to_string(DebugEvent event) {
        switch (event) {
        case DebugEvent::PREMISES_MERGED:
            return "premises-merged";
        case DebugEvent::CASCADE_APPLIED:
            return "cascade-applied";
        case DebugEvent::SWEEP_COMPLETED:
            return "sweep-completed";
        case DebugEvent::TERMINAL_REACHED:
            return "terminal-reached";
        case DebugEvent::FIXPOINT_REACHED:
            return "fixpoint-reached";
        case DebugEvent::SWEEP_LIMIT_HIT:
            return "sweep-limit-hit";
        }
        return "unknown";
    }

    Saturation::Saturation(std::vector<Relation> relations, SaturationConfig config)
        : relations_(std::move(relations)), config_(config) {}

    void Saturation::merge_premises() {
        if (premises_merged_)
            return;
        premises_merged_ = true;

        const std::size_t n = relations_.size();
        for (std::size_t a = 0; a < n; ++a) {
            for (std::size_t b = 0; b < n; ++b) {
                if (a == b)
                    continue;
                if (relations_[a].matches(relations_[b]) && relations_[b].extend(relations_[a])) {
                    ++extensions_;
                    fixpoint_ = false;
                    notifyDebug(DebugEvent::PREMISES_MERGED, a, b, true);
                }
            }
        }
    }

    bool Saturation::sweep() {
        merge_premises();

        const bool changed = config_.pool != nullptr ? sweep_parallel() : sweep_sequential();
        ++sweeps_;
        notifyDebug(DebugEvent::SWEEP_COMPLETED, npos, npos, changed);
        if (!changed) {
            fixpoint_ = true;
            notifyDebug(DebugEvent::FIXPOINT_REACHED);
        }
        return changed;
    }

    bool Saturation::sweep_sequential() {
        bool changed = false;
        const std::size_t n = relations_.size();
        for (std::size_t a = 0; a < n; ++a) {
            for (std::size_t b = 0; b < n; ++b) {
                if (a == b)
                    continue;
                if (relations_[a].cascades(relations_[b]) && relations_[a].extend(relations_[b])) {
                    ++extensions_;
                    changed = true;
                    notifyDebug(DebugEvent::CASCADE_APPLIED, b, a, true);
                }
            }
        }
        return changed;
    }

    // Each task owns one target slot and reads the state as of the start of
    // the sweep; additions are applied once every task has finished.
    bool Saturation::sweep_parallel() {
        const std::size_t n = relations_.size();
        std::vector<LabelSet> pending(n);

        config_.pool->bulk(
            [&](std::size_t a) {
                const Relation &target = relations_[a];
                for (std::size_t b = 0; b < n; ++b) {
                    if (a == b)
                        continue;
                    if (target.cascades(relations_[b]))
                        pending[a].insert(relations_[b].to().begin(), relations_[b].to().end());
                }
            },
            n);

        bool changed = false;
        for (std::size_t a = 0; a < n; ++a) {
            if (relations_[a].extend(pending[a])) {
                ++extensions_;
                changed = true;
                notifyDebug(DebugEvent::CASCADE_APPLIED, npos, a, true);
            }
        }
        return changed;
    }

    bool Saturation::next_sweep(bool &changed) {
        if (sweeps_ >= config_.max_sweeps) {
            exhausted_ = true;
            notifyDebug(DebugEvent::SWEEP_LIMIT_HIT);
            return false;
        }
        changed = sweep();
        return true;
    }

    bool Saturation::run(const Query &query, bool all) {
        merge_premises();

        // Already saturated by an earlier call: another sweep cannot change anything.
        if (fixpoint_)
            return check_terminal(query, all);

        bool changed = true;
        while (changed) {
            if (!next_sweep(changed))
                return false;
            if (check_terminal(query, all))
                return true;
        }
        return false;
    }

    bool Saturation::check_terminal(const Query &query, bool all) {
        auto hit = find_satisfying(query, all);
        if (!hit)
            return false;
        notifyDebug(DebugEvent::TERMINAL_REACHED, npos, *hit);
        return true;
    }

    void Saturation::saturate() {
        merge_premises();

        bool changed = !fixpoint_;
        while (changed) {
            if (!next_sweep(changed))
                return;
        }
    }

    Verdict Saturation::evaluate(const Query &query) {
        saturate();
        if (holds(query, true))
            return Verdict::All;
        if (holds(query, false))
            return Verdict::Some;
        return Verdict::None;
    }

    bool Saturation::holds(const Query &query, bool all) const { return find_satisfying(query, all).has_value(); }

    std::optional<std::size_t> Saturation::find_satisfying(const Query &query, bool all) const {
        for (std::size_t i = 0; i < relations_.size(); ++i) {
            if (relations_[i].satisfies(query, all))
                return i;
        }
        return std::nullopt;
    }

    void Saturation::notifyDebug(DebugEvent event, std::size_t source, std::size_t target, bool changed) {
        if (!debugCallback_)
            return;
        debugCallback_(DebugInfo{event, sweeps_, source, target, changed, std::chrono::steady_clock::now()});
    }

} // namespace syllog::logic
