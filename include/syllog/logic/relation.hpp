#pragma once

#include "query.hpp"
#include <iosfwd>
#include <set>
#include <string>
#include <utility>

namespace syllog::logic {

    using LabelSet = std::set<Label>;

    // -------------------------------------------------------------------------
    // Relation
    // -------------------------------------------------------------------------

    // "Objects with every label in from() also have every label in to()".
    //
    // from() is frozen at construction. to() only ever grows: extend() is the
    // single mutator and it never removes a label. Relations are identified by
    // address, so a relation never matches, cascades into or extends itself.
    class Relation {
      public:
        Relation() = default;
        Relation(LabelSet from, LabelSet to) : from_(std::move(from)), to_(std::move(to)) {}

        const LabelSet &from() const { return from_; }
        const LabelSet &to() const { return to_; }

        // from() ⊆ other.from(). Seeds other with this relation's conclusions.
        bool matches(const Relation &other) const;

        // other.from() ⊆ to(). Our conclusions satisfy other's premise.
        bool cascades(const Relation &other) const;

        // Union source.to() into to(). Returns true iff to() grew.
        bool extend(const Relation &source);
        bool extend(const LabelSet &labels);

        // Terminal predicate.
        //   - from() contains the subject and to() contains the ability, or
        //   - !all and to() contains both the subject and the ability.
        bool satisfies(const Query &query, bool all) const;

      private:
        LabelSet from_;
        LabelSet to_;
    };

    // satisfies() against the default PIGS / FLY query.
    bool can_fly(const Relation &relation, bool all);

    // "{A, B}" with labels in set order.
    std::string to_string(const LabelSet &labels);

    // "{A, B} -> {C}"
    std::string to_string(const Relation &relation);

    std::ostream &operator<<(std::ostream &os, const Relation &relation);

} // namespace syllog::logic
