#include "syllog/logic/relation.hpp"
#include <algorithm>
#include <ostream>
#include <sstream>

namespace syllog::logic {

    bool Relation::matches(const Relation &other) const {
        return std::includes(other.from_.begin(), other.from_.end(), from_.begin(), from_.end());
    }

    bool Relation::cascades(const Relation &other) const {
        return std::includes(to_.begin(), to_.end(), other.from_.begin(), other.from_.end());
    }

    bool Relation::extend(const Relation &source) {
        if (&source == this)
            return false;
        return extend(source.to_);
    }

    bool Relation::extend(const LabelSet &labels) {
        const auto before = to_.size();
        to_.insert(labels.begin(), labels.end());
        return to_.size() > before;
    }

    bool Relation::satisfies(const Query &query, bool all) const {
        const bool concludes_ability = to_.contains(query.ability);

        if (from_.contains(query.subject) && concludes_ability)
            return true;

        return !all && concludes_ability && to_.contains(query.subject);
    }

    bool can_fly(const Relation &relation, bool all) { return relation.satisfies(Query{}, all); }

    std::string to_string(const LabelSet &labels) {
        std::ostringstream oss;
        oss << '{';
        bool first = true;
        for (const auto &label : labels) {
            if (!first)
                oss << ", ";
            oss << label;
            first = false;
        }
        oss << '}';
        return oss.str();
    }

    std::string to_string(const Relation &relation) {
        return to_string(relation.from()) + " -> " + to_string(relation.to());
    }

    std::ostream &operator<<(std::ostream &os, const Relation &relation) { return os << to_string(relation); }

} // namespace syllog::logic
