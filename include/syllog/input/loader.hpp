#pragma once

#include "statement.hpp"
#include "syllog/logic/relation.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace syllog::input {

    // Reads a positive statement count on the first line, then exactly that
    // many statements, one per line. Throws ParseError on any malformed line;
    // nothing is returned for partially valid input.
    std::vector<logic::Relation> load_relations(std::istream &in);

    std::vector<logic::Relation> load_relations(const std::string &text);

} // namespace syllog::input
