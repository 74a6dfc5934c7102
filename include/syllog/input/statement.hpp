#pragma once

#include "syllog/logic/relation.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace syllog::input {

    // Malformed count line or statement. line() is 1-based, 0 when the text
    // was parsed without line context.
    class ParseError : public std::runtime_error {
      public:
        ParseError(std::size_t line, const std::string &message);

        std::size_t line() const { return line_; }

      private:
        std::size_t line_;
    };

    // Statement grammar (whitespace separated tokens):
    //
    //   statement := group connector group
    //   group     := label (joiner label)*
    //   joiner    := "with" | "and" | "that" "can"
    //   connector := "are" | "have" | "can"
    //
    // A leading "things" in the premise is the universal object class and
    // adds no label: "things with WINGS can FLY" is {WINGS} -> {FLY}.
    logic::Relation parse_statement(std::string_view text, std::size_t line = 0);

    // "are", "have" or "can": the word that ends a premise.
    bool is_connector(std::string_view word);

} // namespace syllog::input
