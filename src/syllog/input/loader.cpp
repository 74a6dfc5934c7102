#include "syllog/input/loader.hpp"
#include <charconv>
#include <istream>
#include <sstream>
#include <string_view>

namespace syllog::input {

    namespace {

        std::string_view trim(std::string_view text) {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }

        std::size_t parse_count(const std::string &line) {
            const std::string_view text = trim(line);
            if (text.empty())
                throw ParseError(1, "missing statement count");

            std::size_t count = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
            if (ec != std::errc() || end != text.data() + text.size())
                throw ParseError(1, "invalid statement count '" + std::string(text) + "'");
            if (count == 0)
                throw ParseError(1, "statement count must be positive");
            return count;
        }

    } // namespace

    std::vector<logic::Relation> load_relations(std::istream &in) {
        std::string line;
        if (!std::getline(in, line))
            throw ParseError(1, "missing statement count");

        const std::size_t count = parse_count(line);

        std::vector<logic::Relation> relations;
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t lineno = i + 2;
            if (!std::getline(in, line))
                throw ParseError(lineno, "expected " + std::to_string(count) + " statements, found " +
                                             std::to_string(i));
            relations.push_back(parse_statement(line, lineno));
        }
        return relations;
    }

    std::vector<logic::Relation> load_relations(const std::string &text) {
        std::istringstream in(text);
        return load_relations(in);
    }

} // namespace syllog::input
