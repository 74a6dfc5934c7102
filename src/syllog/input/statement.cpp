#include "syllog/input/statement.hpp"
#include <cctype>
#include <utility>
#include <vector>

namespace syllog::input {

    namespace {

        constexpr std::string_view kUniversalSubject = "things";

        std::string format_message(std::size_t line, const std::string &message) {
            if (line == 0)
                return message;
            return "line " + std::to_string(line) + ": " + message;
        }

        std::vector<std::string_view> tokenize(std::string_view text) {
            std::vector<std::string_view> tokens;
            std::size_t i = 0;
            while (i < text.size()) {
                while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
                    ++i;
                const std::size_t start = i;
                while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])))
                    ++i;
                if (i > start)
                    tokens.push_back(text.substr(start, i - start));
            }
            return tokens;
        }

        std::string quoted(std::string_view word) { return "'" + std::string(word) + "'"; }

        // Reads `label (joiner label)*` starting at pos into labels.
        // A premise group must end on a connector, which is consumed.
        // A conclusion group must end with the statement.
        class GroupReader {
          public:
            GroupReader(const std::vector<std::string_view> &tokens, std::size_t line)
                : tokens_(tokens), line_(line) {}

            void premise(logic::LabelSet &labels) { read(labels, true); }
            void conclusion(logic::LabelSet &labels) { read(labels, false); }

          private:
            void read(logic::LabelSet &labels, bool premise) {
                if (at_end())
                    throw ParseError(line_, premise ? "empty statement" : "missing conclusion after connector");

                bool first = true;
                for (;;) {
                    const std::string_view label = tokens_[pos_++];
                    if (!(premise && first && label == kUniversalSubject))
                        labels.emplace(label);
                    first = false;

                    if (at_end()) {
                        if (premise)
                            throw ParseError(line_, "statement ends before a connector (are, have, can)");
                        return;
                    }

                    const std::string_view word = tokens_[pos_++];
                    if (word == "with" || word == "and") {
                        expect_label(word);
                        continue;
                    }
                    if (word == "that") {
                        if (at_end() || tokens_[pos_] != "can")
                            throw ParseError(line_, "expected 'can' after 'that'");
                        ++pos_;
                        expect_label("that can");
                        continue;
                    }
                    if (is_connector(word)) {
                        if (premise)
                            return;
                        throw ParseError(line_, "unexpected connector " + quoted(word) + " in conclusion");
                    }
                    throw ParseError(line_, "unexpected token " + quoted(word) + ", expected a joiner or connector");
                }
            }

            void expect_label(std::string_view after) const {
                if (at_end())
                    throw ParseError(line_, "statement ends after " + quoted(after));
            }

            bool at_end() const { return pos_ >= tokens_.size(); }

            const std::vector<std::string_view> &tokens_;
            std::size_t line_;
            std::size_t pos_ = 0;
        };

    } // namespace

    ParseError::ParseError(std::size_t line, const std::string &message)
        : std::runtime_error(format_message(line, message)), line_(line) {}

    bool is_connector(std::string_view word) { return word == "are" || word == "have" || word == "can"; }

    logic::Relation parse_statement(std::string_view text, std::size_t line) {
        const auto tokens = tokenize(text);
        GroupReader reader(tokens, line);

        logic::LabelSet from;
        logic::LabelSet to;
        reader.premise(from);
        reader.conclusion(to);
        return logic::Relation(std::move(from), std::move(to));
    }

} // namespace syllog::input
