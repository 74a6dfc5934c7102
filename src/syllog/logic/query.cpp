#include "syllog/logic/query.hpp"
#include <algorithm>
#include <cctype>

namespace syllog::logic {

    namespace {

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

    } // namespace

    std::string describe(Verdict verdict, const Query &query) {
        const std::string tail = lowercase(query.subject) + " can " + lowercase(query.ability);
        switch (verdict) {
        case Verdict::All:
            return "All " + tail;
        case Verdict::Some:
            return "Some " + tail;
        case Verdict::None:
            break;
        }
        return "No " + tail;
    }

    const char *to_string(Verdict verdict) {
        switch (verdict) {
        case Verdict::All:
            return "all";
        case Verdict::Some:
            return "some";
        case Verdict::None:
            break;
        }
        return "none";
    }

} // namespace syllog::logic
