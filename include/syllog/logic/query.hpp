#pragma once

#include <string>

namespace syllog::logic {

    using Label = std::string;

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    // The label pair tested by the terminal predicate: "can <subject> <ability>?"
    // The default query is the classic PIGS / FLY question.
    struct Query {
        Label subject = "PIGS";
        Label ability = "FLY";
    };

    enum class Verdict { All, Some, None };

    // Human-readable verdict line, e.g. "All pigs can fly".
    std::string describe(Verdict verdict, const Query &query = {});

    const char *to_string(Verdict verdict);

} // namespace syllog::logic
