#include "Materializer.h"
#include "../occurrence/Iterators.h"
#include "../observability/Logging.h"

namespace recurrence {

using temporal::Instant;

std::vector<MaterializedOccurrence> materialize_occurrences(const occurrence::Generator& generator,
                                                            const Instant& window_from,
                                                            const Instant& window_to) {
    std::vector<MaterializedOccurrence> out;
    if (!window_from.is_before(window_to)) return out;

    occurrence::RunArgs args;
    args.start = window_from;
    args.end = window_to;
    auto it = occurrence::occurrences(generator, args);
    while (auto v = it.next()) {
        if (v->is_equal(window_to)) break;
        auto end = v->end();
        out.emplace_back(v->to_iso_string(), end ? std::optional<std::string>(end->to_iso_string()) : std::nullopt);
    }
    return out;
}

std::vector<MaterializedOccurrence> materialize_occurrences(const occurrence::Generator& generator,
                                                            const std::string& window_from_iso,
                                                            const std::string& window_to_iso) {
    auto from = Instant::parse_iso(window_from_iso);
    auto to = Instant::parse_iso(window_to_iso);
    if (!from || !to) {
        observability::log_warn("materialize.invalid_window", {{"from", window_from_iso}, {"to", window_to_iso}});
        return {};
    }
    return materialize_occurrences(generator, *from, *to);
}

}
