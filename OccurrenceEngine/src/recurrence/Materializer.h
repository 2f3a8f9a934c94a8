#pragma once

#include "../occurrence/Generator.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace recurrence {

// (start, end) as ISO strings; end is set only for occurrences with a duration.
using MaterializedOccurrence = std::pair<std::string, std::optional<std::string>>;

// Occurrences starting in [window_from, window_to).
std::vector<MaterializedOccurrence> materialize_occurrences(const occurrence::Generator& generator,
                                                            const temporal::Instant& window_from,
                                                            const temporal::Instant& window_to);

// Same, with ISO window bounds. An unparsable bound yields no occurrences.
std::vector<MaterializedOccurrence> materialize_occurrences(const occurrence::Generator& generator,
                                                            const std::string& window_from_iso,
                                                            const std::string& window_to_iso);

}
