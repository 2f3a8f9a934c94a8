#pragma once

#include "Cursor.h"

#include <memory>
#include <variant>

namespace recurrence { class Rule; }

namespace occurrence {

class Dates;
class OccurrenceStream;

// Anything that yields an ordered occurrence sequence.
using Generator = std::variant<std::shared_ptr<const recurrence::Rule>,
                               std::shared_ptr<const Dates>,
                               std::shared_ptr<const OccurrenceStream>>;

Generator make_generator(recurrence::Rule rule);
Generator make_generator(Dates dates);

std::unique_ptr<Cursor> open_cursor(const Generator& generator, const RunArgs& args);
bool is_infinite(const Generator& generator);
bool has_duration(const Generator& generator);
int64_t max_duration(const Generator& generator);
// "rule", "dates" or "operator"
const char* generator_kind(const Generator& generator);

}
