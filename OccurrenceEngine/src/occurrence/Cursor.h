#pragma once

#include "../temporal/Instant.h"

#include <cstddef>
#include <optional>
#include <stdexcept>

namespace occurrence {

// Bounds of one traversal. `start` and `end` are inclusive.
struct RunArgs {
    std::optional<temporal::Instant> start;
    std::optional<temporal::Instant> end;
    std::optional<size_t> take;
    bool reverse = false;
};

class ArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Pull side of a single traversal. Each traversal owns its cursor; cursors are
// never shared between traversals.
class Cursor {
public:
    virtual ~Cursor() = default;
    // Next value in traversal order, or nullopt once exhausted.
    virtual std::optional<temporal::Instant> next() = 0;
    // Values strictly before `date` (after it, in reverse) may be dropped
    // without being emitted. A hint: it never reorders emitted values.
    virtual void skip_to(const temporal::Instant& date) = 0;
};

// True when `a` comes strictly before `b` in traversal order.
inline bool precedes(const temporal::Instant& a, const temporal::Instant& b, bool reverse) {
    return reverse ? a.is_after(b) : a.is_before(b);
}

}
