#include "Generator.h"
#include "Dates.h"
#include "Operators.h"
#include "../recurrence/Rule.h"

#include <type_traits>

namespace occurrence {

Generator make_generator(recurrence::Rule rule) {
    return std::make_shared<const recurrence::Rule>(std::move(rule));
}

Generator make_generator(Dates dates) {
    return std::make_shared<const Dates>(std::move(dates));
}

std::unique_ptr<Cursor> open_cursor(const Generator& generator, const RunArgs& args) {
    return std::visit([&](const auto& g) { return g->open(args); }, generator);
}

bool is_infinite(const Generator& generator) {
    return std::visit([](const auto& g) { return g->is_infinite(); }, generator);
}

bool has_duration(const Generator& generator) {
    return std::visit([](const auto& g) { return g->has_duration(); }, generator);
}

int64_t max_duration(const Generator& generator) {
    return std::visit([](const auto& g) { return g->max_duration(); }, generator);
}

const char* generator_kind(const Generator& generator) {
    return std::visit([](const auto& g) -> const char* {
        using T = std::decay_t<decltype(*g)>;
        if constexpr (std::is_same_v<T, recurrence::Rule>) return "rule";
        else if constexpr (std::is_same_v<T, Dates>) return "dates";
        else return "operator";
    }, generator);
}

}
