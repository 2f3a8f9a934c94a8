#pragma once

#include "RuleOptions.h"
#include "../occurrence/Cursor.h"

#include <functional>
#include <memory>

namespace recurrence {

// A validated recurrence rule. Immutable: update() returns a new rule.
class Rule {
public:
    explicit Rule(RuleOptions options);

    const RuleOptions& options() const { return options_; }
    const NormalizedRuleOptions& normalized() const { return *normalized_; }

    Rule update(const std::function<void(RuleOptions&)>& edit) const;

    bool is_infinite() const { return !normalized_->end && !normalized_->count; }
    bool has_duration() const { return normalized_->duration > 0; }
    int64_t max_duration() const { return normalized_->duration; }
    const temporal::TimezoneLabel& timezone() const { return normalized_->start.timezone(); }

    std::unique_ptr<occurrence::Cursor> open(const occurrence::RunArgs& args) const;

private:
    RuleOptions options_;
    std::shared_ptr<const NormalizedRuleOptions> normalized_;
};

}
