#include "Rule.h"
#include "Pipeline.h"
#include "../config/Config.h"

#include <algorithm>
#include <vector>

namespace recurrence {

using occurrence::RunArgs;
using temporal::Instant;

static std::optional<Instant> earliest(const std::optional<Instant>& a, const std::optional<Instant>& b) {
    if (!a) return b;
    if (!b) return a;
    return b->is_before(*a) ? b : a;
}

static std::optional<Instant> latest(const std::optional<Instant>& a, const std::optional<Instant>& b) {
    if (!a) return b;
    if (!b) return a;
    return b->is_after(*a) ? b : a;
}

namespace {

class RuleCursor : public occurrence::Cursor {
public:
    RuleCursor(std::shared_ptr<const NormalizedRuleOptions> options, const RunArgs& args, int max_iterations)
        : options_(options), args_(args),
          pipeline_(options, args.reverse ? Direction::Reverse : Direction::Forward, max_iterations) {
        const auto& o = *options_;
        if (o.count && args.reverse) {
            // count is measured from the rule start: walk forward and replay backwards
            RunArgs forward_args;
            forward_args.end = args.end;
            RuleCursor forward(options_, forward_args, max_iterations);
            std::vector<Instant> values;
            while (auto v = forward.next()) {
                if (!args.start || v->is_after_or_equal(*args.start)) values.push_back(*v);
            }
            std::reverse(values.begin(), values.end());
            buffer_ = std::move(values);
            return;
        }
        if (o.count) {
            candidate_ = o.start;
            skip_until_ = args.start;
            limit_ = args.end;
        } else if (!args.reverse) {
            candidate_ = latest(o.start, args.start);
            limit_ = earliest(o.end, args.end);
        } else {
            candidate_ = earliest(o.end, args.end);
            if (!candidate_) throw occurrence::ArgumentError("reverse traversal of an infinite rule requires an end date");
            limit_ = latest(o.start, args.start);
        }
    }

    std::optional<Instant> next() override {
        if (args_.take && emitted_ >= *args_.take) return std::nullopt;
        if (buffer_) {
            if (index_ >= buffer_->size()) return std::nullopt;
            ++emitted_;
            return (*buffer_)[index_++];
        }
        while (candidate_) {
            auto found = pipeline_.resolve(*candidate_, limit_);
            if (!found) {
                candidate_.reset();
                return std::nullopt;
            }
            ++produced_;
            if (options_->count && produced_ >= *options_->count) candidate_.reset();
            else candidate_ = pipeline_.advance(*found);

            if (skip_until_ && found->is_before(*skip_until_)) continue;
            ++emitted_;
            return found->with_duration(options_->duration);
        }
        return std::nullopt;
    }

    void skip_to(const Instant& date) override {
        if (buffer_) {
            while (index_ < buffer_->size() && (*buffer_)[index_].is_after(date)) ++index_;
            return;
        }
        if (options_->count) {
            if (!skip_until_ || skip_until_->is_before(date)) skip_until_ = date;
            return;
        }
        if (candidate_ && occurrence::precedes(*candidate_, date, args_.reverse)) candidate_ = date;
    }

private:
    std::shared_ptr<const NormalizedRuleOptions> options_;
    RunArgs args_;
    Pipeline pipeline_;
    std::optional<Instant> candidate_;
    std::optional<Instant> limit_;
    // values before this are counted toward `count` but not emitted
    std::optional<Instant> skip_until_;
    std::optional<std::vector<Instant>> buffer_;
    size_t index_ = 0;
    size_t emitted_ = 0;
    int produced_ = 0;
};

}

Rule::Rule(RuleOptions options)
    : options_(std::move(options)),
      normalized_(std::make_shared<const NormalizedRuleOptions>(normalize_rule_options(options_))) {}

Rule Rule::update(const std::function<void(RuleOptions&)>& edit) const {
    RuleOptions next = options_;
    edit(next);
    return Rule(std::move(next));
}

std::unique_ptr<occurrence::Cursor> Rule::open(const RunArgs& args) const {
    return std::make_unique<RuleCursor>(normalized_, args, config::current().max_pipeline_iterations);
}

}
