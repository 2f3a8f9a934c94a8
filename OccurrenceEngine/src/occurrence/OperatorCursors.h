#pragma once

#include "Operators.h"

#include <deque>
#include <memory>
#include <vector>

namespace occurrence {

// A cursor together with its pending value.
class StreamNode {
public:
    explicit StreamNode(std::unique_ptr<Cursor> cursor);

    const std::optional<temporal::Instant>& value() const { return value_; }
    bool done() const { return !value_.has_value(); }
    void pick();
    void skip_to(const temporal::Instant& date, bool reverse);

private:
    std::unique_ptr<Cursor> cursor_;
    std::optional<temporal::Instant> value_;
};

class EmptyCursor : public Cursor {
public:
    std::optional<temporal::Instant> next() override { return std::nullopt; }
    void skip_to(const temporal::Instant&) override {}
};

// Applies `take`; subclasses produce the unbounded sequence.
class OperatorCursor : public Cursor {
public:
    explicit OperatorCursor(const RunArgs& args) : args_(args) {}
    std::optional<temporal::Instant> next() final;

protected:
    virtual std::optional<temporal::Instant> produce() = 0;
    bool reverse() const { return args_.reverse; }
    RunArgs upstream_args() const;

    RunArgs args_;

private:
    size_t emitted_ = 0;
};

class AddCursor : public OperatorCursor {
public:
    AddCursor(const std::vector<Generator>& inputs, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    std::vector<StreamNode> nodes_;
};

class SubtractCursor : public OperatorCursor {
public:
    SubtractCursor(const Generator& base, const std::vector<Generator>& streams, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    bool excluded(const temporal::Instant& v);

    std::unique_ptr<StreamNode> base_;
    std::unique_ptr<StreamNode> excluded_;
    std::vector<temporal::Instant> group_;
};

class IntersectionCursor : public OperatorCursor {
public:
    IntersectionCursor(const std::vector<Generator>& inputs, int max_failed_iterations, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    bool align();

    std::vector<StreamNode> nodes_;
    int max_failed_iterations_;
    std::optional<temporal::Instant> aligned_;
};

class UniqueCursor : public OperatorCursor {
public:
    UniqueCursor(const Generator& base, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    StreamNode base_;
};

class MergeDurationCursor : public OperatorCursor {
public:
    MergeDurationCursor(const Generator& base, int64_t max_duration, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    std::optional<temporal::Instant> produce_forward();
    std::optional<temporal::Instant> produce_reverse();
    std::optional<temporal::Instant> peek() const;
    temporal::Instant take_next();
    [[noreturn]] void fail(const temporal::Instant& first, int64_t length) const;

    StreamNode base_;
    int64_t max_duration_;
    std::deque<temporal::Instant> pending_;
};

class SplitDurationCursor : public OperatorCursor {
public:
    SplitDurationCursor(const Generator& base, int64_t max_duration, SplitFn split, const RunArgs& args);
    void skip_to(const temporal::Instant& date) override;

protected:
    std::optional<temporal::Instant> produce() override;

private:
    void split_into(const temporal::Instant& interval, std::vector<temporal::Instant>& out) const;
    bool releasable(const temporal::Instant& piece) const;
    bool in_bounds(const temporal::Instant& piece) const;

    StreamNode base_;
    int64_t max_duration_;
    int64_t base_max_duration_;
    SplitFn split_;
    // pieces not yet released, in traversal order
    std::vector<temporal::Instant> buffer_;
};

}
