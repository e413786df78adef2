#pragma once

/// @file context.h
/// @brief Cooperative cancellation context for evaluation runs

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include <absl/status/status.h>

namespace evalkit::eval {

/// @brief Cancellation signal observed between metric invocations
///
/// A default-constructed context is a root that only ends when Cancel() is
/// called. Derived contexts also end when their parent ends or when their
/// deadline passes. Done() never blocks; nothing in evalkit waits on a
/// context.
///
/// Example:
/// @code
///   auto ctx = EvalContext::WithCancel(EvalContext::Background());
///   std::thread stopper([ctx] { ctx->Cancel(); });
///   auto results = engine.EvaluateMany(*ctx, inputs);
/// @endcode
class EvalContext {
public:
    using Clock = std::chrono::steady_clock;

    EvalContext() = default;

    EvalContext(const EvalContext&) = delete;
    EvalContext& operator=(const EvalContext&) = delete;

    /// @brief Shared root context that is never cancelled
    static std::shared_ptr<const EvalContext> Background();

    /// @brief Child context cancelled by Cancel() or by its parent
    static std::shared_ptr<EvalContext> WithCancel(
        std::shared_ptr<const EvalContext> parent);

    /// @brief Child context that additionally ends at a deadline
    static std::shared_ptr<EvalContext> WithDeadline(
        std::shared_ptr<const EvalContext> parent,
        Clock::time_point deadline);

    /// @brief True once cancelled, past the deadline, or the parent is done
    bool Done() const;

    /// @brief OK while live; CancelledError or DeadlineExceededError once done
    absl::Status Err() const;

    /// @brief Cancel this context and every context derived from it
    void Cancel();

    /// @brief Earliest deadline of this context and its ancestors
    std::optional<Clock::time_point> Deadline() const;

private:
    EvalContext(std::shared_ptr<const EvalContext> parent,
                std::optional<Clock::time_point> deadline);

    std::shared_ptr<const EvalContext> parent_;
    std::optional<Clock::time_point> deadline_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace evalkit::eval
