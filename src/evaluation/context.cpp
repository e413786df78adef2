#include "evaluation/context.h"

#include <algorithm>

#include "common/error.h"

namespace evalkit::eval {

EvalContext::EvalContext(std::shared_ptr<const EvalContext> parent,
                         std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent)), deadline_(deadline) {}

std::shared_ptr<const EvalContext> EvalContext::Background() {
    static const std::shared_ptr<const EvalContext> background =
        std::make_shared<const EvalContext>();
    return background;
}

std::shared_ptr<EvalContext> EvalContext::WithCancel(
    std::shared_ptr<const EvalContext> parent) {
    return std::shared_ptr<EvalContext>(
        new EvalContext(std::move(parent), std::nullopt));
}

std::shared_ptr<EvalContext> EvalContext::WithDeadline(
    std::shared_ptr<const EvalContext> parent,
    Clock::time_point deadline) {
    return std::shared_ptr<EvalContext>(
        new EvalContext(std::move(parent), deadline));
}

bool EvalContext::Done() const {
    if (cancelled_.load(std::memory_order_acquire)) {
        return true;
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        return true;
    }
    return parent_ != nullptr && parent_->Done();
}

absl::Status EvalContext::Err() const {
    if (cancelled_.load(std::memory_order_acquire)) {
        return CancelledError("context canceled");
    }
    if (parent_ != nullptr) {
        absl::Status parent_status = parent_->Err();
        if (!parent_status.ok()) {
            return parent_status;
        }
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        return absl::DeadlineExceededError("context deadline exceeded");
    }
    return absl::OkStatus();
}

void EvalContext::Cancel() {
    cancelled_.store(true, std::memory_order_release);
}

std::optional<EvalContext::Clock::time_point> EvalContext::Deadline() const {
    std::optional<Clock::time_point> parent_deadline;
    if (parent_ != nullptr) {
        parent_deadline = parent_->Deadline();
    }
    if (!deadline_.has_value()) {
        return parent_deadline;
    }
    if (!parent_deadline.has_value()) {
        return deadline_;
    }
    return std::min(*deadline_, *parent_deadline);
}

}  // namespace evalkit::eval
