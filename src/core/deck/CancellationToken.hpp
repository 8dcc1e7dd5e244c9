#pragma once

#include "core/deck/SessionTypes.hpp"
#include <atomic>
#include <memory>

namespace odb {

// Shared cancellation flag. Copies observe the same state; the first
// cancel() wins and fixes the reason.
class CancellationToken {
public:
    CancellationToken()
        : reason_(std::make_shared<std::atomic<CancelReason>>(CancelReason::None))
    {
    }

    /// Returns true only for the call that actually cancelled.
    bool cancel(CancelReason reason)
    {
        if (reason == CancelReason::None)
            return false;
        CancelReason expected = CancelReason::None;
        return reason_->compare_exchange_strong(expected, reason);
    }

    bool isCancelled() const { return reason_->load() != CancelReason::None; }
    CancelReason reason() const { return reason_->load(); }

    bool sharesStateWith(const CancellationToken& other) const { return reason_ == other.reason_; }

private:
    std::shared_ptr<std::atomic<CancelReason>> reason_;
};

} // namespace odb
