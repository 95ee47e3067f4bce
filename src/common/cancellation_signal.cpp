#include "common/cancellation_signal.hpp"

void CancellationSignal::set() {
    {
        std::lock_guard lg(mtx_);
        set_ = true;
    }
    cv_.notify_all();
}

bool CancellationSignal::isSet() const {
    std::lock_guard lg(mtx_);
    return set_;
}

bool CancellationSignal::waitFor(Duration timeout) {
    std::unique_lock lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return set_; });
}
