#include <evsim/core/state.hpp>

namespace evsim::core {

detail::AnyBox& State::queue_box(IdValue id) noexcept {
    auto it = queues_.find(id);
    if (it == queues_.end()) {
        detail::invariant_failure("unknown queue id");
    }
    return it->second;
}

const detail::AnyBox& State::queue_box(IdValue id) const noexcept {
    auto it = queues_.find(id);
    if (it == queues_.end()) {
        detail::invariant_failure("unknown queue id");
    }
    return it->second;
}

} // namespace evsim::core
