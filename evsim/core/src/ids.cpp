#include <evsim/core/ids.hpp>

#include <atomic>

namespace evsim::core {

namespace {

std::atomic<IdValue> global_id_counter{0};

} // anonymous namespace

IdValue next_global_id() noexcept {
    return global_id_counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace evsim::core
