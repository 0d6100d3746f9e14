#pragma once

#include <evsim/core/any_box.hpp>
#include <evsim/core/ids.hpp>
#include <evsim/core/queue.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace evsim::core {

/// @brief Shared simulation state: a heterogeneous value store plus queues.
/// @ingroup core_state
///
/// Values of arbitrary types are inserted with insert(), which returns a
/// typed Key used for every later access. Queues of any type deriving
/// from Queue are registered with add_queue(), which returns a typed
/// QueueId.
///
/// Both maps erase the static type of what they hold. Lookups go
/// through a typed handle, and the handle can only be produced by
/// inserting a value of exactly that type, so the downcast back cannot
/// fail in a correct program. If it does (e.g. a handle from another
/// State), the process aborts.
///
/// Value keys come from the process-wide id counter; queue ids from a
/// counter local to this State. Values may be removed; queues may not.
///
/// @code
/// core::State state;
/// auto key = state.insert(7);
/// auto queue = state.add_queue(core::Fifo<int>{});
/// (void)state.send(queue, *state.get(key));
/// @endcode
///
/// @see Key, QueueId, Queue
class State {
public:
    State() = default;

    State(const State&) = delete;
    State& operator=(const State&) = delete;
    State(State&&) = default;
    State& operator=(State&&) = default;

    // ------------------------------------------------------------------------
    // Value store
    // ------------------------------------------------------------------------

    /// @brief Store @p value and return the key that gives access to it.
    ///
    /// Discarding the key makes the value unreachable.
    template<typename V>
    [[nodiscard]] Key<std::decay_t<V>> insert(V&& value) {
        const IdValue id = next_global_id();
        values_.emplace(id, detail::AnyBox(std::forward<V>(value)));
        return Key<std::decay_t<V>>(id);
    }

    /// @brief Remove the value behind @p key and hand it back.
    /// @return The value, or std::nullopt if it was already removed.
    template<typename V>
    std::optional<V> remove(Key<V> key) {
        auto it = values_.find(key.id_);
        if (it == values_.end()) {
            return std::nullopt;
        }
        std::optional<V> value(std::move(it->second.template checked<V>("value key type mismatch")));
        values_.erase(it);
        return value;
    }

    /// @brief Read access to a stored value.
    /// @return Pointer to the value, or nullptr if it was removed.
    template<typename V>
    [[nodiscard]] const V* get(Key<V> key) const noexcept {
        auto it = values_.find(key.id_);
        if (it == values_.end()) {
            return nullptr;
        }
        return &it->second.template checked<V>("value key type mismatch");
    }

    /// @brief Write access to a stored value.
    /// @return Pointer to the value, or nullptr if it was removed.
    template<typename V>
    [[nodiscard]] V* get_mut(Key<V> key) noexcept {
        auto it = values_.find(key.id_);
        if (it == values_.end()) {
            return nullptr;
        }
        return &it->second.template checked<V>("value key type mismatch");
    }

    template<typename V>
    [[nodiscard]] bool contains(Key<V> key) const noexcept {
        return values_.contains(key.id_);
    }

    /// @brief Number of values currently stored.
    [[nodiscard]] std::size_t value_count() const noexcept { return values_.size(); }

    // ------------------------------------------------------------------------
    // Queues
    // ------------------------------------------------------------------------

    /// @brief Register @p queue and return its typed identifier.
    /// @tparam Q A concrete queue type deriving from Queue<Q::value_type>.
    template<typename Q>
    [[nodiscard]] QueueId<Q> add_queue(Q queue) {
        static_assert(std::is_base_of_v<Queue<typename Q::value_type>, Q>,
                      "queues must derive from evsim::core::Queue<T>");
        const IdValue id = next_queue_id_++;
        queues_.emplace(id, detail::AnyBox(std::move(queue)));
        return QueueId<Q>(id);
    }

    /// @brief Push @p item onto the queue.
    /// @return PushResult::CapacityExceeded if the queue is bounded and full.
    template<typename Q>
    [[nodiscard]] PushResult send(QueueId<Q> queue_id, typename Q::value_type item) {
        return queue_mut(queue_id).push(std::move(item));
    }

    /// @brief Pop the next item from the queue.
    /// @return The item, or std::nullopt if the queue is empty.
    template<typename Q>
    std::optional<typename Q::value_type> recv(QueueId<Q> queue_id) {
        return queue_mut(queue_id).pop();
    }

    /// @brief Number of items in the queue.
    template<typename Q>
    [[nodiscard]] std::size_t len(QueueId<Q> queue_id) const noexcept {
        return queue(queue_id).len();
    }

    template<typename Q>
    [[nodiscard]] bool is_empty(QueueId<Q> queue_id) const noexcept {
        return queue(queue_id).is_empty();
    }

    /// @brief Typed access to the underlying queue.
    template<typename Q>
    [[nodiscard]] const Q& queue(QueueId<Q> queue_id) const noexcept {
        return queue_box(queue_id.id_).template checked<Q>("queue id type mismatch");
    }

    /// @brief Typed mutable access to the underlying queue.
    template<typename Q>
    [[nodiscard]] Q& queue_mut(QueueId<Q> queue_id) noexcept {
        return queue_box(queue_id.id_).template checked<Q>("queue id type mismatch");
    }

    /// @brief Number of registered queues.
    [[nodiscard]] std::size_t queue_count() const noexcept { return queues_.size(); }

private:
    // Queues are never removed, so an unknown id is fatal.
    [[nodiscard]] detail::AnyBox& queue_box(IdValue id) noexcept;
    [[nodiscard]] const detail::AnyBox& queue_box(IdValue id) const noexcept;

    std::unordered_map<IdValue, detail::AnyBox> values_;
    std::unordered_map<IdValue, detail::AnyBox> queues_;
    IdValue next_queue_id_{0};
};

} // namespace evsim::core
