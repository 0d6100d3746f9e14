#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace evsim::core {

/// @brief Outcome of pushing an item onto a queue.
///
/// Overflowing a bounded queue is the only recoverable error of the
/// kernel. It is returned rather than thrown so the caller can decide to
/// drop, retry or log.
///
/// @see Queue::push, State::send
/// @ingroup core_queues
enum class PushResult : std::uint8_t {
    Ok,               ///< The item was enqueued.
    CapacityExceeded, ///< The queue was full; the item was dropped.
};

/// @brief Capacity used by queues that were not given a bound.
/// @ingroup core_queues
inline constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

/// @brief Abstract interface of a queue stored in a State.
/// @ingroup core_queues
///
/// Implementations decide the order in which items come out. State
/// only relies on push(), pop() and len(); queue-specific operations are
/// reached through State::queue() / State::queue_mut().
///
/// @tparam T Item type.
/// @see Fifo, PriorityQueue, State::add_queue
template<typename T>
class Queue {
public:
    using value_type = T;

    virtual ~Queue() = default;

    /// @brief Enqueue @p item.
    /// @return PushResult::CapacityExceeded if the queue is full.
    [[nodiscard]] virtual PushResult push(T item) = 0;

    /// @brief Dequeue the next item, or std::nullopt if the queue is empty.
    virtual std::optional<T> pop() = 0;

    /// @brief Number of items currently held.
    [[nodiscard]] virtual std::size_t len() const noexcept = 0;

    [[nodiscard]] virtual bool is_empty() const noexcept { return len() == 0; }

protected:
    Queue() = default;
    Queue(const Queue&) = default;
    Queue& operator=(const Queue&) = default;
    Queue(Queue&&) = default;
    Queue& operator=(Queue&&) = default;
};

/// @brief First-in first-out queue with an optional capacity bound.
/// @ingroup core_queues
///
/// Items are pushed at the back and popped from the front. A
/// default-constructed Fifo is unbounded in practice (its capacity is
/// the largest representable size).
///
/// @code
/// auto fifo = core::Fifo<std::string>::bounded(2);
/// (void)fifo.push("A");
/// (void)fifo.push("B");
/// assert(fifo.push("C") == core::PushResult::CapacityExceeded);
/// @endcode
template<typename T>
class Fifo final : public Queue<T> {
public:
    Fifo() = default;

    /// @brief Create a FIFO holding at most @p capacity items.
    ///
    /// A capacity of zero is accepted: every push then reports
    /// PushResult::CapacityExceeded.
    [[nodiscard]] static Fifo bounded(std::size_t capacity) {
        return Fifo(capacity);
    }

    [[nodiscard]] PushResult push(T item) override {
        if (items_.size() >= capacity_) {
            return PushResult::CapacityExceeded;
        }
        items_.push_back(std::move(item));
        return PushResult::Ok;
    }

    std::optional<T> pop() override {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    [[nodiscard]] std::size_t len() const noexcept override { return items_.size(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// @brief Oldest item, or nullptr if empty.
    [[nodiscard]] const T* front() const noexcept {
        return items_.empty() ? nullptr : &items_.front();
    }

private:
    explicit Fifo(std::size_t capacity) : capacity_(capacity) {}

    std::deque<T> items_;
    std::size_t capacity_{UNBOUNDED};
};

/// @brief Heap-ordered queue returning the greatest item first.
/// @ingroup core_queues
///
/// Ordering follows @p Compare (`std::less<T>` by default, making this a
/// max-queue). The relative order of equal items is unspecified.
///
/// @tparam T       Item type.
/// @tparam Compare Strict weak ordering; the item ranked last is popped first.
template<typename T, typename Compare = std::less<T>>
class PriorityQueue final : public Queue<T> {
public:
    PriorityQueue() = default;

    explicit PriorityQueue(Compare compare)
        : compare_(std::move(compare)) {}

    /// @brief Create a priority queue holding at most @p capacity items (zero rejects every push).
    [[nodiscard]] static PriorityQueue bounded(std::size_t capacity, Compare compare = Compare{}) {
        PriorityQueue queue(std::move(compare));
        queue.capacity_ = capacity;
        return queue;
    }

    [[nodiscard]] PushResult push(T item) override {
        if (heap_.size() >= capacity_) {
            return PushResult::CapacityExceeded;
        }
        heap_.push_back(std::move(item));
        std::push_heap(heap_.begin(), heap_.end(), compare_);
        return PushResult::Ok;
    }

    std::optional<T> pop() override {
        if (heap_.empty()) {
            return std::nullopt;
        }
        std::pop_heap(heap_.begin(), heap_.end(), compare_);
        std::optional<T> item(std::move(heap_.back()));
        heap_.pop_back();
        return item;
    }

    [[nodiscard]] std::size_t len() const noexcept override { return heap_.size(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// @brief Greatest item, or nullptr if empty.
    [[nodiscard]] const T* top() const noexcept {
        return heap_.empty() ? nullptr : &heap_.front();
    }

private:
    std::vector<T> heap_;
    Compare compare_{};
    std::size_t capacity_{UNBOUNDED};
};

} // namespace evsim::core
