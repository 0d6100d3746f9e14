#pragma once

/// @file producer_consumer_model.hpp
/// @brief Producer/consumer model driven by the evsim kernel.
///
/// A producer emits a fixed number of products at a constant interval into
/// a FIFO queue and notifies a consumer, which processes one product at a
/// time. Overflowing a bounded queue drops the product.

#include <evsim/core/simulation.hpp>
#include <evsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace evsim::demo {

struct Product {
    uint64_t serial;
};

struct Produce {};

enum class ConsumerEvent : uint8_t {
    Received,
    Finished,
};

struct Counters {
    uint64_t produced{0};
    uint64_t consumed{0};
    uint64_t dropped{0};
};

class Consumer final : public core::Component<ConsumerEvent> {
public:
    Consumer(core::QueueId<core::Fifo<Product>> incoming,
             core::Key<std::optional<Product>> working_on,
             core::Key<Counters> counters, core::Duration consume_time, std::ostream* log)
        : incoming_(incoming)
        , working_on_(working_on)
        , counters_(counters)
        , consume_time_(consume_time)
        , log_(log) {}

    void process_event(core::ComponentId<ConsumerEvent> self_id, const ConsumerEvent& event,
                       core::Scheduler& scheduler, core::State& state) const override {
        std::optional<Product>& current = *state.get_mut(working_on_);

        switch (event) {
        case ConsumerEvent::Received:
            // A busy consumer checks the queue again when it finishes
            if (!current) {
                current = state.recv(incoming_);
                if (current) {
                    scheduler.schedule(consume_time_, self_id, ConsumerEvent::Finished);
                }
            }
            break;

        case ConsumerEvent::Finished:
            if (current) {
                if (log_ != nullptr) {
                    *log_ << scheduler.time() << ": consumed #" << current->serial << '\n';
                }
                current.reset();
                ++state.get_mut(counters_)->consumed;
                if (!state.is_empty(incoming_)) {
                    scheduler.schedule_now(self_id, ConsumerEvent::Received);
                }
            }
            break;
        }
    }

private:
    core::QueueId<core::Fifo<Product>> incoming_;
    core::Key<std::optional<Product>> working_on_;
    core::Key<Counters> counters_;
    core::Duration consume_time_;
    std::ostream* log_;
};

class Producer final : public core::Component<Produce> {
public:
    Producer(core::QueueId<core::Fifo<Product>> outgoing,
             core::ComponentId<ConsumerEvent> consumer, core::Key<Counters> counters,
             uint64_t items, core::Duration interval, std::ostream* log)
        : outgoing_(outgoing)
        , consumer_(consumer)
        , counters_(counters)
        , items_(items)
        , interval_(interval)
        , log_(log) {}

    void process_event(core::ComponentId<Produce> self_id, const Produce& /*event*/,
                       core::Scheduler& scheduler, core::State& state) const override {
        Counters& counters = *state.get_mut(counters_);
        if (counters.produced >= items_) {
            return;
        }

        const uint64_t serial = counters.produced++;
        scheduler.schedule(interval_, self_id, Produce{});

        if (state.send(outgoing_, Product{serial}) == core::PushResult::CapacityExceeded) {
            ++counters.dropped;
            if (log_ != nullptr) {
                *log_ << scheduler.time() << ": dropped #" << serial << '\n';
            }
            return;
        }

        if (log_ != nullptr) {
            *log_ << scheduler.time() << ": produced #" << serial << '\n';
        }
        scheduler.schedule_now(consumer_, ConsumerEvent::Received);
    }

private:
    core::QueueId<core::Fifo<Product>> outgoing_;
    core::ComponentId<ConsumerEvent> consumer_;
    core::Key<Counters> counters_;
    uint64_t items_;
    core::Duration interval_;
    std::ostream* log_;
};

struct ModelParams {
    uint64_t items{10};
    core::Duration produce_interval{core::duration_from_seconds(1.0)};
    core::Duration consume_time{core::duration_from_seconds(1.0)};
    std::size_t capacity{0};       // 0 = unbounded
    std::ostream* log{nullptr};    // nullptr = silent
};

/// @brief Handles to the parts of a model registered in a Simulation.
struct Model {
    core::QueueId<core::Fifo<Product>> queue;
    core::Key<std::optional<Product>> working_on;
    core::Key<Counters> counters;
    core::ComponentId<ConsumerEvent> consumer;
    core::ComponentId<Produce> producer;
};

/// @brief Register the model in @p sim and schedule the first production at time zero.
inline Model build_model(core::Simulation& sim, const ModelParams& params) {
    Model model;
    model.queue = params.capacity == 0 ? sim.add_queue(core::Fifo<Product>{})
                                       : sim.add_bounded_queue<Product>(params.capacity);
    model.working_on = sim.state().insert(std::optional<Product>{});
    model.counters = sim.state().insert(Counters{});

    model.consumer = sim.add_component(Consumer{
        model.queue, model.working_on, model.counters, params.consume_time, params.log});
    model.producer = sim.add_component(Producer{
        model.queue, model.consumer, model.counters, params.items,
        params.produce_interval, params.log});

    sim.schedule(core::Duration::zero(), model.producer, Produce{});
    return model;
}

} // namespace evsim::demo
