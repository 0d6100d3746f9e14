#include <evsim/core/simulation.hpp>

namespace evsim::core {

bool Simulation::step() {
    auto entry = scheduler_.pop();
    if (!entry) {
        return false;
    }

    trace([&](TraceWriter& w) {
        w.type("event_dispatched");
        w.field("component_id", entry->component_idx());
        w.field("sequence", entry->sequence());
        w.field("pending", static_cast<uint64_t>(scheduler_.size()));
    });

    components_.process_event_entry(std::move(*entry), scheduler_, state_);
    return true;
}

void Simulation::run() {
    while (step()) {
    }
}

void Simulation::run(const SideEffect& side_effect) {
    while (step()) {
        if (side_effect) {
            side_effect(*this);
        }
    }
}

} // namespace evsim::core
