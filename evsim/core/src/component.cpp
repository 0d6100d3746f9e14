#include <evsim/core/component.hpp>

namespace evsim::core {

void Components::process_event_entry(EventEntry entry, Scheduler& scheduler, State& state) const {
    auto it = components_.find(entry.component_idx());
    if (it == components_.end()) {
        detail::invariant_failure("event entry targets an unknown component");
    }
    it->second->process_event_entry(entry, scheduler, state);
}

} // namespace evsim::core
