#include <evsim/core/types.hpp>

#include <ostream>

namespace evsim::core {

std::ostream& operator<<(std::ostream& os, Duration d) {
    return os << d.seconds() << 's';
}

std::ostream& operator<<(std::ostream& os, TimePoint tp) {
    return os << tp.time_since_epoch();
}

} // namespace evsim::core
