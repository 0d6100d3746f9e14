#pragma once

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <limits>

namespace evsim::core {

/// @brief Non-negative time interval represented as an integer nanosecond count.
///
/// Duration wraps a `uint64_t` nanosecond value with a private constructor.
/// All construction goes through named factories, so a negative interval
/// cannot be expressed: conversions from negative seconds clamp to zero and
/// subtraction saturates at zero. Addition and oversized conversions saturate
/// at max(), so time never wraps.
///
/// @see duration_from_seconds, duration_from_nanoseconds, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    uint64_t ns_;

    explicit constexpr Duration(uint64_t ns) noexcept : ns_(ns) {}

    static constexpr uint64_t MAX_NS = std::numeric_limits<uint64_t>::max();

    // 2^64, the first double past the representable range
    static constexpr double NS_LIMIT = 18446744073709551616.0;

    // Round double seconds to nearest nanosecond, clamping into [0, MAX_NS]
    static constexpr uint64_t secs_to_ns(double s) noexcept {
        if (!(s > 0.0)) {
            return 0;
        }
        const double ns = s * 1e9 + 0.5;
        if (ns >= NS_LIMIT) {
            return MAX_NS;
        }
        return static_cast<uint64_t>(ns);
    }

    static constexpr uint64_t saturating_add(uint64_t a, uint64_t b) noexcept {
        return a > MAX_NS - b ? MAX_NS : a + b;
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(uint64_t ns) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Longest representable duration; sums saturate here.
    static constexpr Duration max() noexcept { return Duration{MAX_NS}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr uint64_t nanoseconds() const noexcept {
        return ns_;
    }

    /// @brief Add a duration, saturating at max().
    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{saturating_add(ns_, rhs.ns_)};
    }

    /// @brief Subtract a duration, saturating at zero.
    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ > rhs.ns_ ? ns_ - rhs.ns_ : 0};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ = saturating_add(ns_, rhs.ns_);
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ = ns_ > rhs.ns_ ? ns_ - rhs.ns_ : 0;
        return *this;
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulation time as a Duration offset from epoch (time zero).
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added. Nothing precedes the epoch: subtraction
/// saturates there. Addition saturates at the latest representable time.
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_nanoseconds(uint64_t ns) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    /// @brief Compute the duration between two time points (zero if @p rhs is later).
    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from seconds (round to nearest ns, negatives clamp to zero).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(uint64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Extract the raw nanosecond count from a Duration.
[[nodiscard]] constexpr uint64_t duration_to_nanoseconds(Duration d) noexcept {
    return d.nanoseconds();
}

/// @brief Create a TimePoint from a value in seconds since epoch.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Create a TimePoint from nanoseconds since epoch.
[[nodiscard]] constexpr TimePoint time_from_nanoseconds(uint64_t ns) noexcept {
    return TimePoint{duration_from_nanoseconds(ns)};
}

/// @brief Convert a TimePoint to seconds since epoch (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Print a duration in seconds with an `s` suffix (e.g. `1.5s`).
std::ostream& operator<<(std::ostream& os, Duration d);

/// @brief Print a time point as its offset from epoch (e.g. `10s`).
std::ostream& operator<<(std::ostream& os, TimePoint tp);

} // namespace evsim::core
