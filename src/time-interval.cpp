// src/native/fusion/time-interval.cpp
#include "include/time-interval.h"

#include <algorithm>
#include <cmath>

namespace Fusion {

bool TimeInterval::is_valid() const {
    return std::isfinite(start) && std::isfinite(end) && start >= 0.0 && end > start;
}

std::optional<TimeInterval> overlap(const TimeInterval& a, const TimeInterval& b) {
    if (a.start < b.end && b.start < a.end) {
        return TimeInterval{std::max(a.start, b.start), std::min(a.end, b.end)};
    }
    return std::nullopt;
}

double overlap_duration(const TimeInterval& a, const TimeInterval& b) {
    auto intersection = overlap(a, b);
    return intersection ? intersection->duration() : 0.0;
}

bool contains(const TimeInterval& outer, const TimeInterval& inner, double tolerance) {
    return inner.start + tolerance >= outer.start && inner.end <= outer.end + tolerance;
}

bool abuts(const TimeInterval& current, const TimeInterval& next, double tolerance) {
    return next.start - current.end < tolerance;
}

} // namespace Fusion
