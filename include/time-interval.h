// src/native/fusion/include/time-interval.h
#pragma once

#include <optional>

namespace Fusion {

/**
 * Upstream models jitter their timestamps by a few milliseconds.
 * Gaps smaller than this are treated as abutting.
 */
constexpr double kTimestampTolerance = 1e-3;

/**
 * Half-open time span [start, end) in seconds
 */
struct TimeInterval {
    double start = 0.0;
    double end = 0.0;

    double duration() const { return end - start; }

    /**
     * Check the interval invariant: finite, start >= 0, end > start
     */
    bool is_valid() const;
};

/**
 * Intersection of two intervals
 * @return Intersection, or nullopt when the intervals only touch or are disjoint
 */
std::optional<TimeInterval> overlap(const TimeInterval& a, const TimeInterval& b);

/**
 * Length of the intersection in seconds (0 when there is none)
 */
double overlap_duration(const TimeInterval& a, const TimeInterval& b);

/**
 * Check that inner lies within outer, allowing each edge to stick out by tolerance
 */
bool contains(const TimeInterval& outer, const TimeInterval& inner,
              double tolerance = kTimestampTolerance);

/**
 * Check that next starts less than tolerance after current ends.
 * Overlapping intervals abut as well.
 */
bool abuts(const TimeInterval& current, const TimeInterval& next,
           double tolerance = kTimestampTolerance);

} // namespace Fusion
