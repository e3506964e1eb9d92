#include "ogcode/xy2/TimelineSampler.hpp"

#include "ogcode/core/JobConfig.hpp"

#include <algorithm>
#include <cmath>

namespace ogcode::xy2 {

TimelineSampler::TimelineSampler(const timing::Timeline& timeline_, std::chrono::nanoseconds period_)
: timeline(timeline_), period(period_) {
    if (period.count() <= 0) {
        return;
    }
    const double total = std::max(0.0, timeline.totalDuration);
    const double periods = std::ceil(total / config::toSeconds(period) - 1e-9);
    count = static_cast<std::uint64_t>(std::max(0.0, periods)) + 1;
}

TimedPoint TimelineSampler::next() {
    TimedPoint point;
    point.timestamp = std::chrono::nanoseconds(static_cast<std::int64_t>(index) * period.count());
    ++index;

    const auto& entries = timeline.entries;
    if (entries.empty()) {
        point.position = timeline.startPosition;
        return point;
    }

    const double t = config::toSeconds(point.timestamp);
    while (cursor + 1 < entries.size() && entries[cursor].endTime() <= t) {
        ++cursor;
    }

    const auto& entry = entries[cursor];
    if (entry.kind == timing::TimelineEntry::Kind::Hold) {
        point.position = entry.position;
        return point;
    }
    const auto& segment = timeline.segments[entry.segmentIndex];
    point.position = segment.positionAt(t - entry.startTime);
    point.segmentIndex = entry.segmentIndex;
    return point;
}

} // namespace ogcode::xy2
