#pragma once

#include <optional>
#include <vector>
#include "MediaItem.h"

struct ActiveItem {
    int index = -1;
    double localTime = 0.0;   // seconds since the item's start on the timeline
};

// Stateless global-timeline math shared by the render loop and the UI.
namespace Timeline {

    // Sum of item durations; NaN/inf entries count as zero.
    double totalDuration(const std::vector<MediaItem>& items);

    // First item whose [start, start + duration) contains t.
    // Empty for t < 0, t >= totalDuration, or an empty list.
    std::optional<ActiveItem> resolveActiveItem(const std::vector<MediaItem>& items, double t);

    // Global start time of the item at index.
    double itemStartTime(const std::vector<MediaItem>& items, int index);

    // Linear fade-in/fade-out envelope clamped to [0, 1].
    double fadeAlpha(double localTime, double duration, const FadeSettings& fades);
}
