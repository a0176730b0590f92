#include "Timeline.h"
#include <cmath>
#include <algorithm>

namespace {

double finiteOrZero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

} // namespace

namespace Timeline {

double totalDuration(const std::vector<MediaItem>& items) {
    double total = 0.0;
    for (const auto& item : items)
        total += finiteOrZero(item.duration);
    return total;
}

std::optional<ActiveItem> resolveActiveItem(const std::vector<MediaItem>& items, double t) {
    if (!std::isfinite(t) || t < 0.0) return std::nullopt;

    double runningStart = 0.0;
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        double d = finiteOrZero(items[i].duration);
        if (d > 0.0 && t >= runningStart && t < runningStart + d) {
            ActiveItem active;
            active.index = i;
            active.localTime = t - runningStart;
            return active;
        }
        runningStart += d;
    }
    return std::nullopt;
}

double itemStartTime(const std::vector<MediaItem>& items, int index) {
    double start = 0.0;
    int n = std::min(index, static_cast<int>(items.size()));
    for (int i = 0; i < n; ++i)
        start += finiteOrZero(items[i].duration);
    return start;
}

double fadeAlpha(double localTime, double duration, const FadeSettings& fades) {
    double alpha = 1.0;
    if (fades.fadeIn && fades.fadeInDuration > 0.0 && localTime < fades.fadeInDuration) {
        alpha = localTime / fades.fadeInDuration;
    } else if (fades.fadeOut && fades.fadeOutDuration > 0.0
               && localTime > duration - fades.fadeOutDuration) {
        alpha = (duration - localTime) / fades.fadeOutDuration;
    }
    return std::clamp(alpha, 0.0, 1.0);
}

} // namespace Timeline
