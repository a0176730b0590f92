#include "TimelineModel.h"
#include "Logging.h"
#include <QUuid>
#include <algorithm>
#include <cmath>

namespace {
    constexpr double AllowedFadeDurations[] = {0.5, 1.0, 2.0};
}

TimelineModel::TimelineModel(QObject* parent) : QObject(parent) {}
TimelineModel::~TimelineModel() = default;

QString TimelineModel::addItem(MediaItem item) {
    if (item.id.isEmpty())
        item.id = QUuid::createUuid().toString(QUuid::WithoutBraces);

    if (item.isImage()) {
        if (item.duration <= 0.0)
            item.duration = AppConstants::DefaultImageDuration;
        item.duration = qBound(AppConstants::MinImageDuration, item.duration,
                               AppConstants::MaxImageDuration);
    } else if (!item.isTrimInitialized) {
        item.duration = 0.0;
    }

    item.transform.scale = ClipTransform::clampScale(item.transform.scale);
    item.transform.positionX = ClipTransform::clampX(item.transform.positionX);
    item.transform.positionY = ClipTransform::clampY(item.transform.positionY);
    item.volume = qBound(0.0, item.volume, AppConstants::MaxVolume);

    QString id = item.id;
    m_items.push_back(std::move(item));
    qCDebug(srTimeline, "added item %s (%d total)", qPrintable(id), itemCount());
    emit itemAdded(id);
    emit itemsChanged();
    return id;
}

void TimelineModel::removeItem(const QString& id) {
    int idx = indexOf(id);
    if (idx < 0) return;
    m_items.erase(m_items.begin() + idx);
    emit itemRemoved(id);
    emit itemsChanged();
}

void TimelineModel::moveItem(int from, int to) {
    int n = itemCount();
    if (from < 0 || from >= n || to < 0 || to >= n || from == to) return;
    MediaItem moved = std::move(m_items[from]);
    m_items.erase(m_items.begin() + from);
    m_items.insert(m_items.begin() + to, std::move(moved));
    emit itemsChanged();
}

void TimelineModel::clear() {
    if (m_items.empty()) return;
    std::vector<QString> ids;
    ids.reserve(m_items.size());
    for (const auto& item : m_items) ids.push_back(item.id);
    m_items.clear();
    for (const auto& id : ids) emit itemRemoved(id);
    emit itemsChanged();
}

int TimelineModel::indexOf(const QString& id) const {
    for (int i = 0; i < itemCount(); ++i) {
        if (m_items[i].id == id) return i;
    }
    return -1;
}

const MediaItem* TimelineModel::find(const QString& id) const {
    int idx = indexOf(id);
    return idx >= 0 ? &m_items[idx] : nullptr;
}

MediaItem* TimelineModel::findMutable(const QString& id) {
    int idx = indexOf(id);
    return idx >= 0 ? &m_items[idx] : nullptr;
}

double TimelineModel::totalDuration() const {
    double total = 0.0;
    for (const auto& item : m_items) {
        if (std::isfinite(item.duration)) total += item.duration;
    }
    return total;
}

void TimelineModel::notifyUpdated(const QString& id) {
    emit itemUpdated(id);
    emit itemsChanged();
}

TrimRange TimelineModel::validateTrim(double start, double end, double maxDuration) {
    const double gap = AppConstants::MinTrimGap;
    TrimRange r;
    if (maxDuration <= gap) {
        r.end = std::max(0.0, maxDuration);
        return r;
    }
    r.start = std::max(0.0, std::min(start, end - gap));
    r.start = std::min(r.start, maxDuration - gap);
    r.end = std::max(r.start + gap, std::min(end, maxDuration));
    return r;
}

double TimelineModel::snapFadeDuration(double seconds) {
    double best = AllowedFadeDurations[0];
    for (double d : AllowedFadeDurations) {
        if (std::abs(d - seconds) < std::abs(best - seconds)) best = d;
    }
    return best;
}

void TimelineModel::setVideoDuration(const QString& id, double originalDuration) {
    MediaItem* item = findMutable(id);
    if (!item || !item->isVideo()) return;
    if (!std::isfinite(originalDuration) || originalDuration <= 0.0) {
        qCWarning(srTimeline, "ignoring invalid duration %f for %s", originalDuration, qPrintable(id));
        return;
    }

    item->originalDuration = originalDuration;
    if (!item->isTrimInitialized) {
        item->trimStart = 0.0;
        item->trimEnd = originalDuration;
        item->isTrimInitialized = true;
    } else {
        // Keep the user's trim, but never past the source end
        TrimRange r = validateTrim(item->trimStart, item->trimEnd, originalDuration);
        item->trimStart = r.start;
        item->trimEnd = r.end;
    }
    item->duration = item->trimEnd - item->trimStart;
    notifyUpdated(id);
}

void TimelineModel::updateVideoTrim(const QString& id, double start, double end) {
    MediaItem* item = findMutable(id);
    if (!item || !item->isVideo() || item->originalDuration <= 0.0) return;

    TrimRange r = validateTrim(start, end, item->originalDuration);
    item->trimStart = r.start;
    item->trimEnd = r.end;
    item->duration = r.duration();
    item->isTrimInitialized = true;
    notifyUpdated(id);
}

void TimelineModel::updateImageDuration(const QString& id, double seconds) {
    MediaItem* item = findMutable(id);
    if (!item || !item->isImage()) return;
    item->duration = qBound(AppConstants::MinImageDuration, seconds, AppConstants::MaxImageDuration);
    notifyUpdated(id);
}

void TimelineModel::updateScale(const QString& id, double scale) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->transform.scale = ClipTransform::clampScale(scale);
    notifyUpdated(id);
}

void TimelineModel::updatePosition(const QString& id, double x, double y) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->transform.positionX = ClipTransform::clampX(x);
    item->transform.positionY = ClipTransform::clampY(y);
    notifyUpdated(id);
}

void TimelineModel::resetTransform(const QString& id) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->transform.reset();
    notifyUpdated(id);
}

void TimelineModel::updateVolume(const QString& id, double volume) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->volume = qBound(0.0, volume, AppConstants::MaxVolume);
    notifyUpdated(id);
}

void TimelineModel::toggleMute(const QString& id) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->isMuted = !item->isMuted;
    notifyUpdated(id);
}

void TimelineModel::setFadeIn(const QString& id, bool enabled) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->fades.fadeIn = enabled;
    notifyUpdated(id);
}

void TimelineModel::setFadeOut(const QString& id, bool enabled) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->fades.fadeOut = enabled;
    notifyUpdated(id);
}

void TimelineModel::setFadeInDuration(const QString& id, double seconds) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->fades.fadeInDuration = snapFadeDuration(seconds);
    notifyUpdated(id);
}

void TimelineModel::setFadeOutDuration(const QString& id, double seconds) {
    MediaItem* item = findMutable(id);
    if (!item) return;
    item->fades.fadeOutDuration = snapFadeDuration(seconds);
    notifyUpdated(id);
}
