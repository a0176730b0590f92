#pragma once

#include <QObject>
#include <QString>
#include <vector>
#include "MediaItem.h"

struct TrimRange {
    double start = 0.0;
    double end = 0.0;
    double duration() const { return end - start; }
};

// Ordered list of visual items plus the validated edits the UI can make.
// All mutators run on the main thread; each emits itemsChanged().
class TimelineModel : public QObject {
    Q_OBJECT
public:
    explicit TimelineModel(QObject* parent = nullptr);
    ~TimelineModel();

    QString addItem(MediaItem item);
    void removeItem(const QString& id);
    void moveItem(int from, int to);
    void clear();

    const std::vector<MediaItem>& items() const { return m_items; }
    int itemCount() const { return static_cast<int>(m_items.size()); }
    int indexOf(const QString& id) const;
    const MediaItem* find(const QString& id) const;
    double totalDuration() const;

    // First metadata report for a video; trim is initialised only once.
    void setVideoDuration(const QString& id, double originalDuration);
    void updateVideoTrim(const QString& id, double start, double end);
    void updateImageDuration(const QString& id, double seconds);

    void updateScale(const QString& id, double scale);
    void updatePosition(const QString& id, double x, double y);
    void resetTransform(const QString& id);

    void updateVolume(const QString& id, double volume);
    void toggleMute(const QString& id);

    void setFadeIn(const QString& id, bool enabled);
    void setFadeOut(const QString& id, bool enabled);
    void setFadeInDuration(const QString& id, double seconds);
    void setFadeOutDuration(const QString& id, double seconds);

    static TrimRange validateTrim(double start, double end, double maxDuration);
    static double snapFadeDuration(double seconds);

signals:
    void itemsChanged();
    void itemAdded(const QString& id);
    void itemRemoved(const QString& id);
    void itemUpdated(const QString& id);

private:
    MediaItem* findMutable(const QString& id);
    void notifyUpdated(const QString& id);

    std::vector<MediaItem> m_items;
};
