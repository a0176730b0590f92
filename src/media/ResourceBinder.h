#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>
#include <map>
#include <memory>
#include "MediaSource.h"

class PlaybackClock;
class TimelineModel;
class AudioTrackModel;

enum class SourceKind {
    Video,
    Image,
    Audio
};

struct SourceRequest {
    QString key;
    QString path;
    SourceKind kind = SourceKind::Video;
};

using SourceFactory = std::function<std::unique_ptr<MediaSource>(const SourceRequest&)>;

// Owns one live MediaSource per timeline item, the music track and every
// narration clip, keyed by id. Sources are created and released as the
// models change; natural durations are reported once a source opens.
class ResourceBinder : public QObject {
    Q_OBJECT
public:
    ResourceBinder(TimelineModel* timeline, AudioTrackModel* tracks,
                   PlaybackClock* clock, QObject* parent = nullptr);
    ~ResourceBinder();

    // Replaces how sources are created. Existing sources are kept.
    void setSourceFactory(SourceFactory factory);
    static SourceFactory defaultFactory(PlaybackClock* clock, int sampleRate, int channels);

    // Brings the source map in line with the models.
    void sync();
    void releaseAll();

    MediaSource* source(const QString& key) const;
    MediaSource* musicSource() const { return source(musicKey()); }
    MediaSource* narrationSource(const QString& id) const { return source(narrationKey(id)); }
    QStringList keys() const;
    int sourceCount() const { return static_cast<int>(m_entries.size()); }

    static QString musicKey() { return QStringLiteral("music"); }
    static QString narrationKey(const QString& id) { return QStringLiteral("narration:") + id; }

signals:
    void sourceAdded(const QString& key, MediaSource* source);
    // Emitted before the source is destroyed.
    void sourceRemoved(const QString& key);
    void sourceFailed(const QString& key, const QString& error);
    void durationLoaded(const QString& itemId, double seconds);
    void musicDurationLoaded(double seconds);
    void narrationDurationLoaded(const QString& narrationId, double seconds);

private:
    struct Entry {
        QString path;
        SourceKind kind = SourceKind::Video;
        std::unique_ptr<MediaSource> source;
    };

    struct PendingDuration {
        QString key;
        double seconds = 0.0;
    };

    void bind(const SourceRequest& request, std::vector<PendingDuration>& durations);
    void release(const QString& key);

    TimelineModel* m_timeline;
    AudioTrackModel* m_tracks;
    SourceFactory m_factory;
    std::map<QString, Entry> m_entries;
    bool m_syncing = false;
};
