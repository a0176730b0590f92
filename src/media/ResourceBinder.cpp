#include "ResourceBinder.h"
#include "AudioSource.h"
#include "ImageSource.h"
#include "VideoSource.h"
#include "TimelineModel.h"
#include "AudioTrackModel.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QSet>

ResourceBinder::ResourceBinder(TimelineModel* timeline, AudioTrackModel* tracks,
                               PlaybackClock* clock, QObject* parent)
    : QObject(parent)
    , m_timeline(timeline)
    , m_tracks(tracks)
    , m_factory(defaultFactory(clock, AppConstants::MixSampleRate, AppConstants::MixChannels))
{
    connect(m_timeline, &TimelineModel::itemsChanged, this, &ResourceBinder::sync);
    connect(m_tracks, &AudioTrackModel::tracksChanged, this, &ResourceBinder::sync);
    connect(m_tracks, &AudioTrackModel::musicChanged, this, &ResourceBinder::sync);
}

ResourceBinder::~ResourceBinder() {
    releaseAll();
}

void ResourceBinder::setSourceFactory(SourceFactory factory) {
    m_factory = std::move(factory);
}

SourceFactory ResourceBinder::defaultFactory(PlaybackClock* clock, int sampleRate, int channels) {
    return [clock, sampleRate, channels](const SourceRequest& req) -> std::unique_ptr<MediaSource> {
        switch (req.kind) {
        case SourceKind::Video: {
            auto src = std::make_unique<VideoSource>(clock, sampleRate, channels);
            src->open(req.path);
            return src;
        }
        case SourceKind::Image: {
            auto src = std::make_unique<ImageSource>(clock, sampleRate, channels);
            src->open(req.path);
            return src;
        }
        case SourceKind::Audio: {
            auto src = std::make_unique<AudioSource>(clock, sampleRate, channels);
            src->open(req.path);
            return src;
        }
        }
        return nullptr;
    };
}

MediaSource* ResourceBinder::source(const QString& key) const {
    auto it = m_entries.find(key);
    return it != m_entries.end() ? it->second.source.get() : nullptr;
}

QStringList ResourceBinder::keys() const {
    QStringList result;
    for (const auto& [key, entry] : m_entries) result.append(key);
    return result;
}

void ResourceBinder::sync() {
    // Duration reports feed back into the models, which re-enter here
    if (m_syncing) return;
    m_syncing = true;

    std::vector<SourceRequest> wanted;
    for (const auto& item : m_timeline->items()) {
        wanted.push_back({item.id, item.sourcePath,
                          item.isVideo() ? SourceKind::Video : SourceKind::Image});
    }
    if (m_tracks->hasMusic())
        wanted.push_back({musicKey(), m_tracks->music().sourcePath, SourceKind::Audio});
    for (const auto& clip : m_tracks->narrations())
        wanted.push_back({narrationKey(clip.id), clip.sourcePath, SourceKind::Audio});

    QSet<QString> wantedKeys;
    for (const auto& req : wanted) wantedKeys.insert(req.key);

    QStringList stale;
    for (const auto& [key, entry] : m_entries) {
        if (!wantedKeys.contains(key)) stale.append(key);
    }
    for (const auto& key : stale) release(key);

    std::vector<PendingDuration> durations;
    for (const auto& req : wanted) bind(req, durations);

    m_syncing = false;

    for (const auto& d : durations) {
        if (d.key == musicKey()) {
            emit musicDurationLoaded(d.seconds);
        } else if (d.key.startsWith(QStringLiteral("narration:"))) {
            emit narrationDurationLoaded(d.key.mid(10), d.seconds);
        } else {
            emit durationLoaded(d.key, d.seconds);
        }
    }
}

void ResourceBinder::bind(const SourceRequest& request, std::vector<PendingDuration>& durations) {
    auto it = m_entries.find(request.key);
    if (it != m_entries.end()) {
        if (it->second.path == request.path && it->second.kind == request.kind) return;
        release(request.key);
    }

    std::unique_ptr<MediaSource> src = m_factory ? m_factory(request) : nullptr;
    if (!src) {
        qCWarning(srMedia) << "no source for" << request.key << request.path;
        emit sourceFailed(request.key, tr("Cannot create source for %1").arg(request.path));
        return;
    }

    if (!src->errorString().isEmpty()) {
        qCWarning(srMedia) << "source" << request.key << "failed:" << src->errorString();
        emit sourceFailed(request.key, src->errorString());
    }

    MediaSource* raw = src.get();
    Entry entry;
    entry.path = request.path;
    entry.kind = request.kind;
    entry.source = std::move(src);
    m_entries[request.key] = std::move(entry);

    qCDebug(srMedia) << "bound" << request.key << request.path;
    emit sourceAdded(request.key, raw);

    if (request.kind != SourceKind::Image && raw->isReady())
        durations.push_back({request.key, raw->duration()});
}

void ResourceBinder::release(const QString& key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return;

    emit sourceRemoved(key);
    qCDebug(srMedia) << "released" << key;
    m_entries.erase(it);
}

void ResourceBinder::releaseAll() {
    QStringList all = keys();
    for (const auto& key : all) release(key);
}
