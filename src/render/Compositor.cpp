#include "Compositor.h"
#include "TimelineModel.h"
#include "AudioTrackModel.h"
#include "CaptionModel.h"
#include "Timeline.h"
#include "ResourceBinder.h"
#include "MediaSource.h"
#include "AudioMixer.h"
#include "ImageUtil.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QPainter>
#include <algorithm>
#include <cmath>
#include <exception>

Compositor::Compositor(TimelineModel* timeline, AudioTrackModel* tracks, CaptionModel* captions,
                       ResourceBinder* binder, AudioMixer* mixer, const EngineConfig& config,
                       QObject* parent)
    : QObject(parent)
    , m_timeline(timeline)
    , m_tracks(tracks)
    , m_captions(captions)
    , m_binder(binder)
    , m_mixer(mixer)
{
    setConfig(config);

    connect(m_binder, &ResourceBinder::sourceAdded, this, [this](const QString& key, MediaSource* src) {
        if (src->hasAudio()) m_mixer->addPath(key, src);
    });
    connect(m_binder, &ResourceBinder::sourceRemoved, this, [this](const QString& key) {
        m_mixer->removePath(key);
    });
}

Compositor::~Compositor() = default;

void Compositor::setConfig(const EngineConfig& config) {
    m_config = config;
    m_canvas = QImage(m_config.canvasWidth, m_config.canvasHeight, QImage::Format_RGB32);
    m_canvas.fill(Qt::black);
    m_baseLayer = m_canvas;
}

FrameState Compositor::render(double time, RenderMode mode, bool exporting) {
    FrameState state;
    const bool exact = mode == RenderMode::Exact;

    try {
        const auto& items = m_timeline->items();
        const double total = Timeline::totalDuration(items);

        std::optional<ActiveItem> active = Timeline::resolveActiveItem(items, time);
        if (!active && !items.empty() && total > 0.0
            && time >= total - AppConstants::EndFallbackWindow) {
            // Hold the last clip on its final instant instead of going black
            int last = static_cast<int>(items.size()) - 1;
            active = ActiveItem{last, std::max(0.0, items[last].duration - 0.001)};
        }

        QImage previousBase = m_baseLayer;
        m_canvas.fill(Qt::black);

        if (active) {
            const MediaItem& item = items[active->index];
            MediaSource* src = m_binder->source(item.id);

            state.activeIndex = active->index;
            state.itemId = item.id;
            state.localTime = active->localTime;
            state.alpha = Timeline::fadeAlpha(active->localTime, item.duration, item.fades);

            if (item.isVideo() && src)
                renderActiveVideo(item, src, active->localTime, state.alpha, exact, state);

            if (src && src->hasFrame()) {
                drawSource(src, item, state.alpha, state);
            } else {
                qCDebug(srRender) << "source not ready:" << item.id << "at" << time;
                if (exporting && !previousBase.isNull()) {
                    m_canvas = previousBase;
                    state.heldPrevious = true;
                }
            }
        }

        m_baseLayer = m_canvas;

        quiesceInactive(state.activeIndex);
        if (active) preloadNext(active->index, active->localTime);

        processMusic(time, total, exact);
        processNarrations(time, exact);

        state.captionCount = m_captionRenderer.render(m_canvas, *m_captions, time);
    } catch (const std::exception& e) {
        state.ok = false;
        state.error = QString::fromLocal8Bit(e.what());
        qCWarning(srRender) << "render step failed at" << time << ":" << state.error;
    }

    m_lastFrame = state;
    return state;
}

void Compositor::renderActiveVideo(const MediaItem& item, MediaSource* src, double local,
                                   double alpha, bool exact, FrameState& state) {
    double target = item.trimStart + local;
    state.sourcePosition = target;

    double tolerance = exact ? m_config.exactDriftTolerance : m_config.liveDriftTolerance;
    if (std::abs(src->position() - target) > tolerance) {
        if (!src->setPosition(target))
            qCWarning(srRender) << "drift correction failed for" << item.id << "->" << target;
    }

    if (exact) src->pause();
    else if (src->isPaused()) src->play();

    double gain = (exact || item.isMuted) ? 0.0 : item.volume * alpha;
    m_mixer->setGain(item.id, gain, m_config.videoGainTimeConstant);
}

void Compositor::drawSource(MediaSource* src, const MediaItem& item, double alpha, FrameState& state) {
    QImage frame = src->currentFrame();
    if (frame.isNull()) return;

    QRectF rect = ImageUtil::placedRect(frame.size(), m_canvas.size(), item.transform.scale,
                                        item.transform.positionX, item.transform.positionY);

    QPainter painter(&m_canvas);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.setOpacity(alpha);
    painter.drawImage(rect, frame);
    painter.end();

    state.drawRect = rect;
    state.drawn = true;
}

void Compositor::quiesceInactive(int activeIndex) {
    const auto& items = m_timeline->items();
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        if (i == activeIndex || !items[i].isVideo()) continue;
        if (MediaSource* src = m_binder->source(items[i].id)) src->pause();
        m_mixer->setGain(items[i].id, 0.0, m_config.videoGainTimeConstant);
    }
}

void Compositor::preloadNext(int activeIndex, double localTime) {
    const auto& items = m_timeline->items();
    const MediaItem& current = items[activeIndex];
    int next = activeIndex + 1;
    if (next >= static_cast<int>(items.size())) return;
    if (localTime <= current.duration - m_config.preloadLookahead) return;

    const MediaItem& upcoming = items[next];
    if (!upcoming.isVideo()) return;

    MediaSource* src = m_binder->source(upcoming.id);
    if (!src) return;

    if ((src->isPaused() || !src->hasFrame())
        && std::abs(src->position() - upcoming.trimStart) > m_config.preloadRepositionThreshold) {
        qCDebug(srRender) << "preloading" << upcoming.id << "at" << upcoming.trimStart;
        if (!src->setPosition(upcoming.trimStart))
            qCWarning(srRender) << "preload seek failed for" << upcoming.id;
    }
}

void Compositor::processMusic(double time, double total, bool exact) {
    if (!m_tracks->hasMusic()) return;
    MediaSource* src = m_binder->musicSource();
    if (!src) return;

    const AudioTrack& track = m_tracks->music();
    const QString key = ResourceBinder::musicKey();
    const double trackTime = time - track.delay + track.startPoint;

    if (exact) {
        m_mixer->setGain(key, 0.0, m_config.trackGainTimeConstant);
        src->pause();
        // Keep it placed so resuming is instant
        if (trackTime >= 0.0 && trackTime <= track.duration
            && std::abs(src->position() - trackTime) > m_config.trackExactDriftTolerance
            && !src->setPosition(trackTime)) {
            qCWarning(srRender) << "music reposition failed ->" << trackTime;
        }
        return;
    }

    if (time < track.delay) {
        m_mixer->setGain(key, 0.0, AppConstants::PreDelayGainTimeConstant);
        src->pause();
        return;
    }

    if (trackTime >= track.duration) {
        m_mixer->setGain(key, 0.0, m_config.trackGainTimeConstant);
        src->pause();
        return;
    }

    if (std::abs(src->position() - trackTime) > m_config.trackLiveDriftTolerance) {
        src->pause();
        if (!src->setPosition(trackTime))
            qCWarning(srRender) << "music drift correction failed ->" << trackTime;
    }
    if (src->isPaused()) src->play();

    double played = time - track.delay;
    double volume = track.volume;
    if (track.fadeIn && track.fadeInDuration > 0.0 && played < track.fadeInDuration)
        volume *= played / track.fadeInDuration;
    if (track.fadeOut && track.fadeOutDuration > 0.0 && time > total - track.fadeOutDuration)
        volume *= std::max(0.0, (total - time) / track.fadeOutDuration);

    m_mixer->setGain(key, volume, m_config.trackGainTimeConstant);
}

void Compositor::processNarrations(double time, bool exact) {
    for (const auto& clip : m_tracks->narrations()) {
        MediaSource* src = m_binder->narrationSource(clip.id);
        if (!src) continue;

        const QString key = ResourceBinder::narrationKey(clip.id);
        const double clipTime = time - clip.startTime;
        const double sourceTime = clip.trimStart + clipTime;
        const bool inRange = clipTime >= 0.0 && clipTime < clip.playLength();

        if (exact) {
            m_mixer->setGain(key, 0.0, m_config.trackGainTimeConstant);
            src->pause();
            if (inRange && std::abs(src->position() - sourceTime) > m_config.trackExactDriftTolerance
                && !src->setPosition(sourceTime))
                qCWarning(srRender) << "narration reposition failed for" << clip.id;
            continue;
        }

        if (!inRange) {
            m_mixer->setGain(key, 0.0, m_config.trackGainTimeConstant);
            src->pause();
            continue;
        }

        if (std::abs(src->position() - sourceTime) > m_config.trackLiveDriftTolerance) {
            src->pause();
            if (!src->setPosition(sourceTime))
                qCWarning(srRender) << "narration drift correction failed for" << clip.id;
        }
        if (src->isPaused()) src->play();

        m_mixer->setGain(key, clip.isMuted ? 0.0 : clip.volume, m_config.trackGainTimeConstant);
    }
}

void Compositor::silenceAll() {
    for (const auto& key : m_binder->keys()) {
        if (MediaSource* src = m_binder->source(key)) src->pause();
    }
    m_mixer->silenceAll(m_config.videoGainTimeConstant);
}

void Compositor::primeVideoSources() {
    for (const auto& item : m_timeline->items()) {
        if (!item.isVideo()) continue;
        MediaSource* src = m_binder->source(item.id);
        if (!src) continue;
        src->pause();
        if (!src->setPosition(item.trimStart))
            qCWarning(srRender) << "cannot prime" << item.id;
    }
}
