#pragma once

// A complete engine graph wired the way the main window wires it, with
// fake media and a manual clock.

#include <QObject>
#include "TestDoubles.h"
#include "timeline/TimelineModel.h"
#include "timeline/AudioTrackModel.h"
#include "timeline/CaptionModel.h"
#include "audio/AudioMixer.h"
#include "render/Compositor.h"
#include "render/PlaybackEngine.h"
#include "app/EngineConfig.h"

inline EngineConfig smallCanvasConfig() {
    EngineConfig config;
    config.canvasWidth = 320;
    config.canvasHeight = 180;
    return config;
}

struct EngineFixture {
    explicit EngineFixture(const EngineConfig& cfg = smallCanvasConfig())
        : config(cfg)
        , library(&clock)
        , binder(&timeline, &tracks, &clock)
        , mixer(48000, 2)
        , compositor(&timeline, &tracks, &captions, &binder, &mixer, config)
        , scheduler(&clock)
        , engine(&compositor, &mixer, &timeline, &clock, &scheduler)
    {
        binder.setSourceFactory(library.factory());
        mixer.setMonitorEndpoint(&monitor);

        QObject::connect(&binder, &ResourceBinder::durationLoaded, &timeline, &TimelineModel::setVideoDuration);
        QObject::connect(&binder, &ResourceBinder::musicDurationLoaded, &tracks, &AudioTrackModel::setMusicDuration);
        QObject::connect(&binder, &ResourceBinder::narrationDurationLoaded, &tracks, &AudioTrackModel::setNarrationDuration);
    }

    QString addVideo(const QString& path, double duration, QColor color = Qt::red, float pcm = 0.25f) {
        library.add(path, FakeMedia{duration, color, pcm, false});
        MediaItem item;
        item.sourcePath = path;
        item.displayName = path;
        item.kind = MediaKind::Video;
        return timeline.addItem(item);
    }

    QString addImage(const QString& path, double seconds, QColor color = Qt::blue) {
        library.add(path, FakeMedia{0.0, color, 0.0f, false});
        MediaItem item;
        item.sourcePath = path;
        item.displayName = path;
        item.kind = MediaKind::Image;
        item.duration = seconds;
        return timeline.addItem(item);
    }

    FakeSource* source(const QString& key) const { return library.source(key); }

    EngineConfig config;
    ManualClock clock;
    FakeMediaLibrary library;
    TimelineModel timeline;
    AudioTrackModel tracks;
    CaptionModel captions;
    ResourceBinder binder;
    AudioMixer mixer;
    CaptureEndpoint monitor;
    Compositor compositor;
    ManualScheduler scheduler;
    PlaybackEngine engine;
};
