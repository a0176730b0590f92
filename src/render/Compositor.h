#pragma once

#include <QObject>
#include <QImage>
#include <QRectF>
#include <QString>
#include "EngineConfig.h"
#include "CaptionRenderer.h"

class TimelineModel;
class AudioTrackModel;
class CaptionModel;
class ResourceBinder;
class AudioMixer;
class MediaSource;
struct MediaItem;

enum class RenderMode {
    Live,     // smooth playback, drift tolerated
    Exact     // scrub, pause and the first export frame
};

// What one render step did. Two exact renders of the same state produce
// equal values.
struct FrameState {
    int activeIndex = -1;
    QString itemId;
    double localTime = 0.0;
    double sourcePosition = 0.0;
    double alpha = 0.0;
    QRectF drawRect;
    bool drawn = false;
    bool heldPrevious = false;
    int captionCount = 0;
    bool ok = true;
    QString error;
};

// One compositing pass over the global timeline: positions media sources,
// draws the active item and captions, and drives every audio path's gain.
// Preview and export both go through render().
class Compositor : public QObject {
    Q_OBJECT
public:
    Compositor(TimelineModel* timeline, AudioTrackModel* tracks, CaptionModel* captions,
               ResourceBinder* binder, AudioMixer* mixer, const EngineConfig& config,
               QObject* parent = nullptr);
    ~Compositor();

    FrameState render(double time, RenderMode mode, bool exporting = false);

    // Pauses every source and ramps every gain to zero.
    void silenceAll();
    // Positions each video source at its trim start.
    void primeVideoSources();

    const QImage& canvas() const { return m_canvas; }
    const FrameState& lastFrame() const { return m_lastFrame; }

    const EngineConfig& config() const { return m_config; }
    void setConfig(const EngineConfig& config);

private:
    void renderActiveVideo(const MediaItem& item, MediaSource* src, double local,
                           double alpha, bool exact, FrameState& state);
    void drawSource(MediaSource* src, const MediaItem& item, double alpha, FrameState& state);
    void quiesceInactive(int activeIndex);
    void preloadNext(int activeIndex, double localTime);
    void processMusic(double time, double total, bool exact);
    void processNarrations(double time, bool exact);

    TimelineModel* m_timeline;
    AudioTrackModel* m_tracks;
    CaptionModel* m_captions;
    ResourceBinder* m_binder;
    AudioMixer* m_mixer;
    EngineConfig m_config;
    CaptionRenderer m_captionRenderer;

    QImage m_canvas;
    QImage m_baseLayer;     // last canvas before captions, held while exporting
    FrameState m_lastFrame;
};
