#pragma once

#include <QMainWindow>
#include <QDockWidget>
#include <QString>
#include <memory>
#include "EngineConfig.h"
#include "ExportPipeline.h"

class ClipListPanel;
class ItemInspector;
class AudioPanel;
class PreviewWidget;
class QProgressBar;
class QAction;
class QMenu;
class TimelineModel;
class AudioTrackModel;
class CaptionModel;
class SteadyClock;
class ResourceBinder;
class AudioMixer;
class AudioOutput;
class ExportAudioSink;
class Compositor;
class TimerFrameScheduler;
class PlaybackEngine;
class MediaExporter;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const EngineConfig& config, QWidget* parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onAddClips();
    void onSetMusic();
    void onAddNarration();
    void onImportCaptions();
    void onExportRequested();
    void onStopExport();
    void onShowLog();
    void onFrameRendered(double time);
    void onSelectionChanged(const QString& id);
    void onExportDone(const ExportArtifact& artifact);
    void onExportFailed(const QString& reason);

private:
    void setupEngine();
    void setupUi();
    void setupMenuBar();
    void setupDockWidgets();
    void connectSignals();
    void scheduleRefresh();
    void updateSelectionOverlay();
    void setExporting(bool exporting);

    EngineConfig m_config;

    // Models
    TimelineModel* m_timeline = nullptr;
    AudioTrackModel* m_tracks = nullptr;
    CaptionModel* m_captions = nullptr;

    // Engine
    std::unique_ptr<SteadyClock> m_clock;
    std::unique_ptr<ExportAudioSink> m_exportSink;
    ResourceBinder* m_binder = nullptr;
    AudioMixer* m_mixer = nullptr;
    AudioOutput* m_audioOutput = nullptr;
    Compositor* m_compositor = nullptr;
    TimerFrameScheduler* m_scheduler = nullptr;
    PlaybackEngine* m_engine = nullptr;
    MediaExporter* m_recorder = nullptr;
    ExportPipeline* m_exportPipeline = nullptr;

    // UI
    QDockWidget* m_clipDock = nullptr;
    QDockWidget* m_inspectorDock = nullptr;
    QDockWidget* m_audioDock = nullptr;
    ClipListPanel* m_clipList = nullptr;
    ItemInspector* m_inspector = nullptr;
    AudioPanel* m_audioPanel = nullptr;
    PreviewWidget* m_previewWidget = nullptr;
    QProgressBar* m_exportProgress = nullptr;
    QAction* m_exportAction = nullptr;
    QAction* m_stopExportAction = nullptr;
    QMenu* m_viewMenu = nullptr;

    QString m_selectedId;
    bool m_refreshPending = false;
};
