#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include "AppConstants.h"

// Tunables of the playback/export engine. Missing JSON keys keep these defaults.
struct EngineConfig {
    int canvasWidth = AppConstants::CanvasWidth;
    int canvasHeight = AppConstants::CanvasHeight;
    double fps = AppConstants::DefaultFps;

    double liveDriftTolerance = AppConstants::LiveDriftTolerance;
    double exactDriftTolerance = AppConstants::ExactDriftTolerance;
    double trackLiveDriftTolerance = AppConstants::TrackLiveDriftTolerance;
    double trackExactDriftTolerance = AppConstants::TrackExactDriftTolerance;
    double preloadLookahead = AppConstants::PreloadLookahead;
    double preloadRepositionThreshold = AppConstants::PreloadRepositionThreshold;

    double videoGainTimeConstant = AppConstants::VideoGainTimeConstant;
    double trackGainTimeConstant = AppConstants::TrackGainTimeConstant;

    int maxConsecutiveRenderFailures = AppConstants::MaxConsecutiveRenderFailures;

    int exportVideoBitrate = AppConstants::ExportVideoBitrate;
    int exportAudioBitrate = AppConstants::ExportAudioBitrate;
    QString exportDirectory;    // empty = system Movies location

    QString logRules;           // QLoggingCategory filter rules
};

class EngineConfigStore : public QObject {
    Q_OBJECT
public:
    explicit EngineConfigStore(QObject* parent = nullptr);
    ~EngineConfigStore();

    bool save(const QString& filePath, const EngineConfig& config);
    bool load(const QString& filePath, EngineConfig& config);

    // <AppConfigLocation>/engine.json
    static QString defaultPath();

    static QJsonObject toJson(const EngineConfig& config);
    static EngineConfig fromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
