#include "EngineConfig.h"
#include <QDir>
#include <QFileInfo>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>

EngineConfigStore::EngineConfigStore(QObject* parent) : QObject(parent) {}
EngineConfigStore::~EngineConfigStore() = default;

QString EngineConfigStore::defaultPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath("engine.json");
}

bool EngineConfigStore::save(const QString& filePath, const EngineConfig& config) {
    QJsonObject root;
    root["version"] = 1;
    root["engine"] = toJson(config);

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

bool EngineConfigStore::load(const QString& filePath, EngineConfig& config) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    auto doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        m_error = "Invalid config format";
        return false;
    }

    config = fromJson(doc.object()["engine"].toObject());
    return true;
}

QJsonObject EngineConfigStore::toJson(const EngineConfig& config) {
    QJsonObject obj;
    obj["canvasWidth"] = config.canvasWidth;
    obj["canvasHeight"] = config.canvasHeight;
    obj["fps"] = config.fps;
    obj["liveDriftTolerance"] = config.liveDriftTolerance;
    obj["exactDriftTolerance"] = config.exactDriftTolerance;
    obj["trackLiveDriftTolerance"] = config.trackLiveDriftTolerance;
    obj["trackExactDriftTolerance"] = config.trackExactDriftTolerance;
    obj["preloadLookahead"] = config.preloadLookahead;
    obj["preloadRepositionThreshold"] = config.preloadRepositionThreshold;
    obj["videoGainTimeConstant"] = config.videoGainTimeConstant;
    obj["trackGainTimeConstant"] = config.trackGainTimeConstant;
    obj["maxConsecutiveRenderFailures"] = config.maxConsecutiveRenderFailures;
    obj["exportVideoBitrate"] = config.exportVideoBitrate;
    obj["exportAudioBitrate"] = config.exportAudioBitrate;
    obj["exportDirectory"] = config.exportDirectory;
    obj["logRules"] = config.logRules;
    return obj;
}

EngineConfig EngineConfigStore::fromJson(const QJsonObject& obj) {
    EngineConfig d;
    EngineConfig cfg;
    cfg.canvasWidth = qMax(16, obj["canvasWidth"].toInt(d.canvasWidth));
    cfg.canvasHeight = qMax(16, obj["canvasHeight"].toInt(d.canvasHeight));
    cfg.fps = qBound(1.0, obj["fps"].toDouble(d.fps), 120.0);
    cfg.liveDriftTolerance = obj["liveDriftTolerance"].toDouble(d.liveDriftTolerance);
    cfg.exactDriftTolerance = obj["exactDriftTolerance"].toDouble(d.exactDriftTolerance);
    cfg.trackLiveDriftTolerance = obj["trackLiveDriftTolerance"].toDouble(d.trackLiveDriftTolerance);
    cfg.trackExactDriftTolerance = obj["trackExactDriftTolerance"].toDouble(d.trackExactDriftTolerance);
    cfg.preloadLookahead = obj["preloadLookahead"].toDouble(d.preloadLookahead);
    cfg.preloadRepositionThreshold = obj["preloadRepositionThreshold"].toDouble(d.preloadRepositionThreshold);
    cfg.videoGainTimeConstant = obj["videoGainTimeConstant"].toDouble(d.videoGainTimeConstant);
    cfg.trackGainTimeConstant = obj["trackGainTimeConstant"].toDouble(d.trackGainTimeConstant);
    cfg.maxConsecutiveRenderFailures = qMax(1, obj["maxConsecutiveRenderFailures"].toInt(d.maxConsecutiveRenderFailures));
    cfg.exportVideoBitrate = obj["exportVideoBitrate"].toInt(d.exportVideoBitrate);
    cfg.exportAudioBitrate = obj["exportAudioBitrate"].toInt(d.exportAudioBitrate);
    cfg.exportDirectory = obj["exportDirectory"].toString(d.exportDirectory);
    cfg.logRules = obj["logRules"].toString(d.logRules);
    return cfg;
}
