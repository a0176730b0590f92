#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <vector>
#include "Caption.h"

class CaptionModel : public QObject {
    Q_OBJECT
public:
    explicit CaptionModel(QObject* parent = nullptr);
    ~CaptionModel();

    QString addCaption(Caption caption);
    void updateCaption(const Caption& caption);
    void removeCaption(const QString& id);
    void moveCaption(int from, int to);
    void clear();

    const std::vector<Caption>& captions() const { return m_captions; }
    int captionCount() const { return static_cast<int>(m_captions.size()); }

    const CaptionSettings& settings() const { return m_settings; }
    void setSettings(const CaptionSettings& settings);
    void setEnabled(bool enabled);

    // Captions whose [start, end) contains t, in list order.
    std::vector<const Caption*> activeCaptions(double t) const;

    static ResolvedCaptionStyle resolveStyle(const Caption& caption, const CaptionSettings& settings);
    static int pixelSize(CaptionSize size);
    static double captionAlpha(const Caption& caption, const ResolvedCaptionStyle& style, double t);

    // Caption list files (JSON)
    bool save(const QString& filePath) const;
    bool load(const QString& filePath);
    QString errorString() const { return m_error; }

    static QJsonObject captionToJson(const Caption& caption);
    static Caption captionFromJson(const QJsonObject& obj);
    static QJsonObject settingsToJson(const CaptionSettings& settings);
    static CaptionSettings settingsFromJson(const QJsonObject& obj);

signals:
    void captionsChanged();

private:
    std::vector<Caption> m_captions;
    CaptionSettings m_settings;
    mutable QString m_error;
};
