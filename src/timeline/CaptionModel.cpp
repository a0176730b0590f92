#include "CaptionModel.h"
#include "Logging.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QUuid>
#include <algorithm>

namespace {

QString positionName(CaptionPosition p) {
    switch (p) {
        case CaptionPosition::Top:    return "top";
        case CaptionPosition::Center: return "center";
        case CaptionPosition::Bottom: return "bottom";
    }
    return "bottom";
}

std::optional<CaptionPosition> positionFromName(const QString& name) {
    if (name == "top") return CaptionPosition::Top;
    if (name == "center") return CaptionPosition::Center;
    if (name == "bottom") return CaptionPosition::Bottom;
    return std::nullopt;
}

QString sizeName(CaptionSize s) {
    switch (s) {
        case CaptionSize::Small:  return "small";
        case CaptionSize::Medium: return "medium";
        case CaptionSize::Large:  return "large";
        case CaptionSize::XLarge: return "xlarge";
    }
    return "medium";
}

std::optional<CaptionSize> sizeFromName(const QString& name) {
    if (name == "small") return CaptionSize::Small;
    if (name == "medium") return CaptionSize::Medium;
    if (name == "large") return CaptionSize::Large;
    if (name == "xlarge") return CaptionSize::XLarge;
    return std::nullopt;
}

QString fontStyleName(CaptionFontStyle f) {
    return f == CaptionFontStyle::Mincho ? "mincho" : "gothic";
}

std::optional<CaptionFontStyle> fontStyleFromName(const QString& name) {
    if (name == "gothic") return CaptionFontStyle::Gothic;
    if (name == "mincho") return CaptionFontStyle::Mincho;
    return std::nullopt;
}

} // namespace

CaptionModel::CaptionModel(QObject* parent) : QObject(parent) {}
CaptionModel::~CaptionModel() = default;

QString CaptionModel::addCaption(Caption caption) {
    if (caption.id.isEmpty())
        caption.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    caption.startTime = std::max(0.0, caption.startTime);
    caption.endTime = std::max(caption.startTime, caption.endTime);
    QString id = caption.id;
    m_captions.push_back(std::move(caption));
    emit captionsChanged();
    return id;
}

void CaptionModel::updateCaption(const Caption& caption) {
    for (auto& c : m_captions) {
        if (c.id == caption.id) {
            c = caption;
            c.startTime = std::max(0.0, c.startTime);
            c.endTime = std::max(c.startTime, c.endTime);
            emit captionsChanged();
            return;
        }
    }
}

void CaptionModel::removeCaption(const QString& id) {
    auto it = std::find_if(m_captions.begin(), m_captions.end(),
                           [&](const Caption& c) { return c.id == id; });
    if (it == m_captions.end()) return;
    m_captions.erase(it);
    emit captionsChanged();
}

void CaptionModel::moveCaption(int from, int to) {
    int n = captionCount();
    if (from < 0 || from >= n || to < 0 || to >= n || from == to) return;
    Caption moved = std::move(m_captions[from]);
    m_captions.erase(m_captions.begin() + from);
    m_captions.insert(m_captions.begin() + to, std::move(moved));
    emit captionsChanged();
}

void CaptionModel::clear() {
    m_captions.clear();
    emit captionsChanged();
}

void CaptionModel::setSettings(const CaptionSettings& settings) {
    m_settings = settings;
    m_settings.blur = qBound(0.0, m_settings.blur, 5.0);
    emit captionsChanged();
}

void CaptionModel::setEnabled(bool enabled) {
    m_settings.enabled = enabled;
    emit captionsChanged();
}

std::vector<const Caption*> CaptionModel::activeCaptions(double t) const {
    std::vector<const Caption*> active;
    if (!m_settings.enabled) return active;
    for (const auto& c : m_captions) {
        if (c.isActiveAt(t)) active.push_back(&c);
    }
    return active;
}

int CaptionModel::pixelSize(CaptionSize size) {
    switch (size) {
        case CaptionSize::Small:  return 32;
        case CaptionSize::Medium: return 48;
        case CaptionSize::Large:  return 64;
        case CaptionSize::XLarge: return 80;
    }
    return 48;
}

ResolvedCaptionStyle CaptionModel::resolveStyle(const Caption& caption, const CaptionSettings& settings) {
    ResolvedCaptionStyle style;
    style.position = caption.overridePosition.value_or(settings.position);
    style.fontStyle = caption.overrideFontStyle.value_or(settings.fontStyle);
    style.pixelSize = pixelSize(caption.overrideFontSize.value_or(settings.fontSize));
    style.fadeIn = caption.overrideFadeIn.value_or(settings.bulkFadeIn);
    style.fadeOut = caption.overrideFadeOut.value_or(settings.bulkFadeOut);

    // A per-caption duration only applies when that caption forces the fade on
    bool ownFadeIn = caption.overrideFadeIn.value_or(false) && caption.overrideFadeInDuration.has_value();
    bool ownFadeOut = caption.overrideFadeOut.value_or(false) && caption.overrideFadeOutDuration.has_value();
    double bulkIn = settings.bulkFadeInDuration > 0.0 ? settings.bulkFadeInDuration : 1.0;
    double bulkOut = settings.bulkFadeOutDuration > 0.0 ? settings.bulkFadeOutDuration : 1.0;
    style.fadeInDuration = ownFadeIn ? *caption.overrideFadeInDuration : bulkIn;
    style.fadeOutDuration = ownFadeOut ? *caption.overrideFadeOutDuration : bulkOut;
    return style;
}

double CaptionModel::captionAlpha(const Caption& caption, const ResolvedCaptionStyle& style, double t) {
    double duration = caption.endTime - caption.startTime;
    double local = t - caption.startTime;

    double fadeInAlpha = 1.0;
    double fadeOutAlpha = 1.0;
    if (style.fadeIn && style.fadeInDuration > 0.0 && local < style.fadeInDuration)
        fadeInAlpha = local / style.fadeInDuration;
    if (style.fadeOut && style.fadeOutDuration > 0.0 && local > duration - style.fadeOutDuration)
        fadeOutAlpha = (duration - local) / style.fadeOutDuration;

    return qBound(0.0, fadeInAlpha * fadeOutAlpha, 1.0);
}

bool CaptionModel::save(const QString& filePath) const {
    QJsonArray arr;
    for (const auto& c : m_captions)
        arr.append(captionToJson(c));

    QJsonObject root;
    root["version"] = 1;
    root["settings"] = settingsToJson(m_settings);
    root["captions"] = arr;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    return true;
}

bool CaptionModel::load(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    auto doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        m_error = "Invalid caption file format";
        return false;
    }

    auto root = doc.object();
    if (root.contains("settings"))
        m_settings = settingsFromJson(root["settings"].toObject());

    m_captions.clear();
    for (const auto& val : root["captions"].toArray())
        addCaption(captionFromJson(val.toObject()));

    qCInfo(srTimeline, "loaded %d captions from %s", captionCount(), qPrintable(filePath));
    emit captionsChanged();
    return true;
}

QJsonObject CaptionModel::captionToJson(const Caption& caption) {
    QJsonObject obj;
    obj["id"] = caption.id;
    obj["text"] = caption.text;
    obj["startTime"] = caption.startTime;
    obj["endTime"] = caption.endTime;
    if (caption.overridePosition) obj["overridePosition"] = positionName(*caption.overridePosition);
    if (caption.overrideFontStyle) obj["overrideFontStyle"] = fontStyleName(*caption.overrideFontStyle);
    if (caption.overrideFontSize) obj["overrideFontSize"] = sizeName(*caption.overrideFontSize);
    if (caption.overrideFadeIn) obj["overrideFadeIn"] = *caption.overrideFadeIn ? "on" : "off";
    if (caption.overrideFadeOut) obj["overrideFadeOut"] = *caption.overrideFadeOut ? "on" : "off";
    if (caption.overrideFadeInDuration) obj["overrideFadeInDuration"] = *caption.overrideFadeInDuration;
    if (caption.overrideFadeOutDuration) obj["overrideFadeOutDuration"] = *caption.overrideFadeOutDuration;
    return obj;
}

Caption CaptionModel::captionFromJson(const QJsonObject& obj) {
    Caption c;
    c.id = obj["id"].toString();
    c.text = obj["text"].toString();
    c.startTime = obj["startTime"].toDouble();
    c.endTime = obj["endTime"].toDouble(c.startTime);
    c.overridePosition = positionFromName(obj["overridePosition"].toString());
    c.overrideFontStyle = fontStyleFromName(obj["overrideFontStyle"].toString());
    c.overrideFontSize = sizeFromName(obj["overrideFontSize"].toString());
    if (obj.contains("overrideFadeIn")) c.overrideFadeIn = obj["overrideFadeIn"].toString() == "on";
    if (obj.contains("overrideFadeOut")) c.overrideFadeOut = obj["overrideFadeOut"].toString() == "on";
    if (obj.contains("overrideFadeInDuration")) c.overrideFadeInDuration = obj["overrideFadeInDuration"].toDouble();
    if (obj.contains("overrideFadeOutDuration")) c.overrideFadeOutDuration = obj["overrideFadeOutDuration"].toDouble();
    return c;
}

QJsonObject CaptionModel::settingsToJson(const CaptionSettings& settings) {
    QJsonObject obj;
    obj["enabled"] = settings.enabled;
    obj["fontSize"] = sizeName(settings.fontSize);
    obj["fontStyle"] = fontStyleName(settings.fontStyle);
    obj["fontColor"] = settings.fontColor.name();
    obj["strokeColor"] = settings.strokeColor.name();
    obj["strokeWidth"] = settings.strokeWidth;
    obj["position"] = positionName(settings.position);
    obj["blur"] = settings.blur;
    obj["bulkFadeIn"] = settings.bulkFadeIn;
    obj["bulkFadeOut"] = settings.bulkFadeOut;
    obj["bulkFadeInDuration"] = settings.bulkFadeInDuration;
    obj["bulkFadeOutDuration"] = settings.bulkFadeOutDuration;
    return obj;
}

CaptionSettings CaptionModel::settingsFromJson(const QJsonObject& obj) {
    CaptionSettings s;
    s.enabled = obj["enabled"].toBool(true);
    s.fontSize = sizeFromName(obj["fontSize"].toString()).value_or(CaptionSize::Medium);
    s.fontStyle = fontStyleFromName(obj["fontStyle"].toString()).value_or(CaptionFontStyle::Gothic);
    s.fontColor = QColor(obj["fontColor"].toString("#ffffff"));
    s.strokeColor = QColor(obj["strokeColor"].toString("#000000"));
    s.strokeWidth = obj["strokeWidth"].toDouble(2.0);
    s.position = positionFromName(obj["position"].toString()).value_or(CaptionPosition::Bottom);
    s.blur = qBound(0.0, obj["blur"].toDouble(0.0), 5.0);
    s.bulkFadeIn = obj["bulkFadeIn"].toBool(false);
    s.bulkFadeOut = obj["bulkFadeOut"].toBool(false);
    s.bulkFadeInDuration = obj["bulkFadeInDuration"].toDouble(AppConstants::DefaultCaptionFadeDuration);
    s.bulkFadeOutDuration = obj["bulkFadeOutDuration"].toDouble(AppConstants::DefaultCaptionFadeDuration);
    return s;
}
