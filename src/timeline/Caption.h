#pragma once

#include <QString>
#include <QColor>
#include <optional>
#include "AppConstants.h"

enum class CaptionPosition {
    Top,
    Center,
    Bottom
};

enum class CaptionSize {
    Small,
    Medium,
    Large,
    XLarge
};

enum class CaptionFontStyle {
    Gothic,   // sans-serif
    Mincho    // serif
};

struct Caption {
    QString id;
    QString text;
    double startTime = 0.0;
    double endTime = 0.0;

    // Per-caption overrides; unset fields fall back to CaptionSettings
    std::optional<CaptionPosition> overridePosition;
    std::optional<CaptionFontStyle> overrideFontStyle;
    std::optional<CaptionSize> overrideFontSize;
    std::optional<bool> overrideFadeIn;
    std::optional<bool> overrideFadeOut;
    std::optional<double> overrideFadeInDuration;
    std::optional<double> overrideFadeOutDuration;

    bool isActiveAt(double t) const { return t >= startTime && t < endTime; }
};

struct CaptionSettings {
    bool enabled = true;
    CaptionSize fontSize = CaptionSize::Medium;
    CaptionFontStyle fontStyle = CaptionFontStyle::Gothic;
    QColor fontColor{0xFF, 0xFF, 0xFF};
    QColor strokeColor{0x00, 0x00, 0x00};
    double strokeWidth = 2.0;
    CaptionPosition position = CaptionPosition::Bottom;
    double blur = 0.0;          // 0..5 px
    bool bulkFadeIn = false;
    bool bulkFadeOut = false;
    double bulkFadeInDuration = AppConstants::DefaultCaptionFadeDuration;
    double bulkFadeOutDuration = AppConstants::DefaultCaptionFadeDuration;
};

// Effective style of one caption after override resolution.
struct ResolvedCaptionStyle {
    CaptionPosition position = CaptionPosition::Bottom;
    CaptionFontStyle fontStyle = CaptionFontStyle::Gothic;
    int pixelSize = 48;
    bool fadeIn = false;
    bool fadeOut = false;
    double fadeInDuration = AppConstants::DefaultCaptionFadeDuration;
    double fadeOutDuration = AppConstants::DefaultCaptionFadeDuration;
};
