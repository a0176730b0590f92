#pragma once

#include <QString>
#include "ClipTransform.h"
#include "AppConstants.h"

enum class MediaKind {
    Video,
    Image
};

struct FadeSettings {
    bool fadeIn = false;
    bool fadeOut = false;
    double fadeInDuration = AppConstants::DefaultItemFadeDuration;
    double fadeOutDuration = AppConstants::DefaultItemFadeDuration;
};

// One visual entry of the global timeline.
struct MediaItem {
    QString id;
    QString sourcePath;
    QString displayName;
    MediaKind kind = MediaKind::Video;

    double duration = 0.0;          // trimEnd - trimStart for video, display time for image

    // Video only
    double originalDuration = 0.0;
    double trimStart = 0.0;
    double trimEnd = 0.0;
    bool isTrimInitialized = false;

    ClipTransform transform;

    // Audio controls (video only)
    double volume = 1.0;
    bool isMuted = false;

    FadeSettings fades;

    bool isVideo() const { return kind == MediaKind::Video; }
    bool isImage() const { return kind == MediaKind::Image; }
};
