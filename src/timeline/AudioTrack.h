#pragma once

#include <QString>
#include "AppConstants.h"

// Background music. At most one per project.
struct AudioTrack {
    QString sourcePath;
    QString displayName;
    double duration = 0.0;     // source length
    double startPoint = 0.0;   // head trim inside the source
    double delay = 0.0;        // when the track begins on the global timeline
    double volume = 1.0;
    bool fadeIn = false;
    bool fadeOut = false;
    double fadeInDuration = AppConstants::DefaultMusicFadeDuration;
    double fadeOutDuration = AppConstants::DefaultMusicFadeDuration;

    bool isValid() const { return !sourcePath.isEmpty(); }
};

// Independently placed voice clip. trimStart/trimEnd select the audible
// span of the source; startTime places it on the global timeline.
struct NarrationClip {
    QString id;
    QString sourcePath;
    QString displayName;
    double duration = 0.0;
    double startTime = 0.0;
    double trimStart = 0.0;
    double trimEnd = 0.0;
    double volume = 1.0;
    bool isMuted = false;

    double playLength() const { return trimEnd - trimStart; }
};
