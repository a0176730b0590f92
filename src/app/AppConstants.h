#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "StoryReel";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "StoryReel";

    inline constexpr int DefaultWindowWidth = 1400;
    inline constexpr int DefaultWindowHeight = 900;

    // Output canvas
    inline constexpr int CanvasWidth = 1280;
    inline constexpr int CanvasHeight = 720;
    inline constexpr double DefaultFps = 30.0;

    // Mixer format (interleaved float)
    inline constexpr int MixSampleRate = 48000;
    inline constexpr int MixChannels = 2;

    // Sync tolerances (seconds)
    inline constexpr double LiveDriftTolerance = 0.8;
    inline constexpr double ExactDriftTolerance = 0.01;
    inline constexpr double TrackLiveDriftTolerance = 0.5;
    inline constexpr double TrackExactDriftTolerance = 0.1;
    inline constexpr double PreloadLookahead = 1.5;
    inline constexpr double PreloadRepositionThreshold = 0.1;
    inline constexpr double EndFallbackWindow = 0.2;

    // Gain smoothing time constants (seconds)
    inline constexpr double VideoGainTimeConstant = 0.05;
    inline constexpr double TrackGainTimeConstant = 0.1;
    inline constexpr double PreDelayGainTimeConstant = 0.01;

    // Item limits
    inline constexpr double MinScale = 0.5;
    inline constexpr double MaxScale = 3.0;
    inline constexpr double MaxPositionX = 1280.0;
    inline constexpr double MaxPositionY = 720.0;
    inline constexpr double MaxVolume = 2.5;          // items and tracks
    inline constexpr double MinTrimGap = 0.1;
    inline constexpr double MinNarrationTrimGap = 0.05;
    inline constexpr double DefaultImageDuration = 5.0;
    inline constexpr double MinImageDuration = 0.5;
    inline constexpr double MaxImageDuration = 60.0;
    inline constexpr double DefaultItemFadeDuration = 1.0;
    inline constexpr double DefaultMusicFadeDuration = 2.0;
    inline constexpr double DefaultCaptionFadeDuration = 0.5;

    // Render loop
    inline constexpr int MaxConsecutiveRenderFailures = 120;
    inline constexpr double SeekSettleTimeout = 3.0;   // seconds of exact retries after a seek

    // Export
    inline constexpr int ExportVideoBitrate = 5000000;
    inline constexpr int ExportAudioBitrate = 128000;
    inline constexpr int PrimingSettleMs = 200;
    inline constexpr int PrimingRecordDelayMs = 100;
}
