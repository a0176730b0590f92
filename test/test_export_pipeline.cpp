#include <cassert>
#include <cstdio>
#include <cmath>
#include <cstdlib>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QTemporaryDir>
#include "EngineFixture.h"
#include "audio/ExportAudioSink.h"
#include "export/ExportPipeline.h"
#include "export/EncodingProfile.h"

static bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

struct ExportFixture {
    ExportFixture()
        : sink(2)
        , pipeline(&f.engine, &f.compositor, &f.mixer, &sink, &recorder, &f.scheduler, exportConfig())
    {
        f.mixer.setExportEndpoint(&sink);
        pipeline.setEncoderProbe([](const QString&) { return true; });

        QObject::connect(&pipeline, &ExportPipeline::priming, [this]() { ++primings; });
        QObject::connect(&pipeline, &ExportPipeline::recording, [this]() { ++recordings; });
        QObject::connect(&pipeline, &ExportPipeline::done, [this](const ExportArtifact& a) {
            ++dones;
            artifact = a;
        });
        QObject::connect(&pipeline, &ExportPipeline::failed, [this](const QString& r) {
            ++failures;
            reason = r;
        });
        QObject::connect(&pipeline, &ExportPipeline::progress, [this](double p) { lastProgress = p; });
    }

    EngineConfig exportConfig() {
        EngineConfig config = smallCanvasConfig();
        config.exportDirectory = outDir.path();
        return config;
    }

    // Runs the priming phase up to the first recorded step.
    void runPriming() {
        f.scheduler.advance(AppConstants::PrimingSettleMs);
        f.scheduler.advance(AppConstants::PrimingRecordDelayMs);
    }

    QTemporaryDir outDir;
    EngineFixture f;
    ExportAudioSink sink;
    FakeRecorder recorder;
    ExportPipeline pipeline;

    int primings = 0;
    int recordings = 0;
    int dones = 0;
    int failures = 0;
    double lastProgress = -1.0;
    QString reason;
    ExportArtifact artifact;
};

void test_full_export_produces_one_artifact() {
    ExportFixture x;
    assert(x.outDir.isValid());
    x.f.addImage("still.png", 12.0);
    x.f.library.add("music.mp3", FakeMedia{30.0, Qt::black, 0.5f, false});
    AudioTrack music;
    music.sourcePath = "music.mp3";
    music.duration = 30.0;
    x.f.tracks.setMusic(music);

    assert(x.pipeline.startExport());
    assert(x.pipeline.state() == ExportState::Priming);
    assert(x.primings == 1);
    assert(x.f.mixer.destination() == AudioMixer::Destination::Export);
    assert(x.recorder.starts == 0);

    x.f.scheduler.advance(AppConstants::PrimingSettleMs - 1);
    assert(x.pipeline.state() == ExportState::Priming);

    x.f.scheduler.advance(1 + AppConstants::PrimingRecordDelayMs);
    assert(x.pipeline.state() == ExportState::Recording);
    assert(x.recordings == 1);
    assert(x.recorder.starts == 1);
    assert(x.recorder.settings.fps == 30);
    assert(x.recorder.settings.width == 320 && x.recorder.settings.height == 180);
    assert(x.recorder.settings.profile.videoEncoder == "libx264");
    assert(x.f.engine.isExporting());

    x.f.scheduler.advance(13000);

    assert(x.dones == 1);
    assert(x.failures == 0);
    assert(x.pipeline.state() == ExportState::Done);
    assert(x.recorder.finishes == 1);
    assert(x.recorder.videoFrames == 360);
    // At most the last frame interval of audio is left unpumped
    assert(x.recorder.audioFrames >= 12 * 48000 - 48000 / 30);
    assert(x.recorder.audioFrames <= 12 * 48000);
    assert(near(x.lastProgress, 1.0));
    assert(x.f.mixer.destination() == AudioMixer::Destination::Monitor);
    assert(x.f.engine.state() == PlaybackState::Stopped);

    assert(x.artifact.fileName.startsWith("storyreel_"));
    assert(x.artifact.fileName.endsWith(".mp4"));
    assert(x.artifact.mimeType == "video/mp4");
    assert(near(x.artifact.duration, 12.0));
    QFile file(x.artifact.filePath);
    assert(file.open(QIODevice::ReadOnly));
    QByteArray data = file.readAll();
    assert(data == "encoded:360");
    assert(x.artifact.sizeBytes == data.size());

    // Nothing more happens afterwards
    x.f.scheduler.advance(5000);
    assert(x.dones == 1);

    x.pipeline.reset();
    assert(x.pipeline.state() == ExportState::Idle);
    printf("PASS: test_full_export_produces_one_artifact\n");
}

void test_fixed_rate_duplicates_lagging_frames() {
    ExportFixture x;
    x.f.addImage("still.png", 1.0);

    assert(x.pipeline.startExport());
    x.runPriming();

    // One stalled step covering a third of a second
    x.f.scheduler.advance(20);
    x.f.clock.advance(0.3);
    x.f.scheduler.advance(20);
    assert(x.recorder.videoFrames == 10);

    x.f.scheduler.advance(2000);
    assert(x.dones == 1);
    assert(x.recorder.videoFrames == 30);
    printf("PASS: test_fixed_rate_duplicates_lagging_frames\n");
}

void test_stall_keeps_audio_with_video() {
    ExportFixture x;
    x.f.addImage("still.png", 2.0);
    x.f.library.add("music.mp3", FakeMedia{30.0, Qt::black, 0.5f, false});
    AudioTrack music;
    music.sourcePath = "music.mp3";
    music.duration = 30.0;
    x.f.tracks.setMusic(music);

    assert(x.pipeline.startExport());
    x.runPriming();

    // The UI thread blocks for a whole second before the first step
    x.f.scheduler.advance(20);
    x.f.clock.advance(1.0);
    x.f.scheduler.advance(20);
    assert(x.recorder.videoFrames == 31);
    assert(x.recorder.audioFrames >= 49000);

    x.f.scheduler.advance(3000);
    assert(x.dones == 1);
    assert(x.recorder.videoFrames == 60);

    long long expected = static_cast<long long>(x.recorder.videoFrames) * 48000 / 30;
    assert(std::llabs(x.recorder.audioFrames - expected) <= 48000 / 30);
    printf("PASS: test_stall_keeps_audio_with_video\n");
}

void test_rejects_busy_and_empty() {
    ExportFixture x;
    assert(!x.pipeline.startExport());
    assert(!x.pipeline.errorString().isEmpty());
    assert(x.pipeline.state() == ExportState::Idle);

    x.f.addImage("still.png", 2.0);
    assert(x.pipeline.startExport());
    assert(!x.pipeline.startExport());
    assert(x.pipeline.isBusy());
    assert(x.primings == 1);
    printf("PASS: test_rejects_busy_and_empty\n");
}

void test_recorder_start_failure() {
    ExportFixture x;
    x.f.addImage("still.png", 2.0);
    x.recorder.failStart = true;

    assert(x.pipeline.startExport());
    x.runPriming();

    assert(x.failures == 1);
    assert(x.reason.contains("encoder unavailable"));
    assert(x.pipeline.state() == ExportState::Idle);
    assert(x.recorder.aborts == 1);
    assert(x.f.mixer.destination() == AudioMixer::Destination::Monitor);
    assert(!x.f.engine.isPlaying());
    assert(x.dones == 0);
    printf("PASS: test_recorder_start_failure\n");
}

void test_encoder_failure_mid_export() {
    ExportFixture x;
    x.f.addImage("still.png", 3.0);
    x.recorder.failVideoAt = 20;

    assert(x.pipeline.startExport());
    x.runPriming();
    x.f.scheduler.advance(4000);

    assert(x.failures == 1);
    assert(x.dones == 0);
    assert(x.recorder.videoFrames == 20);
    assert(x.f.engine.state() == PlaybackState::Stopped);
    assert(x.pipeline.state() == ExportState::Idle);
    assert(QDir(x.outDir.path()).entryList(QDir::Files).isEmpty());
    printf("PASS: test_encoder_failure_mid_export\n");
}

void test_stop_while_priming_cancels() {
    ExportFixture x;
    x.f.addImage("still.png", 2.0);

    assert(x.pipeline.startExport());
    x.pipeline.stopExport();
    assert(x.pipeline.state() == ExportState::Idle);
    assert(x.f.mixer.destination() == AudioMixer::Destination::Monitor);

    x.f.scheduler.advance(1000);
    assert(x.recorder.starts == 0);
    assert(x.dones == 0 && x.failures == 0);
    printf("PASS: test_stop_while_priming_cancels\n");
}

void test_stop_while_recording_keeps_partial() {
    ExportFixture x;
    x.f.addImage("still.png", 10.0);

    assert(x.pipeline.startExport());
    x.runPriming();
    x.f.scheduler.advance(1000);
    x.pipeline.stopExport();

    assert(x.dones == 1);
    assert(x.pipeline.state() == ExportState::Done);
    assert(x.artifact.duration > 0.9 && x.artifact.duration < 1.1);
    assert(QFileInfo::exists(x.artifact.filePath));
    assert(!x.f.engine.isPlaying());
    printf("PASS: test_stop_while_recording_keeps_partial\n");
}

void test_render_failures_fail_export() {
    ExportFixture x;
    QString id = x.f.addVideo("a.mp4", 10.0);

    assert(x.pipeline.startExport());
    x.runPriming();
    x.f.source(id)->setThrowOnFrame(true);
    x.f.scheduler.advance(10000);

    assert(x.failures == 1);
    assert(x.dones == 0);
    assert(x.pipeline.state() == ExportState::Idle);
    assert(x.f.engine.state() == PlaybackState::Stopped);
    printf("PASS: test_render_failures_fail_export\n");
}

void test_profile_negotiation_order() {
    EncodingProfile best = EncodingProfiles::negotiate([](const QString&) { return true; });
    assert(best.container == "mp4" && best.videoEncoder == "libx264" && best.audioEncoder == "aac");

    EncodingProfile second = EncodingProfiles::negotiate([](const QString& name) { return name != "libx264"; });
    assert(second.videoEncoder == "libopenh264");

    EncodingProfile webm = EncodingProfiles::negotiate([](const QString& name) {
        return name == "libvpx" || name == "opus";
    });
    assert(webm.container == "webm" && webm.audioEncoder == "opus" && webm.mimeType == "video/webm");

    EncodingProfile none = EncodingProfiles::negotiate([](const QString&) { return false; });
    assert(none.isFallback);
    assert(none.extension == "mkv");
    assert(none.videoEncoder == "mjpeg");
    printf("PASS: test_profile_negotiation_order\n");
}

int main(int argc, char* argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);

    test_full_export_produces_one_artifact();
    test_fixed_rate_duplicates_lagging_frames();
    test_stall_keeps_audio_with_video();
    test_rejects_busy_and_empty();
    test_recorder_start_failure();
    test_encoder_failure_mid_export();
    test_stop_while_priming_cancels();
    test_stop_while_recording_keeps_partial();
    test_render_failures_fail_export();
    test_profile_negotiation_order();
    printf("All export pipeline tests passed.\n");
    return 0;
}
