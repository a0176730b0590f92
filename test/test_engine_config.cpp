#include <cassert>
#include <cstdio>
#include <cmath>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>
#include "app/EngineConfig.h"

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

void test_defaults() {
    EngineConfig config;
    assert(config.canvasWidth == 1280);
    assert(config.canvasHeight == 720);
    assert(near(config.fps, 30.0));
    assert(near(config.liveDriftTolerance, 0.8));
    assert(near(config.exactDriftTolerance, 0.01));
    assert(near(config.trackLiveDriftTolerance, 0.5));
    assert(near(config.trackExactDriftTolerance, 0.1));
    assert(near(config.preloadLookahead, 1.5));
    assert(config.maxConsecutiveRenderFailures == 120);
    assert(config.exportDirectory.isEmpty());

    // An empty object keeps every default
    EngineConfig fromEmpty = EngineConfigStore::fromJson(QJsonObject());
    assert(fromEmpty.canvasWidth == config.canvasWidth);
    assert(near(fromEmpty.videoGainTimeConstant, config.videoGainTimeConstant));
    assert(fromEmpty.exportVideoBitrate == config.exportVideoBitrate);
    printf("PASS: test_defaults\n");
}

void test_json_fields() {
    EngineConfig config;
    config.canvasWidth = 1920;
    config.canvasHeight = 1080;
    config.fps = 25.0;
    config.liveDriftTolerance = 0.6;
    config.maxConsecutiveRenderFailures = 10;
    config.exportDirectory = "/tmp/out";
    config.logRules = "storyreel.*.debug=true";

    QJsonObject obj = EngineConfigStore::toJson(config);
    assert(obj["canvasWidth"].toInt() == 1920);
    assert(obj["logRules"].toString() == "storyreel.*.debug=true");

    EngineConfig back = EngineConfigStore::fromJson(obj);
    assert(back.canvasHeight == 1080);
    assert(near(back.fps, 25.0));
    assert(near(back.liveDriftTolerance, 0.6));
    assert(back.maxConsecutiveRenderFailures == 10);
    assert(back.exportDirectory == "/tmp/out");
    printf("PASS: test_json_fields\n");
}

void test_values_clamped() {
    QJsonObject obj;
    obj["canvasWidth"] = 4;
    obj["canvasHeight"] = -10;
    obj["fps"] = 500.0;
    obj["maxConsecutiveRenderFailures"] = 0;

    EngineConfig config = EngineConfigStore::fromJson(obj);
    assert(config.canvasWidth == 16);
    assert(config.canvasHeight == 16);
    assert(near(config.fps, 120.0));
    assert(config.maxConsecutiveRenderFailures == 1);

    obj["fps"] = 0.0;
    assert(near(EngineConfigStore::fromJson(obj).fps, 1.0));
    printf("PASS: test_values_clamped\n");
}

void test_save_and_load() {
    QTemporaryDir dir;
    assert(dir.isValid());
    QString path = dir.filePath("nested/engine.json");

    EngineConfig config;
    config.fps = 24.0;
    config.exportAudioBitrate = 128000;

    EngineConfigStore store;
    assert(store.save(path, config));

    EngineConfig loaded;
    assert(store.load(path, loaded));
    assert(near(loaded.fps, 24.0));
    assert(loaded.exportAudioBitrate == 128000);
    printf("PASS: test_save_and_load\n");
}

void test_load_errors() {
    EngineConfigStore store;
    EngineConfig config;
    config.fps = 50.0;

    assert(!store.load("/nonexistent/engine.json", config));
    assert(store.errorString().startsWith("Cannot read"));
    // A failed load leaves the caller's values alone
    assert(near(config.fps, 50.0));

    QTemporaryDir dir;
    QString path = dir.filePath("broken.json");
    QFile file(path);
    assert(file.open(QIODevice::WriteOnly));
    file.write("not json");
    file.close();

    assert(!store.load(path, config));
    assert(store.errorString() == "Invalid config format");
    assert(near(config.fps, 50.0));
    printf("PASS: test_load_errors\n");
}

int main() {
    test_defaults();
    test_json_fields();
    test_values_clamped();
    test_save_and_load();
    test_load_errors();
    printf("All engine config tests passed.\n");
    return 0;
}
