#include <cassert>
#include <cstdio>
#include <cmath>
#include <limits>
#include <QStringList>
#include "timeline/Timeline.h"
#include "timeline/TimelineModel.h"

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

static std::vector<MediaItem> itemsWithDurations(std::initializer_list<double> durations) {
    std::vector<MediaItem> items;
    int n = 0;
    for (double d : durations) {
        MediaItem item;
        item.id = QString("item%1").arg(n++);
        item.duration = d;
        items.push_back(item);
    }
    return items;
}

void test_total_and_active_item() {
    auto items = itemsWithDurations({10.0, 5.0, 20.0});
    assert(near(Timeline::totalDuration(items), 35.0));

    auto active = Timeline::resolveActiveItem(items, 12.0);
    assert(active.has_value());
    assert(active->index == 1);
    assert(near(active->localTime, 2.0));

    // Boundaries belong to the later item
    assert(Timeline::resolveActiveItem(items, 0.0)->index == 0);
    assert(Timeline::resolveActiveItem(items, 10.0)->index == 1);
    assert(Timeline::resolveActiveItem(items, 15.0)->index == 2);
    assert(near(Timeline::resolveActiveItem(items, 34.999)->localTime, 19.999, 1e-6));

    assert(!Timeline::resolveActiveItem(items, 35.0).has_value());
    assert(!Timeline::resolveActiveItem(items, -0.1).has_value());
    assert(!Timeline::resolveActiveItem({}, 0.0).has_value());
    printf("PASS: test_total_and_active_item\n");
}

void test_non_finite_durations_ignored() {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    auto items = itemsWithDurations({4.0, nan, 0.0, inf, 6.0});
    assert(near(Timeline::totalDuration(items), 10.0));

    auto active = Timeline::resolveActiveItem(items, 5.0);
    assert(active && active->index == 4);
    assert(near(active->localTime, 1.0));
    assert(near(Timeline::itemStartTime(items, 4), 4.0));
    assert(!Timeline::resolveActiveItem(items, nan).has_value());
    printf("PASS: test_non_finite_durations_ignored\n");
}

void test_item_start_times() {
    auto items = itemsWithDurations({3.0, 4.0, 5.0});
    assert(near(Timeline::itemStartTime(items, 0), 0.0));
    assert(near(Timeline::itemStartTime(items, 2), 7.0));
    assert(near(Timeline::itemStartTime(items, 10), 12.0));
    printf("PASS: test_item_start_times\n");
}

void test_fade_alpha() {
    FadeSettings none;
    assert(near(Timeline::fadeAlpha(0.0, 5.0, none), 1.0));

    FadeSettings fades;
    fades.fadeIn = true;
    fades.fadeOut = true;
    fades.fadeInDuration = 1.0;
    fades.fadeOutDuration = 2.0;
    assert(near(Timeline::fadeAlpha(0.0, 10.0, fades), 0.0));
    assert(near(Timeline::fadeAlpha(0.25, 10.0, fades), 0.25));
    assert(near(Timeline::fadeAlpha(5.0, 10.0, fades), 1.0));
    assert(near(Timeline::fadeAlpha(9.0, 10.0, fades), 0.5));
    assert(near(Timeline::fadeAlpha(10.0, 10.0, fades), 0.0));
    assert(near(Timeline::fadeAlpha(12.0, 10.0, fades), 0.0));

    // Never falls while fading in, never rises while fading out
    double previous = Timeline::fadeAlpha(0.0, 10.0, fades);
    for (int i = 1; i <= 1000; ++i) {
        double t = i * 0.01;
        double alpha = Timeline::fadeAlpha(t, 10.0, fades);
        assert(alpha >= 0.0 && alpha <= 1.0);
        if (t <= fades.fadeInDuration) assert(alpha >= previous - 1e-12);
        if (t >= 10.0 - fades.fadeOutDuration) assert(alpha <= previous + 1e-12);
        previous = alpha;
    }
    printf("PASS: test_fade_alpha\n");
}

void test_trim_validation() {
    // Single end update from an existing start
    TrimRange r = TimelineModel::validateTrim(5.0, 25.0, 30.0);
    assert(near(r.start, 5.0) && near(r.end, 25.0));
    assert(near(r.duration(), 20.0));

    // Crossed handles keep the minimum gap
    r = TimelineModel::validateTrim(10.0, 4.0, 30.0);
    assert(r.start <= r.end - 0.1 + 1e-9);
    assert(r.start >= 0.0 && r.end <= 30.0);

    r = TimelineModel::validateTrim(-3.0, 50.0, 30.0);
    assert(near(r.start, 0.0) && near(r.end, 30.0));

    r = TimelineModel::validateTrim(29.99, 30.0, 30.0);
    assert(r.end <= 30.0 && r.start <= r.end - 0.1 + 1e-9);

    r = TimelineModel::validateTrim(0.0, 1.0, 0.05);
    assert(near(r.start, 0.0) && near(r.end, 0.05));
    printf("PASS: test_trim_validation\n");
}

void test_video_duration_initialises_trim_once() {
    TimelineModel model;
    MediaItem video;
    video.sourcePath = "a.mp4";
    video.kind = MediaKind::Video;
    video.duration = 99.0;
    QString id = model.addItem(video);
    assert(near(model.find(id)->duration, 0.0));

    model.setVideoDuration(id, 30.0);
    const MediaItem* item = model.find(id);
    assert(item->isTrimInitialized);
    assert(near(item->trimStart, 0.0) && near(item->trimEnd, 30.0));
    assert(near(item->duration, 30.0));

    model.updateVideoTrim(id, 5.0, 25.0);
    assert(near(model.find(id)->duration, 20.0));

    // A later metadata report keeps the user's trim
    model.setVideoDuration(id, 30.0);
    assert(near(model.find(id)->trimStart, 5.0));
    assert(near(model.find(id)->duration, 20.0));

    // A shorter source pulls the trim inside it
    model.setVideoDuration(id, 15.0);
    assert(model.find(id)->trimEnd <= 15.0);

    model.setVideoDuration(id, std::numeric_limits<double>::quiet_NaN());
    model.setVideoDuration(id, -1.0);
    assert(near(model.find(id)->originalDuration, 15.0));
    printf("PASS: test_video_duration_initialises_trim_once\n");
}

void test_image_and_transform_limits() {
    TimelineModel model;
    MediaItem image;
    image.kind = MediaKind::Image;
    QString id = model.addItem(image);
    assert(near(model.find(id)->duration, AppConstants::DefaultImageDuration));

    model.updateImageDuration(id, 0.1);
    assert(near(model.find(id)->duration, 0.5));
    model.updateImageDuration(id, 120.0);
    assert(near(model.find(id)->duration, 60.0));

    model.updateScale(id, 10.0);
    assert(near(model.find(id)->transform.scale, 3.0));
    model.updateScale(id, 0.1);
    assert(near(model.find(id)->transform.scale, 0.5));
    model.updatePosition(id, 5000.0, -5000.0);
    assert(near(model.find(id)->transform.positionX, 1280.0));
    assert(near(model.find(id)->transform.positionY, -720.0));
    model.resetTransform(id);
    assert(model.find(id)->transform.isIdentity());

    // Trim edits do not apply to images
    model.updateVideoTrim(id, 1.0, 2.0);
    assert(near(model.find(id)->duration, 60.0));
    printf("PASS: test_image_and_transform_limits\n");
}

void test_audio_and_fade_edits() {
    TimelineModel model;
    MediaItem video;
    video.kind = MediaKind::Video;
    QString id = model.addItem(video);

    model.updateVolume(id, 3.0);
    assert(near(model.find(id)->volume, 2.5));
    model.updateVolume(id, -1.0);
    assert(near(model.find(id)->volume, 0.0));
    model.toggleMute(id);
    assert(model.find(id)->isMuted);

    model.setFadeIn(id, true);
    model.setFadeInDuration(id, 1.7);
    model.setFadeOutDuration(id, 0.1);
    assert(model.find(id)->fades.fadeIn);
    assert(near(model.find(id)->fades.fadeInDuration, 2.0));
    assert(near(model.find(id)->fades.fadeOutDuration, 0.5));
    assert(near(TimelineModel::snapFadeDuration(0.9), 1.0));
    printf("PASS: test_audio_and_fade_edits\n");
}

void test_list_edits_and_signals() {
    TimelineModel model;
    int changes = 0;
    QStringList removed;
    QObject::connect(&model, &TimelineModel::itemsChanged, [&]() { ++changes; });
    QObject::connect(&model, &TimelineModel::itemRemoved, [&](const QString& id) { removed << id; });

    MediaItem image;
    image.kind = MediaKind::Image;
    QString a = model.addItem(image);
    QString b = model.addItem(image);
    QString c = model.addItem(image);
    assert(changes == 3);
    assert(a != b && b != c);

    model.moveItem(0, 2);
    assert(model.indexOf(a) == 2 && model.indexOf(b) == 0);
    model.moveItem(0, 7);
    assert(model.indexOf(b) == 0);

    model.removeItem(b);
    assert(model.itemCount() == 2);
    assert(removed == QStringList{b});
    model.removeItem("unknown");
    assert(model.itemCount() == 2);

    model.clear();
    assert(model.itemCount() == 0);
    assert(removed.size() == 3);

    // Edits on unknown ids are ignored
    int before = changes;
    model.updateScale("unknown", 2.0);
    assert(changes == before);
    printf("PASS: test_list_edits_and_signals\n");
}

int main() {
    test_total_and_active_item();
    test_non_finite_durations_ignored();
    test_item_start_times();
    test_fade_alpha();
    test_trim_validation();
    test_video_duration_initialises_trim_once();
    test_image_and_transform_limits();
    test_audio_and_fade_edits();
    test_list_edits_and_signals();
    printf("All timeline tests passed.\n");
    return 0;
}
