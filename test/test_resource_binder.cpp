#include <cassert>
#include <cstdio>
#include <cmath>
#include <QStringList>
#include "TestDoubles.h"
#include "timeline/TimelineModel.h"
#include "timeline/AudioTrackModel.h"

struct BinderFixture {
    BinderFixture()
        : library(&clock)
        , binder(&timeline, &tracks, &clock)
    {
        binder.setSourceFactory(library.factory());
        QObject::connect(&binder, &ResourceBinder::durationLoaded, &timeline, &TimelineModel::setVideoDuration);
        QObject::connect(&binder, &ResourceBinder::musicDurationLoaded, &tracks, &AudioTrackModel::setMusicDuration);
        QObject::connect(&binder, &ResourceBinder::narrationDurationLoaded, &tracks, &AudioTrackModel::setNarrationDuration);
        QObject::connect(&binder, &ResourceBinder::sourceRemoved, [this](const QString& key) { removed.append(key); });
        QObject::connect(&binder, &ResourceBinder::sourceFailed, [this](const QString& key, const QString&) { failed.append(key); });
    }

    QString addItem(const QString& path, MediaKind kind, double seconds = 0.0) {
        MediaItem item;
        item.sourcePath = path;
        item.displayName = path;
        item.kind = kind;
        item.duration = seconds;
        return timeline.addItem(item);
    }

    ManualClock clock;
    FakeMediaLibrary library;
    TimelineModel timeline;
    AudioTrackModel tracks;
    ResourceBinder binder;
    QStringList removed;
    QStringList failed;
};

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

void test_items_bound_and_durations_reported() {
    BinderFixture f;
    f.library.add("clip.mp4", FakeMedia{8.0, Qt::red, 0.25f, false});
    f.library.add("still.png", FakeMedia{0.0, Qt::blue, 0.0f, false});

    QString video = f.addItem("clip.mp4", MediaKind::Video);
    QString image = f.addItem("still.png", MediaKind::Image, 4.0);

    assert(f.binder.sourceCount() == 2);
    assert(f.binder.source(video) != nullptr);
    assert(f.binder.source(image) != nullptr);

    const MediaItem* v = f.timeline.find(video);
    assert(v->isTrimInitialized);
    assert(near(v->originalDuration, 8.0));
    assert(near(v->trimEnd, 8.0));
    assert(near(v->duration, 8.0));

    // Image display time is the user's, not the source's
    assert(near(f.timeline.find(image)->duration, 4.0));
    assert(near(f.timeline.totalDuration(), 12.0));
    printf("PASS: test_items_bound_and_durations_reported\n");
}

void test_reorder_keeps_sources() {
    BinderFixture f;
    f.library.add("a.mp4", FakeMedia{5.0, Qt::red, 0.0f, false});
    f.library.add("b.mp4", FakeMedia{6.0, Qt::green, 0.0f, false});
    QString a = f.addItem("a.mp4", MediaKind::Video);
    f.addItem("b.mp4", MediaKind::Video);
    int created = f.library.createdCount;
    MediaSource* before = f.binder.source(a);

    f.timeline.moveItem(0, 1);
    f.timeline.updateVolume(a, 0.5);

    assert(f.library.createdCount == created);
    assert(f.binder.source(a) == before);
    assert(f.removed.isEmpty());
    printf("PASS: test_reorder_keeps_sources\n");
}

void test_removed_items_released() {
    BinderFixture f;
    QString a = f.addItem("a.mp4", MediaKind::Video);
    QString b = f.addItem("b.mp4", MediaKind::Video);

    f.timeline.removeItem(a);
    assert(f.binder.source(a) == nullptr);
    assert(f.binder.source(b) != nullptr);
    assert(f.removed == QStringList{a});

    f.timeline.clear();
    assert(f.binder.sourceCount() == 0);
    assert(f.removed.size() == 2);
    printf("PASS: test_removed_items_released\n");
}

void test_music_bound_and_rebound() {
    BinderFixture f;
    f.library.add("song.mp3", FakeMedia{30.0, Qt::black, 0.5f, false});
    f.library.add("other.mp3", FakeMedia{45.0, Qt::black, 0.5f, false});

    AudioTrack music;
    music.sourcePath = "song.mp3";
    f.tracks.setMusic(music);

    assert(f.binder.musicSource() != nullptr);
    assert(f.binder.keys().contains(ResourceBinder::musicKey()));
    assert(near(f.tracks.music().duration, 30.0));
    int created = f.library.createdCount;

    // Edits to the same file keep the source
    f.tracks.updateMusicVolume(0.5);
    assert(f.library.createdCount == created);

    AudioTrack replacement = f.tracks.music();
    replacement.sourcePath = "other.mp3";
    replacement.duration = 0.0;
    f.tracks.setMusic(replacement);
    assert(f.library.createdCount == created + 1);
    assert(f.removed == QStringList{ResourceBinder::musicKey()});
    assert(near(f.tracks.music().duration, 45.0));

    f.tracks.clearMusic();
    assert(f.binder.musicSource() == nullptr);
    assert(f.binder.sourceCount() == 0);
    printf("PASS: test_music_bound_and_rebound\n");
}

void test_narration_keys() {
    BinderFixture f;
    f.library.add("voice.wav", FakeMedia{12.0, Qt::black, 0.3f, false});

    NarrationClip clip;
    clip.sourcePath = "voice.wav";
    clip.startTime = 2.0;
    QString id = f.tracks.addNarration(clip);

    assert(ResourceBinder::narrationKey(id) == "narration:" + id);
    assert(f.binder.narrationSource(id) != nullptr);
    assert(f.binder.narrationSource(id) == f.binder.source("narration:" + id));

    const NarrationClip* bound = f.tracks.findNarration(id);
    assert(near(bound->duration, 12.0));
    assert(near(bound->trimEnd, 12.0));

    f.tracks.removeNarration(id);
    assert(f.binder.narrationSource(id) == nullptr);
    printf("PASS: test_narration_keys\n");
}

void test_failures_reported() {
    BinderFixture f;
    f.library.add("broken.mp4", FakeMedia{10.0, Qt::red, 0.0f, true});
    QString id = f.addItem("broken.mp4", MediaKind::Video);

    assert(f.failed == QStringList{id});
    // The failed source stays bound so the compositor can skip it
    assert(f.binder.source(id) != nullptr);
    assert(!f.binder.source(id)->isReady());
    assert(!f.timeline.find(id)->isTrimInitialized);

    f.binder.setSourceFactory([](const SourceRequest&) { return std::unique_ptr<MediaSource>(); });
    QString missing = f.addItem("gone.mp4", MediaKind::Video);
    assert(f.failed.contains(missing));
    assert(f.binder.source(missing) == nullptr);
    printf("PASS: test_failures_reported\n");
}

void test_release_all() {
    BinderFixture f;
    f.addItem("a.mp4", MediaKind::Video);
    AudioTrack music;
    music.sourcePath = "song.mp3";
    f.tracks.setMusic(music);
    assert(f.binder.sourceCount() == 2);

    f.binder.releaseAll();
    assert(f.binder.sourceCount() == 0);
    assert(f.removed.size() == 2);

    // The next model change binds everything again
    f.binder.sync();
    assert(f.binder.sourceCount() == 2);
    printf("PASS: test_release_all\n");
}

int main() {
    test_items_bound_and_durations_reported();
    test_reorder_keeps_sources();
    test_removed_items_released();
    test_music_bound_and_rebound();
    test_narration_keys();
    test_failures_reported();
    test_release_all();
    printf("All resource binder tests passed.\n");
    return 0;
}
