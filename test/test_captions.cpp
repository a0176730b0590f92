#include <cassert>
#include <cstdio>
#include <cmath>
#include <QFile>
#include <QTemporaryDir>
#include "timeline/CaptionModel.h"
#include "render/CaptionRenderer.h"

static bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

static Caption makeCaption(const QString& text, double start, double end) {
    Caption c;
    c.text = text;
    c.startTime = start;
    c.endTime = end;
    return c;
}

void test_active_captions_in_list_order() {
    CaptionModel model;
    model.addCaption(makeCaption("first", 0.0, 3.0));
    model.addCaption(makeCaption("second", 2.0, 5.0));
    model.addCaption(makeCaption("later", 6.0, 8.0));

    auto active = model.activeCaptions(2.5);
    assert(active.size() == 2);
    assert(active[0]->text == "first");
    assert(active[1]->text == "second");

    // End is exclusive
    active = model.activeCaptions(3.0);
    assert(active.size() == 1 && active[0]->text == "second");
    assert(model.activeCaptions(5.5).empty());

    model.setEnabled(false);
    assert(model.activeCaptions(2.5).empty());
    printf("PASS: test_active_captions_in_list_order\n");
}

void test_caption_times_normalised() {
    CaptionModel model;
    QString id = model.addCaption(makeCaption("x", -2.0, -5.0));
    assert(near(model.captions()[0].startTime, 0.0));
    assert(near(model.captions()[0].endTime, 0.0));

    Caption updated = model.captions()[0];
    updated.startTime = 4.0;
    updated.endTime = 1.0;
    model.updateCaption(updated);
    assert(near(model.captions()[0].endTime, 4.0));

    model.removeCaption(id);
    assert(model.captionCount() == 0);
    printf("PASS: test_caption_times_normalised\n");
}

void test_style_resolution() {
    CaptionSettings settings;
    settings.position = CaptionPosition::Top;
    settings.fontSize = CaptionSize::Large;
    settings.bulkFadeIn = true;
    settings.bulkFadeInDuration = 0.8;

    Caption plain = makeCaption("a", 0.0, 4.0);
    ResolvedCaptionStyle style = CaptionModel::resolveStyle(plain, settings);
    assert(style.position == CaptionPosition::Top);
    assert(style.pixelSize == 64);
    assert(style.fontStyle == CaptionFontStyle::Gothic);
    assert(style.fadeIn && !style.fadeOut);
    assert(near(style.fadeInDuration, 0.8));

    Caption custom = plain;
    custom.overridePosition = CaptionPosition::Center;
    custom.overrideFontSize = CaptionSize::Small;
    custom.overrideFontStyle = CaptionFontStyle::Mincho;
    custom.overrideFadeIn = false;
    custom.overrideFadeOut = true;
    custom.overrideFadeOutDuration = 1.5;
    style = CaptionModel::resolveStyle(custom, settings);
    assert(style.position == CaptionPosition::Center);
    assert(style.pixelSize == 32);
    assert(style.fontStyle == CaptionFontStyle::Mincho);
    assert(!style.fadeIn && style.fadeOut);
    assert(near(style.fadeOutDuration, 1.5));

    // An own duration without forcing the fade on falls back to the bulk value
    Caption durationOnly = plain;
    durationOnly.overrideFadeInDuration = 3.0;
    style = CaptionModel::resolveStyle(durationOnly, settings);
    assert(near(style.fadeInDuration, 0.8));

    assert(CaptionModel::pixelSize(CaptionSize::Medium) == 48);
    assert(CaptionModel::pixelSize(CaptionSize::XLarge) == 80);
    printf("PASS: test_style_resolution\n");
}

void test_caption_alpha() {
    Caption c = makeCaption("a", 10.0, 14.0);
    ResolvedCaptionStyle style;
    style.fadeIn = true;
    style.fadeOut = true;
    style.fadeInDuration = 1.0;
    style.fadeOutDuration = 2.0;

    assert(near(CaptionModel::captionAlpha(c, style, 10.0), 0.0));
    assert(near(CaptionModel::captionAlpha(c, style, 10.5), 0.5));
    assert(near(CaptionModel::captionAlpha(c, style, 11.5), 1.0));
    assert(near(CaptionModel::captionAlpha(c, style, 13.0), 0.5));

    // Overlapping fades multiply on short captions
    Caption shortCaption = makeCaption("b", 0.0, 1.0);
    double alpha = CaptionModel::captionAlpha(shortCaption, style, 0.5);
    assert(near(alpha, 0.5 * 0.25));

    ResolvedCaptionStyle noFades;
    assert(near(CaptionModel::captionAlpha(c, noFades, 10.0), 1.0));
    printf("PASS: test_caption_alpha\n");
}

void test_anchor_positions() {
    ResolvedCaptionStyle style;
    style.pixelSize = 48;
    style.position = CaptionPosition::Top;
    assert(near(CaptionRenderer::anchorY(720, style), 74.0));
    style.position = CaptionPosition::Center;
    assert(near(CaptionRenderer::anchorY(720, style), 360.0));
    style.position = CaptionPosition::Bottom;
    assert(near(CaptionRenderer::anchorY(720, style), 646.0));
    printf("PASS: test_anchor_positions\n");
}

void test_caption_file_load() {
    QTemporaryDir dir;
    assert(dir.isValid());
    QString path = dir.filePath("captions.json");

    QFile file(path);
    assert(file.open(QIODevice::WriteOnly));
    file.write(R"({
        "version": 1,
        "settings": { "fontSize": "xlarge", "position": "center", "blur": 9,
                      "fontStyle": "unknown", "bulkFadeOut": true },
        "captions": [
            { "text": "Hello", "startTime": 1, "endTime": 3, "overridePosition": "top",
              "overrideFadeIn": "on", "overrideFadeInDuration": 0.4 },
            { "text": "World", "startTime": 4 }
        ]
    })");
    file.close();

    CaptionModel model;
    model.addCaption(makeCaption("stale", 0.0, 1.0));
    int changes = 0;
    QObject::connect(&model, &CaptionModel::captionsChanged, [&]() { ++changes; });

    assert(model.load(path));
    assert(changes > 0);
    assert(model.captionCount() == 2);
    assert(model.settings().fontSize == CaptionSize::XLarge);
    assert(model.settings().position == CaptionPosition::Center);
    assert(model.settings().fontStyle == CaptionFontStyle::Gothic);
    assert(near(model.settings().blur, 5.0));
    assert(model.settings().bulkFadeOut);

    const Caption& hello = model.captions()[0];
    assert(hello.text == "Hello");
    assert(!hello.id.isEmpty());
    assert(hello.overridePosition == CaptionPosition::Top);
    assert(hello.overrideFadeIn == true);
    assert(near(*hello.overrideFadeInDuration, 0.4));
    assert(!hello.overrideFontSize.has_value());

    const Caption& world = model.captions()[1];
    assert(near(world.endTime, 4.0));

    // Saved files load back into an equal list
    QString copy = dir.filePath("copy.json");
    assert(model.save(copy));
    CaptionModel reloaded;
    assert(reloaded.load(copy));
    assert(reloaded.captionCount() == 2);
    assert(reloaded.captions()[0].id == hello.id);
    printf("PASS: test_caption_file_load\n");
}

void test_caption_file_errors() {
    CaptionModel model;
    assert(!model.load("/nonexistent/captions.json"));
    assert(!model.errorString().isEmpty());

    QTemporaryDir dir;
    QString path = dir.filePath("bad.json");
    QFile file(path);
    assert(file.open(QIODevice::WriteOnly));
    file.write("[1, 2, 3]");
    file.close();
    assert(!model.load(path));
    assert(model.errorString() == "Invalid caption file format");
    printf("PASS: test_caption_file_errors\n");
}

int main() {
    test_active_captions_in_list_order();
    test_caption_times_normalised();
    test_style_resolution();
    test_caption_alpha();
    test_anchor_positions();
    test_caption_file_load();
    test_caption_file_errors();
    printf("All caption tests passed.\n");
    return 0;
}
