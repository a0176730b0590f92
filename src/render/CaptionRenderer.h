#pragma once

#include <QObject>
#include <QImage>

class CaptionModel;
class QPainter;
struct Caption;
struct CaptionSettings;
struct ResolvedCaptionStyle;

// Draws the captions active at t onto the composited frame.
class CaptionRenderer : public QObject {
    Q_OBJECT
public:
    explicit CaptionRenderer(QObject* parent = nullptr);
    ~CaptionRenderer();

    // Returns the number of captions drawn.
    int render(QImage& frame, const CaptionModel& model, double t);

    static double anchorY(int canvasHeight, const ResolvedCaptionStyle& style);

private:
    void drawCaption(QPainter& painter, const QSize& canvas, const Caption& caption,
                     const CaptionSettings& settings, double t);
};
