#pragma once

#include <QWidget>
#include <QImage>
#include <QRectF>
#include <QSize>
#include <QSlider>
#include <QPushButton>
#include <QLabel>

class PreviewCanvas;
struct ClipTransform;

class PreviewWidget : public QWidget {
    Q_OBJECT
public:
    explicit PreviewWidget(QWidget* parent = nullptr);
    ~PreviewWidget();

    void displayFrame(const QImage& frame);
    void setDuration(double seconds);
    void setCurrentTime(double seconds);
    void setPlayingState(bool playing);
    void setControlsEnabled(bool enabled);

    void setCanvasSize(QSize canvasSize);
    void setSelection(const ClipTransform& transform, const QRectF& drawRect);
    void clearSelection();

signals:
    void playPauseClicked();
    void seekRequested(double seconds);
    void stepForward();
    void stepBackward();
    void transformEdited(double scale, double positionX, double positionY);

private:
    PreviewCanvas* m_canvas;
    QWidget* m_controlsBar;
    QSlider* m_seekSlider;
    QPushButton* m_playButton;
    QPushButton* m_stepBackButton;
    QPushButton* m_stepForwardButton;
    QLabel* m_timeLabel;

    double m_duration = 0.0;
};
