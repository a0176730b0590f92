#include "PreviewWidget.h"
#include "PreviewCanvas.h"
#include "TimeUtil.h"
#include <QVBoxLayout>
#include <QHBoxLayout>

PreviewWidget::PreviewWidget(QWidget* parent) : QWidget(parent) {
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);

    m_canvas = new PreviewCanvas(this);
    mainLayout->addWidget(m_canvas, 1);

    // Controls bar
    m_controlsBar = new QWidget(this);
    auto* controlsLayout = new QHBoxLayout(m_controlsBar);
    controlsLayout->setContentsMargins(8, 4, 8, 4);

    m_stepBackButton = new QPushButton("◀", m_controlsBar);
    m_stepBackButton->setFixedWidth(30);
    controlsLayout->addWidget(m_stepBackButton);

    m_playButton = new QPushButton("▶", m_controlsBar);
    m_playButton->setFixedWidth(60);
    controlsLayout->addWidget(m_playButton);

    m_stepForwardButton = new QPushButton("▶", m_controlsBar);
    m_stepForwardButton->setFixedWidth(30);
    controlsLayout->addWidget(m_stepForwardButton);

    m_seekSlider = new QSlider(Qt::Horizontal, m_controlsBar);
    m_seekSlider->setRange(0, 10000);
    controlsLayout->addWidget(m_seekSlider, 1);

    m_timeLabel = new QLabel("00:00:00.000 / 00:00:00.000", m_controlsBar);
    m_timeLabel->setFixedWidth(220);
    controlsLayout->addWidget(m_timeLabel);

    mainLayout->addWidget(m_controlsBar);

    connect(m_playButton, &QPushButton::clicked, this, &PreviewWidget::playPauseClicked);
    connect(m_stepBackButton, &QPushButton::clicked, this, &PreviewWidget::stepBackward);
    connect(m_stepForwardButton, &QPushButton::clicked, this, &PreviewWidget::stepForward);
    connect(m_seekSlider, &QSlider::sliderMoved, this, [this](int value) {
        emit seekRequested(m_duration * value / 10000.0);
    });
    connect(m_canvas, &PreviewCanvas::transformEdited, this, &PreviewWidget::transformEdited);
}

PreviewWidget::~PreviewWidget() = default;

void PreviewWidget::displayFrame(const QImage& frame) {
    m_canvas->setFrame(frame);
}

void PreviewWidget::setDuration(double seconds) {
    m_duration = seconds;
}

void PreviewWidget::setCurrentTime(double seconds) {
    m_timeLabel->setText(QString("%1 / %2")
        .arg(TimeUtil::secondsToHMSms(seconds))
        .arg(TimeUtil::secondsToHMSms(m_duration)));

    if (!m_seekSlider->isSliderDown() && m_duration > 0) {
        m_seekSlider->setValue(static_cast<int>(seconds / m_duration * 10000));
    }
}

void PreviewWidget::setPlayingState(bool playing) {
    m_playButton->setText(playing ? "⏸" : "▶");
}

void PreviewWidget::setControlsEnabled(bool enabled) {
    m_controlsBar->setEnabled(enabled);
}

void PreviewWidget::setCanvasSize(QSize canvasSize) {
    m_canvas->setCanvasSize(canvasSize);
}

void PreviewWidget::setSelection(const ClipTransform& transform, const QRectF& drawRect) {
    m_canvas->setSelection(transform, drawRect);
}

void PreviewWidget::clearSelection() {
    m_canvas->clearSelection();
}
