#pragma once

#include <QWidget>
#include <QImage>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include "ClipTransform.h"

// Shows the composited canvas and, for the selected item, corner handles
// for scaling and a drag area for moving it.
class PreviewCanvas : public QWidget {
    Q_OBJECT
public:
    explicit PreviewCanvas(QWidget* parent = nullptr);

    void setFrame(const QImage& frame);
    void setCanvasSize(QSize canvasSize);
    // drawRect is in canvas pixels, as reported by the compositor.
    void setSelection(const ClipTransform& transform, const QRectF& drawRect);
    void clearSelection();
    void resetView();

signals:
    void transformEdited(double scale, double positionX, double positionY);
    void clicked();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    enum class DragMode { None, Scale, Move, ViewPan };

    QRectF canvasDisplayRect() const;
    QRectF selectionDisplayRect() const;
    DragMode hitTest(const QPointF& pos) const;

    QImage m_frame;
    QSize m_canvasSize{1280, 720};

    bool m_hasSelection = false;
    ClipTransform m_transform;
    QRectF m_drawRect;

    DragMode m_dragMode = DragMode::None;
    QPointF m_dragStart;
    ClipTransform m_dragStartTransform;

    double m_viewZoom = 1.0;
    QPointF m_viewOffset{0.0, 0.0};
    QPointF m_viewPanStart;
    QPointF m_viewOffsetStart;

    static constexpr double HandleRadius = 8.0;
};
