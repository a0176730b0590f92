#include "PreviewCanvas.h"
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QLineF>

PreviewCanvas::PreviewCanvas(QWidget* parent) : QWidget(parent) {
    setMinimumSize(320, 180);
    setMouseTracking(true);
}

void PreviewCanvas::setFrame(const QImage& frame) {
    m_frame = frame;
    update();
}

void PreviewCanvas::setCanvasSize(QSize canvasSize) {
    m_canvasSize = canvasSize;
    update();
}

void PreviewCanvas::setSelection(const ClipTransform& transform, const QRectF& drawRect) {
    // Keep the in-progress drag authoritative
    if (m_dragMode == DragMode::Scale || m_dragMode == DragMode::Move) return;
    m_hasSelection = true;
    m_transform = transform;
    m_drawRect = drawRect;
    update();
}

void PreviewCanvas::clearSelection() {
    m_hasSelection = false;
    m_drawRect = QRectF();
    update();
}

void PreviewCanvas::resetView() {
    m_viewZoom = 1.0;
    m_viewOffset = QPointF(0.0, 0.0);
    update();
}

QRectF PreviewCanvas::canvasDisplayRect() const {
    if (!m_canvasSize.isValid() || m_canvasSize.isEmpty()) return QRectF();

    QSizeF canvasSize(m_canvasSize);
    QSizeF widgetSize = size();

    double baseScale = qMin(widgetSize.width() / canvasSize.width(),
                            widgetSize.height() / canvasSize.height());
    double effectiveScale = baseScale * m_viewZoom;

    double w = canvasSize.width() * effectiveScale;
    double h = canvasSize.height() * effectiveScale;
    double x = (widgetSize.width() - w) / 2.0 + m_viewOffset.x();
    double y = (widgetSize.height() - h) / 2.0 + m_viewOffset.y();

    return QRectF(x, y, w, h);
}

QRectF PreviewCanvas::selectionDisplayRect() const {
    QRectF cr = canvasDisplayRect();
    if (cr.isNull() || !m_hasSelection || m_drawRect.isEmpty()) return QRectF();

    double k = cr.width() / m_canvasSize.width();
    return QRectF(cr.x() + m_drawRect.x() * k, cr.y() + m_drawRect.y() * k,
                  m_drawRect.width() * k, m_drawRect.height() * k);
}

PreviewCanvas::DragMode PreviewCanvas::hitTest(const QPointF& pos) const {
    QRectF sel = selectionDisplayRect();
    if (sel.isNull()) return DragMode::None;

    const QPointF corners[4] = {sel.topLeft(), sel.topRight(), sel.bottomRight(), sel.bottomLeft()};
    for (const auto& c : corners) {
        if (QLineF(pos, c).length() < HandleRadius) return DragMode::Scale;
    }
    if (sel.contains(pos)) return DragMode::Move;
    return DragMode::None;
}

void PreviewCanvas::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    painter.fillRect(rect(), QColor(0x3a, 0x3a, 0x3a));

    QRectF cr = canvasDisplayRect();
    if (cr.isNull()) return;

    painter.fillRect(cr, Qt::black);
    if (!m_frame.isNull()) painter.drawImage(cr, m_frame);

    QRectF sel = selectionDisplayRect();
    if (sel.isNull()) return;

    painter.setPen(QPen(Qt::white, 1.5, Qt::DashLine));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(sel);

    painter.setPen(QPen(Qt::white, 1.5));
    painter.setBrush(QColor(255, 255, 255, 200));
    for (const auto& c : {sel.topLeft(), sel.topRight(), sel.bottomRight(), sel.bottomLeft()})
        painter.drawEllipse(c, HandleRadius, HandleRadius);
}

void PreviewCanvas::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        m_dragMode = DragMode::ViewPan;
        m_viewPanStart = event->position();
        m_viewOffsetStart = m_viewOffset;
        setCursor(Qt::ClosedHandCursor);
        return;
    }

    if (event->button() != Qt::LeftButton) return;

    DragMode mode = hitTest(event->position());
    if (mode == DragMode::None) {
        emit clicked();
        return;
    }

    m_dragMode = mode;
    m_dragStart = event->position();
    m_dragStartTransform = m_transform;
}

void PreviewCanvas::mouseMoveEvent(QMouseEvent* event) {
    if (m_dragMode == DragMode::ViewPan) {
        m_viewOffset = m_viewOffsetStart + (event->position() - m_viewPanStart);
        update();
        return;
    }

    if (m_dragMode == DragMode::None) {
        switch (hitTest(event->position())) {
            case DragMode::Scale: setCursor(Qt::SizeFDiagCursor); break;
            case DragMode::Move:  setCursor(Qt::SizeAllCursor); break;
            default:              setCursor(Qt::ArrowCursor); break;
        }
        return;
    }

    QRectF cr = canvasDisplayRect();
    if (cr.isNull()) return;

    QPointF pos = event->position();
    double displayScale = cr.width() / m_canvasSize.width();
    QPointF itemCenter = cr.center()
        + QPointF(m_dragStartTransform.positionX, m_dragStartTransform.positionY) * displayScale;

    if (m_dragMode == DragMode::Scale) {
        double startDist = QLineF(itemCenter, m_dragStart).length();
        double curDist = QLineF(itemCenter, pos).length();
        if (startDist > 1.0) {
            m_transform.scale = ClipTransform::clampScale(m_dragStartTransform.scale * curDist / startDist);
        }
    } else if (m_dragMode == DragMode::Move && displayScale > 0.0) {
        QPointF delta = (pos - m_dragStart) / displayScale;
        m_transform.positionX = ClipTransform::clampX(m_dragStartTransform.positionX + delta.x());
        m_transform.positionY = ClipTransform::clampY(m_dragStartTransform.positionY + delta.y());
    }

    emit transformEdited(m_transform.scale, m_transform.positionX, m_transform.positionY);
}

void PreviewCanvas::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton && m_dragMode == DragMode::ViewPan) {
        m_dragMode = DragMode::None;
        setCursor(Qt::ArrowCursor);
        return;
    }
    if (event->button() == Qt::LeftButton) m_dragMode = DragMode::None;
}

void PreviewCanvas::wheelEvent(QWheelEvent* event) {
    if (!(event->modifiers() & Qt::ControlModifier)) {
        event->ignore();
        return;
    }

    // Ctrl+scroll zooms the view around the cursor
    QPointF mousePos = event->position();
    QRectF before = canvasDisplayRect();
    if (before.isNull()) {
        event->accept();
        return;
    }

    double relX = (mousePos.x() - before.x()) / before.width();
    double relY = (mousePos.y() - before.y()) / before.height();

    double factor = event->angleDelta().y() > 0 ? 1.15 : 1.0 / 1.15;
    m_viewZoom = qBound(0.1, m_viewZoom * factor, 20.0);

    QSizeF canvasSize(m_canvasSize);
    QSizeF widgetSize = size();
    double baseScale = qMin(widgetSize.width() / canvasSize.width(),
                            widgetSize.height() / canvasSize.height());
    double newW = canvasSize.width() * baseScale * m_viewZoom;
    double newH = canvasSize.height() * baseScale * m_viewZoom;

    m_viewOffset.setX(mousePos.x() - relX * newW - (widgetSize.width() - newW) / 2.0);
    m_viewOffset.setY(mousePos.y() - relY * newH - (widgetSize.height() - newH) / 2.0);

    update();
    event->accept();
}

void PreviewCanvas::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        resetView();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}
