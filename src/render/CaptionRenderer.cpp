#include "CaptionRenderer.h"
#include "CaptionModel.h"
#include <QFont>
#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace {
    constexpr double EdgePadding = 50.0;
    constexpr int BlurSamplesPerRing = 18;

    QFont captionFont(const ResolvedCaptionStyle& style) {
        QFont font;
        if (style.fontStyle == CaptionFontStyle::Mincho) {
            font.setFamily("Noto Serif CJK JP");
            font.setStyleHint(QFont::Serif);
        } else {
            font.setFamily("Noto Sans CJK JP");
            font.setStyleHint(QFont::SansSerif);
        }
        font.setPixelSize(style.pixelSize);
        font.setBold(true);
        return font;
    }
}

CaptionRenderer::CaptionRenderer(QObject* parent) : QObject(parent) {}
CaptionRenderer::~CaptionRenderer() = default;

double CaptionRenderer::anchorY(int canvasHeight, const ResolvedCaptionStyle& style) {
    switch (style.position) {
    case CaptionPosition::Top:
        return EdgePadding + style.pixelSize / 2.0;
    case CaptionPosition::Center:
        return canvasHeight / 2.0;
    case CaptionPosition::Bottom:
        break;
    }
    return canvasHeight - EdgePadding - style.pixelSize / 2.0;
}

int CaptionRenderer::render(QImage& frame, const CaptionModel& model, double t) {
    std::vector<const Caption*> active = model.activeCaptions(t);
    if (active.empty()) return 0;

    QPainter painter(&frame);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    for (const Caption* caption : active)
        drawCaption(painter, frame.size(), *caption, model.settings(), t);

    painter.end();
    return static_cast<int>(active.size());
}

void CaptionRenderer::drawCaption(QPainter& painter, const QSize& canvas, const Caption& caption,
                                  const CaptionSettings& settings, double t) {
    ResolvedCaptionStyle style = CaptionModel::resolveStyle(caption, settings);
    double alpha = CaptionModel::captionAlpha(caption, style, t);
    if (alpha <= 0.0) return;

    QFont font = captionFont(style);
    QFontMetricsF fm(font);

    // Text path centered horizontally, vertically centered on the anchor
    QPainterPath path;
    double width = fm.horizontalAdvance(caption.text);
    double baseline = anchorY(canvas.height(), style) + (fm.ascent() - fm.descent()) / 2.0;
    path.addText(QPointF((canvas.width() - width) / 2.0, baseline), font, caption.text);

    QPen stroke(settings.strokeColor, settings.strokeWidth * 2.0);
    stroke.setJoinStyle(Qt::RoundJoin);

    painter.save();

    double blur = std::max(0.0, settings.blur);
    if (blur > 0.0) {
        // Soft edge from offset copies of the fill on concentric rings
        double blurNorm = std::min(1.0, blur / 5.0);
        int rings = std::max(3, qRound(blur * 3.5));
        double maxRadius = std::max(1.5, blur * 2.6);
        int total = rings * BlurSamplesPerRing;

        for (int ring = 1; ring <= rings; ++ring) {
            double radius = static_cast<double>(ring) / rings * maxRadius;
            double ringWeight = std::max(0.3, 1.0 - (ring - 1.0) / std::max(1, rings - 1) * 0.55);
            double sampleAlpha = (0.95 + blurNorm * 0.55) * ringWeight / total;
            for (int i = 0; i < BlurSamplesPerRing; ++i) {
                double angle = 2.0 * M_PI * i / BlurSamplesPerRing;
                painter.setOpacity(std::min(1.0, alpha * sampleAlpha * 4.0));
                painter.fillPath(path.translated(std::cos(angle) * radius, std::sin(angle) * radius),
                                 settings.fontColor);
            }
        }

        double coreFill = std::max(0.35, 0.88 - blurNorm * 0.45);
        double coreStroke = std::max(0.0, 0.9 - blurNorm * 1.4);
        if (coreStroke > 0.01) {
            painter.setOpacity(alpha * coreStroke);
            painter.strokePath(path, stroke);
        }
        painter.setOpacity(alpha * coreFill);
        painter.fillPath(path, settings.fontColor);
    } else {
        painter.setOpacity(alpha);
        painter.strokePath(path, stroke);
        painter.fillPath(path, settings.fontColor);
    }

    painter.restore();
}
