#include "DarkTheme.h"
#include <QPalette>
#include <QStyleFactory>

void DarkTheme::apply(QApplication& app) {
    app.setStyle(QStyleFactory::create("Fusion"));

    const QColor text(220, 218, 214);
    const QColor muted(120, 118, 116);

    QPalette palette;
    palette.setColor(QPalette::Window, Surface);
    palette.setColor(QPalette::WindowText, text);
    palette.setColor(QPalette::Base, QColor(24, 24, 27));
    palette.setColor(QPalette::AlternateBase, Surface.lighter(115));
    palette.setColor(QPalette::ToolTipBase, Surface);
    palette.setColor(QPalette::ToolTipText, text);
    palette.setColor(QPalette::Text, text);
    palette.setColor(QPalette::Button, QColor(48, 47, 52));
    palette.setColor(QPalette::ButtonText, text);
    palette.setColor(QPalette::BrightText, Accent.lighter(130));
    palette.setColor(QPalette::Link, Accent);
    palette.setColor(QPalette::Highlight, Accent);
    palette.setColor(QPalette::HighlightedText, QColor(20, 20, 20));

    palette.setColor(QPalette::Disabled, QPalette::Text, muted);
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, muted);
    palette.setColor(QPalette::Disabled, QPalette::WindowText, muted);

    app.setPalette(palette);

    app.setStyleSheet(QString(
        "QGroupBox { border: 1px solid #3a393e; border-radius: 4px; margin-top: 14px; }"
        "QGroupBox::title { subcontrol-origin: margin; left: 8px; padding: 0 3px; }"
        "QProgressBar::chunk { background-color: %1; }")
        .arg(Accent.name()));
}
