#pragma once

#include <QApplication>
#include <QColor>

namespace DarkTheme {

inline const QColor Accent(232, 121, 72);       // selection handles, progress
inline const QColor Surface(36, 36, 40);

void apply(QApplication& app);

} // namespace DarkTheme
