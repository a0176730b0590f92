#pragma once

#include <QtGlobal>
#include "AppConstants.h"

// Placement of a visual item on the output canvas, applied on top of the
// contain-fit base scale.
struct ClipTransform {
    double scale = 1.0;
    double positionX = 0.0;   // canvas pixels from center
    double positionY = 0.0;

    bool isIdentity() const {
        return scale == 1.0 && positionX == 0.0 && positionY == 0.0;
    }

    void reset() {
        scale = 1.0;
        positionX = 0.0;
        positionY = 0.0;
    }

    static double clampScale(double s) {
        return qBound(AppConstants::MinScale, s, AppConstants::MaxScale);
    }

    static double clampX(double x) {
        return qBound(-AppConstants::MaxPositionX, x, AppConstants::MaxPositionX);
    }

    static double clampY(double y) {
        return qBound(-AppConstants::MaxPositionY, y, AppConstants::MaxPositionY);
    }
};
