#pragma once
#include <cmath>

#include "../common/Constants.h"
#include "../common/Utils.h"

// Transform -> indicator position (percent of the widget range)
namespace IndicatorMapping
{
    inline int scalePercent(double scale)
    {
        return int(Utils::clamp((scale - 0.2) / 2.6 * 100.0, 5.0, 100.0));
    }

    // Centered marker, a half turn either way covers 40%
    inline int rotationXPercent(double rotationX)
    {
        return int(Utils::clamp(50.0 + rotationX / PI * 40.0, 5.0, 95.0));
    }

    // Auto-rotate accumulates without bound; only the current turn is shown
    inline int rotationYPercent(double rotationY)
    {
        const double wrapped = std::fmod(rotationY, 2.0 * PI);
        return int(Utils::clamp(50.0 + wrapped / PI * 25.0, 5.0, 95.0));
    }
}
