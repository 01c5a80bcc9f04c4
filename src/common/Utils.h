#pragma once

#include <QElapsedTimer>

/**
 * Generic helpers used across modules.
 */

namespace Utils
{

    inline double clamp(double v, double min, double max)
    {
        if (v < min)
            return min;
        if (v > max)
            return max;
        return v;
    }

    // Rate meter for the ticker / feed readouts
    class FPSTimer
    {
    public:
        FPSTimer()
        {
            timer_.start();
        }

        float fps()
        {
            qint64 ms = timer_.restart();
            if (ms <= 0)
                return 0.f;
            return 1000.f / ms;
        }

    private:
        QElapsedTimer timer_;
    };
}
