#pragma once
#include <optional>

/**
 * ExponentialFilter
 * --------------------------
 * Single-channel exponential moving average.
 *
 * The estimate is either empty or seeded. The first sample after
 * construction or reset() seeds it verbatim; later samples are blended:
 *   estimate = alpha * sample + (1 - alpha) * estimate
 */

class ExponentialFilter
{
public:
    explicit ExponentialFilter(double alpha = 0.5)
        : alpha_(alpha) {}

    double filter(double sample);
    void reset();

    bool isSeeded() const { return estimate_.has_value(); }
    std::optional<double> estimate() const { return estimate_; }

    double alpha() const { return alpha_; }
    void setAlpha(double alpha) { alpha_ = alpha; }

private:
    double alpha_;
    std::optional<double> estimate_;
};
