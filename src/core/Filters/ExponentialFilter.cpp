#include "ExponentialFilter.h"

double ExponentialFilter::filter(double sample)
{
    if (!estimate_)
    {
        estimate_ = sample;
        return sample;
    }

    // Same blend as alpha * sample + (1 - alpha) * estimate, but a
    // constant input leaves the estimate bit-exact
    *estimate_ += alpha_ * (sample - *estimate_);
    return *estimate_;
}

void ExponentialFilter::reset()
{
    estimate_.reset();
}
