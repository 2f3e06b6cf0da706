#include "transport/loss_model.h"
#include "core/errors.h"

#include <cmath>

namespace flowbench {

BernoulliLoss::BernoulliLoss(double p, uint64_t seed)
    : p_(p), gen_(seed), dist_(0.0, 1.0)
{
    if (!std::isfinite(p) || p < 0.0 || p > 1.0)
        throw ConfigError("BernoulliLoss: loss probability must be in [0, 1]");
}

bool BernoulliLoss::drop() {
    if (p_ <= 0.0)
        return false;
    return dist_(gen_) < p_;
}

}  // namespace flowbench
