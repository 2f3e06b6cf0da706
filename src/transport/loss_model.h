#pragma once

#include <cstdint>
#include <random>

namespace flowbench {

/// Independent per-datagram loss with probability p, seeded so a run can be
/// replayed exactly.
class BernoulliLoss {
public:
    /// Throws ConfigError unless 0 <= p <= 1.
    BernoulliLoss(double p, uint64_t seed);

    /// True when the next datagram should be lost.
    bool drop();

    double probability() const { return p_; }

private:
    double p_;
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dist_;
};

}  // namespace flowbench
