#pragma once
#include <cmath>
#include <limits>

#include "sitnikov/errors.hpp"

namespace sitnikov {

constexpr int NEWTON_RAPHSON_MAX_ITER = 5000;

// Find a root of f (derivative d) with the Newton-Raphson method.
// Converged when two consecutive points are closer than 10 epsilon;
// throws ConvergenceFailure after NEWTON_RAPHSON_MAX_ITER iterations.
template <typename F, typename Fun, typename Der>
F newton_raphson(const Fun& f, const Der& d, F initial) {
    const F eps = std::numeric_limits<F>::epsilon();

    // already a root (the circular-orbit case)
    if (std::abs(initial) < eps) return initial;

    F x_1 = initial;
    for (int i = 0; i < NEWTON_RAPHSON_MAX_ITER; i++) {
        const F x_2 = x_1 - f(x_1) / d(x_1);
        if (std::abs(x_1 - x_2) < eps * F(10)) return x_2;
        x_1 = x_2;
    }
    throw ConvergenceFailure(static_cast<double>(initial));
}

} // namespace sitnikov
