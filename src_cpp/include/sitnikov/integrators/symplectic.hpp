#pragma once
#include <cmath>
#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "sitnikov/errors.hpp"
#include "sitnikov/result.hpp"

namespace sitnikov {

enum class SymplecticMethod { LEAPFROG, YOSHIDA_4TH };

// Coefficients of the 4th-order Yoshida composition, k = 2^(1/3)
namespace yoshida {
inline const double K = std::cbrt(2.0);

// triple jump of leapfrog steps
inline const double D_1 = 1.0 / (2.0 - K);
inline const double D_2 = 1.0 - 2.0 * D_1;
inline const double D_3 = D_1 + D_2;

// drift-kick form
inline const double W_0 = -K / (2.0 - K);
inline const double W_1 = 1.0 / (2.0 - K);
} // namespace yoshida

// A system of 2nd-order ODEs d^2q/dt^2 = accelerations(t, q).
// The state vector is [q..., v...]: positions in the first half,
// velocities in the second. Implement `accelerations`; the
// integration methods are fixed.
template <typename F>
class SymplecticIntegrator {
public:
    virtual ~SymplecticIntegrator() = default;

    // Accelerations at time t for the given positions; may throw
    virtual std::vector<F> accelerations(F t, const std::vector<F>& positions) const = 0;

    // n <= 0 yields only the initial column
    Result<F> integrate(const std::vector<F>& x, F t_0, F h, long n, SymplecticMethod method) const {
        auto result = Result<F>::prepare(x, n > 0 ? static_cast<std::size_t>(n) : 0);
        switch (method) {
            case SymplecticMethod::LEAPFROG:
                try {
                    leapfrog(t_0, h, n, result);
                } catch (const std::exception&) {
                    std::throw_with_nested(Error("Couldn't integrate using the leapfrog method"));
                }
                break;
            case SymplecticMethod::YOSHIDA_4TH:
                try {
                    yoshida_4th(t_0, h, n, result);
                } catch (const std::exception&) {
                    std::throw_with_nested(Error("Couldn't integrate using the 4th-order Yoshida method"));
                }
                break;
        }
        return result;
    }

    // One velocity-Verlet step from t to t + h. `a` holds the accelerations
    // at the current positions on entry and at the new ones on return.
    void leapfrog_once(F t, std::vector<F>& x, std::vector<F>& a, F h) const {
        const std::size_t lh = half(x);
        std::vector<F> q(lh);
        for (std::size_t j = 0; j < lh; j++) {
            q[j] = x[j] + x[j + lh] * h + F(0.5) * a[j] * h * h;
        }

        std::vector<F> a_new;
        try {
            a_new = accelerations(t + h, q);
        } catch (const std::exception&) {
            std::throw_with_nested(CallbackFailure("Couldn't compute the new accelerations"));
        }
        if (a_new.size() != lh) throw DimensionMismatch(lh, a_new.size());

        for (std::size_t j = 0; j < lh; j++) {
            x[j] = q[j];
            x[j + lh] = x[j + lh] + F(0.5) * (a[j] + a_new[j]) * h;
        }
        a.swap(a_new);
    }

    void leapfrog(F t_0, F h, long n, Result<F>& result) const {
        std::vector<F> x = result.initial_values();
        std::vector<F> a = initial_accelerations(t_0, x);
        for (long i = 0; i < n; i++) {
            const F t = t_0 + static_cast<F>(i) * h;
            try {
                leapfrog_once(t, x, a, h);
            } catch (const std::exception&) {
                std::throw_with_nested(CallbackFailure("Couldn't compute the next state at step " + std::to_string(i)));
            }
            result.set_state(static_cast<std::size_t>(i) + 1, x);
        }
    }

    // Three leapfrog sub-steps per step; only the outer steps are recorded
    void yoshida_4th(F t_0, F h, long n, Result<F>& result) const {
        const F i_1 = h * static_cast<F>(yoshida::D_1);
        const F i_2 = h * static_cast<F>(yoshida::D_2);
        const F i_3 = h * static_cast<F>(yoshida::D_3);
        const F offsets[3] = {F(0), i_1, i_3};
        const F steps[3] = {i_1, i_2, i_1};

        std::vector<F> x = result.initial_values();
        std::vector<F> a = initial_accelerations(t_0, x);
        for (long i = 0; i < n; i++) {
            const F t = t_0 + static_cast<F>(i) * h;
            for (int s = 0; s < 3; s++) {
                try {
                    leapfrog_once(t + offsets[s], x, a, steps[s]);
                } catch (const std::exception&) {
                    std::throw_with_nested(CallbackFailure(
                        "Couldn't compute sub-step " + std::to_string(s + 1) + " of step " + std::to_string(i)));
                }
            }
            result.set_state(static_cast<std::size_t>(i) + 1, x);
        }
    }

    // 4th-order Yoshida written as drift-kick pairs with a closing drift;
    // an independent derivation of the same scheme as `yoshida_4th`
    void yoshida_4th_drift_kick(F t_0, F h, long n, Result<F>& result) const {
        const F c_1 = static_cast<F>(yoshida::W_1 / 2.0) * h;
        const F c_2 = static_cast<F>((yoshida::W_0 + yoshida::W_1) / 2.0) * h;
        const F c_3 = c_2;
        const F c_4 = c_1;
        const F d_1 = static_cast<F>(yoshida::W_1) * h;
        const F d_2 = static_cast<F>(yoshida::W_0) * h;
        const F d_3 = d_1;
        const F c[3] = {c_1, c_2, c_3};
        const F d[3] = {d_1, d_2, d_3};
        const F offsets[3] = {c_1, c_1 + c_2, c_1 + c_2 + c_3};

        std::vector<F> x = result.initial_values();
        const std::size_t lh = half(x);
        std::vector<F> q(lh);
        std::vector<F> a;
        for (long i = 0; i < n; i++) {
            const F t = t_0 + static_cast<F>(i) * h;
            for (int s = 0; s < 3; s++) {
                for (std::size_t j = 0; j < lh; j++) {
                    x[j] = x[j] + c[s] * x[j + lh];
                    q[j] = x[j];
                }
                try {
                    a = accelerations(t + offsets[s], q);
                } catch (const std::exception&) {
                    std::throw_with_nested(CallbackFailure(
                        "Couldn't compute the accelerations at sub-step " + std::to_string(s + 1) +
                        " of step " + std::to_string(i)));
                }
                if (a.size() != lh) throw DimensionMismatch(lh, a.size());
                for (std::size_t j = 0; j < lh; j++) x[j + lh] = x[j + lh] + d[s] * a[j];
            }
            for (std::size_t j = 0; j < lh; j++) x[j] = x[j] + c_4 * x[j + lh];
            result.set_state(static_cast<std::size_t>(i) + 1, x);
        }
    }

private:
    static std::size_t half(const std::vector<F>& x) {
        if (x.size() % 2 != 0) {
            throw DimensionMismatch("state vector of length " + std::to_string(x.size()) +
                                    " can't be split into positions and velocities");
        }
        return x.size() / 2;
    }

    std::vector<F> initial_accelerations(F t_0, const std::vector<F>& x) const {
        const std::size_t lh = half(x);
        std::vector<F> a;
        try {
            a = accelerations(t_0, std::vector<F>(x.begin(), x.begin() + static_cast<std::ptrdiff_t>(lh)));
        } catch (const std::exception&) {
            std::throw_with_nested(CallbackFailure("Couldn't compute the initial accelerations"));
        }
        if (a.size() != lh) throw DimensionMismatch(lh, a.size());
        return a;
    }
};

} // namespace sitnikov
