#pragma once
#include <cstddef>
#include <exception>
#include <string>
#include <vector>

#include "sitnikov/errors.hpp"
#include "sitnikov/result.hpp"

namespace sitnikov {

enum class GeneralMethod { RUNGE_KUTTA_4TH };

// A system of 1st-order ODEs dx/dt = update(t, x).
// Implement `update`; the integration methods are fixed.
template <typename F>
class GeneralIntegrator {
public:
    virtual ~GeneralIntegrator() = default;

    // Right-hand side at (t, x); may throw
    virtual std::vector<F> update(F t, const std::vector<F>& x) const = 0;

    // Integrate `n` steps of size `h` from (t_0, x); h < 0 integrates backward.
    // n <= 0 yields only the initial column.
    Result<F> integrate(const std::vector<F>& x, F t_0, F h, long n, GeneralMethod method) const {
        auto result = Result<F>::prepare(x, n > 0 ? static_cast<std::size_t>(n) : 0);
        switch (method) {
            case GeneralMethod::RUNGE_KUTTA_4TH:
                try {
                    runge_kutta_4th(t_0, h, n, result);
                } catch (const std::exception&) {
                    std::throw_with_nested(Error("Couldn't integrate using the 4th-order Runge-Kutta method"));
                }
                break;
        }
        return result;
    }

    // Classic RK4 from the first column of `result`, filling columns 1..n
    void runge_kutta_4th(F t_0, F h, long n, Result<F>& result) const {
        std::vector<F> x = result.initial_values();
        const std::size_t l = x.size();
        std::vector<F> x_m(l);
        std::vector<F> k_1, k_2, k_3, k_4;

        for (long i = 0; i < n; i++) {
            const F t = t_0 + static_cast<F>(i) * h;
            const F t_2 = t + h / F(2);
            const F t_4 = t + h;

            int stage = 1;
            try {
                k_1 = update(t, x);
                check_size(k_1, l);
                for (std::size_t j = 0; j < l; j++) x_m[j] = x[j] + h * k_1[j] / F(2);

                stage = 2;
                k_2 = update(t_2, x_m);
                check_size(k_2, l);
                for (std::size_t j = 0; j < l; j++) x_m[j] = x[j] + h * k_2[j] / F(2);

                stage = 3;
                k_3 = update(t_2, x_m);
                check_size(k_3, l);
                for (std::size_t j = 0; j < l; j++) x_m[j] = x[j] + h * k_3[j];

                stage = 4;
                k_4 = update(t_4, x_m);
                check_size(k_4, l);
            } catch (const std::exception&) {
                std::throw_with_nested(CallbackFailure(
                    "Couldn't compute the " + stage_name(stage) + " increment at step " + std::to_string(i)));
            }

            for (std::size_t j = 0; j < l; j++) {
                x[j] = x[j] + h / F(6) * (k_1[j] + F(2) * k_2[j] + F(2) * k_3[j] + k_4[j]);
            }
            result.set_state(static_cast<std::size_t>(i) + 1, x);
        }
    }

private:
    static void check_size(const std::vector<F>& k, std::size_t l) {
        if (k.size() != l) throw DimensionMismatch(l, k.size());
    }

    static std::string stage_name(int stage) {
        switch (stage) {
            case 1: return "first";
            case 2: return "second";
            case 3: return "third";
            default: return "fourth";
        }
    }
};

} // namespace sitnikov
