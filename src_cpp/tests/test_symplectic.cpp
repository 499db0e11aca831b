#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "check.hpp"
#include "sitnikov/errors.hpp"
#include "sitnikov/integrators/symplectic.hpp"

using sitnikov::Result;
using sitnikov::SymplecticIntegrator;
using sitnikov::SymplecticMethod;

// q'' = t - q, q(0) = 1, q'(0) = 0; q = t - sin t + cos t
template <typename F>
struct Forced : SymplecticIntegrator<F> {
    std::vector<F> accelerations(F t, const std::vector<F>& q) const override {
        return {t - q[0]};
    }
};

// Two uncoupled oscillators with different frequencies
struct Pair : SymplecticIntegrator<double> {
    std::vector<double> accelerations(double, const std::vector<double>& q) const override {
        return {-q[0], -4.0 * q[1]};
    }
};

struct Failing : SymplecticIntegrator<double> {
    std::vector<double> accelerations(double t, const std::vector<double>& q) const override {
        if (t > 0.25) throw std::runtime_error("force field undefined");
        return {-q[0]};
    }
};

static std::vector<double> expected(double t) {
    return {t - std::sin(t) + std::cos(t), 1.0 - std::sin(t) - std::cos(t)};
}

// Forward to t = n h against the analytic solution, then backward to t = 0
static void check_method(SymplecticMethod method, int order, const char* name) {
    const Forced<double> sys{};
    const double h = 1e-2;
    const std::size_t n = 3000;
    const double t = h * static_cast<double>(n);
    const double tol = 10.0 * std::pow(h, order);

    const auto fwd = sys.integrate({1.0, 0.0}, 0.0, h, n, method);
    CHECK(fwd.steps() == n, name << ": one column per outer step");
    const auto x = fwd.state(n);
    const auto x_0 = expected(t);
    CHECK_NEAR(x[0], x_0[0], tol, name << ": position differs from the analytic solution");
    CHECK_NEAR(x[1], x_0[1], tol, name << ": velocity differs from the analytic solution");

    const auto bwd = sys.integrate(x, t, -h, n, method);
    const auto back = bwd.state(n);
    CHECK_NEAR(back[0], 1.0, tol, name << ": no time reversibility (position)");
    CHECK_NEAR(back[1], 0.0, tol, name << ": no time reversibility (velocity)");
}

static void test_leapfrog_reversibility_over_steps() {
    const Pair sys{};
    const std::vector<double> x_0 = {1.0, -0.5, 0.0, 0.3};
    const std::size_t n = 1000;
    for (const double h : {1e-2, 1e-3, 1e-4, 1e-5, 1e-6}) {
        const auto fwd = sys.integrate(x_0, 0.0, h, n, SymplecticMethod::LEAPFROG);
        const auto bwd = sys.integrate(fwd.state(n), h * static_cast<double>(n), -h, n, SymplecticMethod::LEAPFROG);
        const auto x = bwd.state(n);
        for (std::size_t j = 0; j < x.size(); j++) {
            CHECK_NEAR(x[j], x_0[j], std::pow(h, 2), "leapfrog: component " << j << " isn't restored, h = " << h);
        }
    }
}

static void test_yoshida_reversibility_over_steps() {
    const Pair sys{};
    const std::vector<double> x_0 = {1.0, -0.5, 0.0, 0.3};
    const std::size_t n = 1000;
    for (const double h : {1e-2, 5e-3, 1e-3}) {
        const auto fwd = sys.integrate(x_0, 0.0, h, n, SymplecticMethod::YOSHIDA_4TH);
        const auto bwd = sys.integrate(fwd.state(n), h * static_cast<double>(n), -h, n, SymplecticMethod::YOSHIDA_4TH);
        const auto x = bwd.state(n);
        for (std::size_t j = 0; j < x.size(); j++) {
            CHECK_NEAR(x[j], x_0[j], 10.0 * std::pow(h, 4), "yoshida: component " << j << " isn't restored, h = " << h);
        }
    }
}

static void test_yoshida_cross_validation() {
    const Forced<double> sys{};
    const double h = 1e-2;
    const std::size_t n = 3000;

    auto kick_drift = Result<double>::prepare({1.0, 0.0}, n);
    auto drift_kick = Result<double>::prepare({1.0, 0.0}, n);
    sys.yoshida_4th(0.0, h, n, kick_drift);
    sys.yoshida_4th_drift_kick(0.0, h, n, drift_kick);

    for (const std::size_t i : {std::size_t(1), std::size_t(100), n}) {
        const auto a = kick_drift.state(i);
        const auto b = drift_kick.state(i);
        CHECK_NEAR(a[0], b[0], std::pow(h, 4), "formulations disagree on the position at step " << i);
        CHECK_NEAR(a[1], b[1], std::pow(h, 4), "formulations disagree on the velocity at step " << i);
    }
}

static void test_leapfrog_once_carries_accelerations() {
    const Pair sys{};
    std::vector<double> x = {1.0, 1.0, 0.0, 0.0};
    std::vector<double> a = sys.accelerations(0.0, {1.0, 1.0});
    sys.leapfrog_once(0.0, x, a, 0.1);

    CHECK_NEAR(x[0], 1.0 - 0.5 * 0.01, 1e-15, "kick-drift of the first position");
    CHECK_NEAR(x[1], 1.0 - 0.5 * 4.0 * 0.01, 1e-15, "kick-drift of the second position");
    const auto a_new = sys.accelerations(0.1, {x[0], x[1]});
    CHECK(a == a_new, "the returned accelerations belong to the new positions");
    CHECK_NEAR(x[2], 0.5 * (-1.0 + a_new[0]) * 0.1, 1e-15, "kick of the first velocity");
    CHECK_NEAR(x[3], 0.5 * (-4.0 + a_new[1]) * 0.1, 1e-15, "kick of the second velocity");
}

static void test_single_precision() {
    const Forced<float> sys{};
    const auto result = sys.integrate({1.f, 0.f}, 0.f, 1e-2f, 100, SymplecticMethod::YOSHIDA_4TH);
    const auto x_0 = expected(1.0);
    CHECK_NEAR(result.state(100)[0], x_0[0], 1e-4, "single-precision integration");
}

static void test_zero_steps() {
    const Pair sys{};
    for (const auto method : {SymplecticMethod::LEAPFROG, SymplecticMethod::YOSHIDA_4TH}) {
        for (const long n : {0L, -1L, -1000L}) {
            const auto result = sys.integrate({1.0, 2.0, 3.0, 4.0}, 0.0, 1e-2, n, method);
            CHECK(result.steps() == 0, n << " steps yield only the initial column");
            CHECK((result.initial_values() == std::vector<double>{1.0, 2.0, 3.0, 4.0}), "initial column is kept");
        }
    }
}

static void test_steps_past_the_buffer() {
    const Pair sys{};
    auto result = Result<double>::prepare({1.0, 2.0, 3.0, 4.0}, 2);
    bool thrown = false;
    try {
        sys.leapfrog(0.0, 1e-2, 5, result);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    CHECK(thrown, "stepping past the last column must be rejected");
    CHECK(result.steps() == 2, "the buffer keeps its size");
}

static void test_odd_state_length() {
    const Pair sys{};
    bool thrown = false;
    try {
        sys.integrate({1.0, 2.0, 3.0}, 0.0, 1e-2, 1, SymplecticMethod::LEAPFROG);
    } catch (const sitnikov::Error& e) {
        thrown = has_cause<sitnikov::DimensionMismatch>(e);
    }
    CHECK(thrown, "a state that can't be halved must be rejected");
}

static void test_callback_failure() {
    const Failing sys{};
    bool thrown = false;
    try {
        sys.integrate({1.0, 0.0}, 0.0, 0.1, 10, SymplecticMethod::YOSHIDA_4TH);
    } catch (const sitnikov::Error& e) {
        thrown = true;
        const std::string what = sitnikov::describe(e);
        CHECK(has_cause<sitnikov::CallbackFailure>(e), "the failure is reported as a callback failure");
        CHECK(what.find("4th-order Yoshida") != std::string::npos, "context names the method: " << what);
        // step 2 starts at t = 0.2; its first sub-step ends at 0.2 + 0.1 d_1 > 0.25
        CHECK(what.find("sub-step 1 of step 2") != std::string::npos, "context names the sub-step: " << what);
        CHECK(what.find("force field undefined") != std::string::npos, "context keeps the cause: " << what);
    }
    CHECK(thrown, "a failing acceleration must abort the integration");
}

int main() {
    check_method(SymplecticMethod::LEAPFROG, 2, "leapfrog");
    check_method(SymplecticMethod::YOSHIDA_4TH, 4, "yoshida");
    test_leapfrog_reversibility_over_steps();
    test_yoshida_reversibility_over_steps();
    test_yoshida_cross_validation();
    test_leapfrog_once_carries_accelerations();
    test_single_precision();
    test_zero_steps();
    test_steps_past_the_buffer();
    test_odd_state_length();
    test_callback_failure();
    std::cout << "[OK] symplectic integrator\n";
    return 0;
}
