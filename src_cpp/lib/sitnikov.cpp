#include "sitnikov/models/sitnikov.hpp"

#include <cmath>
#include <exception>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "sitnikov/api.hpp"
#include "sitnikov/errors.hpp"
#include "sitnikov/integrators/general.hpp"
#include "sitnikov/integrators/symplectic.hpp"
#include "sitnikov/megno.hpp"
#include "sitnikov/newton_raphson.hpp"

namespace sitnikov {

// Equations of motion of one or more independent copies of the third body
class Model::Motion : public SymplecticIntegrator<double> {
public:
    explicit Motion(const Model& model) : model_(model) {}

    std::vector<double> accelerations(double t, const std::vector<double>& z) const override {
        std::vector<double> a(z.size());
        for (std::size_t j = 0; j < z.size(); j++) a[j] = model_.acceleration(t, z[j]);
        return a;
    }

private:
    const Model& model_;
};

// The same system written as 1st-order ODEs, [z..., z_v...]' = [z_v..., a...]
class Model::MotionFirstOrder : public GeneralIntegrator<double> {
public:
    explicit MotionFirstOrder(const Model& model) : model_(model) {}

    std::vector<double> update(double t, const std::vector<double>& x) const override {
        const std::size_t lh = x.size() / 2;
        std::vector<double> dx(x.size());
        for (std::size_t j = 0; j < lh; j++) {
            dx[j] = x[j + lh];
            dx[j + lh] = model_.acceleration(t, x[j]);
        }
        return dx;
    }

private:
    const Model& model_;
};

// Equations of motion of the primary and the shadow trajectory plus the
// integrals of the MEGNO equations (see T. C. Hinse et al., 2010).
// State: [z, z~, z_v, z~_v, Y, Ybar].
class Model::MegnoEquations : public GeneralIntegrator<double> {
public:
    explicit MegnoEquations(const Model& model) : model_(model) {}

    std::vector<double> update(double t, const std::vector<double>& x) const override {
        double a_1 = 0.0;
        double a_2 = 0.0;
        try {
            a_1 = model_.acceleration(t, x[0]);
        } catch (const std::exception&) {
            std::throw_with_nested(Error("Couldn't compute the acceleration of the first trajectory"));
        }
        try {
            a_2 = model_.acceleration(t, x[1]);
        } catch (const std::exception&) {
            std::throw_with_nested(Error("Couldn't compute the acceleration of the second trajectory"));
        }

        const double delta_z = x[1] - x[0];
        const double delta_z_v = x[3] - x[2];
        const double delta_a = a_2 - a_1;
        const double delta_dot_pr = delta_z_v * delta_z + delta_a * delta_z_v;
        const double delta_norm_sq = delta_z * delta_z + delta_z_v * delta_z_v;

        // Strictly these carry t - t_0 rather than t; the integrals are
        // singular at t - t_0 = 0 and the limit t -> +inf is the same
        return {
            x[2],
            x[3],
            a_1,
            a_2,
            delta_dot_pr / delta_norm_sq * t,
            2.0 * x[4] / t,
        };
    }

private:
    const Model& model_;
};

Model::Model(const ModelCfg& cfg) {
    validate(cfg);

    e_ = cfg.e;
    tau_ = cfg.tau * 2.0 * PI;
    t_0_ = cfg.t_0;
    h_ = cfg.h * PI / 2.0;
    // 4 / h is integral, the rounding only removes representation error
    n_ = static_cast<std::size_t>(std::llround(static_cast<double>(cfg.periods) * 4.0 / cfg.h));
    i_m_ = static_cast<std::size_t>(std::llround(1.0 / cfg.h));
    x_0_ = {cfg.z_0, cfg.z_v_0};
    compute_megno_ = cfg.compute_megno;
    method_ = cfg.method;
    megno_method_ = cfg.megno_method;
}

double Model::eccentric_anomaly(double m) const {
    if (e_ == 0.0) return m;

    // E(m + 2 pi k) = E(m) + 2 pi k; solve for m in [0, 2 pi)
    const double k = std::floor(m / (2.0 * PI));
    const double m_r = m - 2.0 * PI * k;

    const auto fun = [&](double x) { return x - e_ * std::sin(x) - m_r; };
    const auto der = [&](double x) { return 1.0 - e_ * std::cos(x); };
    const double initial = e_ > 0.8 ? PI : m_r;

    return 2.0 * PI * k + newton_raphson(fun, der, initial);
}

double Model::radius(double t) const {
    double ea = 0.0;
    try {
        ea = eccentric_anomaly(t - tau_);
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Couldn't compute the eccentric anomaly"));
    }
    return 1.0 - e_ * std::cos(ea);
}

double Model::acceleration(double t, double z) const {
    double r = 0.0;
    try {
        r = radius(t);
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Couldn't compute the radius"));
    }
    return -z / std::pow(r * r + z * z, 1.5);
}

std::vector<double> Model::shadow_initial_values() const {
    std::mt19937_64 rng(SHADOW_SEED);
    std::normal_distribution<double> normal(0.0, SHADOW_SIGMA);
    const double z = x_0_[0] + normal(rng);
    const double z_v = x_0_[1] + normal(rng);
    return {z, z_v};
}

std::vector<double> Model::times(std::size_t from, std::size_t to) const {
    std::vector<double> t;
    t.reserve(to - from + 1);
    for (std::size_t i = from; i <= to; i++) t.push_back(t_0_ + static_cast<double>(i) * h_);
    return t;
}

Result<double> Model::integrate_motion(const std::vector<double>& x, double t_0, std::size_t n) const {
    const long steps = static_cast<long>(n);
    switch (method_) {
        case Method::RUNGE_KUTTA_4TH:
            return MotionFirstOrder(*this).integrate(x, t_0, h_, steps, GeneralMethod::RUNGE_KUTTA_4TH);
        case Method::LEAPFROG:
            return Motion(*this).integrate(x, t_0, h_, steps, SymplecticMethod::LEAPFROG);
        case Method::YOSHIDA_4TH:
            return Motion(*this).integrate(x, t_0, h_, steps, SymplecticMethod::YOSHIDA_4TH);
    }
    throw ConfigurationInvalid("unknown integration method");
}

void Model::integrate() {
    results_ = Results();
    try {
        if (!compute_megno_) {
            const auto x = integrate_motion(x_0_, t_0_, n_);
            Results res;
            res.t = times(0, n_);
            res.z = x.row(0);
            res.z_v = x.row(1);
            results_ = std::move(res);
        } else if (megno_method_ == MegnoMethod::VARIATIONAL) {
            integrate_variational();
        } else {
            integrate_trapezoidal();
        }
    } catch (const std::exception&) {
        results_ = Results();
        std::throw_with_nested(Error("Couldn't integrate the model"));
    }
}

void Model::integrate_variational() {
    const auto shadow = shadow_initial_values();

    // Integrate the equations of motion alone for `i_m` steps
    // to step over the singular point at t = 0
    Result<double> x;
    try {
        x = integrate_motion({x_0_[0], shadow[0], x_0_[1], shadow[1]}, t_0_, i_m_);
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Couldn't integrate the equations of motion"));
    }
    const auto s = x.state(i_m_);
    const double t_m = t_0_ + static_cast<double>(i_m_) * h_;
    const std::size_t n_m = n_ - i_m_;

    Result<double> m;
    try {
        m = MegnoEquations(*this).integrate(
            {s[0], s[1], s[2], s[3], 0.0, 0.0}, t_m, h_, static_cast<long>(n_m), GeneralMethod::RUNGE_KUTTA_4TH);
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Couldn't integrate the MEGNO equations"));
    }

    Results res;
    res.t = times(i_m_, n_);
    for (std::size_t i = 0; i <= n_m; i++) {
        const double t = res.t[i];
        m(4, i) = 2.0 * m(4, i) / t;
        m(5, i) = m(5, i) / t;
    }
    res.z = m.row(0);
    res.z_v = m.row(2);
    res.megno = m.row(4);
    res.mean_megno = m.row(5);
    results_ = std::move(res);
}

void Model::integrate_trapezoidal() {
    const auto shadow = shadow_initial_values();

    Result<double> x;
    try {
        x = integrate_motion({x_0_[0], shadow[0], x_0_[1], shadow[1]}, t_0_, n_);
    } catch (const std::exception&) {
        std::throw_with_nested(Error("Couldn't integrate the equations of motion"));
    }

    Results res;
    res.t = times(1, n_);
    res.z.reserve(n_);
    res.z_v.reserve(n_);
    res.megno.reserve(n_);
    res.mean_megno.reserve(n_);

    MegnoAccumulator<double> megno(h_);
    for (std::size_t i = 1; i <= n_; i++) {
        const double t = res.t[i - 1];
        const double z = x(0, i);
        const double dis_z = std::abs(x(1, i) - z);
        const double dis_z_v = std::abs(x(3, i) - x(2, i));

        double r = 0.0;
        try {
            r = radius(t);
        } catch (const std::exception&) {
            std::throw_with_nested(Error("Couldn't compute the integrand at step " + std::to_string(i)));
        }
        megno.push(t, megno_integrand(t, z, r, dis_z, dis_z_v));

        res.z.push_back(z);
        res.z_v.push_back(x(2, i));
        res.megno.push_back(megno.megno());
        res.mean_megno.push_back(megno.mean_megno());
    }
    results_ = std::move(res);
}

} // namespace sitnikov
