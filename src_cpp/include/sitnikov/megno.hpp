#pragma once
#include <cmath>
#include <cstddef>

namespace sitnikov {

// Integrand of the MEGNO expression for the Sitnikov problem.
// (dis_z, dis_z_v) is the displacement between the primary and the shadow
// trajectory, projected onto the tangent (linearized) flow at position z,
// with r the distance of the primaries from the barycenter.
template <typename F>
F megno_integrand(F t, F z, F r, F dis_z, F dis_z_v) {
    const F dis_norm = std::sqrt(dis_z * dis_z + dis_z_v * dis_z_v);
    const F r2 = r * r;
    const F tan_z = dis_z * (F(2) * z * z - r2) / std::pow(r2 + z * z, F(2.5));
    const F tan_z_v = dis_z_v;
    const F tan_norm = (tan_z * dis_z + tan_z_v * dis_z_v) / dis_norm;
    return tan_norm / dis_norm * t;
}

// Running MEGNO and mean MEGNO built with an incremental trapezoidal rule.
// Only the previous integrand and MEGNO values are kept.
template <typename F>
class MegnoAccumulator {
public:
    explicit MegnoAccumulator(F h) : h_(h) {}

    // Add the integrand evaluated at step i + 1 (time t)
    void push(F t, F integrand) {
        ++i_;
        integral_ = trapezoidal(integral_, integrand_prev_, integrand);
        megno_ = F(2) / t * integral_;
        mean_integral_ = trapezoidal(mean_integral_, megno_prev_, megno_);
        mean_megno_ = mean_integral_ / t;
        integrand_prev_ = integrand;
        megno_prev_ = megno_;
    }

    F megno() const { return megno_; }
    F mean_megno() const { return mean_megno_; }

private:
    F trapezoidal(F integral, F prev, F current) const {
        if (i_ == 1) return integral + h_ * (prev + current) / F(2);
        const F i = static_cast<F>(i_);
        return (integral + h_ * prev / F(2) / (i - F(1))) * (i - F(1)) / i + h_ * current / F(2) / i;
    }

    F h_;
    std::size_t i_ = 0;
    F integral_ = F(0);
    F mean_integral_ = F(0);
    F integrand_prev_ = F(0);
    F megno_prev_ = F(0);
    F megno_ = F(0);
    F mean_megno_ = F(0);
};

} // namespace sitnikov
