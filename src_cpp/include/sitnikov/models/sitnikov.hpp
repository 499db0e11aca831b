#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "sitnikov/result.hpp"
#include "sitnikov/types.hpp"

namespace sitnikov {

constexpr double PI = 3.141592653589793238462643383279502884;

// Shadow trajectory for MEGNOs: normal perturbation of the initial values
constexpr std::uint64_t SHADOW_SEED = 1;
constexpr double SHADOW_SIGMA = 1.0e-1;

struct Results {
    std::vector<double> t;
    std::vector<double> z;
    std::vector<double> z_v;
    std::vector<double> megno;
    std::vector<double> mean_megno;
};

// The Sitnikov problem: a massless body moving along the axis through the
// barycenter of two equal primaries on elliptic orbits (unit semi-major axis,
// period 2 pi)
class Model {
public:
    // Throws ConfigurationInvalid if `cfg` is out of range
    explicit Model(const ModelCfg& cfg);
    virtual ~Model() = default;

    // Solve Kepler's equation E - e sin E = m
    double eccentric_anomaly(double m) const;

    // Distance from the barycenter to either of the primaries
    double radius(double t) const;

    // d^2z/dt^2 = -z / (r^2 + z^2)^(3/2). Every integration path evaluates
    // the force through this function; a derived model may replace it.
    virtual double acceleration(double t, double z) const;

    // Integrate the equations of motion and, if configured, compute MEGNOs.
    // On failure the results are left empty.
    void integrate();

    // Initial values of the shadow trajectory, [z~_0, z~_v_0]
    std::vector<double> shadow_initial_values() const;

    const Results& results() const { return results_; }

    double e() const { return e_; }
    double tau() const { return tau_; }
    double t_0() const { return t_0_; }
    double h() const { return h_; }
    std::size_t n() const { return n_; }
    std::size_t i_m() const { return i_m_; }
    const std::vector<double>& x_0() const { return x_0_; }

private:
    class Motion;
    class MotionFirstOrder;
    class MegnoEquations;

    Result<double> integrate_motion(const std::vector<double>& x, double t_0, std::size_t n) const;
    void integrate_variational();
    void integrate_trapezoidal();
    std::vector<double> times(std::size_t from, std::size_t to) const;

    double e_;
    double tau_;     // radians
    double t_0_;
    double h_;       // physical time step
    std::size_t n_;
    std::size_t i_m_; // MEGNO offset, a quarter of the period
    std::vector<double> x_0_;
    bool compute_megno_;
    Method method_;
    MegnoMethod megno_method_;

    Results results_;
};

} // namespace sitnikov
