#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sitnikov {

enum class Method : std::uint8_t {
    RUNGE_KUTTA_4TH = 0,
    LEAPFROG = 1,
    YOSHIDA_4TH = 2
};

// How MEGNOs are obtained
enum class MegnoMethod : std::uint8_t {
    VARIATIONAL = 0, // extra ODEs integrated with RK4 after a quarter period
    TRAPEZOIDAL = 1  // incremental trapezoidal rule over the shadow trajectory
};

enum class Status : std::uint8_t {
    OK = 0,
    ERROR = 1
};

struct ModelCfg {
    double e = 0.0;         // eccentricity, [0, 1)
    double tau = 0.0;       // time at the pericenter, fraction of 2 pi, [0, 1)
    double t_0 = 0.0;       // initial time
    double z_0 = 1.0;       // initial position of the third body
    double z_v_0 = 0.0;     // initial velocity of the third body
    double h = 1.0e-2;      // time step, multiple of pi / 2; 4 / h must be integral
    std::size_t periods = 1000; // multiples of 2 pi
    bool compute_megno = false;
    Method method = Method::YOSHIDA_4TH;
    MegnoMethod megno_method = MegnoMethod::VARIATIONAL;
};

struct TrajectorySitnikov {
    std::vector<double> t;          // time moments
    std::vector<double> z;          // position of the third body
    std::vector<double> z_v;        // velocity of the third body
    std::vector<double> megno;      // empty unless MEGNOs are computed
    std::vector<double> mean_megno;

    Status status = Status::OK;
    std::string message;

    // parameters of the run
    double e = 0.0;
    double tau = 0.0;  // radians
    double h = 0.0;    // physical time step
    std::size_t n = 0;
    std::size_t i_m = 0;
};

} // namespace sitnikov
