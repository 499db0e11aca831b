#include "sitnikov/api.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "sitnikov/errors.hpp"
#include "sitnikov/models/sitnikov.hpp"

namespace sitnikov {

static inline bool in_range(double x, double lo, double hi_excl) {
    return x >= lo && x < hi_excl;
}

static inline bool all_finite(const std::vector<double>& v) {
    for (const double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

void validate(const ModelCfg& cfg) {
    const double eps = std::numeric_limits<double>::epsilon();

    if (!in_range(cfg.e, 0.0, 1.0)) throw ConfigurationInvalid("eccentricity is not in the range [0, 1)");
    if (!in_range(cfg.tau, 0.0, 1.0)) throw ConfigurationInvalid("time at the pericenter is not in the range [0, 1)");
    if (!(cfg.h >= eps && cfg.h <= 1.0e-1)) throw ConfigurationInvalid("time step is not in the range [epsilon, 0.1]");

    const double a = 4.0 / cfg.h;
    if (std::abs(a - std::round(a)) >= eps) {
        throw ConfigurationInvalid("time step is incorrect; make sure that the expression `4 / h` gives an integral value");
    }
    if (cfg.periods < 1) throw ConfigurationInvalid("number of periods must be at least 1");
    // the integrators count steps with a `long`
    if (static_cast<double>(cfg.periods) * std::round(a) >= static_cast<double>(std::numeric_limits<long>::max())) {
        throw ConfigurationInvalid("number of periods is too large for the time step");
    }

    if (!std::isfinite(cfg.t_0)) throw ConfigurationInvalid("initial value of time must be finite");
    if (!std::isfinite(cfg.z_0)) throw ConfigurationInvalid("initial value of position must be finite");
    if (!std::isfinite(cfg.z_v_0)) throw ConfigurationInvalid("initial value of velocity must be finite");

    // MEGNOs divide by t
    if (cfg.compute_megno && cfg.t_0 < 0.0) {
        throw ConfigurationInvalid("initial value of time must be non-negative when computing MEGNOs");
    }
}

TrajectorySitnikov simulate_sitnikov(const ModelCfg& cfg) {
    Model model(cfg);
    return simulate_sitnikov(model);
}

TrajectorySitnikov simulate_sitnikov(Model& model) {
    TrajectorySitnikov out;
    out.e = model.e();
    out.tau = model.tau();
    out.h = model.h();
    out.n = model.n();
    out.i_m = model.i_m();
    out.status = Status::OK;

    try {
        model.integrate();
    } catch (const Error& e) {
        out.status = Status::ERROR;
        out.message = describe(e);
        return out;
    }

    Results res = model.results();
    out.t = std::move(res.t);
    out.z = std::move(res.z);
    out.z_v = std::move(res.z_v);
    out.megno = std::move(res.megno);
    out.mean_megno = std::move(res.mean_megno);

    if (!all_finite(out.z) || !all_finite(out.z_v) || !all_finite(out.megno) || !all_finite(out.mean_megno)) {
        out.status = Status::ERROR;
        out.message = "non-finite state encountered";
    }
    return out;
}

} // namespace sitnikov
