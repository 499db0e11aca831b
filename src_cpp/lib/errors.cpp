#include "sitnikov/errors.hpp"

#include <sstream>

namespace sitnikov {

static std::string convergence_message(double initial) {
    std::ostringstream os;
    os.precision(17);
    os << "The Newton-Raphson method didn't converge with initial = " << initial;
    return os.str();
}

ConvergenceFailure::ConvergenceFailure(double initial)
    : Error(convergence_message(initial)), initial_(initial) {}

static void describe_into(const std::exception& e, std::string& out) {
    if (!out.empty()) out += ": ";
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        describe_into(cause, out);
    } catch (...) {
        out += ": unknown error";
    }
}

std::string describe(const std::exception& e) {
    std::string out;
    describe_into(e, out);
    return out;
}

} // namespace sitnikov
