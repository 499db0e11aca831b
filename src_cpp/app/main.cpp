// Command-line driver: integrate the Sitnikov problem and dump the series
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "sitnikov/api.hpp"
#include "sitnikov/errors.hpp"
#include "sitnikov/io.hpp"
#include "sitnikov/types.hpp"

static void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " -o <dir> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Output:" << std::endl;
    std::cout << "  -o, --output <dir>  Existing output directory" << std::endl;
    std::cout << "  --megno             Compute MEGNOs" << std::endl;
    std::cout << "  --trapezoidal       Compute MEGNOs with the trapezoidal rule" << std::endl;
    std::cout << "                      instead of the variational equations" << std::endl;
    std::cout << std::endl;
    std::cout << "Model:" << std::endl;
    std::cout << "  -e <E>              Eccentricity, [0, 1) (default: 0.0)" << std::endl;
    std::cout << "  -t <TAU>            Time at the pericenter, fraction of 2 pi (default: 0.0)" << std::endl;
    std::cout << "  -a <T_0>            Initial value of time (default: 0.0)" << std::endl;
    std::cout << "  -p <Z_0>            Initial position of the third body (default: 1.0)" << std::endl;
    std::cout << "  -v <Z_V_0>          Initial velocity of the third body (default: 0.0)" << std::endl;
    std::cout << std::endl;
    std::cout << "Integration:" << std::endl;
    std::cout << "  -h <H>              Time step, multiple of pi / 2 (default: 1e-2)" << std::endl;
    std::cout << "  -P <PERIODS>        Number of periods, multiple of 2 pi (default: 1000)" << std::endl;
    std::cout << "  -m <METHOD>         rk4 | leapfrog | yoshida (default: yoshida)" << std::endl;
    std::cout << "  --help              Print this message" << std::endl;
}

static bool parse_method(const std::string& s, sitnikov::Method& method) {
    if (s == "rk4") {
        method = sitnikov::Method::RUNGE_KUTTA_4TH;
    } else if (s == "leapfrog") {
        method = sitnikov::Method::LEAPFROG;
    } else if (s == "yoshida") {
        method = sitnikov::Method::YOSHIDA_4TH;
    } else {
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    sitnikov::ModelCfg cfg;
    std::string output;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--megno") {
            cfg.compute_megno = true;
            continue;
        }
        if (arg == "--trapezoidal") {
            cfg.megno_method = sitnikov::MegnoMethod::TRAPEZOIDAL;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Error: Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        const std::string value = argv[++i];
        try {
            if (arg == "-o" || arg == "--output") {
                output = value;
            } else if (arg == "-e") {
                cfg.e = std::stod(value);
            } else if (arg == "-t") {
                cfg.tau = std::stod(value);
            } else if (arg == "-a") {
                cfg.t_0 = std::stod(value);
            } else if (arg == "-p") {
                cfg.z_0 = std::stod(value);
            } else if (arg == "-v") {
                cfg.z_v_0 = std::stod(value);
            } else if (arg == "-h") {
                cfg.h = std::stod(value);
            } else if (arg == "-P") {
                const long long periods = std::stoll(value);
                if (periods < 1) throw std::invalid_argument("number of periods must be positive");
                cfg.periods = static_cast<std::size_t>(periods);
            } else if (arg == "-m") {
                if (!parse_method(value, cfg.method)) {
                    std::cerr << "Error: Unknown integration method: " << value << std::endl;
                    return 1;
                }
            } else {
                std::cerr << "Error: Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Couldn't parse the value of " << arg << ": " << value << std::endl;
            return 1;
        }
    }

    if (output.empty()) {
        std::cerr << "Error: The output directory is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (!std::filesystem::is_directory(output)) {
        std::cerr << "Error: Output must be an existing directory: " << output << std::endl;
        return 1;
    }

    try {
        const auto traj = sitnikov::simulate_sitnikov(cfg);
        if (traj.status != sitnikov::Status::OK) {
            std::cerr << "Error: Couldn't integrate the model: " << traj.message << std::endl;
            return 1;
        }
        std::cout << "e = " << traj.e << ", h = " << traj.h << ", n = " << traj.n;
        if (cfg.compute_megno) {
            std::cout << ", MEGNO from step " << (cfg.megno_method == sitnikov::MegnoMethod::VARIATIONAL ? traj.i_m : 1)
                      << ", final MEGNO = " << traj.megno.back()
                      << ", mean MEGNO = " << traj.mean_megno.back();
        }
        std::cout << std::endl;

        sitnikov::write_trajectory(traj, output);
        std::cout << "Results written to: " << output << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << sitnikov::describe(e) << std::endl;
        return 1;
    }
    return 0;
}
