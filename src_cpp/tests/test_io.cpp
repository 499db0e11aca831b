#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "check.hpp"
#include "sitnikov/io.hpp"
#include "sitnikov/types.hpp"

namespace fs = std::filesystem;

static std::vector<double> read_series(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    CHECK(file.good(), "can't open " << path.string());

    std::uint64_t count = 0;
    file.read(reinterpret_cast<char*>(&count), sizeof(count));
    std::vector<double> values(static_cast<std::size_t>(count));
    if (count > 0) {
        file.read(reinterpret_cast<char*>(values.data()), static_cast<std::streamsize>(count * sizeof(double)));
    }
    CHECK(file.good(), "truncated series in " << path.string());
    CHECK(file.peek() == std::ifstream::traits_type::eof(), "trailing bytes in " << path.string());
    return values;
}

static fs::path scratch_dir() {
    const fs::path dir = fs::temp_directory_path() / "sitnikov_test_io";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void test_series_layout() {
    const fs::path dir = scratch_dir();
    const std::vector<double> values = {1.0, -0.5, 3.25, 1e-300};
    sitnikov::write_series(values, dir / "series.bin");

    CHECK(fs::file_size(dir / "series.bin") == sizeof(std::uint64_t) + values.size() * sizeof(double), "file size");
    CHECK(read_series(dir / "series.bin") == values, "values read back");

    sitnikov::write_series({}, dir / "empty.bin");
    CHECK(fs::file_size(dir / "empty.bin") == sizeof(std::uint64_t), "an empty series holds only the count");
    CHECK(read_series(dir / "empty.bin").empty(), "empty series read back");

    fs::remove_all(dir);
}

static void test_trajectory_files() {
    const fs::path dir = scratch_dir();

    sitnikov::TrajectorySitnikov traj;
    traj.z = {1.0, 0.9, 0.7};
    traj.z_v = {0.0, -0.1, -0.2};
    sitnikov::write_trajectory(traj, dir);
    CHECK(read_series(dir / "z.bin") == traj.z, "positions");
    CHECK(read_series(dir / "z_v.bin") == traj.z_v, "velocities");
    CHECK(!fs::exists(dir / "megno.bin"), "no MEGNO file without MEGNOs");

    traj.megno = {0.0, 1.5, 1.9};
    traj.mean_megno = {0.0, 0.7, 1.1};
    sitnikov::write_trajectory(traj, dir);
    CHECK(read_series(dir / "megno.bin") == traj.megno, "MEGNOs");
    CHECK(read_series(dir / "mean_megno.bin") == traj.mean_megno, "mean MEGNOs");

    fs::remove_all(dir);
}

static void test_missing_directory() {
    const fs::path dir = fs::temp_directory_path() / "sitnikov_test_io_missing";
    fs::remove_all(dir);
    bool thrown = false;
    try {
        sitnikov::write_series({1.0}, dir / "z.bin");
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()).find("Couldn't open") != std::string::npos;
    }
    CHECK(thrown, "writing into a missing directory must fail");
}

int main() {
    test_series_layout();
    test_trajectory_files();
    test_missing_directory();
    std::cout << "[OK] io\n";
    return 0;
}
