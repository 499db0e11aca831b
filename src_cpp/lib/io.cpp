#include "sitnikov/io.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace sitnikov {

void write_series(const std::vector<double>& values, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw std::runtime_error("Couldn't open " + path.string() + " for writing");

    const std::uint64_t count = values.size();
    file.write(reinterpret_cast<const char*>(&count), sizeof(count));
    if (!values.empty()) {
        file.write(reinterpret_cast<const char*>(values.data()),
                   static_cast<std::streamsize>(values.size() * sizeof(double)));
    }
    file.flush();
    if (!file) throw std::runtime_error("Couldn't write the series to " + path.string());
}

void write_trajectory(const TrajectorySitnikov& traj, const std::filesystem::path& dir) {
    write_series(traj.z, dir / "z.bin");
    write_series(traj.z_v, dir / "z_v.bin");
    if (!traj.megno.empty()) {
        write_series(traj.megno, dir / "megno.bin");
        write_series(traj.mean_megno, dir / "mean_megno.bin");
    }
}

} // namespace sitnikov
