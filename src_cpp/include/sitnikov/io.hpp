#pragma once
#include <filesystem>
#include <vector>

#include "sitnikov/types.hpp"

namespace sitnikov {

// Binary dump of one series: a native-endian u64 element count followed by
// the values as native-endian doubles. Throws std::runtime_error on I/O failure.
void write_series(const std::vector<double>& values, const std::filesystem::path& path);

// z.bin and z_v.bin, plus megno.bin and mean_megno.bin when MEGNOs were computed
void write_trajectory(const TrajectorySitnikov& traj, const std::filesystem::path& dir);

} // namespace sitnikov
