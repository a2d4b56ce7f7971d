#include "geolocator/cluster_objective.hpp"

using namespace std;

namespace geolocator
{
double SquaredSizesObjective::Measure(vector<size_t> const & sizes) const
{
  double result = 0.0;
  for (auto const size : sizes)
    result += static_cast<double>(size) * static_cast<double>(size);
  return result;
}

double SquaredSizesObjective::Gain(size_t sourceSize, size_t destSize) const
{
  auto const d = static_cast<double>(destSize);
  if (sourceSize == 0)
    return 2.0 * d + 1.0;

  // (s - 1)^2 + (d + 1)^2 - s^2 - d^2.
  auto const s = static_cast<double>(sourceSize);
  return 2.0 * (d - s + 1.0);
}
}  // namespace geolocator
