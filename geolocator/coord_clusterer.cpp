#include "geolocator/coord_clusterer.hpp"

#include "geometry/distance_on_sphere.hpp"

#include "base/assert.hpp"

#include <algorithm>

using namespace std;

namespace
{
int const kUnvisited = -2;
int const kNoise = -1;
}  // namespace

namespace geolocator
{
double constexpr CoordClusterer::kDefaultMaxDistKm;
size_t constexpr CoordClusterer::kDefaultMinSize;

CoordClusterer::CoordClusterer(double maxDistKm, size_t minSize)
  : m_maxDistKm(maxDistKm), m_maxRadians(ms::AngleForDistanceOnEarth(maxDistKm)), m_minSize(minSize)
{
  CHECK_GREATER_OR_EQUAL(m_maxDistKm, 0.0, ());
  CHECK_GREATER_OR_EQUAL(m_minSize, 1, ());
}

vector<size_t> CoordClusterer::GetNeighbours(vector<ms::LatLon> const & points, size_t i) const
{
  vector<size_t> neighbours;
  for (size_t j = 0; j < points.size(); ++j)
  {
    auto const & a = points[i];
    auto const & b = points[j];
    if (ms::DistanceOnSphere(a.m_lat, a.m_lon, b.m_lat, b.m_lon) <= m_maxRadians)
      neighbours.push_back(j);
  }
  return neighbours;
}

vector<vector<size_t>> CoordClusterer::ClusterIndices(vector<ms::LatLon> const & points) const
{
  vector<int> labels(points.size(), kUnvisited);
  int clustersCount = 0;

  for (size_t i = 0; i < points.size(); ++i)
  {
    if (labels[i] != kUnvisited)
      continue;

    auto const neighbours = GetNeighbours(points, i);
    if (neighbours.size() < m_minSize)
    {
      // May still become a border point of a later cluster.
      labels[i] = kNoise;
      continue;
    }

    int const label = clustersCount++;
    labels[i] = label;
    vector<size_t> queue(neighbours.begin(), neighbours.end());
    for (size_t k = 0; k < queue.size(); ++k)
    {
      size_t const j = queue[k];
      if (labels[j] == kNoise)
        labels[j] = label;
      if (labels[j] != kUnvisited)
        continue;

      labels[j] = label;
      auto const next = GetNeighbours(points, j);
      if (next.size() >= m_minSize)
        queue.insert(queue.end(), next.begin(), next.end());
    }
  }

  vector<vector<size_t>> clusters(static_cast<size_t>(clustersCount));
  for (size_t i = 0; i < points.size(); ++i)
  {
    if (labels[i] >= 0)
      clusters[static_cast<size_t>(labels[i])].push_back(i);
  }
  return clusters;
}

vector<vector<ms::LatLon>> CoordClusterer::Cluster(vector<ms::LatLon> const & points) const
{
  vector<vector<ms::LatLon>> result;
  for (auto const & indices : ClusterIndices(points))
  {
    vector<ms::LatLon> cluster;
    cluster.reserve(indices.size());
    for (auto const i : indices)
      cluster.push_back(points[i]);
    result.push_back(move(cluster));
  }
  return result;
}
}  // namespace geolocator
