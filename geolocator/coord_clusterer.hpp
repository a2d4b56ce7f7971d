#pragma once

#include "geometry/latlon.hpp"

#include <cstddef>
#include <vector>

namespace geolocator
{
// Density based clustering (DBSCAN) of geographic points with the great circle metric.
//
// A point is a core point when at least |minSize| points, the point itself included,
// lie within |maxDistKm| of it. Clusters are the sets of points density-reachable from
// core points; the remaining points are outliers and belong to no cluster.
class CoordClusterer
{
public:
  static double constexpr kDefaultMaxDistKm = 150.0;
  static size_t constexpr kDefaultMinSize = 1;

  explicit CoordClusterer(double maxDistKm = kDefaultMaxDistKm,
                          size_t minSize = kDefaultMinSize);

  double GetMaxDistKm() const { return m_maxDistKm; }

  // Returns groups of indices into |points|. Groups are ordered by their first core point,
  // indices within a group ascend.
  std::vector<std::vector<size_t>> ClusterIndices(std::vector<ms::LatLon> const & points) const;

  std::vector<std::vector<ms::LatLon>> Cluster(std::vector<ms::LatLon> const & points) const;

private:
  std::vector<size_t> GetNeighbours(std::vector<ms::LatLon> const & points, size_t i) const;

  double m_maxDistKm;
  // |m_maxDistKm| as an angle on the unit sphere.
  double m_maxRadians;
  size_t m_minSize;
};
}  // namespace geolocator
