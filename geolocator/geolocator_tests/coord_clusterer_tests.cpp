#include "testing/testing.hpp"

#include "geolocator/coord_clusterer.hpp"

#include "geometry/distance_on_sphere.hpp"
#include "geometry/latlon.hpp"

#include <cstddef>
#include <vector>

using namespace geolocator;
using namespace std;

namespace
{
using Groups = vector<vector<size_t>>;

ms::LatLon const kGeneva(46.20, 6.14);
ms::LatLon const kLausanne(46.52, 6.63);
ms::LatLon const kChicago(41.88, -87.63);
ms::LatLon const kGenevaIllinois(41.88, -88.30);
ms::LatLon const kTokyo(35.68, 139.69);

UNIT_TEST(CoordClusterer_Smoke)
{
  CoordClusterer const clusterer;
  vector<ms::LatLon> const points = {kGeneva, kChicago, kLausanne, kGenevaIllinois, kTokyo};

  TEST_EQUAL(clusterer.ClusterIndices(points), (Groups{{0, 2}, {1, 3}, {4}}), ());

  auto const clusters = clusterer.Cluster(points);
  TEST_EQUAL(clusters.size(), 3, ());
  TEST_EQUAL(clusters[0], (vector<ms::LatLon>{kGeneva, kLausanne}), ());
  TEST_EQUAL(clusters[2], (vector<ms::LatLon>{kTokyo}), ());
}

UNIT_TEST(CoordClusterer_Empty)
{
  CoordClusterer const clusterer;
  TEST(clusterer.ClusterIndices({}).empty(), ());
}

UNIT_TEST(CoordClusterer_OutliersAreDropped)
{
  CoordClusterer const clusterer(150.0 /* maxDistKm */, 2 /* minSize */);
  vector<ms::LatLon> const points = {kGeneva, kChicago, kLausanne, kGenevaIllinois, kTokyo};

  TEST_EQUAL(clusterer.ClusterIndices(points), (Groups{{0, 2}, {1, 3}}), ());
}

UNIT_TEST(CoordClusterer_SmallRadius)
{
  CoordClusterer const clusterer(10.0 /* maxDistKm */);
  vector<ms::LatLon> const points = {kGeneva, kLausanne, kGeneva};

  // Equal points are always neighbours.
  TEST_EQUAL(clusterer.ClusterIndices(points), (Groups{{0, 2}, {1}}), ());
}

UNIT_TEST(CoordClusterer_Chain)
{
  // Neighbouring points are ~133 km apart, the ends ~267 km.
  vector<ms::LatLon> const points = {{0.0, 0.0}, {0.0, 1.2}, {0.0, 2.4}};
  TEST_GREATER(ms::DistanceOnEarth(points[0], points[2]), 150.0, ());

  CoordClusterer const clusterer;
  TEST_EQUAL(clusterer.ClusterIndices(points), (Groups{{0, 1, 2}}), ());
}

UNIT_TEST(CoordClusterer_BorderPoints)
{
  // With minSize 3 only the inner points are core points, the ends join as border points.
  vector<ms::LatLon> const points = {{0.0, 0.0}, {0.0, 1.0}, {0.0, 2.0}, {0.0, 3.0}, kTokyo};

  CoordClusterer const clusterer(150.0 /* maxDistKm */, 3 /* minSize */);
  TEST_EQUAL(clusterer.ClusterIndices(points), (Groups{{0, 1, 2, 3}}), ());
}
}  // namespace
