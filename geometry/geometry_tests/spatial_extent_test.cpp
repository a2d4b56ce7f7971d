#include "testing/testing.hpp"

#include "base/assert.hpp"

#include "geometry/latlon.hpp"
#include "geometry/latlon_rect.hpp"
#include "geometry/spatial_extent.hpp"

namespace
{
ms::LatLonRect MakeRect(double minLon, double minLat, double maxLon, double maxLat)
{
  auto const rect = ms::LatLonRect::Make(minLon, minLat, maxLon, maxLat);
  CHECK(rect, ());
  return *rect;
}
}  // namespace

UNIT_TEST(LatLonRect_Make)
{
  TEST(ms::LatLonRect::Make(6.0, 46.0, 6.3, 46.4), ());
  TEST(!ms::LatLonRect::Make(6.3, 46.0, 6.0, 46.4), ());
  TEST(!ms::LatLonRect::Make(6.0, 46.4, 6.3, 46.0), ());
  TEST(!ms::LatLonRect::Make(6.0, 46.0, 6.3, 91.0), ());

  auto const rect = MakeRect(6.0, 46.0, 6.3, 46.4);
  TEST_EQUAL(rect.MinLon(), 6.0, ());
  TEST_EQUAL(rect.MinLat(), 46.0, ());
  TEST_EQUAL(rect.MaxLon(), 6.3, ());
  TEST_EQUAL(rect.MaxLat(), 46.4, ());
}

UNIT_TEST(SpatialExtent_PointPoint)
{
  ms::SpatialExtent const a = ms::LatLon(46.2, 6.14);
  ms::SpatialExtent const b = ms::LatLon(46.2, 6.14);
  ms::SpatialExtent const c = ms::LatLon(46.21, 6.14);
  TEST(ms::Intersects(a, b), ());
  TEST(!ms::Intersects(a, c), ());
}

UNIT_TEST(SpatialExtent_PointBox)
{
  ms::SpatialExtent const box = MakeRect(6.0, 46.0, 6.3, 46.4);
  TEST(ms::Intersects(box, ms::SpatialExtent(ms::LatLon(46.2, 6.14))), ());
  TEST(ms::Intersects(ms::SpatialExtent(ms::LatLon(46.2, 6.14)), box), ());
  // Border counts.
  TEST(ms::Intersects(box, ms::SpatialExtent(ms::LatLon(46.4, 6.3))), ());
  TEST(!ms::Intersects(box, ms::SpatialExtent(ms::LatLon(46.5, 6.14))), ());
}

UNIT_TEST(SpatialExtent_BoxBox)
{
  ms::SpatialExtent const geneva = MakeRect(6.0, 46.0, 6.3, 46.4);
  ms::SpatialExtent const overlapping = MakeRect(6.2, 46.3, 6.8, 46.7);
  ms::SpatialExtent const touching = MakeRect(6.3, 46.4, 6.5, 46.6);
  ms::SpatialExtent const apart = MakeRect(6.5, 46.0, 6.8, 46.4);

  TEST(ms::Intersects(geneva, overlapping), ());
  TEST(ms::Intersects(overlapping, geneva), ());
  TEST(ms::Intersects(geneva, touching), ());
  TEST(!ms::Intersects(geneva, apart), ());
}
