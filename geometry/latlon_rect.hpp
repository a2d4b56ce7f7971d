#pragma once

#include "geometry/latlon.hpp"

#include <boost/optional.hpp>

#include <string>

namespace ms
{
// Axis-aligned box in geographic coordinates. Boxes crossing the antimeridian are not
// supported: geocoders report them with minLon > maxLon and they are rejected by Make().
class LatLonRect
{
public:
  LatLonRect() = default;

  // Arguments are in the (minlon, minlat, maxlon, maxlat) order of geocoder bounds.
  static boost::optional<LatLonRect> Make(double minLon, double minLat, double maxLon,
                                          double maxLat);

  LatLon Min() const { return m_min; }
  LatLon Max() const { return m_max; }

  double MinLon() const { return m_min.m_lon; }
  double MinLat() const { return m_min.m_lat; }
  double MaxLon() const { return m_max.m_lon; }
  double MaxLat() const { return m_max.m_lat; }

  // Boundary points are inside.
  bool IsPointInside(LatLon const & ll) const;
  // Rects that only touch each other intersect.
  bool IsIntersect(LatLonRect const & rect) const;

  bool operator==(LatLonRect const & rhs) const { return m_min == rhs.m_min && m_max == rhs.m_max; }

private:
  LatLonRect(LatLon const & min, LatLon const & max) : m_min(min), m_max(max) {}

  LatLon m_min;
  LatLon m_max;
};

std::string DebugPrint(LatLonRect const & rect);
}  // namespace ms
