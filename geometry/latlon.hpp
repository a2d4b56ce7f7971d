#pragma once

#include <string>

namespace ms
{
/// \brief Class for representing WGS point.
class LatLon
{
public:
  static double constexpr kMinLat = -90.0;
  static double constexpr kMaxLat = 90.0;
  static double constexpr kMinLon = -180.0;
  static double constexpr kMaxLon = 180.0;

  double m_lat = 0.0;
  double m_lon = 0.0;

  LatLon() = default;
  LatLon(double lat, double lon) : m_lat(lat), m_lon(lon) {}

  static LatLon Zero() { return LatLon(0.0, 0.0); }

  bool IsValid() const;

  bool operator==(LatLon const & rhs) const;
  bool operator!=(LatLon const & rhs) const { return !(*this == rhs); }
  bool operator<(LatLon const & rhs) const;

  bool EqualDxDy(LatLon const & p, double eps) const;

  struct Hash
  {
    size_t operator()(LatLon const & p) const;
  };
};

std::string DebugPrint(LatLon const & t);
}  // namespace ms
