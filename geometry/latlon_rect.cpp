#include "geometry/latlon_rect.hpp"

#include <sstream>

using namespace std;

namespace ms
{
// static
boost::optional<LatLonRect> LatLonRect::Make(double minLon, double minLat, double maxLon,
                                             double maxLat)
{
  LatLon const min(minLat, minLon);
  LatLon const max(maxLat, maxLon);
  if (!min.IsValid() || !max.IsValid())
    return {};
  if (minLat > maxLat || minLon > maxLon)
    return {};
  return LatLonRect(min, max);
}

bool LatLonRect::IsPointInside(LatLon const & ll) const
{
  return m_min.m_lat <= ll.m_lat && ll.m_lat <= m_max.m_lat && m_min.m_lon <= ll.m_lon &&
         ll.m_lon <= m_max.m_lon;
}

bool LatLonRect::IsIntersect(LatLonRect const & rect) const
{
  if (rect.m_max.m_lat < m_min.m_lat || m_max.m_lat < rect.m_min.m_lat)
    return false;
  if (rect.m_max.m_lon < m_min.m_lon || m_max.m_lon < rect.m_min.m_lon)
    return false;
  return true;
}

string DebugPrint(LatLonRect const & rect)
{
  ostringstream out;
  out.precision(10);
  out << "ms::LatLonRect(" << rect.MinLon() << ", " << rect.MinLat() << ", " << rect.MaxLon()
      << ", " << rect.MaxLat() << ")";
  return out.str();
}
}  // namespace ms
