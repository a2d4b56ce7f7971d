#include "geometry/latlon.hpp"

#include "base/math.hpp"

#include <functional>
#include <sstream>
#include <tuple>

using namespace std;

namespace ms
{
// static
double constexpr LatLon::kMinLat;
double constexpr LatLon::kMaxLat;
double constexpr LatLon::kMinLon;
double constexpr LatLon::kMaxLon;

bool LatLon::IsValid() const
{
  return base::Between(kMinLat, kMaxLat, m_lat) && base::Between(kMinLon, kMaxLon, m_lon);
}

bool LatLon::operator==(ms::LatLon const & rhs) const
{
  return m_lat == rhs.m_lat && m_lon == rhs.m_lon;
}

bool LatLon::operator<(ms::LatLon const & rhs) const
{
  return tie(m_lat, m_lon) < tie(rhs.m_lat, rhs.m_lon);
}

bool LatLon::EqualDxDy(LatLon const & p, double eps) const
{
  return (base::AlmostEqualAbs(m_lat, p.m_lat, eps) &&
          base::AlmostEqualAbs(m_lon, p.m_lon, eps));
}

size_t LatLon::Hash::operator()(ms::LatLon const & p) const
{
  auto const h1 = hash<double>{}(p.m_lat);
  auto const h2 = hash<double>{}(p.m_lon);
  return h1 ^ (h2 << 1);
}

string DebugPrint(LatLon const & t)
{
  ostringstream out;
  out.precision(20);
  out << "ms::LatLon(" << t.m_lat << ", " << t.m_lon << ")";
  return out.str();
}
}  // namespace ms
