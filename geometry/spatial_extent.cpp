#include "geometry/spatial_extent.hpp"

using namespace std;

namespace ms
{
namespace
{
class IntersectsVisitor : public boost::static_visitor<bool>
{
public:
  bool operator()(LatLon const & lhs, LatLon const & rhs) const { return lhs == rhs; }

  bool operator()(LatLon const & point, LatLonRect const & rect) const
  {
    return rect.IsPointInside(point);
  }

  bool operator()(LatLonRect const & rect, LatLon const & point) const
  {
    return rect.IsPointInside(point);
  }

  bool operator()(LatLonRect const & lhs, LatLonRect const & rhs) const
  {
    return lhs.IsIntersect(rhs);
  }
};

class DebugPrintVisitor : public boost::static_visitor<string>
{
public:
  template <typename T>
  string operator()(T const & t) const
  {
    return DebugPrint(t);
  }
};
}  // namespace

bool Intersects(SpatialExtent const & lhs, SpatialExtent const & rhs)
{
  return boost::apply_visitor(IntersectsVisitor(), lhs, rhs);
}

string DebugPrint(SpatialExtent const & extent)
{
  return boost::apply_visitor(DebugPrintVisitor(), extent);
}
}  // namespace ms
