#pragma once

#include "geometry/latlon.hpp"
#include "geometry/latlon_rect.hpp"

#include <string>

#include <boost/variant.hpp>

namespace ms
{
// Where a geocoded object is: a bare point or a bounding box.
using SpatialExtent = boost::variant<LatLon, LatLonRect>;

// Point/point: equal coordinates. Point/box: the point lies in the box or on its border.
// Box/box: the boxes overlap or touch.
bool Intersects(SpatialExtent const & lhs, SpatialExtent const & rhs);

std::string DebugPrint(SpatialExtent const & extent);
}  // namespace ms
