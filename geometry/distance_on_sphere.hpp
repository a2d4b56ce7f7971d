#pragma once

#include "geometry/latlon.hpp"

namespace ms
{
// Mean radius of the Earth in kilometres, the value the great circle metric of geopy uses.
double constexpr kEarthRadiusKm = 6371.009;

// Distance on unit sphere between (lat1, lon1) and (lat2, lon2).
// lat1, lat2, lon1, lon2 - in degrees.
double DistanceOnSphere(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg);

// Great circle distance on the Earth in kilometres.
double DistanceOnEarth(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg);

double DistanceOnEarth(LatLon const & ll1, LatLon const & ll2);

// Angle on the unit sphere, in radians, that spans |distanceKm| on the Earth surface.
double AngleForDistanceOnEarth(double distanceKm);
}  // namespace ms
