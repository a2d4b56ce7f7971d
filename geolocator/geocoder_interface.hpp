#pragma once

#include "geolocator/types.hpp"

#include "platform/http_client.hpp"

#include <string>

namespace geolocator
{
// A geocoding provider: turns a place name into zero or more candidates.
// Implementations keep no state between calls and may be used from several threads.
class GeocoderInterface
{
public:
  virtual ~GeocoderInterface() = default;

  // Name recorded in Candidate::m_geocoder.
  virtual std::string const & GetName() const = 0;

  // Throws GeocoderException when the provider can not be queried or answers garbage.
  virtual Candidates Geocode(std::string const & placeName) const = 0;
};

// Runs |request| and returns the response body. Throws GeocoderException on transport
// errors and non-2xx answers.
std::string FetchGeocoderResponse(std::string const & geocoderName, platform::HttpClient & request);
}  // namespace geolocator
