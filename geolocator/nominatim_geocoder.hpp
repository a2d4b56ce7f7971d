#pragma once

#include "geolocator/geocoder_interface.hpp"
#include "geolocator/types.hpp"

#include <cstddef>
#include <string>

namespace geolocator
{
// Forward geocoding with an OpenStreetMap Nominatim server.
class NominatimGeocoder : public GeocoderInterface
{
public:
  static char const * const kDefaultUrl;
  static char const * const kUserAgent;
  static size_t constexpr kDefaultRecords = 20;

  explicit NominatimGeocoder(std::string const & url, size_t records = kDefaultRecords);

  // GeocoderInterface overrides:
  std::string const & GetName() const override;
  Candidates Geocode(std::string const & placeName) const override;

  // Reads the json array of a Nominatim search response. Records without valid
  // coordinates are skipped. Throws coding::JsonException on malformed json.
  static Candidates ParseResponse(std::string const & response);

private:
  std::string m_url;
  size_t m_records;
};
}  // namespace geolocator
