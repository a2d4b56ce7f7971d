#pragma once

#include "geolocator/geocoder_interface.hpp"
#include "geolocator/types.hpp"

#include <cstddef>
#include <string>

namespace geolocator
{
// Forward geocoding with the OpenCage API.
class OpenCageGeocoder : public GeocoderInterface
{
public:
  static char const * const kDefaultUrl;
  static size_t constexpr kDefaultRecords = 10;

  OpenCageGeocoder(std::string const & url, std::string const & apiKey,
                   size_t records = kDefaultRecords);

  // GeocoderInterface overrides:
  std::string const & GetName() const override;
  Candidates Geocode(std::string const & placeName) const override;

  // Reads the "results" of an OpenCage response. Results without valid coordinates are
  // skipped. Throws coding::JsonException on malformed json.
  static Candidates ParseResponse(std::string const & response);

private:
  std::string m_url;
  std::string m_apiKey;
  size_t m_records;
};
}  // namespace geolocator
