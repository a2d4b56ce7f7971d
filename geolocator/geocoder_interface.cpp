#include "geolocator/geocoder_interface.hpp"

using namespace std;

namespace geolocator
{
string FetchGeocoderResponse(string const & geocoderName, platform::HttpClient & request)
{
  if (!request.RunHttpRequest())
  {
    MYTHROW(GeocoderException, (geocoderName, "request failed:", request.ErrorMessage(),
                                "url:", request.UrlRequested()));
  }

  if (!request.WasSuccessful())
  {
    MYTHROW(GeocoderException, (geocoderName, "answered with code", request.ResponseCode(),
                                request.ServerResponse()));
  }

  return request.ServerResponse();
}
}  // namespace geolocator
