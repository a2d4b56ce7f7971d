#include "geolocator/opencage_geocoder.hpp"

#include "coding/json.hpp"
#include "coding/url.hpp"

#include "platform/http_client.hpp"

#include "base/logging.hpp"

#include <utility>

using namespace std;

namespace geolocator
{
namespace
{
string const kName = "opencage";

bool ReadLatLng(coding::JsonValue const & root, ms::LatLon & latLon)
{
  if (!root.IsObject())
    return false;

  auto const & lat = coding::GetJsonOptionalField(root, "lat");
  auto const & lng = coding::GetJsonOptionalField(root, "lng");
  if (!lat.IsNumber() || !lng.IsNumber())
    return false;
  latLon = ms::LatLon(lat.GetDouble(), lng.GetDouble());
  return latLon.IsValid();
}

boost::optional<ms::LatLonRect> ReadBounds(coding::JsonValue const & result)
{
  auto const & bounds = coding::GetJsonOptionalField(result, "bounds");
  if (!bounds.IsObject())
    return {};

  ms::LatLon southwest;
  ms::LatLon northeast;
  if (!ReadLatLng(coding::GetJsonOptionalField(bounds, "southwest"), southwest) ||
      !ReadLatLng(coding::GetJsonOptionalField(bounds, "northeast"), northeast))
  {
    return {};
  }
  return ms::LatLonRect::Make(southwest.m_lon, southwest.m_lat, northeast.m_lon, northeast.m_lat);
}
}  // namespace

char const * const OpenCageGeocoder::kDefaultUrl = "https://api.opencagedata.com/geocode/v1/json";
size_t constexpr OpenCageGeocoder::kDefaultRecords;

OpenCageGeocoder::OpenCageGeocoder(string const & url, string const & apiKey, size_t records)
  : m_url(url), m_apiKey(apiKey), m_records(records)
{
}

string const & OpenCageGeocoder::GetName() const { return kName; }

Candidates OpenCageGeocoder::Geocode(string const & placeName) const
{
  platform::HttpClient request(coding::MakeUrl(
      m_url, {{"q", placeName}, {"key", m_apiKey}, {"limit", to_string(m_records)}}));

  auto const response = FetchGeocoderResponse(kName, request);
  try
  {
    return ParseResponse(response);
  }
  catch (coding::JsonException const & e)
  {
    MYTHROW(GeocoderException, (kName, "bad response for", placeName, e.Msg()));
  }
}

// static
Candidates OpenCageGeocoder::ParseResponse(string const & response)
{
  coding::JsonDocument doc;
  coding::ParseJson(response, doc);

  auto const & results = coding::GetJsonObligatoryField(doc, "results");
  if (!results.IsArray())
    MYTHROW(coding::JsonException, ("\"results\" must be an array"));

  Candidates candidates;
  for (auto const & result : results.GetArray())
  {
    if (!result.IsObject())
      continue;

    Candidate candidate;
    if (!ReadLatLng(coding::GetJsonOptionalField(result, "geometry"), candidate.m_latLon))
    {
      LOG(LDEBUG, ("Skipped an OpenCage result without valid geometry"));
      continue;
    }

    coding::FromJsonObjectOptionalField(result, "formatted", candidate.m_address);
    candidate.m_boundingBox = ReadBounds(result);
    candidate.m_geocoder = kName;

    auto const & components = coding::GetJsonOptionalField(result, "components");
    if (components.IsObject())
    {
      for (auto const & member : components.GetObject())
      {
        if (member.value.IsString())
          candidate.m_components.emplace(member.name.GetString(), member.value.GetString());
      }
    }

    auto const & annotations = coding::GetJsonOptionalField(result, "annotations");
    if (annotations.IsObject())
    {
      auto const & osm = coding::GetJsonOptionalField(annotations, "OSM");
      if (osm.IsObject())
        coding::FromJsonObjectOptionalField(osm, "url", candidate.m_osmUrl);
    }

    candidates.push_back(move(candidate));
  }
  return candidates;
}
}  // namespace geolocator
