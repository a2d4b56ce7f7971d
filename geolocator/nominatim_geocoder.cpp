#include "geolocator/nominatim_geocoder.hpp"

#include "coding/json.hpp"
#include "coding/url.hpp"

#include "platform/http_client.hpp"

#include "base/logging.hpp"
#include "base/string_utils.hpp"

#include <utility>
#include <vector>

using namespace std;

namespace geolocator
{
namespace
{
string const kName = "nominatim";

// Nominatim writes numbers as json strings.
bool ReadNumber(coding::JsonValue const & value, double & number)
{
  if (value.IsNumber())
  {
    number = value.GetDouble();
    return true;
  }
  return value.IsString() && strings::to_double(value.GetString(), number);
}

// "boundingbox": [minlat, maxlat, minlon, maxlon].
boost::optional<ms::LatLonRect> ReadBoundingBox(coding::JsonValue const & record)
{
  auto const & box = coding::GetJsonOptionalField(record, "boundingbox");
  if (!box.IsArray() || box.Size() != 4)
    return {};

  double coords[4];
  for (rapidjson::SizeType i = 0; i < 4; ++i)
  {
    if (!ReadNumber(box[i], coords[i]))
      return {};
  }
  return ms::LatLonRect::Make(coords[2], coords[0], coords[3], coords[1]);
}
}  // namespace

char const * const NominatimGeocoder::kDefaultUrl = "https://nominatim.openstreetmap.org/search";
char const * const NominatimGeocoder::kUserAgent = "geolocator";
size_t constexpr NominatimGeocoder::kDefaultRecords;

NominatimGeocoder::NominatimGeocoder(string const & url, size_t records)
  : m_url(url), m_records(records)
{
}

string const & NominatimGeocoder::GetName() const { return kName; }

Candidates NominatimGeocoder::Geocode(string const & placeName) const
{
  platform::HttpClient request(coding::MakeUrl(
      m_url, {{"q", placeName}, {"format", "json"}, {"limit", to_string(m_records)}}));
  request.SetUserAgent(kUserAgent);

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
Candidates NominatimGeocoder::ParseResponse(string const & response)
{
  coding::JsonDocument doc;
  coding::ParseJson(response, doc);
  if (!doc.IsArray())
    MYTHROW(coding::JsonException, ("Nominatim response must be an array"));

  Candidates candidates;
  for (auto const & record : doc.GetArray())
  {
    if (!record.IsObject())
      continue;

    double lat = 0.0;
    double lon = 0.0;
    if (!ReadNumber(coding::GetJsonOptionalField(record, "lat"), lat) ||
        !ReadNumber(coding::GetJsonOptionalField(record, "lon"), lon) ||
        !ms::LatLon(lat, lon).IsValid())
    {
      LOG(LDEBUG, ("Skipped a Nominatim record without valid coordinates"));
      continue;
    }

    Candidate candidate;
    candidate.m_latLon = ms::LatLon(lat, lon);
    coding::FromJsonObjectOptionalField(record, "display_name", candidate.m_address);
    candidate.m_boundingBox = ReadBoundingBox(record);
    candidate.m_geocoder = kName;

    string type;
    coding::FromJsonObjectOptionalField(record, "type", type);
    if (!type.empty())
      candidate.m_components.emplace("_type", type);

    candidates.push_back(move(candidate));
  }
  return candidates;
}
}  // namespace geolocator
