#include "geolocator/location_json.hpp"

#include <string>
#include <vector>

using namespace std;

namespace geolocator
{
namespace
{
using coding::JsonAllocator;
using coding::JsonValue;

JsonValue ToJson(vector<string> const & strings, JsonAllocator & allocator)
{
  JsonValue array(rapidjson::kArrayType);
  for (auto const & s : strings)
    array.PushBack(coding::MakeJsonString(s, allocator), allocator);
  return array;
}

// [minlon, minlat, maxlon, maxlat] or [] without a box.
JsonValue BoundingBoxToJson(Candidate const & candidate, JsonAllocator & allocator)
{
  JsonValue array(rapidjson::kArrayType);
  if (auto const & box = candidate.m_boundingBox)
  {
    array.PushBack(box->MinLon(), allocator);
    array.PushBack(box->MinLat(), allocator);
    array.PushBack(box->MaxLon(), allocator);
    array.PushBack(box->MaxLat(), allocator);
  }
  return array;
}

JsonValue ToJson(MapRelevance const & mapRelevance, JsonAllocator & allocator)
{
  JsonValue object(rapidjson::kObjectType);
  for (auto const & item : mapRelevance)
  {
    JsonValue key = coding::MakeJsonString(item.first, allocator);
    object.AddMember(key, item.second, allocator);
  }
  return object;
}

void AddString(JsonValue & object, char const * key, string const & value,
               JsonAllocator & allocator)
{
  object.AddMember(rapidjson::StringRef(key), coding::MakeJsonString(value, allocator), allocator);
}
}  // namespace

JsonValue ToJson(Location const & location, JsonAllocator & allocator)
{
  auto const & candidate = location.m_candidate;
  JsonValue object(rapidjson::kObjectType);
  AddString(object, "address", candidate.m_address, allocator);
  object.AddMember("lat", candidate.m_latLon.m_lat, allocator);
  object.AddMember("lon", candidate.m_latLon.m_lon, allocator);
  object.AddMember("boundingbox", BoundingBoxToJson(candidate, allocator), allocator);
  AddString(object, "geocoder", candidate.m_geocoder, allocator);
  if (!candidate.m_osmUrl.empty())
    AddString(object, "osm_url", candidate.m_osmUrl, allocator);
  AddString(object, "text", location.m_text, allocator);
  object.AddMember("relevance", location.m_relevance, allocator);
  object.AddMember("mentions", ToJson(location.m_mentions, allocator), allocator);
  object.AddMember("cluster", ToJson(location.m_cluster, allocator), allocator);
  object.AddMember("cluster_ratio", location.m_clusterRatio, allocator);
  if (location.m_mapRelevance)
    object.AddMember("map_relevance", ToJson(*location.m_mapRelevance, allocator), allocator);
  return object;
}

JsonValue ToCoreJson(Location const & location, JsonAllocator & allocator)
{
  auto const & candidate = location.m_candidate;
  JsonValue object(rapidjson::kObjectType);
  AddString(object, "address", candidate.m_address, allocator);
  object.AddMember("boundingbox", BoundingBoxToJson(candidate, allocator), allocator);
  object.AddMember("lat", candidate.m_latLon.m_lat, allocator);
  object.AddMember("lon", candidate.m_latLon.m_lon, allocator);
  object.AddMember("mentions", ToJson(location.m_mentions, allocator), allocator);
  if (!candidate.m_osmUrl.empty())
    AddString(object, "osm_url", candidate.m_osmUrl, allocator);
  if (location.m_mapRelevance)
    object.AddMember("map_relevance", ToJson(*location.m_mapRelevance, allocator), allocator);
  AddString(object, "text", location.m_text, allocator);
  return object;
}

JsonValue ToJson(Locations const & locations, JsonAllocator & allocator)
{
  JsonValue object(rapidjson::kObjectType);
  for (auto const & item : locations)
  {
    object.AddMember(coding::MakeJsonString(item.first, allocator),
                     ToJson(item.second, allocator), allocator);
  }
  return object;
}

MapRelevance MapRelevanceFromJson(JsonValue const & value)
{
  if (!value.IsObject())
    MYTHROW(coding::JsonException, ("Map relevance must be a json object"));

  MapRelevance result;
  for (auto const & member : value.GetObject())
  {
    double probability = 0.0;
    coding::FromJson(member.value, probability);
    result.emplace(member.name.GetString(), probability);
  }
  return result;
}
}  // namespace geolocator
