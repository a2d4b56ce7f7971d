#include "testing/testing.hpp"

#include "geolocator/location_json.hpp"
#include "geolocator/relevance_scorer.hpp"

#include "coding/json.hpp"

#include "base/string_utils.hpp"

#include <string>
#include <vector>

using namespace geolocator;
using namespace std;

namespace
{
Location MakeLocation(string const & address, double lat, double lon)
{
  Location location;
  location.m_candidate.m_address = address;
  location.m_candidate.m_latLon = ms::LatLon(lat, lon);
  location.m_candidate.m_geocoder = "opencage";
  location.m_text = "Geneva";
  location.m_relevance = 0.5;
  location.m_mentions = {"Talks in Geneva drew delegates."};
  location.m_cluster = {"Geneva", "Lausanne"};
  location.m_clusterRatio = 1.0;
  return location;
}

UNIT_TEST(HttpRelevanceScorer_MakeRequestBody)
{
  vector<Location> const locations = {MakeLocation("Geneva, Switzerland", 46.2, 6.14)};
  auto const body = HttpRelevanceScorer::MakeRequestBody(locations);

  TEST(strings::StartsWith(body, "locations_data=%5B%7B"), (body));
  TEST(strings::EndsWith(body, "%7D%5D"), (body));
  TEST_EQUAL(body.find(' '), string::npos, (body));
  TEST_EQUAL(body.find('&'), string::npos, (body));
}

UNIT_TEST(HttpRelevanceScorer_ParseResponse)
{
  auto const scores = HttpRelevanceScorer::ParseResponse(
      R"([{"core": 0.9, "relevant": 0.4}, {"core": 0.1}])", 2 /* expectedCount */);

  TEST_EQUAL(scores.size(), 2, ());
  TEST_EQUAL(scores[0].size(), 2, ());
  TEST_NEAR(scores[0].at("core"), 0.9, 1e-12, ());
  TEST_NEAR(scores[0].at("relevant"), 0.4, 1e-12, ());
  TEST_NEAR(scores[1].at("core"), 0.1, 1e-12, ());
}

UNIT_TEST(HttpRelevanceScorer_CountMismatch)
{
  string const response = R"([{"core": 0.9}])";
  try
  {
    HttpRelevanceScorer::ParseResponse(response, 2 /* expectedCount */);
    TEST(false, ("ScoringException expected"));
  }
  catch (ScoringException const & e)
  {
    TEST_EQUAL(e.HttpCode(), 200, ());
    TEST_EQUAL(e.Body(), response, ());
  }
}

UNIT_TEST(HttpRelevanceScorer_MalformedResponse)
{
  TEST_THROW(HttpRelevanceScorer::ParseResponse("<html>502</html>", 1), ScoringException, ());
  TEST_THROW(HttpRelevanceScorer::ParseResponse(R"({"core": 0.9})", 1), ScoringException, ());
  TEST_THROW(HttpRelevanceScorer::ParseResponse(R"([{"core": "high"}])", 1), ScoringException,
             ());
  TEST_THROW(HttpRelevanceScorer::ParseResponse("[1]", 1), ScoringException, ());
}

UNIT_TEST(LocationJson_Full)
{
  auto location = MakeLocation("Geneva, Switzerland", 46.2, 6.14);
  location.m_candidate.m_boundingBox = ms::LatLonRect::Make(6.11, 46.17, 6.18, 46.23);
  location.m_mapRelevance = MapRelevance{{"core", 0.75}};

  coding::JsonDocument doc;
  auto const json = ToJson(location, doc.GetAllocator());

  string address;
  coding::FromJsonObject(json, "address", address);
  TEST_EQUAL(address, "Geneva, Switzerland", ());

  double ratio = 0.0;
  coding::FromJsonObject(json, "cluster_ratio", ratio);
  TEST_EQUAL(ratio, 1.0, ());

  vector<string> cluster;
  coding::FromJsonObject(json, "cluster", cluster);
  TEST_EQUAL(cluster, location.m_cluster, ());

  auto const & box = coding::GetJsonObligatoryField(json, "boundingbox");
  TEST(box.IsArray(), ());
  TEST_EQUAL(box.Size(), 4, ());
  TEST_NEAR(box[0].GetDouble(), 6.11, 1e-12, ());
  TEST_NEAR(box[3].GetDouble(), 46.23, 1e-12, ());

  auto const relevance =
      MapRelevanceFromJson(coding::GetJsonObligatoryField(json, "map_relevance"));
  TEST_EQUAL(relevance, *location.m_mapRelevance, ());

  // No OSM url was reported.
  TEST(!json.HasMember("osm_url"), ());
}

UNIT_TEST(LocationJson_Core)
{
  auto const location = MakeLocation("Geneva, Switzerland", 46.2, 6.14);

  coding::JsonDocument doc;
  auto const json = ToCoreJson(location, doc.GetAllocator());

  TEST(json.HasMember("address"), ());
  TEST(json.HasMember("lat"), ());
  TEST(json.HasMember("lon"), ());
  TEST(json.HasMember("mentions"), ());
  TEST(json.HasMember("text"), ());
  TEST(!json.HasMember("cluster"), ());
  TEST(!json.HasMember("map_relevance"), ());
  TEST_EQUAL(coding::GetJsonObligatoryField(json, "boundingbox").Size(), 0, ());
}
}  // namespace
