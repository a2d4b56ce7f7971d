#include "testing/testing.hpp"

#include "coding/json.hpp"
#include "coding/url.hpp"

#include <string>
#include <vector>

using namespace coding;

UNIT_TEST(Json_ObligatoryAndOptionalFields)
{
  JsonDocument document;
  ParseJson(R"({"geometry": {"lat": 46.2044, "lng": 6.1432}, "formatted": "Geneva"})", document);

  double lat = 0.0;
  FromJsonObject(GetJsonObligatoryField(document, "geometry"), "lat", lat);
  TEST_NEAR(lat, 46.2044, 1e-9, ());

  std::string formatted;
  FromJsonObjectOptionalField(document, "formatted", formatted);
  TEST_EQUAL(formatted, "Geneva", ());

  std::string osmUrl = "stale";
  FromJsonObjectOptionalField(document, "osm_url", osmUrl);
  TEST(osmUrl.empty(), ());

  TEST_THROW(GetJsonObligatoryField(document, "bounds"), JsonException, ());
  TEST_THROW(FromJsonObject(document, "formatted", lat), JsonException, ());
}

UNIT_TEST(Json_Arrays)
{
  JsonDocument document;
  ParseJson(R"({"mentions": ["One.", "Two."], "bad": [1, "x"]})", document);

  std::vector<std::string> mentions;
  FromJsonObject(document, "mentions", mentions);
  TEST_EQUAL(mentions, std::vector<std::string>({"One.", "Two."}), ());

  std::vector<double> bad;
  TEST_THROW(FromJsonObject(document, "bad", bad), JsonException, ());
}

UNIT_TEST(Json_Malformed)
{
  JsonDocument document;
  TEST_THROW(ParseJson("{\"text\": ", document), JsonException, ());
}

UNIT_TEST(Json_CustomPrecisionSerialization)
{
  JsonDocument document;
  document.SetObject();
  auto & allocator = document.GetAllocator();
  document.AddMember("lat", 46.20439, allocator);
  document.AddMember("address", MakeJsonString("Genève, Schweiz", allocator), allocator);

  TEST_EQUAL(SerializeJson(document), R"({"lat":46.204390,"address":"Genève, Schweiz"})", ());
  TEST_EQUAL(SerializeJson(document, 2), R"({"lat":46.20,"address":"Genève, Schweiz"})", ());
}

UNIT_TEST(Url_Encode)
{
  TEST_EQUAL(UrlEncode("Geneva, Switzerland"), "Geneva%2C%20Switzerland", ());
  TEST_EQUAL(UrlEncode("a-b_c.d~e"), "a-b_c.d~e", ());
  TEST_EQUAL(MakeUrl("https://example.org/geocode", {{"q", "São Paulo"}, {"limit", "10"}}),
             "https://example.org/geocode?q=S%C3%A3o%20Paulo&limit=10", ());
  TEST_EQUAL(MakeUrl("https://example.org/search?format=json", {{"q", "x"}}),
             "https://example.org/search?format=json&q=x", ());
}
