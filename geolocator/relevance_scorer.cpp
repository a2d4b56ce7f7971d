#include "geolocator/relevance_scorer.hpp"

#include "geolocator/location_json.hpp"

#include "coding/json.hpp"
#include "coding/url.hpp"

#include "platform/http_client.hpp"

#include "base/logging.hpp"

using namespace std;

namespace geolocator
{
HttpRelevanceScorer::HttpRelevanceScorer(string const & url) : m_url(url) {}

vector<MapRelevance> HttpRelevanceScorer::Score(vector<Location> const & locations) const
{
  platform::HttpClient request(m_url);
  request.SetBodyData(MakeRequestBody(locations), "application/x-www-form-urlencoded");

  if (!request.RunHttpRequest())
  {
    MYTHROW1(ScoringException, (ScorerResponse{0, request.ErrorMessage()}),
             ("Scorer request failed:", request.ErrorMessage(), "url:", m_url));
  }

  if (!request.WasSuccessful())
  {
    MYTHROW1(ScoringException,
             (ScorerResponse{request.ResponseCode(), request.ServerResponse()}),
             ("Scorer answered with code", request.ResponseCode()));
  }

  auto result = ParseResponse(request.ServerResponse(), locations.size());
  LOG(LDEBUG, ("Scored", result.size(), "locations"));
  return result;
}

// static
string HttpRelevanceScorer::MakeRequestBody(vector<Location> const & locations)
{
  coding::JsonDocument doc;
  doc.SetArray();
  for (auto const & location : locations)
    doc.PushBack(ToJson(location, doc.GetAllocator()), doc.GetAllocator());

  return coding::EncodeParams({{"locations_data", coding::SerializeJson(doc)}});
}

// static
vector<MapRelevance> HttpRelevanceScorer::ParseResponse(string const & response,
                                                         size_t expectedCount)
{
  vector<MapRelevance> result;
  try
  {
    coding::JsonDocument doc;
    coding::ParseJson(response, doc);
    if (!doc.IsArray())
      MYTHROW(coding::JsonException, ("Scorer response must be an array"));

    for (auto const & item : doc.GetArray())
      result.push_back(MapRelevanceFromJson(item));
  }
  catch (coding::JsonException const & e)
  {
    MYTHROW1(ScoringException, (ScorerResponse{200, response}),
             ("Malformed scorer response:", e.Msg()));
  }

  if (result.size() != expectedCount)
  {
    MYTHROW1(ScoringException, (ScorerResponse{200, response}),
             ("Scorer returned", result.size(), "scores for", expectedCount, "locations"));
  }
  return result;
}
}  // namespace geolocator
