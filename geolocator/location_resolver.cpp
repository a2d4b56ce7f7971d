#include "geolocator/location_resolver.hpp"

#include "geolocator/cluster_grower.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <utility>

using namespace std;

namespace geolocator
{
namespace
{
string const kCore = "core";
string const kRelevant = "relevant";

double GetProbability(Location const & location, string const & category)
{
  if (!location.m_mapRelevance)
    return 0.0;
  auto const it = location.m_mapRelevance->find(category);
  return it == location.m_mapRelevance->end() ? 0.0 : it->second;
}

// Locations with |category| probability above |cutoff|, most probable first.
vector<Location const *> Rank(Locations const & locations, string const & category,
                              double cutoff)
{
  vector<Location const *> ranked;
  for (auto const & item : locations)
  {
    if (GetProbability(item.second, category) > cutoff)
      ranked.push_back(&item.second);
  }
  stable_sort(ranked.begin(), ranked.end(), [&](Location const * lhs, Location const * rhs) {
    return GetProbability(*lhs, category) > GetProbability(*rhs, category);
  });
  return ranked;
}
}  // namespace

LocationResolver::LocationResolver(Geocoders geocoders, CandidateFilter filter,
                                   shared_ptr<RelevanceScorerInterface const> scorer,
                                   Params const & params)
  : m_geocoders(move(geocoders)), m_filter(move(filter)), m_scorer(move(scorer)), m_params(params)
{
  for (auto const & geocoder : m_geocoders)
    CHECK(geocoder, ());
}

CandidatesByPlace LocationResolver::AssembleGeocodings(Places const & places) const
{
  CandidatesByPlace result;
  for (auto const & place : places)
  {
    Candidates candidates;
    for (auto const & geocoder : m_geocoders)
    {
      try
      {
        auto found = geocoder->Geocode(place.m_name);
        LOG(LDEBUG,
            (geocoder->GetName(), "found", found.size(), "candidates for", place.m_name));
        move(found.begin(), found.end(), back_inserter(candidates));
      }
      catch (GeocoderException const & e)
      {
        LOG(LWARNING,
            ("Geocoder", geocoder->GetName(), "failed for", place.m_name, ":", e.Msg()));
      }
    }

    if (!candidates.empty())
      result[place.m_name] = move(candidates);
  }
  return result;
}

Locations LocationResolver::Resolve(Places const & places, string const & articleText) const
{
  return ResolveCandidates(places, AssembleGeocodings(places), articleText);
}

Locations LocationResolver::ResolveCandidates(Places const & places,
                                              CandidatesByPlace const & candidates,
                                              string const & articleText) const
{
  if (candidates.empty())
    MYTHROW(NoDataException, ("No candidates found for", places.size(), "places"));

  auto const selected = m_filter.Select(candidates, articleText);
  if (selected.empty())
    MYTHROW(NoDataException, ("No candidates passed the filter for", places.size(), "places"));

  ClusterGrower grower(CoordClusterer(m_params.m_maxDistKm, m_params.m_minSize),
                       nullptr /* objective */, m_params.m_seed);
  auto const clusters = grower.Resolve(selected);

  map<string, Place const *> placeByName;
  for (auto const & place : places)
    placeByName.emplace(place.m_name, &place);

  auto const total = static_cast<double>(selected.size());
  Locations locations;
  for (auto const & cluster : clusters)
  {
    vector<string> names;
    for (auto const & member : cluster)
      names.push_back(member.first);

    for (auto const & member : cluster)
    {
      Location location;
      location.m_candidate = member.second;
      auto const it = placeByName.find(member.first);
      if (it != placeByName.end())
      {
        location.m_text = it->second->m_text;
        location.m_relevance = it->second->m_relevance;
        location.m_mentions = it->second->m_mentions;
      }
      location.m_cluster = names;
      location.m_clusterRatio = static_cast<double>(cluster.size()) / total;
      locations.emplace(member.first, move(location));
    }
  }

  if (m_scorer)
    Score(locations);

  LOG(LDEBUG, ("Resolved", locations.size(), "of", places.size(), "places in", clusters.size(),
               "clusters"));
  return locations;
}

void LocationResolver::Score(Locations & locations) const
{
  vector<Location> batch;
  batch.reserve(locations.size());
  for (auto const & item : locations)
    batch.push_back(item.second);

  auto scores = m_scorer->Score(batch);
  if (scores.size() != batch.size())
  {
    MYTHROW1(ScoringException, (ScorerResponse{}),
             ("Scorer returned", scores.size(), "scores for", batch.size(), "locations"));
  }

  size_t i = 0;
  for (auto & item : locations)
    item.second.m_mapRelevance = move(scores[i++]);
}

// static
boost::optional<Location> LocationResolver::PickCore(Locations const & locations, double cutoff)
{
  auto ranked = Rank(locations, kCore, cutoff);
  auto const relevant = Rank(locations, kRelevant, cutoff);
  ranked.insert(ranked.end(), relevant.begin(), relevant.end());

  if (ranked.empty())
    return {};
  return *ranked.front();
}
}  // namespace geolocator
