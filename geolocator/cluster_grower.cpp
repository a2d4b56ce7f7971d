#include "geolocator/cluster_grower.hpp"

#include "geometry/distance_on_sphere.hpp"
#include "geometry/spatial_extent.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include <boost/optional.hpp>

using namespace std;

namespace geolocator
{
namespace
{
// A proposed reassignment of a place. Nothing is changed until the move is applied.
struct Move
{
  string const * m_place = nullptr;
  Candidate const * m_candidate = nullptr;
  boost::optional<size_t> m_source;
  size_t m_dest = 0;
  double m_gain = 0.0;
};

uint32_t MakeSeed(uint32_t seed)
{
  if (seed != 0)
    return seed;
  random_device rd;
  return rd();
}
}  // namespace

ClusterGrower::ClusterGrower(CoordClusterer const & clusterer,
                             unique_ptr<ObjectiveInterface> objective, uint32_t seed)
  : m_clusterer(clusterer)
  , m_objective(move(objective))
  , m_rng(MakeSeed(seed))
{
  if (!m_objective)
    m_objective = make_unique<SquaredSizesObjective>();
}

Clusters ClusterGrower::Seed(CandidatesByPlace const & candidatesByPlace) const
{
  vector<string const *> names;
  vector<ms::LatLon> points;
  for (auto const & item : candidatesByPlace)
  {
    if (item.second.empty())
      continue;
    names.push_back(&item.first);
    points.push_back(item.second.front().m_latLon);
  }

  if (points.empty())
  {
    MYTHROW(NoDataException,
            ("No seed coordinates found among", candidatesByPlace.size(), "places"));
  }

  Clusters clusters;
  for (auto const & indices : m_clusterer.ClusterIndices(points))
  {
    Cluster cluster;
    for (auto const i : indices)
      cluster.emplace(*names[i], candidatesByPlace.at(*names[i]).front());
    clusters.push_back(move(cluster));
  }

  LOG(LDEBUG, ("Seeded", clusters.size(), "clusters from", points.size(), "places"));
  return clusters;
}

Clusters ClusterGrower::Grow(Clusters const & clusters, CandidatesByPlace const & candidatesByPlace)
{
  m_stats = Stats();

  vector<Cluster> arena(clusters);
  map<string, size_t> placeToCluster;
  for (size_t i = 0; i < arena.size(); ++i)
  {
    for (auto const & member : arena[i])
    {
      auto const inserted = placeToCluster.emplace(member.first, i).second;
      CHECK(inserted, ("Place", member.first, "belongs to more than one cluster"));
    }
  }

  vector<size_t> order(arena.size());
  iota(order.begin(), order.end(), 0);

  vector<string const *> places;
  for (auto const & item : candidatesByPlace)
    places.push_back(&item.first);

  m_stats.m_objectiveTrace.push_back(Measure(arena));

  while (true)
  {
    ++m_stats.m_passes;
    shuffle(order.begin(), order.end(), m_rng);
    shuffle(places.begin(), places.end(), m_rng);

    size_t moves = 0;
    for (auto const * place : places)
    {
      for (auto const & candidate : candidatesByPlace.at(*place))
      {
        Move proposal;
        proposal.m_place = place;
        proposal.m_candidate = &candidate;
        auto const it = placeToCluster.find(*place);
        if (it != placeToCluster.end())
          proposal.m_source = it->second;

        auto const dest = find_if(order.cbegin(), order.cend(), [&](size_t i) {
          return (!proposal.m_source || i != *proposal.m_source) && !arena[i].empty() &&
                 Matches(candidate, arena[i]);
        });
        if (dest == order.cend())
          continue;

        proposal.m_dest = *dest;
        size_t const sourceSize = proposal.m_source ? arena[*proposal.m_source].size() : 0;
        proposal.m_gain = m_objective->Gain(sourceSize, arena[proposal.m_dest].size());
        if (proposal.m_gain <= 0.0)
          continue;

        if (proposal.m_source)
          arena[*proposal.m_source].erase(*proposal.m_place);
        arena[proposal.m_dest][*proposal.m_place] = *proposal.m_candidate;
        placeToCluster[*proposal.m_place] = proposal.m_dest;

        ++moves;
        m_stats.m_objectiveTrace.push_back(Measure(arena));
        LOG(LDEBUG, ("Moved", *proposal.m_place, "to cluster", proposal.m_dest, "gain",
                     proposal.m_gain));
      }
    }

    m_stats.m_moves += moves;
    LOG(LDEBUG, ("Pass", m_stats.m_passes, "moves", moves, "objective",
                 m_stats.m_objectiveTrace.back()));
    if (moves == 0)
      break;
  }

  Clusters result;
  for (auto & cluster : arena)
  {
    if (!cluster.empty())
      result.push_back(move(cluster));
  }
  return result;
}

Clusters ClusterGrower::Resolve(CandidatesByPlace const & candidatesByPlace)
{
  auto const seeds = Seed(candidatesByPlace);
  auto result = Grow(seeds, candidatesByPlace);
  LOG(LDEBUG, ("Grown", seeds.size(), "seed clusters into", result.size(), "in",
               m_stats.m_passes, "passes,", m_stats.m_moves, "moves"));
  return result;
}

bool ClusterGrower::Matches(Candidate const & candidate, Cluster const & cluster) const
{
  auto const extent = candidate.GetExtent();
  for (auto const & member : cluster)
  {
    auto const & other = member.second;
    if (ms::Intersects(extent, other.GetExtent()))
      return true;
    if (ms::DistanceOnEarth(candidate.m_latLon, other.m_latLon) <= m_clusterer.GetMaxDistKm())
      return true;
  }
  return false;
}

double ClusterGrower::Measure(vector<Cluster> const & arena) const
{
  vector<size_t> sizes;
  for (auto const & cluster : arena)
  {
    if (!cluster.empty())
      sizes.push_back(cluster.size());
  }
  return m_objective->Measure(sizes);
}
}  // namespace geolocator
