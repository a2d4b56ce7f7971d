#pragma once

#include "geolocator/cluster_objective.hpp"
#include "geolocator/coord_clusterer.hpp"
#include "geolocator/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace geolocator
{
// Assigns every place to a spatial cluster choosing among the place's candidates.
//
// Clusters are seeded by clustering the best candidate of every place. Then, in passes
// over places and clusters in random order, a place is moved to another cluster that one
// of its candidates matches (intersects or lies within the clustering radius of a member)
// whenever the move increases the objective. Growth stops after a pass without moves.
class ClusterGrower
{
public:
  struct Stats
  {
    size_t m_passes = 0;
    size_t m_moves = 0;
    // Objective after seeding and after every accepted move.
    std::vector<double> m_objectiveTrace;
  };

  // |objective| defaults to SquaredSizesObjective. |seed| == 0 seeds the shuffles
  // from std::random_device.
  explicit ClusterGrower(CoordClusterer const & clusterer,
                         std::unique_ptr<ObjectiveInterface> objective = nullptr,
                         uint32_t seed = 0);

  // Clusters of the first candidates of the places. Places whose first candidate is an
  // outlier are left out. Throws NoDataException when no place has a candidate.
  Clusters Seed(CandidatesByPlace const & candidatesByPlace) const;

  // Improves |clusters| by moving places of |candidatesByPlace| between them.
  // Empty clusters are dropped from the result.
  Clusters Grow(Clusters const & clusters, CandidatesByPlace const & candidatesByPlace);

  // Seed() followed by Grow().
  Clusters Resolve(CandidatesByPlace const & candidatesByPlace);

  Stats const & GetStats() const { return m_stats; }

private:
  bool Matches(Candidate const & candidate, Cluster const & cluster) const;
  double Measure(std::vector<Cluster> const & arena) const;

  CoordClusterer m_clusterer;
  std::unique_ptr<ObjectiveInterface> m_objective;
  std::mt19937 m_rng;
  Stats m_stats;
};
}  // namespace geolocator
