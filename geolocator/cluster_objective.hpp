#pragma once

#include <cstddef>
#include <vector>

namespace geolocator
{
// Cohesion score of a partition of places into clusters. The cluster grower accepts a move
// only when it increases the score.
class ObjectiveInterface
{
public:
  virtual ~ObjectiveInterface() = default;

  // Score of a partition given by its cluster sizes.
  virtual double Measure(std::vector<size_t> const & sizes) const = 0;

  // Change of the score when one place leaves a cluster of |sourceSize| places and joins
  // a cluster of |destSize| places. |sourceSize| is 0 for a place not in any cluster.
  virtual double Gain(size_t sourceSize, size_t destSize) const = 0;
};

// Sum of squared cluster sizes: favours few large clusters over many small ones.
class SquaredSizesObjective : public ObjectiveInterface
{
public:
  // ObjectiveInterface overrides:
  double Measure(std::vector<size_t> const & sizes) const override;
  double Gain(size_t sourceSize, size_t destSize) const override;
};
}  // namespace geolocator
