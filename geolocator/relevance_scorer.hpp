#pragma once

#include "geolocator/types.hpp"

#include <string>
#include <vector>

namespace geolocator
{
// Batch classifier of resolved locations.
class RelevanceScorerInterface
{
public:
  virtual ~RelevanceScorerInterface() = default;

  // Returns one {category: probability} mapping per location, in the same order.
  // Throws ScoringException.
  virtual std::vector<MapRelevance> Score(std::vector<Location> const & locations) const = 0;
};

// Scorer served over HTTP: POST locations_data=<json array of locations>, the answer is
// a json array of {category: probability} objects aligned with the request.
class HttpRelevanceScorer : public RelevanceScorerInterface
{
public:
  explicit HttpRelevanceScorer(std::string const & url);

  // RelevanceScorerInterface overrides:
  std::vector<MapRelevance> Score(std::vector<Location> const & locations) const override;

  // The urlencoded form body sent for |locations|.
  static std::string MakeRequestBody(std::vector<Location> const & locations);

  // Throws ScoringException if |response| is not a json array of |expectedCount| objects.
  static std::vector<MapRelevance> ParseResponse(std::string const & response,
                                                 size_t expectedCount);

private:
  std::string m_url;
};
}  // namespace geolocator
