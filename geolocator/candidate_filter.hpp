#pragma once

#include "geolocator/types.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace geolocator
{
// Orders and prunes geocoding candidates by the textual similarity of their addresses
// to the article.
class CandidateFilter
{
public:
  static double constexpr kDefaultThreshold = 0.1;
  static size_t constexpr kHistogramBins = 7;

  // |corpus| is a fixed set of reference texts the bag-of-words model is fitted on together
  // with every article. A negative |threshold| keeps all candidates.
  explicit CandidateFilter(std::vector<std::string> corpus = {},
                           double threshold = kDefaultThreshold);

  // For every place sorts its candidates by descending cosine similarity to |articleText|
  // and keeps those scoring above the threshold. Places left without candidates are dropped.
  // Raw address components are cleared from the surviving candidates.
  CandidatesByPlace Select(CandidatesByPlace const & candidatesByPlace,
                           std::string const & articleText) const;

  // The text a candidate is compared by: string components except the boilerplate ones
  // (country codes, categories, types, postcodes), or the formatted address when there are none.
  static std::string CompileAddress(Candidate const & candidate);

  // Counts of |similarities| over the bins [0, .05, .1, .15, .2, .25, .3, 1].
  static std::array<size_t, kHistogramBins> Histogram(std::vector<double> const & similarities);

private:
  std::vector<std::string> m_corpus;
  double m_threshold;
};
}  // namespace geolocator
