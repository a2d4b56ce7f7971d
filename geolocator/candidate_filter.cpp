#include "geolocator/candidate_filter.hpp"

#include "text/tfidf_vectorizer.hpp"

#include "base/logging.hpp"
#include "base/string_utils.hpp"

#include <algorithm>
#include <utility>

using namespace std;

namespace
{
char const * const kExcludedComponents[] = {"ISO_3166-1_alpha-2", "ISO_3166-1_alpha-3",
                                            "_category",          "_type",
                                            "country_code",       "road_type",
                                            "postcode"};

double const kBinEdges[] = {0.0, 0.05, 0.1, 0.15, 0.2, 0.25, 0.3, 1.0};

bool IsExcluded(string const & key)
{
  return find(begin(kExcludedComponents), end(kExcludedComponents), key) !=
         end(kExcludedComponents);
}
}  // namespace

namespace geolocator
{
double constexpr CandidateFilter::kDefaultThreshold;
size_t constexpr CandidateFilter::kHistogramBins;

CandidateFilter::CandidateFilter(vector<string> corpus, double threshold)
  : m_corpus(move(corpus)), m_threshold(threshold)
{
}

CandidatesByPlace CandidateFilter::Select(CandidatesByPlace const & candidatesByPlace,
                                          string const & articleText) const
{
  // The article takes part in the fit: its place names must be in the vocabulary.
  vector<string> documents(m_corpus);
  documents.push_back(articleText);
  text::TfidfVectorizer vectorizer;
  vectorizer.Fit(documents);

  auto const article = vectorizer.Transform(articleText);

  CandidatesByPlace result;
  for (auto const & item : candidatesByPlace)
  {
    auto const & name = item.first;
    vector<pair<double, Candidate>> scored;
    scored.reserve(item.second.size());
    for (auto const & candidate : item.second)
    {
      double const similarity =
          text::TfidfVectorizer::Cosine(vectorizer.Transform(CompileAddress(candidate)), article);
      scored.emplace_back(similarity, candidate);
    }

    stable_sort(scored.begin(), scored.end(),
                [](pair<double, Candidate> const & lhs, pair<double, Candidate> const & rhs) {
                  return lhs.first > rhs.first;
                });

    vector<double> similarities;
    Candidates selected;
    for (auto & s : scored)
    {
      similarities.push_back(s.first);
      if (m_threshold >= 0.0 && s.first <= m_threshold)
        continue;
      s.second.m_components.clear();
      selected.push_back(move(s.second));
    }

    auto const histogram = Histogram(similarities);
    LOG(LDEBUG, ("Place", name, "similarities", similarities, "histogram",
                 vector<size_t>(histogram.begin(), histogram.end())));

    if (selected.empty())
    {
      LOG(LDEBUG, ("No candidates of", name, "passed the filter"));
      continue;
    }
    result.emplace(name, move(selected));
  }
  return result;
}

// static
string CandidateFilter::CompileAddress(Candidate const & candidate)
{
  vector<string> parts;
  for (auto const & component : candidate.m_components)
  {
    if (IsExcluded(component.first) || component.second.empty())
      continue;
    parts.push_back(component.second);
  }

  if (parts.empty())
    return candidate.m_address;
  return strings::JoinStrings(parts, ", ");
}

// static
array<size_t, CandidateFilter::kHistogramBins> CandidateFilter::Histogram(
    vector<double> const & similarities)
{
  array<size_t, kHistogramBins> counts{};
  for (auto const s : similarities)
  {
    if (s < kBinEdges[0] || s > kBinEdges[kHistogramBins])
      continue;
    // The last bin includes its right edge.
    size_t bin = kHistogramBins - 1;
    for (size_t i = 0; i < kHistogramBins; ++i)
    {
      if (s < kBinEdges[i + 1])
      {
        bin = i;
        break;
      }
    }
    ++counts[bin];
  }
  return counts;
}
}  // namespace geolocator
