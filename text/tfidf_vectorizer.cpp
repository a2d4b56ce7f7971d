#include "text/tfidf_vectorizer.hpp"

#include "text/tokenizer.hpp"

#include "base/logging.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

using namespace std;

namespace text
{
void TfidfVectorizer::Fit(vector<string> const & documents)
{
  m_vocabulary.clear();
  m_idf.clear();
  m_documentsCount = documents.size();

  vector<size_t> documentFrequency;
  for (auto const & document : documents)
  {
    auto const tokens = Tokenize(document);
    set<string> const unique(tokens.begin(), tokens.end());
    for (auto const & token : unique)
    {
      auto const it = m_vocabulary.emplace(token, m_vocabulary.size()).first;
      if (it->second == documentFrequency.size())
        documentFrequency.push_back(0);
      ++documentFrequency[it->second];
    }
  }

  auto const n = static_cast<double>(m_documentsCount);
  m_idf.reserve(documentFrequency.size());
  for (auto const df : documentFrequency)
    m_idf.push_back(log((1.0 + n) / (1.0 + static_cast<double>(df))) + 1.0);

  LOG(LDEBUG, ("Fitted", m_documentsCount, "documents, vocabulary size", m_vocabulary.size()));
}

TfidfVectorizer::SparseVector TfidfVectorizer::Transform(string const & document) const
{
  map<size_t, double> counts;
  for (auto const & token : Tokenize(document))
  {
    auto const it = m_vocabulary.find(token);
    if (it != m_vocabulary.end())
      counts[it->second] += 1.0;
  }

  SparseVector result;
  result.reserve(counts.size());
  double norm = 0.0;
  for (auto const & count : counts)
  {
    double const weight = count.second * m_idf[count.first];
    norm += weight * weight;
    result.emplace_back(count.first, weight);
  }

  if (norm == 0.0)
    return {};

  norm = sqrt(norm);
  for (auto & item : result)
    item.second /= norm;
  return result;
}

double TfidfVectorizer::GetIdf(string const & term) const
{
  auto const it = m_vocabulary.find(term);
  if (it == m_vocabulary.end())
    return 0.0;
  return m_idf[it->second];
}

// static
double TfidfVectorizer::Dot(SparseVector const & lhs, SparseVector const & rhs)
{
  double result = 0.0;
  auto l = lhs.cbegin();
  auto r = rhs.cbegin();
  while (l != lhs.cend() && r != rhs.cend())
  {
    if (l->first < r->first)
    {
      ++l;
    }
    else if (r->first < l->first)
    {
      ++r;
    }
    else
    {
      result += l->second * r->second;
      ++l;
      ++r;
    }
  }
  return result;
}

// static
double TfidfVectorizer::Cosine(SparseVector const & lhs, SparseVector const & rhs)
{
  // Both vectors are either unit length or empty.
  return min(1.0, max(0.0, Dot(lhs, rhs)));
}
}  // namespace text
