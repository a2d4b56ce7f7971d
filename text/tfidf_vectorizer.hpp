#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace text
{
// Bag-of-words vector space with smoothed inverse document frequencies.
class TfidfVectorizer
{
public:
  // Pairs of (term index, weight) sorted by term index.
  using SparseVector = std::vector<std::pair<size_t, double>>;

  // Learns the vocabulary and idf weights from |documents|, forgetting any previous fit.
  // idf(t) = ln((1 + n) / (1 + df(t))) + 1.
  void Fit(std::vector<std::string> const & documents);

  // Returns the L2 normalized tf-idf vector of |document|. Out-of-vocabulary tokens
  // are ignored; a document without known tokens maps to the empty vector.
  SparseVector Transform(std::string const & document) const;

  size_t GetVocabularySize() const { return m_vocabulary.size(); }
  size_t GetDocumentsCount() const { return m_documentsCount; }

  // Returns 0.0 for a term outside of the vocabulary.
  double GetIdf(std::string const & term) const;

  static double Dot(SparseVector const & lhs, SparseVector const & rhs);
  // Cosine similarity of two vectors returned by Transform().
  static double Cosine(SparseVector const & lhs, SparseVector const & rhs);

private:
  std::unordered_map<std::string, size_t> m_vocabulary;
  std::vector<double> m_idf;
  size_t m_documentsCount = 0;
};
}  // namespace text
