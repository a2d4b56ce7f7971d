#include "testing/testing.hpp"

#include "geolocator/candidate_filter.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

using namespace geolocator;
using namespace std;

namespace
{
vector<string> const kCorpus = {"The weather was cold on Monday.",
                                "Markets rallied in New York after the report."};
string const kArticle = "Talks in Geneva, Switzerland drew delegates from Lausanne.";

Candidate MakeCandidate(string const & address, double lat, double lon,
                        map<string, string> const & components)
{
  Candidate candidate;
  candidate.m_address = address;
  candidate.m_latLon = ms::LatLon(lat, lon);
  candidate.m_components = components;
  return candidate;
}

Candidate const kGenevaSwitzerland = MakeCandidate(
    "Geneva, Switzerland", 46.20, 6.14,
    {{"city", "Geneva"}, {"country", "Switzerland"}, {"country_code", "ch"}, {"_type", "city"}});
Candidate const kGenevaIllinois = MakeCandidate(
    "Geneva, IL, United States of America", 41.88, -88.30,
    {{"county", "Kane County"}, {"state", "Illinois"}, {"country", "United States of America"}});
Candidate const kLausanne = MakeCandidate("Lausanne, Switzerland", 46.52, 6.63,
                                          {{"city", "Lausanne"}, {"country", "Switzerland"}});

UNIT_TEST(CandidateFilter_GenevaScenario)
{
  CandidateFilter const filter(kCorpus);
  CandidatesByPlace const candidates = {{"Geneva", {kGenevaIllinois, kGenevaSwitzerland}},
                                        {"Lausanne", {kLausanne}}};

  auto const selected = filter.Select(candidates, kArticle);
  TEST_EQUAL(selected.size(), 2, ());

  auto const & geneva = selected.at("Geneva");
  TEST_EQUAL(geneva.size(), 1, ());
  TEST_EQUAL(geneva[0].m_address, kGenevaSwitzerland.m_address, ());
  TEST(geneva[0].m_components.empty(), ());

  TEST_EQUAL(selected.at("Lausanne").size(), 1, ());
}

UNIT_TEST(CandidateFilter_PlaceWithoutSurvivorsIsDropped)
{
  CandidateFilter const filter(kCorpus);
  CandidatesByPlace const candidates = {
      {"Springfield", {MakeCandidate("Springfield, MO", 37.2, -93.3, {{"state", "Missouri"}})}},
      {"Lausanne", {kLausanne}}};

  auto const selected = filter.Select(candidates, kArticle);
  TEST_EQUAL(selected.size(), 1, ());
  TEST_EQUAL(selected.count("Springfield"), 0, ());
}

UNIT_TEST(CandidateFilter_SortsBySimilarity)
{
  CandidateFilter const filter(kCorpus);
  auto const genevaOnly = MakeCandidate("Geneva", 46.2, 6.1, {{"city", "Geneva"}});
  CandidatesByPlace const candidates = {{"Geneva", {genevaOnly, kGenevaSwitzerland}}};

  auto const selected = filter.Select(candidates, kArticle);
  auto const & geneva = selected.at("Geneva");
  TEST_EQUAL(geneva.size(), 2, ());
  TEST_EQUAL(geneva[0].m_address, kGenevaSwitzerland.m_address, ());
  TEST_EQUAL(geneva[1].m_address, genevaOnly.m_address, ());
}

UNIT_TEST(CandidateFilter_EqualSimilarityKeepsOrder)
{
  CandidateFilter const filter(kCorpus);
  auto first = kGenevaSwitzerland;
  first.m_address = "first";
  auto second = kGenevaSwitzerland;
  second.m_address = "second";

  auto const selected = filter.Select({{"Geneva", {first, second}}}, kArticle);
  auto const & geneva = selected.at("Geneva");
  TEST_EQUAL(geneva.size(), 2, ());
  TEST_EQUAL(geneva[0].m_address, "first", ());
  TEST_EQUAL(geneva[1].m_address, "second", ());
}

UNIT_TEST(CandidateFilter_ThresholdBoundary)
{
  CandidateFilter const filter(kCorpus, 0.99 /* threshold */);
  // A candidate identical to the article has similarity 1.
  auto const identical = MakeCandidate(kArticle, 46.2, 6.1, {});
  auto const selected =
      filter.Select({{"Geneva", {kGenevaIllinois, kGenevaSwitzerland, identical}}}, kArticle);

  auto const & geneva = selected.at("Geneva");
  TEST_EQUAL(geneva.size(), 1, ());
  TEST_EQUAL(geneva[0].m_address, kArticle, ());
}

UNIT_TEST(CandidateFilter_Disabled)
{
  CandidateFilter const filter(kCorpus, -1.0 /* threshold */);
  auto const selected =
      filter.Select({{"Geneva", {kGenevaIllinois, kGenevaSwitzerland}}}, kArticle);

  auto const & geneva = selected.at("Geneva");
  TEST_EQUAL(geneva.size(), 2, ());
  TEST_EQUAL(geneva[0].m_address, kGenevaSwitzerland.m_address, ());
  TEST_EQUAL(geneva[1].m_address, kGenevaIllinois.m_address, ());
}

UNIT_TEST(CandidateFilter_CompileAddress)
{
  auto const candidate = MakeCandidate("Rue du Rhône 1, 1204 Genève, Switzerland", 46.2, 6.1,
                                       {{"ISO_3166-1_alpha-2", "CH"},
                                        {"_category", "place"},
                                        {"_type", "building"},
                                        {"city", "Geneva"},
                                        {"country", "Switzerland"},
                                        {"country_code", "ch"},
                                        {"postcode", "1204"},
                                        {"road_type", "primary"}});
  TEST_EQUAL(CandidateFilter::CompileAddress(candidate), "Geneva, Switzerland", ());

  auto const bare = MakeCandidate("Lausanne, Switzerland", 46.5, 6.6, {{"postcode", "1003"}});
  TEST_EQUAL(CandidateFilter::CompileAddress(bare), "Lausanne, Switzerland", ());
}

UNIT_TEST(CandidateFilter_CategoryWordDoesNotMatch)
{
  // "commerce" is in the article, but as the provider category it is not part of the address.
  auto const candidate = MakeCandidate("Geneva, Switzerland", 46.2, 6.1,
                                       {{"_category", "commerce"}, {"city", "Geneva"}});
  TEST_EQUAL(CandidateFilter::CompileAddress(candidate), "Geneva", ());

  CandidateFilter const filter(kCorpus, 0.1 /* threshold */);
  auto const selected =
      filter.Select({{"Geneva", {candidate}}}, "A commerce fair opened today in Basel.");
  TEST(selected.empty(), ());
}

UNIT_TEST(CandidateFilter_Histogram)
{
  auto const histogram =
      CandidateFilter::Histogram({0.0, 0.04, 0.05, 0.12, 0.3, 1.0, 1.5, -0.1});
  array<size_t, CandidateFilter::kHistogramBins> const expected = {{2, 1, 1, 0, 0, 0, 2}};
  TEST_EQUAL(histogram, expected, ());
}
}  // namespace
