#pragma once

#include "geometry/latlon.hpp"
#include "geometry/latlon_rect.hpp"
#include "geometry/spatial_extent.hpp"

#include "base/exception.hpp"

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace geolocator
{
// No place has usable coordinates: the story can not be located.
DECLARE_EXCEPTION(NoDataException, RootException);
// A single geocoding provider call failed.
DECLARE_EXCEPTION(GeocoderException, RootException);

struct ScorerResponse
{
  long m_httpCode = 0;
  std::string m_body;
};

// The relevance scorer failed. Carries the remote response as is.
class ScoringException : public RootException
{
public:
  ScoringException(ScorerResponse const & response, char const * what, std::string const & msg)
    : RootException(what, msg), m_response(response)
  {
  }

  long HttpCode() const { return m_response.m_httpCode; }
  std::string const & Body() const { return m_response.m_body; }

private:
  ScorerResponse m_response;
};

// A named entity of the article that possibly denotes a geographic location.
struct Place
{
  std::string m_name;
  std::string m_text;
  double m_relevance = 0.0;
  std::vector<std::string> m_mentions;
};

using Places = std::vector<Place>;

// One proposed resolution of a place name returned by a geocoder.
struct Candidate
{
  // The bounding box when the geocoder reported one, the point otherwise.
  ms::SpatialExtent GetExtent() const;

  std::string m_address;
  ms::LatLon m_latLon;
  boost::optional<ms::LatLonRect> m_boundingBox;
  // Raw address fields (city, state, country ...). Only used by the candidate filter.
  std::map<std::string, std::string> m_components;
  std::string m_geocoder;
  std::string m_osmUrl;
};

using Candidates = std::vector<Candidate>;
// Candidates of every place name, best first once filtered.
using CandidatesByPlace = std::map<std::string, Candidates>;

// A group of geographically coincident places: place name -> accepted candidate.
using Cluster = std::map<std::string, Candidate>;
using Clusters = std::vector<Cluster>;

// Category -> probability, e.g. {"core": 0.9, "relevant": 0.7}.
using MapRelevance = std::map<std::string, double>;

struct Location
{
  Candidate m_candidate;
  std::string m_text;
  double m_relevance = 0.0;
  std::vector<std::string> m_mentions;
  // Names of the places of the same cluster, this place included.
  std::vector<std::string> m_cluster;
  double m_clusterRatio = 0.0;
  boost::optional<MapRelevance> m_mapRelevance;
};

using Locations = std::map<std::string, Location>;

std::string DebugPrint(Place const & place);
std::string DebugPrint(Candidate const & candidate);
std::string DebugPrint(Location const & location);
}  // namespace geolocator
