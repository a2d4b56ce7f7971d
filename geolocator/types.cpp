#include "geolocator/types.hpp"

#include <sstream>

using namespace std;

namespace geolocator
{
ms::SpatialExtent Candidate::GetExtent() const
{
  if (m_boundingBox)
    return *m_boundingBox;
  return m_latLon;
}

string DebugPrint(Place const & place)
{
  ostringstream out;
  out << "Place [" << place.m_name << " relevance: " << ::DebugPrint(place.m_relevance)
      << " mentions: " << place.m_mentions.size() << "]";
  return out.str();
}

string DebugPrint(Candidate const & candidate)
{
  ostringstream out;
  out << "Candidate [" << candidate.m_address << " " << DebugPrint(candidate.m_latLon);
  if (candidate.m_boundingBox)
    out << " " << DebugPrint(*candidate.m_boundingBox);
  if (!candidate.m_geocoder.empty())
    out << " by " << candidate.m_geocoder;
  out << "]";
  return out.str();
}

string DebugPrint(Location const & location)
{
  ostringstream out;
  out << "Location [" << DebugPrint(location.m_candidate)
      << " cluster: " << ::DebugPrint(location.m_cluster)
      << " ratio: " << ::DebugPrint(location.m_clusterRatio);
  if (location.m_mapRelevance)
    out << " map relevance: " << ::DebugPrint(*location.m_mapRelevance);
  out << "]";
  return out.str();
}
}  // namespace geolocator
