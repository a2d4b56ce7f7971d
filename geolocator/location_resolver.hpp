#pragma once

#include "geolocator/candidate_filter.hpp"
#include "geolocator/coord_clusterer.hpp"
#include "geolocator/geocoder_interface.hpp"
#include "geolocator/relevance_scorer.hpp"
#include "geolocator/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace geolocator
{
// Resolves the places of one article into locations: geocoding, candidate filtering,
// cluster growth and optional relevance scoring. The resolver keeps no per-article
// state, so one instance may resolve several articles concurrently.
class LocationResolver
{
public:
  struct Params
  {
    double m_maxDistKm = CoordClusterer::kDefaultMaxDistKm;
    size_t m_minSize = CoordClusterer::kDefaultMinSize;
    double m_coreCutoff = 0.5;
    // Seed of the cluster growth shuffles, 0 for a random one.
    uint32_t m_seed = 0;
  };

  using Geocoders = std::vector<std::shared_ptr<GeocoderInterface const>>;

  // |scorer| may be null: locations are left unscored then.
  LocationResolver(Geocoders geocoders, CandidateFilter filter,
                   std::shared_ptr<RelevanceScorerInterface const> scorer, Params const & params);

  // Candidates of every place from every geocoder. A failing geocoder is logged and
  // skipped; places without candidates are left out.
  CandidatesByPlace AssembleGeocodings(Places const & places) const;

  // Throws NoDataException when no place could be located and ScoringException when
  // the scorer fails.
  Locations Resolve(Places const & places, std::string const & articleText) const;

  // Same as above for already geocoded places.
  Locations ResolveCandidates(Places const & places, CandidatesByPlace const & candidates,
                              std::string const & articleText) const;

  // The location with the highest "core" probability above |cutoff|, else the one with
  // the highest "relevant" probability above |cutoff|, else none.
  static boost::optional<Location> PickCore(Locations const & locations, double cutoff);

  boost::optional<Location> PickCore(Locations const & locations) const
  {
    return PickCore(locations, m_params.m_coreCutoff);
  }

private:
  void Score(Locations & locations) const;

  Geocoders m_geocoders;
  CandidateFilter m_filter;
  std::shared_ptr<RelevanceScorerInterface const> m_scorer;
  Params m_params;
};
}  // namespace geolocator
