#pragma once

#include "geolocator/types.hpp"

#include "coding/json.hpp"

namespace geolocator
{
// Full resolved location: address, lat, lon, boundingbox, geocoder, osm_url, text,
// relevance, mentions, cluster, cluster_ratio and map_relevance when scored.
coding::JsonValue ToJson(Location const & location, coding::JsonAllocator & allocator);

// The stable subset written as the story core location.
coding::JsonValue ToCoreJson(Location const & location, coding::JsonAllocator & allocator);

// Object of place name -> ToJson(location).
coding::JsonValue ToJson(Locations const & locations, coding::JsonAllocator & allocator);

// Parses {category: probability} as returned by the relevance scorer.
// Throws coding::JsonException.
MapRelevance MapRelevanceFromJson(coding::JsonValue const & value);
}  // namespace geolocator
