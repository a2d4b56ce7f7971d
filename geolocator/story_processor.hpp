#pragma once

#include "geolocator/location_resolver.hpp"

#include "text/sentences.hpp"

#include <cstddef>
#include <string>

namespace geolocator
{
// Resolves the places of one json story line and returns the line to write:
// "locations" replaced by the resolved ones and "core_location" set when found.
// Unlocated stories are returned unchanged, malformed lines are returned as is, and a
// scorer failure is recorded in the "error" field.
std::string ProcessStory(LocationResolver const & resolver, std::string const & line,
                         size_t mentionsLimit = text::kDefaultMentionsLimit);
}  // namespace geolocator
