#pragma once

#include "geolocator/types.hpp"

#include "text/sentences.hpp"

#include "coding/json.hpp"

#include <cstddef>
#include <string>

namespace geolocator
{
// One article as a json object:
// {"id": ..., "text": ..., "locations": {name: {"text": ..., "relevance": ...}}, ...}.
// Fields the resolver does not know are kept untouched on serialization.
class Story
{
public:
  // Throws coding::JsonException on malformed json or when "text" is missing.
  explicit Story(std::string const & jsonLine,
                 size_t mentionsLimit = text::kDefaultMentionsLimit);

  Story(Story const &) = delete;
  Story & operator=(Story const &) = delete;

  std::string const & GetId() const { return m_id; }
  std::string const & GetText() const { return m_text; }
  // Places of "locations". Mentions missing in the input are looked up in the text.
  Places const & GetPlaces() const { return m_places; }

  // Replaces "locations".
  void SetLocations(Locations const & locations);
  void SetCoreLocation(Location const & location);
  void SetError(std::string const & error);

  std::string Serialize() const;

private:
  void SetMember(char const * key, coding::JsonValue && value);

  coding::JsonDocument m_document;
  std::string m_id;
  std::string m_text;
  Places m_places;
};
}  // namespace geolocator
