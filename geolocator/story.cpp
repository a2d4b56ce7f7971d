#include "geolocator/story.hpp"

#include "geolocator/location_json.hpp"

#include "base/logging.hpp"

#include <sstream>
#include <utility>

using namespace std;

namespace
{
// The id is only a label for logs: numbers are taken too, other values are ignored.
string IdFromJson(coding::JsonValue const & value)
{
  if (value.IsString())
    return value.GetString();
  if (value.IsInt64())
    return to_string(value.GetInt64());
  if (value.IsUint64())
    return to_string(value.GetUint64());
  if (value.IsNumber())
  {
    ostringstream ostr;
    ostr << value.GetDouble();
    return ostr.str();
  }
  if (!value.IsNull())
    LOG(LDEBUG, ("Ignored story id of json type", static_cast<int>(value.GetType())));
  return {};
}
}  // namespace

namespace geolocator
{
Story::Story(string const & jsonLine, size_t mentionsLimit)
{
  coding::ParseJson(jsonLine, m_document);
  if (!m_document.IsObject())
    MYTHROW(coding::JsonException, ("Story must be a json object"));

  m_id = IdFromJson(coding::GetJsonOptionalField(m_document, "id"));
  coding::FromJsonObject(m_document, "text", m_text);

  auto const & locations = coding::GetJsonOptionalField(m_document, "locations");
  if (locations.IsNull())
    return;
  if (!locations.IsObject())
    MYTHROW(coding::JsonException, ("\"locations\" of story", m_id, "must be an object"));

  for (auto const & member : locations.GetObject())
  {
    Place place;
    place.m_name = member.name.GetString();
    auto const & data = member.value;
    if (!data.IsObject())
    {
      LOG(LDEBUG, ("Skipped place", place.m_name, "of story", m_id, "without data"));
      continue;
    }

    coding::FromJsonObjectOptionalField(data, "text", place.m_text);
    if (place.m_text.empty())
      place.m_text = place.m_name;
    coding::FromJsonObjectOptionalField(data, "relevance", place.m_relevance);
    coding::FromJsonObjectOptionalField(data, "mentions", place.m_mentions);
    if (place.m_mentions.empty())
      place.m_mentions = text::FindMentions(place.m_text, m_text, mentionsLimit);

    m_places.push_back(move(place));
  }
}

void Story::SetLocations(Locations const & locations)
{
  SetMember("locations", ToJson(locations, m_document.GetAllocator()));
}

void Story::SetCoreLocation(Location const & location)
{
  SetMember("core_location", ToCoreJson(location, m_document.GetAllocator()));
}

void Story::SetError(string const & error)
{
  SetMember("error", coding::MakeJsonString(error, m_document.GetAllocator()));
}

string Story::Serialize() const { return coding::SerializeJson(m_document); }

void Story::SetMember(char const * key, coding::JsonValue && value)
{
  auto const it = m_document.FindMember(key);
  if (it != m_document.MemberEnd())
  {
    it->value = move(value);
    return;
  }
  m_document.AddMember(rapidjson::StringRef(key), move(value), m_document.GetAllocator());
}
}  // namespace geolocator
