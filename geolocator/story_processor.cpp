#include "geolocator/story_processor.hpp"

#include "geolocator/story.hpp"

#include "coding/json.hpp"

#include "base/logging.hpp"

#include <memory>

using namespace std;

namespace geolocator
{
string ProcessStory(LocationResolver const & resolver, string const & line, size_t mentionsLimit)
{
  unique_ptr<Story> story;
  try
  {
    story = make_unique<Story>(line, mentionsLimit);
  }
  catch (coding::JsonException const & e)
  {
    LOG(LWARNING, ("Malformed story passed through:", e.Msg()));
    return line;
  }

  auto const & places = story->GetPlaces();
  if (places.empty())
  {
    LOG(LDEBUG, ("Story", story->GetId(), "has no places"));
    return story->Serialize();
  }

  try
  {
    auto const locations = resolver.Resolve(places, story->GetText());
    story->SetLocations(locations);

    auto const core = resolver.PickCore(locations);
    if (core)
      story->SetCoreLocation(*core);

    LOG(LINFO, ("Story", story->GetId(), "resolved", locations.size(), "of", places.size(),
                "places, core location:", core ? core->m_candidate.m_address : "none"));
  }
  catch (NoDataException const & e)
  {
    LOG(LINFO, ("Story", story->GetId(), "is unlocated:", e.Msg()));
  }
  catch (ScoringException const & e)
  {
    LOG(LERROR, ("Scoring story", story->GetId(), "failed:", e.Msg(), "code:", e.HttpCode(),
                 "response:", e.Body()));
    story->SetError(e.Msg());
  }

  return story->Serialize();
}
}  // namespace geolocator
