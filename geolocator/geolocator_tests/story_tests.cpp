#include "testing/testing.hpp"

#include "geolocator/location_resolver.hpp"
#include "geolocator/story.hpp"
#include "geolocator/story_io.hpp"
#include "geolocator/story_processor.hpp"

#include "platform/platform_tests_support/scoped_file.hpp"

#include "coding/json.hpp"

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace geolocator;
using namespace platform::tests_support;
using namespace std;

namespace
{
string const kStory =
    R"({"id": "s1", "source": "wire", "text": "Talks in Geneva, Switzerland drew delegates )"
    R"(from Lausanne. The office in Geneva said yes.", "locations": {"Geneva": {"relevance": )"
    R"(0.8}, "Lausanne": {"text": "Lausanne", "relevance": 0.3, "mentions": ["From Lausanne."]}}})";

Candidate MakeCandidate(string const & address, double lat, double lon, string const & city)
{
  Candidate candidate;
  candidate.m_address = address;
  candidate.m_latLon = ms::LatLon(lat, lon);
  candidate.m_components = {{"city", city}, {"country", "Switzerland"}};
  candidate.m_geocoder = "fake";
  return candidate;
}

class FakeGeocoder : public GeocoderInterface
{
public:
  // GeocoderInterface overrides:
  string const & GetName() const override { return m_name; }
  Candidates Geocode(string const & placeName) const override
  {
    if (placeName == "Geneva")
      return {MakeCandidate("Geneva, Switzerland", 46.20, 6.14, "Geneva")};
    if (placeName == "Lausanne")
      return {MakeCandidate("Lausanne, Switzerland", 46.52, 6.63, "Lausanne")};
    return {};
  }

private:
  string m_name = "fake";
};

class CoreScorer : public RelevanceScorerInterface
{
public:
  // RelevanceScorerInterface overrides:
  vector<MapRelevance> Score(vector<Location> const & locations) const override
  {
    vector<MapRelevance> result;
    for (auto const & location : locations)
    {
      double const core = location.m_text == "Geneva" ? 0.9 : 0.1;
      result.push_back({{"core", core}, {"relevant", 0.5}});
    }
    return result;
  }
};

class FailingScorer : public RelevanceScorerInterface
{
public:
  // RelevanceScorerInterface overrides:
  vector<MapRelevance> Score(vector<Location> const & /* locations */) const override
  {
    MYTHROW1(ScoringException, (ScorerResponse{503, "overloaded"}), ("Scorer is down"));
  }
};

LocationResolver MakeResolver(shared_ptr<RelevanceScorerInterface const> scorer)
{
  LocationResolver::Params params;
  params.m_seed = 1;
  return LocationResolver({make_shared<FakeGeocoder>()}, CandidateFilter(), move(scorer),
                          params);
}

UNIT_TEST(Story_Parse)
{
  Story const story(kStory);
  TEST_EQUAL(story.GetId(), "s1", ());
  TEST(story.GetText().find("Lausanne") != string::npos, ());

  auto const & places = story.GetPlaces();
  TEST_EQUAL(places.size(), 2, ());

  TEST_EQUAL(places[0].m_name, "Geneva", ());
  TEST_EQUAL(places[0].m_text, "Geneva", ());
  TEST_EQUAL(places[0].m_relevance, 0.8, ());
  TEST_EQUAL(places[0].m_mentions,
             (vector<string>{"Talks in Geneva, Switzerland drew delegates from Lausanne.",
                             "The office in Geneva said yes."}),
             ());

  TEST_EQUAL(places[1].m_mentions, (vector<string>{"From Lausanne."}), ());
}

UNIT_TEST(Story_MentionsLimit)
{
  Story const story(kStory, 1 /* mentionsLimit */);
  TEST_EQUAL(story.GetPlaces()[0].m_mentions.size(), 1, ());
}

UNIT_TEST(Story_Malformed)
{
  TEST_THROW(Story("{\"text\": "), coding::JsonException, ());
  TEST_THROW(Story("[1, 2]"), coding::JsonException, ());
  TEST_THROW(Story(R"({"id": "no text"})"), coding::JsonException, ());
  TEST_THROW(Story(R"({"text": "t", "locations": [1]})"), coding::JsonException, ());

  Story const bare(R"({"text": "Nothing to see."})");
  TEST(bare.GetPlaces().empty(), ());
  TEST(bare.GetId().empty(), ());
}

UNIT_TEST(Story_NonStringId)
{
  string const numeric =
      R"({"id": 42, "text": "Talks in Geneva.", "locations": {"Geneva": {"relevance": 0.8}}})";
  Story const story(numeric);
  TEST_EQUAL(story.GetId(), "42", ());
  TEST_EQUAL(story.GetPlaces().size(), 1, ());
  TEST_EQUAL(story.GetPlaces()[0].m_name, "Geneva", ());

  TEST_EQUAL(Story(R"({"id": -7, "text": "t"})").GetId(), "-7", ());
  TEST_EQUAL(Story(R"({"id": 1.5, "text": "t"})").GetId(), "1.5", ());
  TEST(Story(R"({"id": ["a"], "text": "t"})").GetId().empty(), ());

  auto const resolver = MakeResolver(make_shared<CoreScorer>());
  coding::JsonDocument doc;
  coding::ParseJson(ProcessStory(resolver, numeric), doc);

  TEST(coding::GetJsonObligatoryField(doc, "locations").HasMember("Geneva"), ());
  TEST(doc.HasMember("core_location"), ());
  TEST_EQUAL(coding::GetJsonObligatoryField(doc, "id").GetInt(), 42, ());
}

UNIT_TEST(Story_SetFields)
{
  Story story(kStory);

  Location location;
  location.m_candidate.m_address = "Geneva, Switzerland";
  location.m_candidate.m_latLon = ms::LatLon(46.2, 6.14);
  location.m_text = "Geneva";
  Locations locations;
  locations["Geneva"] = location;

  story.SetLocations(locations);
  story.SetCoreLocation(location);
  story.SetError("first");
  story.SetError("second");

  coding::JsonDocument doc;
  coding::ParseJson(story.Serialize(), doc);

  string source;
  coding::FromJsonObject(doc, "source", source);
  TEST_EQUAL(source, "wire", ());

  auto const & resolved = coding::GetJsonObligatoryField(doc, "locations");
  TEST(resolved.HasMember("Geneva"), ());
  TEST(!resolved.HasMember("Lausanne"), ());

  string coreAddress;
  coding::FromJsonObject(coding::GetJsonObligatoryField(doc, "core_location"), "address",
                         coreAddress);
  TEST_EQUAL(coreAddress, "Geneva, Switzerland", ());

  string error;
  coding::FromJsonObject(doc, "error", error);
  TEST_EQUAL(error, "second", ());
}

UNIT_TEST(StoryReader_SkipsEmptyLines)
{
  istringstream in("{\"text\": \"a\"}\n\n   \n{\"text\": \"b\"}\n");
  StoryReader reader(in);

  string line;
  vector<string> lines;
  while (reader.Read(line))
    lines.push_back(line);

  TEST_EQUAL(lines, (vector<string>{"{\"text\": \"a\"}", "{\"text\": \"b\"}"}), ());
  TEST_EQUAL(reader.GetLinesRead(), 4, ());
}

UNIT_TEST(StoryReader_MissingFile)
{
  ScopedFile const missing("stories.jsonl", ScopedFile::Mode::DoNotCreate);
  TEST_THROW(StoryReader reader(missing.GetFullPath()), StoryReader::OpenException, ());
}

UNIT_TEST(StoryIo_PlainFile)
{
  ScopedFile const file("stories.jsonl", ScopedFile::Mode::DoNotCreate);
  {
    StoryWriter writer(file.GetFullPath());
    writer.Write("{\"text\": \"a\"}");
    writer.Write("{\"text\": \"b\"}");
    writer.Flush();
    TEST_EQUAL(writer.GetLinesWritten(), 2, ());
  }

  StoryReader reader(file.GetFullPath());
  string line;
  TEST(reader.Read(line), ());
  TEST_EQUAL(line, "{\"text\": \"a\"}", ());
  TEST(reader.Read(line), ());
  TEST_EQUAL(line, "{\"text\": \"b\"}", ());
  TEST(!reader.Read(line), ());
}

UNIT_TEST(StoryIo_GzipFile)
{
  ScopedFile const file("stories.jsonl.gz", ScopedFile::Mode::DoNotCreate);
  {
    StoryWriter writer(file.GetFullPath());
    for (size_t i = 0; i < 100; ++i)
      writer.Write("{\"text\": \"story " + to_string(i) + "\"}");
  }

  StoryReader reader(file.GetFullPath());
  string line;
  size_t count = 0;
  while (reader.Read(line))
  {
    TEST_EQUAL(line, "{\"text\": \"story " + to_string(count) + "\"}", ());
    ++count;
  }
  TEST_EQUAL(count, 100, ());
}

UNIT_TEST(ReadCorpus_KeepsEmptyLines)
{
  ScopedFile const file("corpus.txt", "  First text. \n\n   \nLast text.\n");
  TEST_EQUAL(ReadCorpus(file.GetFullPath()),
             (vector<string>{"First text.", "", "", "Last text."}), ());

  ScopedFile const missing("corpus_missing.txt", ScopedFile::Mode::DoNotCreate);
  TEST_THROW(ReadCorpus(missing.GetFullPath()), StoryReader::OpenException, ());
}

UNIT_TEST(ProcessStory_Resolved)
{
  auto const resolver = MakeResolver(make_shared<CoreScorer>());
  auto const output = ProcessStory(resolver, kStory);

  coding::JsonDocument doc;
  coding::ParseJson(output, doc);

  auto const & locations = coding::GetJsonObligatoryField(doc, "locations");
  TEST(locations.HasMember("Geneva"), ());
  TEST(locations.HasMember("Lausanne"), ());

  double ratio = 0.0;
  coding::FromJsonObject(coding::GetJsonObligatoryField(locations, "Geneva"), "cluster_ratio",
                         ratio);
  TEST_EQUAL(ratio, 1.0, ());

  string coreText;
  coding::FromJsonObject(coding::GetJsonObligatoryField(doc, "core_location"), "text",
                         coreText);
  TEST_EQUAL(coreText, "Geneva", ());
  TEST(!doc.HasMember("error"), ());
}

UNIT_TEST(ProcessStory_WithoutScorer)
{
  auto const resolver = MakeResolver(nullptr);
  coding::JsonDocument doc;
  coding::ParseJson(ProcessStory(resolver, kStory), doc);

  TEST(coding::GetJsonObligatoryField(doc, "locations").HasMember("Geneva"), ());
  TEST(!doc.HasMember("core_location"), ());
}

UNIT_TEST(ProcessStory_Unlocated)
{
  auto const resolver = MakeResolver(make_shared<CoreScorer>());
  string const story = R"({"id": "s2", "text": "In Atlantis.", "locations": {"Atlantis": {}}})";

  coding::JsonDocument doc;
  coding::ParseJson(ProcessStory(resolver, story), doc);

  auto const & locations = coding::GetJsonObligatoryField(doc, "locations");
  TEST(locations.HasMember("Atlantis"), ());
  TEST(!doc.HasMember("core_location"), ());
  TEST(!doc.HasMember("error"), ());
}

UNIT_TEST(ProcessStory_ScoringError)
{
  auto const resolver = MakeResolver(make_shared<FailingScorer>());

  coding::JsonDocument doc;
  coding::ParseJson(ProcessStory(resolver, kStory), doc);

  string error;
  coding::FromJsonObject(doc, "error", error);
  TEST(error.find("Scorer is down") != string::npos, (error));
  TEST(!doc.HasMember("core_location"), ());
}

UNIT_TEST(ProcessStory_MalformedLine)
{
  auto const resolver = MakeResolver(nullptr);
  string const line = "{\"text\": broken";
  TEST_EQUAL(ProcessStory(resolver, line), line, ());
}
}  // namespace
