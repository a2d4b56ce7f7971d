#include "geolocator/candidate_filter.hpp"
#include "geolocator/location_resolver.hpp"
#include "geolocator/nominatim_geocoder.hpp"
#include "geolocator/opencage_geocoder.hpp"
#include "geolocator/relevance_scorer.hpp"
#include "geolocator/story_io.hpp"
#include "geolocator/story_processor.hpp"

#include "base/exception.hpp"
#include "base/logging.hpp"
#include "base/string_utils.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <future>
#include <iostream>
#include <list>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/stacktrace.hpp>

using namespace geolocator;
using namespace std;

namespace po = boost::program_options;

namespace
{
char const * const kApiKeyEnv = "OPENCAGE_API_KEY";
}  // namespace

struct CliCommandOptions
{
  std::string m_config_path;
  std::string m_stories_path;
  std::string m_output_path;
  std::string m_corpus_path;
  double m_max_dist;
  size_t m_min_size;
  double m_filter_threshold;
  double m_core_cutoff;
  size_t m_max_mentions;
  std::string m_geocoders;
  std::string m_opencage_url;
  size_t m_opencage_records;
  std::string m_nominatim_url;
  size_t m_nominatim_records;
  std::string m_model_url;
  unsigned int m_threads;
  uint32_t m_seed;
  std::string m_log_level;
};

CliCommandOptions DefineOptions(int argc, char * argv[])
{
  CliCommandOptions o;
  po::options_description optionsDescription;

  optionsDescription.add_options()
     ("config",
         po::value(&o.m_config_path)->default_value(""),
         "INI-style file with any of the options below. Command line values win.")
     ("stories_path",
         po::value(&o.m_stories_path),
         "Input stories, one json object per line (.jsonl or .jsonl.gz).")
     ("output_path",
         po::value(&o.m_output_path)->default_value(""),
         "Output file for resolved stories (.jsonl or .jsonl.gz), stdout if empty.")
     ("corpus_path",
         po::value(&o.m_corpus_path)->default_value(""),
         "Reference corpus for the candidate filter, one text per line.")
     ("max_dist",
         po::value(&o.m_max_dist)->default_value(CoordClusterer::kDefaultMaxDistKm),
         "Clustering radius, km.")
     ("min_size",
         po::value(&o.m_min_size)->default_value(CoordClusterer::kDefaultMinSize),
         "Minimum neighbourhood size of a cluster core point.")
     ("filter_threshold",
         po::value(&o.m_filter_threshold)->default_value(CandidateFilter::kDefaultThreshold),
         "Cosine similarity a candidate must exceed to be kept, negative to keep all.")
     ("core_cutoff",
         po::value(&o.m_core_cutoff)->default_value(0.5),
         "Probability cutoff of the core location.")
     ("max_mentions",
         po::value(&o.m_max_mentions)->default_value(text::kDefaultMentionsLimit),
         "Mention sentences kept per place.")
     ("geocoders",
         po::value(&o.m_geocoders)->default_value("opencage"),
         "Comma separated geocoders: opencage, nominatim.")
     ("opencage_url",
         po::value(&o.m_opencage_url)->default_value(OpenCageGeocoder::kDefaultUrl),
         "OpenCage endpoint. The API key is read from OPENCAGE_API_KEY.")
     ("opencage_records",
         po::value(&o.m_opencage_records)->default_value(OpenCageGeocoder::kDefaultRecords),
         "Records requested from OpenCage.")
     ("nominatim_url",
         po::value(&o.m_nominatim_url)->default_value(NominatimGeocoder::kDefaultUrl),
         "Nominatim endpoint.")
     ("nominatim_records",
         po::value(&o.m_nominatim_records)->default_value(NominatimGeocoder::kDefaultRecords),
         "Records requested from Nominatim.")
     ("model_url",
         po::value(&o.m_model_url)->default_value(""),
         "Relevance scorer endpoint, scoring is disabled if empty.")
     ("threads",
         po::value(&o.m_threads)->default_value(1),
         "Stories resolved concurrently.")
     ("seed",
         po::value(&o.m_seed)->default_value(0),
         "Seed of the cluster growth shuffles, 0 for a random one.")
     ("log_level",
         po::value(&o.m_log_level)->default_value("INFO"),
         "DEBUG, INFO, WARNING, ERROR or CRITICAL.")
     ("help", "produce help message");

  po::variables_map vm;

  po::store(po::parse_command_line(argc, argv, optionsDescription), vm);
  if (vm.count("config") && !vm["config"].as<std::string>().empty())
  {
    auto const & configPath = vm["config"].as<std::string>();
    std::ifstream config(configPath);
    if (!config)
      throw po::error("can't open config file " + configPath);
    po::store(po::parse_config_file(config, optionsDescription), vm);
  }
  po::notify(vm);

  if (vm.count("help"))
  {
    std::cout << optionsDescription << std::endl;
    exit(1);
  }

  if (o.m_stories_path.empty())
    throw po::error("the option '--stories_path' is required");
  if (o.m_threads == 0)
    throw po::error("the option '--threads' must be positive");
  if (o.m_min_size == 0)
    throw po::error("the option '--min_size' must be positive");

  return o;
}

vector<string> LoadCorpus(string const & path)
{
  if (path.empty())
    return {};

  auto corpus = ReadCorpus(path);
  LOG(LINFO, ("Loaded", corpus.size(), "corpus texts from", path));
  return corpus;
}

LocationResolver::Geocoders MakeGeocoders(CliCommandOptions const & options)
{
  LocationResolver::Geocoders geocoders;
  for (auto const & name : strings::Tokenize(options.m_geocoders, ", "))
  {
    if (name == "opencage")
    {
      char const * apiKey = getenv(kApiKeyEnv);
      if (apiKey == nullptr || *apiKey == '\0')
        throw po::error(string("opencage geocoder requires ") + kApiKeyEnv);
      geocoders.push_back(make_shared<OpenCageGeocoder>(options.m_opencage_url, apiKey,
                                                        options.m_opencage_records));
    }
    else if (name == "nominatim")
    {
      geocoders.push_back(
          make_shared<NominatimGeocoder>(options.m_nominatim_url, options.m_nominatim_records));
    }
    else
    {
      throw po::error("unknown geocoder " + name);
    }
  }

  if (geocoders.empty())
    throw po::error("no geocoders configured");
  return geocoders;
}

int GeolocatorCliMain(int argc, char * argv[])
{
  auto const options = DefineOptions(argc, argv);

  base::LogLevel level;
  if (!base::FromString(options.m_log_level, level))
    throw po::error("unknown log level " + options.m_log_level);
  base::g_LogLevel = level;

  shared_ptr<RelevanceScorerInterface const> scorer;
  if (!options.m_model_url.empty())
    scorer = make_shared<HttpRelevanceScorer>(options.m_model_url);

  LocationResolver::Params params;
  params.m_maxDistKm = options.m_max_dist;
  params.m_minSize = options.m_min_size;
  params.m_coreCutoff = options.m_core_cutoff;
  params.m_seed = options.m_seed;

  LocationResolver const resolver(
      MakeGeocoders(options),
      CandidateFilter(LoadCorpus(options.m_corpus_path), options.m_filter_threshold), scorer,
      params);

  StoryReader reader(options.m_stories_path);
  StoryWriter writer(options.m_output_path);
  size_t const mentionsLimit = options.m_max_mentions;

  LOG(LINFO, ("Resolving stories from", options.m_stories_path, "in", options.m_threads,
              "threads"));

  // Stories are resolved concurrently and written in the input order.
  list<future<string>> tasks;
  bool eof = false;
  while (!eof || !tasks.empty())
  {
    while (!eof && tasks.size() < options.m_threads)
    {
      string line;
      if (!reader.Read(line))
      {
        eof = true;
        break;
      }
      tasks.emplace_back(async(launch::async, [&resolver, mentionsLimit, line]() {
        return ProcessStory(resolver, line, mentionsLimit);
      }));
    }

    if (tasks.empty())
      break;

    writer.Write(tasks.front().get());
    tasks.pop_front();
  }
  writer.Flush();

  LOG(LINFO, ("Written", writer.GetLinesWritten(), "stories"));
  return 0;
}

void ErrorHandler(int signum)
{
  // Avoid recursive calls.
  signal(signum, SIG_DFL);

  // If there was an exception, then we will print the message.
  try
  {
    if (auto const eptr = current_exception())
      rethrow_exception(eptr);
  }
  catch (RootException const & e)
  {
    cerr << "Core exception: " << e.Msg() << "\n";
  }
  catch (exception const & e)
  {
    cerr << "Std exception: " << e.what() << "\n";
  }
  catch (...)
  {
    cerr << "Unknown exception.\n";
  }

  // Print stack stack.
  cerr << boost::stacktrace::stacktrace();
  // We raise the signal SIGABRT, so that there would be an opportunity to make a core dump.
  raise(SIGABRT);
}

int main(int argc, char * argv[])
{
  ios_base::sync_with_stdio(false);
  signal(SIGABRT, ErrorHandler);
  signal(SIGSEGV, ErrorHandler);
  try
  {
    return GeolocatorCliMain(argc, argv);
  }
  catch (po::error & e)
  {
    std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
    return 1;
  }
  catch (RootException & e)
  {
    LOG(LERROR, (e.Msg()));
    return 1;
  }
}
