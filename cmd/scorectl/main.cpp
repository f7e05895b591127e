#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "hacktracker/scoring/v1.hpp"
#include "internal/cache/persistent_cache_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scoring/game_state_reducer.hpp"
#include "internal/scoring/scoring_rules.hpp"
#include "internal/util/errors.hpp"

using namespace hacktracker::scoring::v1;
using hacktracker::scoring::GameStateReducer;

static void Usage() {
  std::cout << "Usage:\n"
            << "  scorectl classify <code>...\n"
            << "  scorectl replay <game.json> <atbats.json>\n"
            << "  scorectl cache --config <config.yaml> get <key>\n"
            << "  scorectl cache --config <config.yaml> remove <key>\n"
            << "  scorectl cache --config <config.yaml> keys\n"
            << "  scorectl cache --config <config.yaml> clear\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// ------------------------------------------------------------

static int Classify(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string code = argv[i];
    std::cout << code << "\t" << hacktracker::scoring::ToString(hacktracker::scoring::Classify(code)) << "\touts="
              << hacktracker::scoring::OutCount(code) << "\n";
  }
  return 0;
}

static int Replay(int argc, char** argv) {
  if (argc != 4) {
    Usage();
    return 1;
  }

  const auto game    = hacktracker::cache::ParseMessage<Game>(ReadFile(argv[2]));
  const auto at_bats = hacktracker::cache::ParseMessage<AtBatList>(ReadFile(argv[3]));

  try {
    const auto state = GameStateReducer::Compute(hacktracker::scoring::ToAtBats(at_bats.at_bats()),
                                                 hacktracker::scoring::ToLineup(game.lineup()));
    std::cout << state.ToString() << "\n";
  } catch (const hacktracker::util::ValidationError& e) {
    std::cerr << "invalid game log: " << e.what() << "\n";
    return 2;
  }
  return 0;
}

static int Cache(int argc, char** argv) {
  if (argc < 5 || std::string(argv[2]) != "--config") {
    Usage();
    return 1;
  }

  const auto config = hacktracker::config::ConfigLoader::LoadFromYaml(argv[3]);
  hacktracker::observability::InitializeLogging(config);

  auto              cache = hacktracker::factory::BuildCacheStore(config);
  const std::string op    = argv[4];

  if (op == "get") {
    if (argc != 6) return 1;

    auto data = cache->GetJson<std::string>(argv[5], [](const std::string& json) { return json; });
    if (!data) {
      std::cerr << "miss: " << argv[5] << "\n";
      return 1;
    }
    std::cout << *data << "\n";
    return 0;
  }

  if (op == "remove") {
    if (argc != 6) return 1;

    cache->Remove(argv[5]);
    std::cout << "removed " << argv[5] << "\n";
    return 0;
  }

  if (op == "keys") {
    for (const auto& key : cache->Keys()) {
      std::cout << key << "\n";
    }
    return 0;
  }

  if (op == "clear") {
    cache->ClearAll();
    std::cout << "cache cleared (schema version " << cache->schema_version() << ")\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[1];

  int code = -1;
  try {
    if (cmd == "classify") code = Classify(argc, argv);
    if (cmd == "replay") code = Replay(argc, argv);
    if (cmd == "cache") code = Cache(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    code = 1;
  }
  hacktracker::observability::ShutdownLogging();
  if (code >= 0) return code;

  Usage();
  return 1;
}
