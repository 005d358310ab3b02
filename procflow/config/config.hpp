#pragma once
#include "definition.hpp"
#include "ini.hpp"

#include <procflow/util/fs.hpp>
#include <procflow/util/logging.hpp>

#include <oxenmq/address.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procflow
{
  using namespace std::chrono_literals;
  using config::ConfigDefinition;

  inline const std::string DEFAULT_ENGINE_RPC{"ipc://procflow-engine.sock"};

  /// instruction keys we look up when no [flow]:step-key is configured
  inline const std::vector<std::string> DEFAULT_STEP_KEYS{
      "stepName", "token", "clientID", "secondParams", "transactionId", "amount"};

  /// where the remote process engine lives and how long we wait on it.
  struct EngineConfig
  {
    oxenmq::address rpc_addr;
    std::chrono::seconds request_timeout{15s};

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct SessionConfig
  {
    bool check_token_expiry = true;
    bool allow_indeterminate = false;
    std::chrono::seconds expiry_leeway{0s};

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct FlowConfig
  {
    std::vector<std::string> step_keys;
    /// zero means wait on step handlers forever
    std::chrono::seconds handler_timeout{0s};

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct LoggingConfig
  {
    log::Type type = log::Type::Print;
    log::Level level = log::Level::info;
    std::string file;

    void
    define_config_options(ConfigDefinition& conf);
  };

  struct Config
  {
    EngineConfig engine;
    SessionConfig session;
    FlowConfig flow;
    LoggingConfig logging;

    // Initialize config definition
    void
    init_config(ConfigDefinition& conf);

    /// Load a config from the given file; a nullopt filename loads the defaults.
    /// returns false if the file could not be read; throws on invalid contents.
    bool
    load(std::optional<fs::path> fname = std::nullopt);

    /// Load a config from a string of ini, same effects as Config::load
    bool
    load_string(std::string_view ini);

    /// generate a fully commented default config file
    static std::string
    generate_ini();

   private:
    void
    load_config_data(std::string_view ini, std::string_view origin);
  };

}  // namespace procflow
