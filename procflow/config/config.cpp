#include "config.hpp"

#include <procflow/util/file.hpp>
#include <procflow/util/str.hpp>

#include <stdexcept>

namespace procflow
{
  using namespace config;

  static auto logcat = log::Cat("config");

  void
  EngineConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "engine",
        "rpc",
        Default{DEFAULT_ENGINE_RPC},
        Comment{
            "oxenmq address of the remote process engine, such as:",
            "    rpc=ipc:///var/lib/procflow/engine.sock",
            "    rpc=tcp://127.0.0.1:5510",
        },
        [this](std::string arg) {
          if (arg.empty())
            throw std::invalid_argument{"[engine]:rpc cannot be empty"};
          rpc_addr = oxenmq::address{arg};
        });

    conf.define_option<int>(
        "engine",
        "timeout",
        Default{15},
        Comment{
            "Seconds to wait for a reply from the process engine before the request fails.",
        },
        [this](int arg) {
          if (arg <= 0)
            throw std::invalid_argument{"[engine]:timeout must be positive"};
          request_timeout = std::chrono::seconds{arg};
        });
  }

  void
  SessionConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<bool>(
        "session",
        "check-token-expiry",
        Default{true},
        assignment_acceptor(check_token_expiry),
        Comment{
            "Consult the access token's expiry claim before resuming a process from a",
            "notification or querying the process directory.",
        });

    conf.define_option<bool>(
        "session",
        "allow-indeterminate",
        Default{false},
        assignment_acceptor(allow_indeterminate),
        Comment{
            "What to do when the access token carries no usable expiry claim: true lets the",
            "request through, false treats the session as unusable.",
        });

    conf.define_option<int>(
        "session",
        "expiry-leeway",
        Default{0},
        Comment{
            "Treat tokens expiring within this many seconds as already expired.",
        },
        [this](int arg) {
          if (arg < 0)
            throw std::invalid_argument{"[session]:expiry-leeway cannot be negative"};
          expiry_leeway = std::chrono::seconds{arg};
        });
  }

  void
  FlowConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "flow",
        "step-key",
        MultiValue,
        Comment{
            "Instruction payload key to extract when decoding a step; may be given more than",
            "once.  stepName is always extracted.  If none are given the defaults are",
            "stepName, token, clientID, secondParams, transactionId and amount.",
        },
        [this](std::string arg) {
          arg = std::string{TrimWhitespace(arg)};
          if (arg.empty())
            throw std::invalid_argument{"[flow]:step-key cannot be empty"};
          step_keys.push_back(std::move(arg));
        });

    conf.define_option<int>(
        "flow",
        "handler-timeout",
        Default{0},
        Comment{
            "Seconds a step handler may take before its step is failed.  0 waits forever.",
        },
        [this](int arg) {
          if (arg < 0)
            throw std::invalid_argument{"[flow]:handler-timeout cannot be negative"};
          handler_timeout = std::chrono::seconds{arg};
        });
  }

  void
  LoggingConfig::define_config_options(ConfigDefinition& conf)
  {
    conf.define_option<std::string>(
        "logging",
        "type",
        Default{"print"},
        [this](std::string arg) { type = log::type_from_string(arg); },
        Comment{
            "Log type (format). Valid options are:",
            "  print - print logs to standard output",
            "  system - logs directed to the system logger (syslog/eventlog/etc.)",
            "  file - plaintext formatting to a file",
        });

    conf.define_option<std::string>(
        "logging",
        "level",
        Default{"info"},
        [this](std::string arg) { level = log::level_from_string(arg); },
        Comment{
            "Minimum log level to print. Logging below this level will be ignored.",
            "Valid log levels, in ascending order, are:",
            "  trace",
            "  debug",
            "  info",
            "  warn",
            "  error",
            "  critical",
            "  none",
        });

    conf.define_option<std::string>(
        "logging",
        "file",
        Default{""},
        assignment_acceptor(file),
        Comment{
            "When using type=file this is the output filename.",
        });
  }

  void
  Config::init_config(ConfigDefinition& conf)
  {
    engine.define_config_options(conf);
    session.define_config_options(conf);
    flow.define_config_options(conf);
    logging.define_config_options(conf);
  }

  void
  Config::load_config_data(std::string_view ini, std::string_view origin)
  {
    ConfigDefinition conf;
    init_config(conf);

    for (const auto& entry : parse_ini(ini, origin))
      conf.set(entry.section, entry.key, entry.value);

    flow.step_keys.clear();
    conf.accept_all();

    if (flow.step_keys.empty())
      flow.step_keys = DEFAULT_STEP_KEYS;
  }

  bool
  Config::load(std::optional<fs::path> fname)
  {
    std::string ini;
    if (fname)
    {
      try
      {
        ini = util::file_to_string(*fname);
      }
      catch (const std::exception& e)
      {
        log::warning(logcat, "cannot read config {}: {}", fname->string(), e.what());
        return false;
      }
    }
    load_config_data(ini, fname ? fname->string() : "<defaults>");
    return true;
  }

  bool
  Config::load_string(std::string_view ini)
  {
    load_config_data(ini, "<string>");
    return true;
  }

  std::string
  Config::generate_ini()
  {
    Config config;
    ConfigDefinition def;
    config.init_config(def);
    def.add_section_comments(
        "engine", {"Remote process engine connection, reached over oxenmq."});
    def.add_section_comments("session", {"Access token checks."});
    def.add_section_comments("flow", {"Step continuation settings."});
    return def.generate_ini();
  }

}  // namespace procflow
