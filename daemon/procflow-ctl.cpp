#include <procflow/config/config.hpp>
#include <procflow/directory/directory_service.hpp>
#include <procflow/directory/omq_transport.hpp>
#include <procflow/ev/ev.hpp>
#include <procflow/flow/payload_codec.hpp>
#include <procflow/session/session_gate.hpp>
#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <oxenmq/oxenmq.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace
{
  struct command_line_options
  {
    // bool options
    bool verbose = false;
    bool checkExpiry = false;

    // string options
    std::string rpc;
    std::string token;
    std::optional<std::string> context;
    std::vector<std::string> filters;
    std::optional<std::string> start;
    std::string data = "{}";
    std::optional<std::string> resume;
    std::optional<std::string> decode;
    std::vector<std::string> keys;
    std::optional<std::string> encode;

    int timeout = 15;
  };

  // Takes a code, prints a message, and returns the code.  Intended use is:
  //     return exit_error(1, "blah: {}", 42);
  // from within main().
  template <typename... T>
  [[nodiscard]] int
  exit_error(int code, std::string_view format, T&&... args)
  {
    fmt::print(stderr, fmt::runtime(format), std::forward<T>(args)...);
    fmt::print(stderr, "\n");
    return code;
  }

  // Same as above, but with code omitted (uses exit code 1)
  template <typename... T>
  [[nodiscard]] int
  exit_error(std::string_view format, T&&... args)
  {
    return exit_error(1, format, std::forward<T>(args)...);
  }

  int
  do_decode(const std::string& payload, std::vector<std::string> keys)
  {
    if (keys.empty())
      keys = procflow::DEFAULT_STEP_KEYS;
    const auto maybe_params = procflow::flow::decode_params(payload, keys);
    if (not maybe_params)
      return exit_error("payload could not be decoded with keys {}", procflow::join(", ", keys));
    std::cout << nlohmann::json(*maybe_params).dump(2) << std::endl;
    return 0;
  }

  int
  do_encode(const std::string& json_str)
  {
    const auto json = nlohmann::json::parse(json_str, nullptr, false);
    if (json.is_discarded() or not json.is_object())
      return exit_error("--encode needs a json object");

    procflow::flow::StepParams params;
    for (const auto& [key, value] : json.items())
      params[key] = value.is_string() ? value.get<std::string>() : value.dump();

    const auto maybe_payload = procflow::flow::encode_result(params);
    if (not maybe_payload)
      return exit_error("result could not be encoded");
    std::cout << *maybe_payload << std::endl;
    return 0;
  }

  /// run one directory operation on a fresh ui loop and wait for its result
  template <typename T, typename Call>
  std::optional<nlohmann::json>
  blocking_call(const procflow::EventLoop_ptr& loop, Call&& call)
  {
    std::promise<procflow::Result<T>> result_promise;
    loop->call_soon([&]() {
      call([&result_promise](procflow::Result<T> result) {
        result_promise.set_value(std::move(result));
      });
    });
    auto result = result_promise.get_future().get();
    if (auto* err = procflow::error_of(result))
    {
      fmt::print(stderr, "{}\n", *err);
      return std::nullopt;
    }
    return nlohmann::json(std::get<T>(result));
  }

}  // namespace

int
main(int argc, char* argv[])
{
  CLI::App cli{"procflow process engine control utility", "procflow-ctl"};
  command_line_options options{};

  // flags: boolean values in command_line_options struct
  cli.add_flag("-v,--verbose", options.verbose, "Verbose");
  cli.add_flag(
      "--check-expiry", options.checkExpiry, "Refuse to talk to the engine with an expired --token");

  // options: string values in command_line_options struct
  cli.add_option("--rpc", options.rpc, "Specify oxenmq address of the process engine")
      ->capture_default_str();
  cli.add_option("--token", options.token, "Access token to send to the engine");
  cli.add_option("--timeout", options.timeout, "Seconds to wait for the engine")
      ->capture_default_str();
  cli.add_option("--context", options.context, "List the processes of a context");
  cli.add_option("--filter", options.filters, "Narrow --context by key=value; may repeat");
  cli.add_option("--start", options.start, "Start or resume the named process");
  cli.add_option("--data", options.data, "Json object to start --start with")
      ->capture_default_str();
  cli.add_option("--resume", options.resume, "Resume a process instance by id");
  cli.add_option("--decode", options.decode, "Decode an instruction payload");
  cli.add_option("--key", options.keys, "Key to extract with --decode; may repeat");
  cli.add_option("--encode", options.encode, "Encode a json object of step results");

  try
  {
    cli.parse(argc, argv);
  }
  catch (const CLI::ParseError& e)
  {
    return cli.exit(e);
  }

  procflow::log::add_sink(procflow::log::Type::Print, "stderr");
  procflow::log::reset_level(
      options.verbose ? procflow::log::Level::debug : procflow::log::Level::warn);

  int numCommands = options.context.has_value() + options.start.has_value()
      + options.resume.has_value() + options.decode.has_value() + options.encode.has_value();

  switch (numCommands)
  {
    case 0:
      return exit_error(3, "One of --context/--start/--resume/--decode/--encode must be specified");
    case 1:
      break;
    default:
      return exit_error(
          3, "Only one of --context/--start/--resume/--decode/--encode may be specified");
  }

  if (options.decode)
    return do_decode(*options.decode, options.keys);
  if (options.encode)
    return do_encode(*options.encode);

  procflow::directory::Filters filters;
  for (const auto& filter : options.filters)
  {
    auto parts = procflow::split(filter, "=");
    if (parts.size() != 2 or parts[0].empty())
      return exit_error("invalid --filter '{}', expected key=value", filter);
    filters.emplace(parts[0], parts[1]);
  }

  auto data = nlohmann::json::parse(options.data, nullptr, false);
  if (data.is_discarded() or not data.is_object())
    return exit_error("--data must be a json object");

  if (options.timeout <= 0)
    return exit_error("--timeout must be positive");

  auto omq = std::make_shared<oxenmq::OxenMQ>(
      [](oxenmq::LogLevel lvl, const char* file, int line, std::string msg) {
        std::cerr << lvl << " [" << file << ":" << line << "] " << msg << std::endl;
      },
      options.verbose ? oxenmq::LogLevel::debug : oxenmq::LogLevel::warn);
  omq->start();

  auto transport = std::make_shared<procflow::directory::OmqTransport>(
      omq,
      oxenmq::address{options.rpc.empty() ? procflow::DEFAULT_ENGINE_RPC : options.rpc},
      std::chrono::seconds{options.timeout});
  transport->ConnectAsync();

  auto gate = std::make_shared<procflow::session::SessionGate>(
      std::make_shared<procflow::session::StaticTokenSource>(
          options.token.empty() ? std::nullopt : std::make_optional(options.token)));

  auto loop = procflow::EventLoop::create();
  auto directory =
      std::make_shared<procflow::directory::DirectoryService>(loop, transport, gate);
  std::thread loop_thread{[loop]() { loop->run(); }};

  std::optional<nlohmann::json> result;
  if (options.context)
  {
    result = blocking_call<procflow::model::ContextFlows>(loop, [&](auto done) {
      directory->get_context_processes(*options.context, filters, options.checkExpiry, done);
    });
  }
  else if (options.start)
  {
    result = blocking_call<procflow::model::ProcessInstance>(loop, [&](auto done) {
      directory->start_or_resume_context_process(
          *options.start, data, options.checkExpiry, done);
    });
  }
  else if (options.resume)
  {
    result = blocking_call<procflow::model::ProcessInstance>(
        loop, [&](auto done) { directory->start_or_resume_process(*options.resume, done); });
  }

  loop->stop();
  loop_thread.join();

  if (not result)
    return 1;
  std::cout << result->dump(2) << std::endl;
  return 0;
}
