#include <procflow.hpp>

#include <procflow/directory/omq_transport.hpp>
#include <procflow/util/logging.hpp>

#include <oxenmq/oxenmq.h>

#include <stdexcept>

static auto logcat = procflow::log::Cat("procflow-context");

namespace procflow
{
  static constexpr oxenmq::LogLevel
  toOxenMQLogLevel(log::Level level)
  {
    switch (level)
    {
      case log::Level::critical:
        return oxenmq::LogLevel::fatal;
      case log::Level::err:
        return oxenmq::LogLevel::error;
      case log::Level::warn:
        return oxenmq::LogLevel::warn;
      case log::Level::info:
        return oxenmq::LogLevel::info;
      case log::Level::debug:
        return oxenmq::LogLevel::debug;
      case log::Level::trace:
      case log::Level::off:
      default:
        return oxenmq::LogLevel::trace;
    }
  }

  static auto omq_cat = log::Cat("omq");

  static void
  omq_logger(oxenmq::LogLevel level, const char* file, int line, std::string msg)
  {
    switch (level)
    {
      case oxenmq::LogLevel::fatal:
        log::critical(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
      case oxenmq::LogLevel::error:
        log::error(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
      case oxenmq::LogLevel::warn:
        log::warning(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
      case oxenmq::LogLevel::info:
        log::info(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
      case oxenmq::LogLevel::debug:
        log::debug(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
      case oxenmq::LogLevel::trace:
      default:
        log::trace(omq_cat, "[{}:{}] {}", file, line, msg);
        break;
    }
  }

  static void
  apply_logging_config(const LoggingConfig& conf)
  {
    auto log_type = conf.type;
    if (log_type == log::Type::File && (conf.file == "stdout" || conf.file == "-" || conf.file.empty()))
      log_type = log::Type::Print;

    if (log::get_level_default() != log::Level::off)
      log::reset_level(conf.level);

    log::clear_sinks();
    log::add_sink(log_type, log_type == log::Type::System ? "procflow" : conf.file);
  }

  bool
  Context::CallSafe(std::function<void(void)> f)
  {
    if (!loop)
      return false;
    loop->call_soon(std::move(f));
    return true;
  }

  void
  Context::Configure(std::shared_ptr<Config> conf)
  {
    if (nullptr != config.get())
      throw std::runtime_error("Config already exists");
    if (not conf)
      throw std::invalid_argument("Cannot configure with a null Config");

    config = std::move(conf);
  }

  bool
  Context::IsUp() const
  {
    return loop && loop->running() && orchestrator;
  }

  std::shared_ptr<directory::Transport>
  Context::makeTransport()
  {
    omq = std::make_shared<oxenmq::OxenMQ>(omq_logger, toOxenMQLogLevel(config->logging.level));
    omq->start();

    auto omq_transport = std::make_shared<directory::OmqTransport>(
        omq, config->engine.rpc_addr, config->engine.request_timeout);
    omq_transport->ConnectAsync();
    return omq_transport;
  }

  void
  Context::Setup(HostBindings host)
  {
    /// Call Configure() before calling Setup()
    if (not config)
      throw std::runtime_error("Cannot call Setup() on context without a Config");
    if (not host.screens)
      throw std::invalid_argument("Cannot call Setup() without a screen host");

    apply_logging_config(config->logging);
    log::debug(logcat, "Setting up flow engine");

    if (!loop)
      loop = EventLoop::create();

    bus = std::make_shared<flow::FlowStateBus>();
    registry = std::make_shared<flow::StepRegistry>();
    const auto shipped = flow::register_default_steps(*registry, host.presenters);
    log::debug(logcat, "registered {} shipped step handlers", shipped);

    gate = std::make_shared<session::SessionGate>(host.tokens, config->session.expiry_leeway);

    transport = host.transport ? std::move(host.transport) : makeTransport();
    directory = std::make_shared<directory::DirectoryService>(
        loop, transport, gate, directory::DirectoryOptions{config->session.allow_indeterminate});

    flow::OrchestratorOptions orchestrator_opts;
    orchestrator_opts.step_keys = config->flow.step_keys;
    orchestrator_opts.handler_timeout = config->flow.handler_timeout;
    orchestrator = std::make_shared<flow::ContinuationOrchestrator>(
        loop, registry, std::move(host.screens), bus, std::move(orchestrator_opts));

    flow::LauncherOptions launcher_opts;
    launcher_opts.check_token_expiry = config->session.check_token_expiry;
    launcher_opts.allow_indeterminate = config->session.allow_indeterminate;
    launcher = std::make_shared<flow::FlowLauncher>(
        loop, directory, orchestrator, bus, gate, launcher_opts);
  }

  int
  Context::Run()
  {
    if (orchestrator == nullptr)
    {
      // we are not set up so we should die
      log::error(logcat, "cannot run non configured context");
      return 1;
    }

    log::info(logcat, "running ui loop");
    loop->run();
    if (closeWaiter)
    {
      closeWaiter->set_value();
    }
    Close();
    return 0;
  }

  void
  Context::end_session()
  {
    log::info(logcat, "ending session");
    if (not bus)
      return;
    auto do_end = [bus = bus]() {
      bus->publish(flow::SessionEnded{});
      bus->clear_listener();
    };
    if (loop)
      loop->call(std::move(do_end));
    else
      do_end();
  }

  void
  Context::CloseAsync()
  {
    /// already closing
    if (IsStopping() or not loop)
      return;

    closeWaiter = std::make_unique<std::promise<void>>();
    loop->call([l = loop]() { l->stop(); });
  }

  bool
  Context::IsStopping() const
  {
    return closeWaiter.operator bool();
  }

  void
  Context::Wait()
  {
    if (closeWaiter)
    {
      closeWaiter->get_future().wait();
      closeWaiter.reset();
    }
  }

  void
  Context::Close()
  {
    log::debug(logcat, "free flow engine");
    launcher.reset();
    orchestrator.reset();
    directory.reset();
    transport.reset();
    gate.reset();
    registry.reset();

    if (bus)
      bus->clear_listener();
    bus.reset();

    log::debug(logcat, "free omq");
    omq.reset();

    log::debug(logcat, "free loop");
    loop.reset();
  }

}  // namespace procflow
