#ifndef PROCFLOW_HPP
#define PROCFLOW_HPP

#include <procflow/config/config.hpp>
#include <procflow/directory/directory_service.hpp>
#include <procflow/directory/transport.hpp>
#include <procflow/ev/ev.hpp>
#include <procflow/flow/default_steps.hpp>
#include <procflow/flow/launcher.hpp>
#include <procflow/flow/orchestrator.hpp>
#include <procflow/flow/screen_host.hpp>
#include <procflow/flow/state_bus.hpp>
#include <procflow/flow/step_registry.hpp>
#include <procflow/session/session_gate.hpp>

#include <functional>
#include <future>
#include <memory>

namespace oxenmq
{
  class OxenMQ;
}

namespace procflow
{
  /// everything the host application plugs into the flow engine
  struct HostBindings
  {
    /// the host's screen stack; required
    std::shared_ptr<flow::ScreenHost> screens;
    /// where the access token comes from; null means there never is one
    std::shared_ptr<session::TokenSource> tokens;
    /// ui for the shipped step handlers; only steps with a presenter get registered
    flow::StepPresenters presenters;
    /// how to reach the engine; null talks oxenmq to [engine]:rpc
    std::shared_ptr<directory::Transport> transport;
  };

  struct Context
  {
    std::shared_ptr<Config> config = nullptr;
    EventLoop_ptr loop = nullptr;
    std::shared_ptr<oxenmq::OxenMQ> omq = nullptr;

    std::shared_ptr<flow::FlowStateBus> bus = nullptr;
    std::shared_ptr<flow::StepRegistry> registry = nullptr;
    std::shared_ptr<session::SessionGate> gate = nullptr;
    std::shared_ptr<directory::Transport> transport = nullptr;
    std::shared_ptr<directory::DirectoryService> directory = nullptr;
    std::shared_ptr<flow::ContinuationOrchestrator> orchestrator = nullptr;
    std::shared_ptr<flow::FlowLauncher> launcher = nullptr;

    virtual ~Context() = default;

    /// Configure given the specified config.  Throws if already configured.
    void
    Configure(std::shared_ptr<Config> conf);

    /// Build the flow engine.  Call Configure() first.  Step handlers the host wants beyond the
    /// shipped ones are added to `registry` after this and before the first continuation.
    void
    Setup(HostBindings host);

    /// run the ui loop on the calling thread until CloseAsync()
    int
    Run();

    bool
    IsUp() const;

    bool
    IsStopping() const;

    /// close async
    void
    CloseAsync();

    /// wait until closed and done
    void
    Wait();

    /// call a function on the ui loop
    /// return true if queued for calling
    /// return false if not queued for calling
    bool
    CallSafe(std::function<void(void)> f);

    /// the user logged out (or the token died): tell the host to tear down any presented flow and
    /// stop delivering outcomes to the current listener
    void
    end_session();

    void
    Close();

   protected:
    /// creates the transport used when the host does not bind one
    virtual std::shared_ptr<directory::Transport>
    makeTransport();

   private:
    std::unique_ptr<std::promise<void>> closeWaiter;
  };

}  // namespace procflow

#endif
