#include <procflow.hpp>

#include <catch2/catch.hpp>

#include "mocks/mock_loop.hpp"
#include "mocks/mock_screen_host.hpp"
#include "mocks/mock_steps.hpp"
#include "mocks/mock_transport.hpp"

using namespace procflow;

namespace
{
  struct ContextFixture
  {
    Context ctx;
    std::shared_ptr<mocks::ManualLoop> loop = std::make_shared<mocks::ManualLoop>();
    std::shared_ptr<mocks::FakeTransport> transport = std::make_shared<mocks::FakeTransport>();
    std::shared_ptr<mocks::RecordingScreenHost> screens =
        std::make_shared<mocks::RecordingScreenHost>();
    std::vector<std::string> outcomes;

    ContextFixture()
    {
      auto config = std::make_shared<Config>();
      REQUIRE(config->load_string("[flow]\nstep-key=stepName\nstep-key=token\n"));
      ctx.Configure(std::move(config));
      ctx.loop = loop;
    }

    HostBindings
    bindings()
    {
      HostBindings host;
      host.screens = screens;
      host.tokens = std::make_shared<session::StaticTokenSource>(
          mocks::make_jwt({{"exp", int64_t{4'000'000'000}}}));
      host.presenters.web_view = std::make_shared<mocks::MockWebViewPresenter>();
      host.transport = transport;
      return host;
    }

    void
    listen()
    {
      ctx.bus->set_listener([this](const flow::FlowOutcome& outcome) {
        if (auto* present = std::get_if<flow::PresentFlow>(&outcome))
          outcomes.push_back("present:" + present->instance.id);
        else
          outcomes.push_back("ended");
      });
    }
  };
}  // namespace

TEST_CASE("Context needs a config and a screen host", "[context]")
{
  Context ctx;
  CHECK_THROWS_AS(ctx.Setup(HostBindings{}), std::runtime_error);
  CHECK_THROWS_AS(ctx.Configure(nullptr), std::invalid_argument);

  ctx.Configure(std::make_shared<Config>());
  CHECK_THROWS_AS(ctx.Configure(std::make_shared<Config>()), std::runtime_error);
  CHECK_THROWS_AS(ctx.Setup(HostBindings{}), std::invalid_argument);
  CHECK(ctx.Run() == 1);
}

TEST_CASE_METHOD(ContextFixture, "Setup wires the engine from the host bindings", "[context]")
{
  ctx.Setup(bindings());

  CHECK(ctx.loop == loop);
  CHECK(ctx.transport == transport);
  CHECK(ctx.omq == nullptr);
  REQUIRE(ctx.registry);
  CHECK(ctx.registry->has(flow::WEB_VIEW_STEP));
  CHECK_FALSE(ctx.registry->has(flow::TRANSACTION_SIGNING_STEP));
  CHECK_FALSE(ctx.registry->has(flow::IDENTITY_VERIFICATION_STEP));
  CHECK(ctx.directory);
  CHECK(ctx.orchestrator);
  CHECK(ctx.launcher);
  CHECK_FALSE(ctx.IsUp());
}

TEST_CASE_METHOD(ContextFixture, "Launcher reaches the engine through the bound transport", "[context]")
{
  ctx.Setup(bindings());
  listen();

  transport->reply_with(mocks::instance_json("p1"));
  ctx.launcher->open_process("p1", [](const Result<model::ProcessInstance>&) {});
  loop->drain();

  REQUIRE(transport->requests.size() == 1);
  CHECK(transport->requests[0].bearer.has_value());
  CHECK(outcomes == std::vector<std::string>{"present:p1"});
}

TEST_CASE_METHOD(ContextFixture, "Ending the session tears down and detaches the listener", "[context]")
{
  ctx.Setup(bindings());
  listen();

  ctx.end_session();
  loop->drain();
  CHECK(outcomes == std::vector<std::string>{"ended"});
  CHECK_FALSE(ctx.bus->has_listener());

  ctx.bus->publish(flow::SessionEnded{});
  CHECK(outcomes.size() == 1);
}

TEST_CASE_METHOD(ContextFixture, "Close releases the engine", "[context]")
{
  ctx.Setup(bindings());
  CHECK(ctx.CallSafe([] {}));
  ctx.Close();

  CHECK_FALSE(ctx.launcher);
  CHECK_FALSE(ctx.orchestrator);
  CHECK_FALSE(ctx.loop);
  CHECK_FALSE(ctx.CallSafe([] {}));
}
