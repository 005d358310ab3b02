#include "default_steps.hpp"

#include <procflow/util/logging.hpp>

#include <stdexcept>

namespace procflow::flow
{
  static auto logcat = log::Cat("default-steps");

  /// forwards a presenter's answer to the step completion
  static PresenterResult
  forward_to(StepCompletion done)
  {
    return [done = std::move(done)](std::optional<StepParams> result, std::string reason) {
      if (result)
        done.complete(std::move(*result));
      else
        done.fail(reason.empty() ? "step was not completed" : std::move(reason));
    };
  }

  WebRedirectStep::WebRedirectStep(std::shared_ptr<WebViewPresenter> presenter)
      : _presenter{std::move(presenter)}
  {
    if (not _presenter)
      throw std::invalid_argument{"web redirect step needs a web view presenter"};
  }

  void
  WebRedirectStep::perform(std::string_view payload, StepCompletion done)
  {
    auto maybe_params = decode_params(payload, {"secondParams", "clientID"});
    if (not maybe_params or maybe_params->count("secondParams") == 0
        or maybe_params->at("secondParams").empty())
    {
      done.fail("web redirect without a url");
      return;
    }
    auto& params = *maybe_params;
    const auto client_id = params.count("clientID") ? params["clientID"] : std::string{};
    log::debug(logcat, "opening web redirect to {}", params["secondParams"]);
    _presenter->open(params["secondParams"], client_id, [done]() {
      // the engine only wants to know the user came back
      done.complete(StepParams{{"", ""}});
    });
  }

  void
  WebRedirectStep::cancel()
  {
    log::debug(logcat, "closing web redirect");
    _presenter->close();
  }

  IdentityVerificationStep::IdentityVerificationStep(
      std::shared_ptr<VerificationProvider> provider)
      : _provider{std::move(provider)}
  {
    if (not _provider)
      throw std::invalid_argument{"identity verification step needs a verification provider"};
  }

  void
  IdentityVerificationStep::perform(std::string_view payload, StepCompletion done)
  {
    auto maybe_params = decode_params(payload, {"token", "clientID"});
    if (not maybe_params or maybe_params->count("token") == 0)
    {
      done.fail("identity verification without a token");
      return;
    }
    auto& params = *maybe_params;
    const auto client_id = params.count("clientID") ? params["clientID"] : std::string{};
    _provider->verify(params["token"], client_id, forward_to(std::move(done)));
  }

  void
  IdentityVerificationStep::cancel()
  {
    _provider->abort();
  }

  TransactionSigningStep::TransactionSigningStep(std::shared_ptr<SigningPresenter> presenter)
      : _presenter{std::move(presenter)}
  {
    if (not _presenter)
      throw std::invalid_argument{"transaction signing step needs a signing presenter"};
  }

  void
  TransactionSigningStep::perform(std::string_view payload, StepCompletion done)
  {
    auto maybe_params = decode_params(payload, {"transactionId", "amount"});
    if (not maybe_params or maybe_params->count("transactionId") == 0)
    {
      done.fail("transaction signing without a transaction id");
      return;
    }
    auto& params = *maybe_params;
    const auto amount = params.count("amount") ? params["amount"] : std::string{};
    _presenter->sign(params["transactionId"], amount, forward_to(std::move(done)));
  }

  void
  TransactionSigningStep::cancel()
  {
    _presenter->dismiss();
  }

  int
  register_default_steps(StepRegistry& registry, const StepPresenters& presenters)
  {
    int registered = 0;
    if (presenters.web_view)
    {
      registry.add(WEB_VIEW_STEP, std::make_shared<WebRedirectStep>(presenters.web_view));
      ++registered;
    }
    if (presenters.verification)
    {
      registry.add(
          IDENTITY_VERIFICATION_STEP,
          std::make_shared<IdentityVerificationStep>(presenters.verification));
      ++registered;
    }
    if (presenters.signing)
    {
      registry.add(
          TRANSACTION_SIGNING_STEP, std::make_shared<TransactionSigningStep>(presenters.signing));
      ++registered;
    }
    return registered;
  }

}  // namespace procflow::flow
