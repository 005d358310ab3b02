#pragma once

#include "step_handler.hpp"
#include "step_registry.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace procflow::flow
{
  /// step ids of the handlers we ship
  inline constexpr auto WEB_VIEW_STEP = "WEB_VIEW";
  inline constexpr auto IDENTITY_VERIFICATION_STEP = "IDENTITY_VERIFICATION";
  inline constexpr auto TRANSACTION_SIGNING_STEP = "TRANSACTION_SIGNING";

  /// completion for host presenters that produce a result: a result map, or nullopt plus why not
  using PresenterResult = std::function<void(std::optional<StepParams>, std::string)>;

  /// host ui that can open a url in a web view
  class WebViewPresenter
  {
   public:
    virtual ~WebViewPresenter() = default;

    /// open `url` and call `on_closed` when the user closes it
    virtual void
    open(const std::string& url, const std::string& client_id, std::function<void()> on_closed) = 0;

    /// close the web view without waiting for the user
    virtual void
    close()
    {}
  };

  /// host integration with an identity verification sdk
  class VerificationProvider
  {
   public:
    virtual ~VerificationProvider() = default;

    virtual void
    verify(const std::string& token, const std::string& client_id, PresenterResult done) = 0;

    virtual void
    abort()
    {}
  };

  /// host ui that asks the user to sign a transaction
  class SigningPresenter
  {
   public:
    virtual ~SigningPresenter() = default;

    virtual void
    sign(const std::string& transaction_id, const std::string& amount, PresenterResult done) = 0;

    /// dismiss the signing prompt
    virtual void
    dismiss()
    {}
  };

  /// opens the `secondParams` url in the host's web view; the result is an empty acknowledgement
  /// once the user closes it.
  class WebRedirectStep : public StepHandler
  {
    std::shared_ptr<WebViewPresenter> _presenter;

   public:
    explicit WebRedirectStep(std::shared_ptr<WebViewPresenter> presenter);

    void
    perform(std::string_view payload, StepCompletion done) override;

    void
    cancel() override;
  };

  /// hands the `token` to the host's identity verification integration
  class IdentityVerificationStep : public StepHandler
  {
    std::shared_ptr<VerificationProvider> _provider;

   public:
    explicit IdentityVerificationStep(std::shared_ptr<VerificationProvider> provider);

    void
    perform(std::string_view payload, StepCompletion done) override;

    void
    cancel() override;
  };

  /// asks the host to have the user sign `transactionId`
  class TransactionSigningStep : public StepHandler
  {
    std::shared_ptr<SigningPresenter> _presenter;

   public:
    explicit TransactionSigningStep(std::shared_ptr<SigningPresenter> presenter);

    void
    perform(std::string_view payload, StepCompletion done) override;

    void
    cancel() override;
  };

  /// the host ui pieces the shipped steps delegate to; any may be null
  struct StepPresenters
  {
    std::shared_ptr<WebViewPresenter> web_view;
    std::shared_ptr<VerificationProvider> verification;
    std::shared_ptr<SigningPresenter> signing;
  };

  /// register the shipped steps for every presenter given.  returns how many were registered.
  int
  register_default_steps(StepRegistry& registry, const StepPresenters& presenters);

}  // namespace procflow::flow
