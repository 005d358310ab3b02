#include "directory_service.hpp"

#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <stdexcept>
#include <vector>

namespace procflow::directory
{
  static auto logcat = log::Cat("directory");

  std::string
  context_processes_path(std::string_view context, const Filters& filters)
  {
    auto path = fmt::format("/contexts/{}/processes", percent_encode(context));
    if (filters.empty())
      return path;

    std::vector<std::string> query;
    for (const auto& [key, value] : filters)
      query.push_back(fmt::format("{}={}", percent_encode(key), percent_encode(value)));
    return fmt::format("{}?{}", path, join("&", query));
  }

  std::string
  resume_process_path(std::string_view instance_id)
  {
    return fmt::format("/processes/{}/resume", percent_encode(instance_id));
  }

  std::string
  transition_path(std::string_view process_id, std::string_view transition_id)
  {
    return fmt::format(
        "/processes/{}/transitions/{}", percent_encode(process_id), percent_encode(transition_id));
  }

  DirectoryService::DirectoryService(
      EventLoop_ptr loop,
      std::shared_ptr<Transport> transport,
      std::shared_ptr<session::SessionGate> gate,
      DirectoryOptions opts)
      : _loop{std::move(loop)}
      , _transport{std::move(transport)}
      , _gate{std::move(gate)}
      , _opts{opts}
  {
    if (not(_loop and _transport and _gate))
      throw std::invalid_argument{"directory service is missing a collaborator"};
  }

  std::optional<Error>
  DirectoryService::check_session(bool check_token_expiry) const
  {
    switch (_gate->evaluate(check_token_expiry))
    {
      case session::SessionStatus::allowed:
        return std::nullopt;
      case session::SessionStatus::expired:
        return Error{ErrorKind::session_expired, "access token expired"};
      case session::SessionStatus::indeterminate:
        if (_opts.allow_indeterminate)
          return std::nullopt;
        return Error{ErrorKind::session_indeterminate, "access token has no expiry"};
    }
    return std::nullopt;
  }

  template <typename T>
  void
  DirectoryService::deliver(Callback<T> done, Result<T> result) const
  {
    if (not done)
      return;
    _loop->call([done = std::move(done), result = std::move(result)]() { done(result); });
  }

  /// turn an engine reply into either the json body or why there is none
  static Result<nlohmann::json>
  interpret_reply(const Request& req, bool ok, const std::vector<std::string>& data)
  {
    if (not ok)
    {
      const auto why = data.empty() ? std::string{"no reply"} : data.front();
      log::warning(logcat, "{} failed: {}", req, why);
      return Error{ErrorKind::transport_failure, why};
    }
    if (data.size() < 2)
    {
      log::warning(logcat, "{}: engine gave a reply with {} parts", req, data.size());
      return Error{ErrorKind::bad_response, "incomplete reply"};
    }

    int status = 0;
    if (not parse_int(data[0], status))
      return Error{ErrorKind::bad_response, fmt::format("invalid status '{}'", data[0])};
    if (status == 401)
    {
      log::info(logcat, "{}: engine rejected our access token", req);
      return Error{ErrorKind::session_expired, "engine rejected the access token"};
    }
    if (status < 200 or status >= 300)
    {
      log::warning(logcat, "{}: engine replied {}", req, status);
      return Error{ErrorKind::bad_response, fmt::format("engine replied {}: {}", status, data[1])};
    }

    auto body = nlohmann::json::parse(data[1], nullptr, false);
    if (body.is_discarded())
      return Error{ErrorKind::bad_response, "reply body is not json"};
    return body;
  }

  template <typename T>
  void
  DirectoryService::send(
      Request req, std::function<T(const nlohmann::json&)> parse, Callback<T> done)
  {
    req.bearer = _gate->access_token();
    auto what = req;
    auto on_reply = [self = shared_from_this(), what, parse = std::move(parse), done](
                        bool ok, std::vector<std::string> data) {
      auto reply = interpret_reply(what, ok, data);
      if (auto* err = error_of(reply))
      {
        self->deliver<T>(done, *err);
        return;
      }
      try
      {
        self->deliver<T>(done, parse(std::get<nlohmann::json>(reply)));
      }
      catch (const std::exception& ex)
      {
        log::warning(logcat, "{}: cannot use engine reply: {}", what, ex.what());
        self->deliver<T>(done, Error{ErrorKind::bad_response, ex.what()});
      }
    };

    try
    {
      _transport->request(std::move(req), std::move(on_reply));
    }
    catch (const std::exception& ex)
    {
      log::error(logcat, "{}: transport failed: {}", what, ex.what());
      deliver<T>(std::move(done), Error{ErrorKind::transport_failure, ex.what()});
    }
  }

  static model::ProcessInstance
  parse_instance(const nlohmann::json& body)
  {
    return body.get<model::ProcessInstance>();
  }

  void
  DirectoryService::get_context_processes(
      std::string context,
      Filters filters,
      bool check_token_expiry,
      Callback<model::ContextFlows> done)
  {
    if (auto err = check_session(check_token_expiry))
    {
      log::info(logcat, "not fetching processes of {}: {}", context, *err);
      deliver<model::ContextFlows>(std::move(done), *err);
      return;
    }

    Request req{Method::get, context_processes_path(context, filters), std::nullopt, std::nullopt};
    send<model::ContextFlows>(
        std::move(req),
        [context](const nlohmann::json& body) {
          auto flows = body.get<model::ContextFlows>();
          if (flows.context.empty())
            flows.context = context;
          return flows;
        },
        std::move(done));
  }

  void
  DirectoryService::start_or_resume_context_process(
      std::string name,
      nlohmann::json data,
      bool check_token_expiry,
      Callback<model::ProcessInstance> done)
  {
    if (auto err = check_session(check_token_expiry))
    {
      log::info(logcat, "not starting process {}: {}", name, *err);
      deliver<model::ProcessInstance>(std::move(done), *err);
      return;
    }

    if (data.is_null())
      data = nlohmann::json::object();
    Request req{Method::post, context_processes_path(name), std::move(data), std::nullopt};
    send<model::ProcessInstance>(std::move(req), parse_instance, std::move(done));
  }

  void
  DirectoryService::start_or_resume_process(
      std::string instance_id, Callback<model::ProcessInstance> done)
  {
    Request req{Method::post, resume_process_path(instance_id), std::nullopt, std::nullopt};
    send<model::ProcessInstance>(std::move(req), parse_instance, std::move(done));
  }

  void
  DirectoryService::submit_transition(
      model::TransitionRequest request, Callback<model::ProcessInstance> done)
  {
    log::debug(
        logcat,
        "submitting transition {} of process {}",
        request.transition_id,
        request.process_id);
    Request req{
        Method::post,
        transition_path(request.process_id, request.transition_id),
        nlohmann::json{{"payload", request.payload}},
        std::nullopt};
    send<model::ProcessInstance>(
        std::move(req),
        parse_instance,
        [done = std::move(done)](Result<model::ProcessInstance> result) {
          if (not done)
            return;
          if (auto* err = error_of(result))
            done(Error{ErrorKind::transition_submit_failure, err->message, err->kind});
          else
            done(std::move(result));
        });
  }

}  // namespace procflow::directory
