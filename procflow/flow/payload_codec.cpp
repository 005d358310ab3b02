#include "payload_codec.hpp"

#include <procflow/util/logging.hpp>
#include <procflow/util/str.hpp>

#include <nlohmann/json.hpp>
#include <oxenc/base64.h>

#include <algorithm>

namespace procflow::flow
{
  static auto logcat = log::Cat("payload-codec");

  std::optional<std::string>
  StepInstruction::param(const std::string& key) const
  {
    if (auto itr = params.find(key); itr != params.end())
      return itr->second;
    return std::nullopt;
  }

  std::optional<std::string>
  decode_transport(std::string_view payload)
  {
    payload = TrimWhitespace(payload);
    if (payload.empty())
      return std::nullopt;

    std::string b64{payload};
    // accept the url-safe alphabet too
    std::replace(b64.begin(), b64.end(), '-', '+');
    std::replace(b64.begin(), b64.end(), '_', '/');
    if (b64.size() % 4 == 1)
      return std::nullopt;
    while (b64.size() % 4 != 0)
      b64 += '=';

    if (not oxenc::is_base64(b64))
      return std::nullopt;
    return oxenc::from_base64(b64);
  }

  /// coerce a json value into the string we hand to step handlers; nullopt for null
  static std::optional<std::string>
  coerce_value(const nlohmann::json& value)
  {
    if (value.is_null())
      return std::nullopt;
    if (value.is_string())
      return value.get<std::string>();
    return value.dump();
  }

  std::optional<StepParams>
  decode_params(std::string_view payload, const std::vector<std::string>& keys)
  {
    const auto maybe_raw = decode_transport(payload);
    if (not maybe_raw)
    {
      log::debug(logcat, "payload is not transport encoded");
      return std::nullopt;
    }

    auto json = nlohmann::json::parse(*maybe_raw, nullptr, false);
    if (json.is_discarded() or not json.is_object())
    {
      log::debug(logcat, "payload does not hold a json object");
      return std::nullopt;
    }

    StepParams params;
    for (const auto& key : keys)
    {
      auto itr = json.find(key);
      if (itr == json.end())
        continue;
      if (auto maybe_value = coerce_value(*itr))
        params.emplace(key, std::move(*maybe_value));
    }

    if (params.empty())
    {
      log::debug(logcat, "payload has none of the {} requested keys", keys.size());
      return std::nullopt;
    }
    return params;
  }

  std::optional<StepInstruction>
  decode_instruction(std::string_view payload, const std::vector<std::string>& keys)
  {
    auto lookup = keys;
    if (std::find(lookup.begin(), lookup.end(), STEP_NAME_KEY) == lookup.end())
      lookup.emplace_back(STEP_NAME_KEY);

    auto maybe_params = decode_params(payload, lookup);
    if (not maybe_params)
      return std::nullopt;

    StepInstruction instruction;
    instruction.params = std::move(*maybe_params);
    if (auto maybe_step = instruction.param(std::string{STEP_NAME_KEY}))
      instruction.step_id = std::move(*maybe_step);

    if (instruction.step_id.empty())
    {
      log::debug(logcat, "payload has no step identifier");
      return std::nullopt;
    }
    return instruction;
  }

  std::optional<std::string>
  encode_result(const StepParams& result)
  {
    try
    {
      const nlohmann::json json(result);
      return oxenc::to_base64(json.dump());
    }
    catch (const nlohmann::json::exception& ex)
    {
      log::warning(logcat, "cannot encode step result: {}", ex.what());
      return std::nullopt;
    }
  }

}  // namespace procflow::flow
