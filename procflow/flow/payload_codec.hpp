#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procflow::flow
{
  /// flat, string keyed parameter or result set carried by a step payload
  using StepParams = std::map<std::string, std::string>;

  /// payload key holding the step identifier
  inline constexpr std::string_view STEP_NAME_KEY = "stepName";

  /// decoded form of an instruction payload: which step to run plus its parameters
  struct StepInstruction
  {
    std::string step_id;
    /// every requested key that was found, including stepName
    StepParams params;

    /// get a parameter if it was present in the payload
    std::optional<std::string>
    param(const std::string& key) const;
  };

  /// Undo the transport encoding (base64, standard or url-safe, padding optional) of a payload.
  /// Returns nullopt if the payload is not valid base64.
  std::optional<std::string>
  decode_transport(std::string_view payload);

  /// Decode a payload into the subset of `keys` it carries, with every value coerced to a string.
  /// Fails (nullopt) if the payload is not base64 wrapped json object or none of the keys are in
  /// it.  Never throws.
  std::optional<StepParams>
  decode_params(std::string_view payload, const std::vector<std::string>& keys);

  /// Same as decode_params but additionally requires a non-empty stepName, which is looked up even
  /// if it is not in `keys`.
  std::optional<StepInstruction>
  decode_instruction(std::string_view payload, const std::vector<std::string>& keys);

  /// Serialize a step result into the transport form used for instructions.  Fails (nullopt) if
  /// the result cannot be represented, e.g. invalid utf-8.  Never throws.
  std::optional<std::string>
  encode_result(const StepParams& result);

}  // namespace procflow::flow
