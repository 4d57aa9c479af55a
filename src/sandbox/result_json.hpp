#pragma once

#include "nlohmann/json.hpp"
#include "sandbox/types.hpp"

namespace socrates::sandbox {

nlohmann::json ToJson(const ParsedError& error);
nlohmann::json ToJson(const ExecutionResult& result);
nlohmann::json ToJson(const TestExecutionResult& result);

}  // namespace socrates::sandbox
