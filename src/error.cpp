#include "keygraph/core/error.hpp"

#include <utility>

#include "keygraph/core/logging.hpp"

namespace keygraph::core {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidVertex:   return "InvalidVertex";
    case ErrorCode::InvalidEdge:     return "InvalidEdge";
    case ErrorCode::InvalidMode:     return "InvalidMode";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::Overflow:        return "Overflow";
  }
  return "Unknown";
}

EngineError::EngineError(std::string operation, ErrorCode code)
    : RuntimeError(operation + ": engine error " + to_string(code) +
                   " (" + std::to_string(static_cast<int>(code)) + ")"),
      operation_(std::move(operation)),
      code_(code) {}

NodeNotFound::NodeNotFound(std::string operation)
    : ValueError(operation + ": node not in graph"),
      operation_(std::move(operation)) {}

void throw_engine_error(const char* operation, ErrorCode code) {
  KEYGRAPH_LOG_ENGINE(operation << " failed: " << to_string(code));
  throw EngineError(operation, code);
}

} // namespace keygraph::core
