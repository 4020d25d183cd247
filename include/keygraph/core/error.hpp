/* Exception types raised by the engine and the keyed layer.
 *
 * Absence of a node is normally encoded in return values (std::optional,
 * bool, empty vectors). Exceptions cover the cases that are not recoverable
 * at the call site:
 *   - EngineError:    an engine call rejected its arguments.
 *   - NodeNotFound:   an operation that needs the node present got an absent one.
 *   - InvariantError: identity map and engine state disagree (a defect).
 */
#pragma once

#include <stdexcept>
#include <string>

namespace keygraph::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Engine diagnostic codes.
enum class ErrorCode {
  InvalidVertex = 1,
  InvalidEdge = 2,
  InvalidMode = 3,
  InvalidArgument = 4,
  Overflow = 5
};

[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

class EngineError : public RuntimeError {
public:
  EngineError(std::string operation, ErrorCode code);

  [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  std::string operation_;
  ErrorCode code_;
};

class NodeNotFound : public ValueError {
public:
  explicit NodeNotFound(std::string operation);

  [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

private:
  std::string operation_;
};

struct InvariantError : public std::logic_error {
  using std::logic_error::logic_error;
};

// Logs (when debug logging is on) and throws EngineError.
[[noreturn]] void throw_engine_error(const char* operation, ErrorCode code);

} // namespace keygraph::core
