#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace keygraph::core {

// Runtime switch for debug tracing: KEYGRAPH_DEBUG=1.
inline bool debug_logging_enabled() {
  static const bool enabled = [] {
    const char* env = std::getenv("KEYGRAPH_DEBUG");
    return env != nullptr && std::strcmp(env, "1") == 0;
  }();
  return enabled;
}

} // namespace keygraph::core

// Usage:
//   KEYGRAPH_LOG_GRAPH("delete_node id=" << id << " shifted=" << n);
//
// Control:
//   Compile-time: cmake -DKEYGRAPH_ENABLE_DEBUG_LOGGING=ON
//   Runtime:      export KEYGRAPH_DEBUG=1
#ifdef KEYGRAPH_ENABLE_DEBUG_LOGGING

#define KEYGRAPH_LOG(category, message) \
  do { \
    if (::keygraph::core::debug_logging_enabled()) { \
      std::clog << "[keygraph:" << category << "] " << message << '\n'; \
    } \
  } while (0)

#else

#define KEYGRAPH_LOG(category, message) \
  do { } while (0)

#endif

#define KEYGRAPH_LOG_ENGINE(message)   KEYGRAPH_LOG("engine", message)
#define KEYGRAPH_LOG_GRAPH(message)    KEYGRAPH_LOG("graph", message)
#define KEYGRAPH_LOG_SELECTOR(message) KEYGRAPH_LOG("selector", message)
