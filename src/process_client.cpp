/*
 *
 *  process_client.cpp
 *
 */

#include "rdc/rdc.hpp"

#include <chrono>

#include "rdc/client.hpp"
#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/options.hpp"

namespace rdc {

namespace {
  Client &processClient() {
    static Client client(OptionsFromEnv());
    return client;
  }

  int toCode(const Status &stat) {
    return static_cast<int>(stat.code());
  }
}

int Initialize() {
  return toCode(processClient().Initialize());
}

int PostWrite(const char *queue, const void *buffer, unsigned long length) {
  if (queue == nullptr) {
    return toCode(Status(StatusCode::kInvalidArgument));
  }
  auto ticket_s = processClient().PostWrite(queue, memory::ConstBuffer(buffer, length), length);
  return toCode(ticket_s.status());
}

int WaitIdle(const char *queue, unsigned long timeout_ms) {
  if (queue == nullptr) {
    return toCode(Status(StatusCode::kInvalidArgument));
  }
  return toCode(processClient().WaitIdle(queue, std::chrono::milliseconds(timeout_ms)));
}

int Shutdown() {
  return toCode(processClient().Shutdown());
}

}
