/*
 *
 *  options.cpp
 *
 *  Reading client options from the environment
 *
 */

#include "rdc/options.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "debug.h"

namespace rdc {

namespace {

int getEnvOrDefault(const char *env_name, int default_val) {
  const char *val = std::getenv(env_name);
  if (val == nullptr) {
    return default_val;
  }
  try {
    size_t pos = 0;
    int parsed = std::stoi(val, &pos);
    if (pos != std::string(val).size() || parsed < 0) {
      throw std::invalid_argument(val);
    }
    return parsed;
  } catch (const std::exception &e) {
    info(stderr, "[options] ignoring malformed %s=%s, using %d\n", env_name, val, default_val);
    return default_val;
  }
}

std::string getEnvOrDefault(const char *env_name, const std::string &default_val) {
  const char *val = std::getenv(env_name);
  if (val == nullptr) {
    return default_val;
  }
  return std::string(val);
}

}

std::vector<std::string> ParseQueueList(const std::string &list) {
  std::vector<std::string> names;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string::npos) {
      end = list.size();
    }
    std::string name = list.substr(start, end - start);
    size_t first = name.find_first_not_of(" \t");
    size_t last = name.find_last_not_of(" \t");
    if (first != std::string::npos) {
      names.push_back(name.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return names;
}

Options OptionsFromEnv() {
  Options opts;
  opts.remote_addr = getEnvOrDefault("RDC_REMOTE_ADDR", opts.remote_addr);
  opts.remote_port = getEnvOrDefault("RDC_REMOTE_PORT", opts.remote_port);
  opts.source_addr = getEnvOrDefault("RDC_SOURCE_ADDR", opts.source_addr);
  opts.device_name = getEnvOrDefault("RDC_DEVICE", opts.device_name);

  int depth = getEnvOrDefault("RDC_QUEUE_DEPTH", (int)opts.queue_depth);
  if (depth > 0) {
    opts.queue_depth = depth;
  }

  std::string backpressure = getEnvOrDefault("RDC_BACKPRESSURE", "block");
  if (backpressure == "fail") {
    opts.backpressure = BackpressureMode::kFailFast;
  } else if (backpressure != "block") {
    info(stderr, "[options] unknown RDC_BACKPRESSURE=%s, using block\n", backpressure.c_str());
  }
  opts.credit_wait_timeout = std::chrono::milliseconds(
      getEnvOrDefault("RDC_CREDIT_WAIT_MS", (int)opts.credit_wait_timeout.count()));

  std::string policy = getEnvOrDefault("RDC_REGISTRATION_POLICY", "reuse");
  if (policy == "strict") {
    opts.registration_policy = RegistrationPolicy::kStrict;
  } else if (policy != "reuse") {
    info(stderr, "[options] unknown RDC_REGISTRATION_POLICY=%s, using reuse\n", policy.c_str());
  }
  std::string mode = getEnvOrDefault("RDC_REGISTRATION_MODE", "on_demand");
  if (mode == "explicit") {
    opts.registration_mode = RegistrationMode::kExplicit;
  } else if (mode != "on_demand") {
    info(stderr, "[options] unknown RDC_REGISTRATION_MODE=%s, using on_demand\n", mode.c_str());
  }

  opts.drain_timeout = std::chrono::milliseconds(
      getEnvOrDefault("RDC_DRAIN_TIMEOUT_MS", (int)opts.drain_timeout.count()));
  opts.static_queues = ParseQueueList(getEnvOrDefault("RDC_STATIC_QUEUES", ""));

  int batch = getEnvOrDefault("RDC_POLL_BATCH", opts.poll_batch);
  if (batch > 0) {
    opts.poll_batch = batch;
  }
  return opts;
}

}
