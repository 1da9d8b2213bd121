/*
 *
 *  options.hpp
 *
 *  Client configuration
 *
 */

#ifndef RDC_OPTIONS_HPP_
#define RDC_OPTIONS_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rdc {

enum class BackpressureMode {
  kBlock,     // PostWrite waits for a free credit
  kFailFast,  // PostWrite returns kCreditExhausted
};

enum class RegistrationPolicy {
  kReuse,   // spans contained in an existing registration reuse it
  kStrict,  // only exact (address, length) matches reuse a registration
};

enum class RegistrationMode {
  kOnDemand,  // PostWrite registers unknown buffers for the duration of the write
  kExplicit,  // PostWrite fails with kRegistrationRequired for unknown buffers
};

struct Options {
  std::string remote_addr;
  int remote_port = 18515;
  std::string source_addr;
  std::string device_name;

  uint32_t queue_depth = 64;
  BackpressureMode backpressure = BackpressureMode::kBlock;
  // Zero waits without bound
  std::chrono::milliseconds credit_wait_timeout{0};

  RegistrationPolicy registration_policy = RegistrationPolicy::kReuse;
  RegistrationMode registration_mode = RegistrationMode::kOnDemand;

  std::chrono::milliseconds drain_timeout{1000};
  std::vector<std::string> static_queues;

  int poll_batch = 16;
  std::chrono::microseconds poll_idle_sleep{50};

  uint8_t retry_count = 7;
  uint8_t rnr_retry_count = 7;
};

// Returns the default options overlaid with RDC_* environment variables
Options OptionsFromEnv();

// Splits a comma separated list, trimming whitespace and dropping empty entries
std::vector<std::string> ParseQueueList(const std::string &list);

}

#endif // RDC_OPTIONS_HPP_
