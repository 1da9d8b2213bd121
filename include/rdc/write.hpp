/*
 *
 *  write.hpp
 *
 *  Outcome of a posted RDMA write and the state of the queue carrying it
 *
 */

#ifndef RDC_WRITE_HPP_
#define RDC_WRITE_HPP_

#include <cstdint>
#include <future>
#include <string>

#include "rdc/error.hpp"

namespace rdc {

enum class QueueState {
  kUnbound,
  kConnecting,
  kConnected,
  kDraining,
  kClosed,
  kError,
};

const char *QueueStateName(QueueState state);

struct CompletionRecord {
  uint64_t id;
  Status status;
  uint32_t byte_len;
};

// Returned by a successful submission. Dropping the ticket detaches the
// caller; the write still completes and its credit is still returned.
struct WriteTicket {
  uint64_t id;
  std::string queue;
  std::shared_future<CompletionRecord> completion;
};

}

#endif // RDC_WRITE_HPP_
