/*
 *
 *  queue.hpp
 *
 *  A named logical queue bound to one RDMA queue pair
 *
 */

#ifndef RDC_QUEUE_HPP_
#define RDC_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/transport.hpp"
#include "rdc/write.hpp"

namespace rdc {

struct WorkRequest {
  uint64_t id;
  memory::Region region;
  uint64_t remote_offset;
  uint32_t length;
};

struct PendingWrite {
  WorkRequest wr;
  std::promise<CompletionRecord> promise;
};

/*
 * All mutable state of a queue (state machine, credits, in-flight writes and
 * the remote write cursor) is guarded by the queue's own mutex. No code path
 * holds the mutex of two queues at once.
 *
 * The invariant credits_ + inflight_.size() == depth_ holds whenever the
 * mutex is released.
 */
class Queue {
  public:
    Queue(std::string name, uint64_t generation, uint32_t depth);
    ~Queue() = default;

    const std::string &GetName() const { return name_; }
    uint64_t GetGeneration() const { return generation_; }
    uint32_t GetDepth() const { return depth_; }

    QueueState GetState();
    uint32_t GetQpNum();
    size_t InFlight();
    uint32_t Credits();

    // Waits until no writes are in flight. Returns kTimeout otherwise.
    Status WaitIdle(std::chrono::milliseconds timeout);
    Status WaitIdleUntil(std::chrono::steady_clock::time_point deadline);

  private:
    friend class QueuePairManager;
    friend class Dispatcher;
    friend class CompletionPoller;

    // Connecting -> Connected
    void Bind(std::unique_ptr<transport::Channel> channel);

    // Moves all in-flight writes out and sets the new state. Credits are returned.
    std::vector<PendingWrite> TakeAllLocked(QueueState state);

    // Next destination offset for a write of length bytes, wrapping to the
    // start of the remote region when the write does not fit at the end.
    StatusOr<uint64_t> ReserveRemoteLocked(uint32_t length);

    const std::string name_;
    const uint64_t generation_;
    const uint32_t depth_;

    std::mutex mu_;
    std::condition_variable cv_;
    QueueState state_;
    uint32_t credits_;
    std::map<uint64_t, PendingWrite> inflight_;

    std::unique_ptr<transport::Channel> channel_;
    transport::RemoteRegion remote_;
    uint64_t remote_cursor_;
    uint32_t qp_num_;
};

}

#endif // RDC_QUEUE_HPP_
