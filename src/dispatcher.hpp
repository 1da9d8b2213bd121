/*
 *
 *  dispatcher.hpp
 *
 *  Submits RDMA writes to a connected queue under credit based flow control
 *
 */

#ifndef RDC_DISPATCHER_HPP_
#define RDC_DISPATCHER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/options.hpp"
#include "rdc/write.hpp"

#include "counters.hpp"
#include "memory_registry.hpp"
#include "queue.hpp"

namespace rdc {

// Destination offset asking the dispatcher to place the write at the queue's remote cursor
const uint64_t kAppendOffset = UINT64_MAX;

class Dispatcher {
  public:
    Dispatcher(memory::Registry *registry, const Options &opts, Counters *counters)
      : registry_(registry), backpressure_(opts.backpressure),
      credit_wait_timeout_(opts.credit_wait_timeout), counters_(counters), next_id_(1) {};
    ~Dispatcher() = default;

    // Posts a signaled RDMA WRITE of the first length bytes of region to
    // remote_offset in the queue's remote region. The returned ticket resolves
    // once the poller or a failure path retires the write.
    //
    // Within a queue, ids are allocated and writes posted in submission order.
    StatusOr<WriteTicket> Submit(const std::shared_ptr<Queue> &queue, const memory::Region &region,
        uint64_t remote_offset, uint32_t length);

  private:
    Status AcquireCreditLocked(Queue *queue, std::unique_lock<std::mutex> &lock);

    memory::Registry *registry_;
    BackpressureMode backpressure_;
    std::chrono::milliseconds credit_wait_timeout_;
    Counters *counters_;
    std::atomic<uint64_t> next_id_;
};

}

#endif // RDC_DISPATCHER_HPP_
