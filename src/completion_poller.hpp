/*
 *
 *  completion_poller.hpp
 *
 *  Drains the send completion queues of all live queues and retires writes
 *
 */

#ifndef RDC_COMPLETION_POLLER_HPP_
#define RDC_COMPLETION_POLLER_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <infiniband/verbs.h>

#include "readerwriterqueue.h"

#include "rdc/error.hpp"
#include "rdc/transport.hpp"

#include "counters.hpp"
#include "memory_registry.hpp"
#include "queue.hpp"
#include "queue_pair_manager.hpp"

namespace rdc {

// Whether a completion with status leaves the queue pair unusable
bool IsConnectionFatal(enum ibv_wc_status status);

/*
 * A single thread cycles over all live queues. Each visit retrieves at most
 * poll_batch completions, so a busy queue delays the others by one sweep at
 * most.
 *
 * Asynchronous device events are pushed by exactly one producer thread and
 * handled on the poller thread, before each sweep.
 */
class CompletionPoller {
  public:
    CompletionPoller(QueuePairManager *manager, memory::Registry *registry, Counters *counters,
        int poll_batch, std::chrono::microseconds idle_sleep);
    ~CompletionPoller();

    Status Start();
    void Stop();
    bool Running() const { return running_.load(); }

    void PushAsyncEvent(const transport::AsyncEvent &ev);

    // Handles pending async events and visits every live queue once.
    // Returns the number of completions retired.
    int PollOnce();

  private:
    void Run();
    void HandleAsyncEvent(const transport::AsyncEvent &ev);
    int DrainQueue(const std::shared_ptr<Queue> &queue);

    QueuePairManager *manager_;
    memory::Registry *registry_;
    Counters *counters_;
    int poll_batch_;
    std::chrono::microseconds idle_sleep_;

    std::vector<struct ibv_wc> wcs_;
    moodycamel::ReaderWriterQueue<transport::AsyncEvent> events_;

    std::atomic<bool> running_;
    std::thread thread_;
};

}

#endif // RDC_COMPLETION_POLLER_HPP_
