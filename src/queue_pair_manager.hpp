/*
 *
 *  queue_pair_manager.hpp
 *
 *  Maps queue names to connected queue pairs
 *
 */

#ifndef RDC_QUEUE_PAIR_MANAGER_HPP_
#define RDC_QUEUE_PAIR_MANAGER_HPP_

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rdc/error.hpp"
#include "rdc/options.hpp"
#include "rdc/transport.hpp"
#include "rdc/write.hpp"

#include "counters.hpp"
#include "memory_registry.hpp"
#include "queue.hpp"

namespace rdc {

const size_t kMaxQueueNameLength = 32;

class QueuePairManager {
  public:
    QueuePairManager(transport::Device *device, memory::Registry *registry, const Options &opts,
        Counters *counters);
    ~QueuePairManager() = default;

    // Returns the connected queue for name, connecting it first if needed.
    // Concurrent callers for the same unbound name share one handshake.
    StatusOr<std::shared_ptr<Queue>> ResolveOrCreate(const std::string &name);

    // Returns the live queue for name or nullptr
    std::shared_ptr<Queue> Find(const std::string &name);
    QueueState GetState(const std::string &name);

    // Connected -> Error. Fails every in-flight write with reason and evicts the
    // queue so the next ResolveOrCreate performs a new handshake.
    void FailQueue(const std::shared_ptr<Queue> &queue, const Status &reason);
    void FailQueueByQpNum(uint32_t qp_num, const Status &reason);
    void FailAll(const Status &reason);

    // Queues with a bound queue pair
    std::vector<std::shared_ptr<Queue>> Snapshot();

    // Connected -> Draining -> Closed for every queue. Writes still in flight
    // after drain_timeout fail with kShuttingDown.
    Status Shutdown(std::chrono::milliseconds drain_timeout);

  private:
    struct Slot {
      std::shared_ptr<Queue> queue;
      std::shared_future<Status> handshake;
    };

    StatusOr<std::shared_ptr<Queue>> Await(const Slot &slot);
    void Complete(std::vector<PendingWrite> &failed, const Status &reason);

    transport::Device *device_;
    memory::Registry *registry_;
    Counters *counters_;
    transport::ChannelOptions channel_opts_;
    uint32_t depth_;

    std::mutex mu_;
    bool shutting_down_;
    uint64_t next_generation_;
    std::map<std::string, Slot> queues_;
};

}

#endif // RDC_QUEUE_PAIR_MANAGER_HPP_
