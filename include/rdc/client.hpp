/*
 *
 *  client.hpp
 *
 *  Client side of the RDMA write transport
 *
 */

#ifndef RDC_CLIENT_HPP_
#define RDC_CLIENT_HPP_

#include <stddef.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/options.hpp"
#include "rdc/stats.hpp"
#include "rdc/transport.hpp"
#include "rdc/write.hpp"

namespace rdc {

namespace memory {
class Registry;
}
class QueuePairManager;
class Dispatcher;
class CompletionPoller;
class AsyncEventTrail;
struct Counters;

using DeviceOpener = std::function<StatusOr<std::unique_ptr<transport::Device>>(const Options &)>;

/*
 * Owns the device, the memory registry, all queues and the completion poller.
 *
 *   Client client(OptionsFromEnv());
 *   auto stat = client.Initialize();
 *   auto ticket = client.PostWrite("ingest", memory::ConstBuffer(buf, len), len);
 *   auto record = client.Wait(ticket.value(), std::chrono::seconds(1));
 *
 * The caller keeps a buffer alive and unmodified until the writes reading from
 * it completed, e.g. by waiting for their tickets or WaitIdle on the queue.
 *
 * All methods are safe to call concurrently.
 */
class Client {
  public:
    explicit Client(Options opts);
    Client(Options opts, DeviceOpener opener);
    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    // Opens the device, starts the completion poller and connects the static
    // queues. Calling it again while initialized is a no-op. A failed attempt
    // is final and later calls return kAlreadyFailed.
    Status Initialize();

    // Writes the first length bytes of buffer to the remote region of queue.
    // The queue is connected on first use.
    StatusOr<WriteTicket> PostWrite(const std::string &queue, memory::ConstBuffer buffer, size_t length);

    // Drains in-flight writes for at most the configured drain timeout, then
    // closes every queue and releases all registrations. The client may be
    // initialized again afterwards.
    Status Shutdown();

    StatusOr<memory::Region> RegisterMemory(memory::ConstBuffer buffer);
    Status DeregisterMemory(const memory::Region &region);

    // Waits for the completion of a write. On kTimeout the write stays in flight.
    StatusOr<CompletionRecord> Wait(const WriteTicket &ticket, std::chrono::milliseconds timeout);

    // Waits until queue has no writes in flight
    Status WaitIdle(const std::string &queue, std::chrono::milliseconds timeout);

    QueueState GetQueueState(const std::string &queue);
    ClientStats GetStats();
    bool Ready();

  private:
    enum class State {
      kUninitialized,
      kReady,
      kFailed,
    };

    // Requires the lifecycle mutex and an exclusive lock of mu_
    void TearDown();
    Status CheckReady();

    const Options opts_;
    DeviceOpener opener_;
    std::unique_ptr<Counters> counters_;

    // Serializes Initialize and Shutdown
    std::mutex lifecycle_mu_;
    // Held shared by operations using the components, exclusively to replace them
    std::shared_timed_mutex mu_;
    State state_;
    Status failure_;

    std::unique_ptr<transport::Device> device_;
    std::unique_ptr<memory::Registry> registry_;
    std::unique_ptr<QueuePairManager> manager_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<CompletionPoller> poller_;
    std::unique_ptr<AsyncEventTrail> trail_;
};

}

#endif // RDC_CLIENT_HPP_
