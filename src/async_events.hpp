/*
 *
 *  async_events.hpp
 *
 *  functions to handle asynchronous events for an RDMA device
 *
 */

#ifndef RDC_ASYNC_EVENTS_HPP_
#define RDC_ASYNC_EVENTS_HPP_

#include <atomic>
#include <functional>
#include <thread>
#include <utility>

#include <infiniband/verbs.h>

#include "rdc/error.hpp"
#include "rdc/transport.hpp"

namespace rdc {

// Prints the provided event to stderr
void LogAsyncEvent(struct ibv_context *ctx, const struct ibv_async_event &ev);

// Maps a verbs event onto the events the client reacts to
transport::AsyncEvent TranslateAsyncEvent(const struct ibv_async_event &ev);

/*
 * Background thread forwarding the asynchronous events of a device to a
 * handler. The handler runs on the trail thread and must not block.
 */
class AsyncEventTrail {
  public:
    using Handler = std::function<void(const transport::AsyncEvent &)>;

    AsyncEventTrail(transport::Device *device, Handler handler)
      : device_(device), handler_(std::move(handler)), running_(false) {};
    ~AsyncEventTrail();

    void Start();
    void Stop();

  private:
    void Run();

    transport::Device *device_;
    Handler handler_;
    std::atomic<bool> running_;
    std::thread thread_;
};

}

#endif // RDC_ASYNC_EVENTS_HPP_
