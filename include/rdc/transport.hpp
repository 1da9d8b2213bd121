/*
 *
 *  transport.hpp
 *
 *  Common interfaces between the client core and the RDMA provider
 *
 */

#ifndef RDC_TRANSPORT_HPP_
#define RDC_TRANSPORT_HPP_

#include <stddef.h>

#include <cstdint>
#include <memory>
#include <string>

#include <infiniband/verbs.h>

#include "rdc/error.hpp"

namespace rdc {
namespace transport {

// Memory the remote peer exposes to a queue during the handshake
struct RemoteRegion {
  uint64_t    addr;
  uint32_t    rkey;
  uint32_t    length;
};

struct MemoryKeys {
  uint64_t    handle;
  uint32_t    lkey;
  uint32_t    rkey;
};

struct ChannelOptions {
  uint32_t max_send_wr;
  uint32_t max_inline_data;
  uint8_t retry_count;
  uint8_t rnr_retry_count;
};

enum class AsyncEventType {
  kQpFatal,
  kCqError,
  kDeviceFatal,
  kPortError,
  kOther,
};

struct AsyncEvent {
  AsyncEventType type;
  uint32_t qp_num;
};

/*
 * One connected queue pair with its send completion queue.
 */
class Channel {
  public:
    virtual ~Channel() = default;

    // Disconnects from the peer. The queue pair is released on destruction.
    virtual Status Close() = 0;

    virtual uint32_t GetQpNum() = 0;
    virtual RemoteRegion GetRemoteRegion() = 0;

    // Posts a signaled RDMA WRITE with ctx as work request id
    virtual Status PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, uint32_t size,
        uint64_t remote_addr, uint32_t rkey) = 0;

    // Retrieves up to max_wc completions without blocking. Returns the number retrieved.
    virtual StatusOr<int> PollSendCq(int max_wc, struct ibv_wc *wcs) = 0;
};

/*
 * An opened RDMA device with its protection domain.
 */
class Device {
  public:
    virtual ~Device() = default;

    virtual Status Close() = 0;
    virtual std::string GetName() = 0;

    virtual StatusOr<MemoryKeys> RegisterMemory(void *addr, size_t length) = 0;
    virtual Status DeregisterMemory(uint64_t handle) = 0;

    // Creates a queue pair and performs the connection handshake for queue_name
    virtual StatusOr<std::unique_ptr<Channel>> Connect(const std::string &queue_name,
        const ChannelOptions &opts) = 0;

    // Waits up to timeout_ms for an asynchronous device event. Returns false if none arrived.
    virtual StatusOr<bool> GetAsyncEvent(AsyncEvent *ev, int timeout_ms) = 0;
};

}
}

#endif // RDC_TRANSPORT_HPP_
