/*
 *
 *  verbs_device.hpp
 *
 *  Transport over libibverbs and librdmacm
 *
 */

#ifndef RDC_VERBS_DEVICE_HPP_
#define RDC_VERBS_DEVICE_HPP_

#include <stddef.h>

#include <cstdint>
#include <memory>
#include <string>

#include <infiniband/verbs.h>

#include "rdc/error.hpp"
#include "rdc/options.hpp"
#include "rdc/transport.hpp"

#include "endpoint.hpp"

namespace rdc {

class VerbsChannel : public transport::Channel {
  public:
    VerbsChannel(std::unique_ptr<endpoint::Endpoint> ep, transport::RemoteRegion remote)
      : ep_(std::move(ep)), remote_(remote) {};
    ~VerbsChannel() = default;

    Status Close();
    uint32_t GetQpNum();
    transport::RemoteRegion GetRemoteRegion();

    Status PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, uint32_t size,
        uint64_t remote_addr, uint32_t rkey);
    StatusOr<int> PollSendCq(int max_wc, struct ibv_wc *wcs);

  private:
    std::unique_ptr<endpoint::Endpoint> ep_;
    transport::RemoteRegion remote_;
};

/*
 * One opened device and protection domain shared by every queue. Queue pairs
 * are created through rdma_cm towards the configured remote endpoint.
 */
class VerbsDevice : public transport::Device {
  public:
    VerbsDevice(struct ibv_context *ctx, struct ibv_pd *pd, const Options &opts)
      : ctx_(ctx), pd_(pd), remote_addr_(opts.remote_addr), remote_port_(opts.remote_port),
      source_addr_(opts.source_addr) {};
    ~VerbsDevice();

    Status Close();
    std::string GetName();

    StatusOr<transport::MemoryKeys> RegisterMemory(void *addr, size_t length);
    Status DeregisterMemory(uint64_t handle);

    StatusOr<std::unique_ptr<transport::Channel>> Connect(const std::string &queue_name,
        const transport::ChannelOptions &opts);

    StatusOr<bool> GetAsyncEvent(transport::AsyncEvent *ev, int timeout_ms);

  private:
    struct ibv_context *ctx_;
    struct ibv_pd *pd_;

    std::string remote_addr_;
    int remote_port_;
    std::string source_addr_;
};

// Opens the device named in opts, or the first one found
StatusOr<std::unique_ptr<transport::Device>> OpenVerbsDevice(const Options &opts);

}

#endif // RDC_VERBS_DEVICE_HPP_
