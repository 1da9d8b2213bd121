/*
 *
 *  verbs_device.cpp
 *
 */

#include "verbs_device.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#include <infiniband/verbs.h>
#include <rdma/rdma_cma.h>

#include "rdc/error.hpp"
#include "rdc/transport.hpp"

#include "async_events.hpp"
#include "debug.h"
#include "endpoint.hpp"
#include "handshake.hpp"

namespace rdc {

Status VerbsChannel::Close() {
  return this->ep_->Close();
}

uint32_t VerbsChannel::GetQpNum() {
  return this->ep_->GetQpNum();
}

transport::RemoteRegion VerbsChannel::GetRemoteRegion() {
  return this->remote_;
}

Status VerbsChannel::PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, uint32_t size,
    uint64_t remote_addr, uint32_t rkey) {
  return this->ep_->PostWrite(ctx, lkey, addr, size, remote_addr, rkey);
}

StatusOr<int> VerbsChannel::PollSendCq(int max_wc, struct ibv_wc *wcs) {
  return this->ep_->PollSendCq(max_wc, wcs);
}

VerbsDevice::~VerbsDevice() {
  if (this->pd_ != nullptr) {
    auto stat = this->Close();
    if (!stat.ok()) {
      info_wtime(stderr, "[verbs] %s\n", stat.message().c_str());
    }
  }
}

Status VerbsDevice::Close() {
  if (this->pd_ == nullptr) {
    return Status();
  }
  int ret = ibv_dealloc_pd(this->pd_);
  this->pd_ = nullptr;
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(ret) + " deallocating protection domain");
  }
  return Status();
}

std::string VerbsDevice::GetName() {
  return ibv_get_device_name(this->ctx_->device);
}

StatusOr<transport::MemoryKeys> VerbsDevice::RegisterMemory(void *addr, size_t length) {
  // the buffers are only ever the source of local reads by the HCA
  struct ibv_mr *mr = ibv_reg_mr(this->pd_, addr, length, 0);
  if (mr == nullptr) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " registering memory: "
        + std::string(strerror(errno)));
  }
  transport::MemoryKeys keys;
  keys.handle = (uint64_t)(uintptr_t)mr;
  keys.lkey = mr->lkey;
  keys.rkey = mr->rkey;
  return keys;
}

Status VerbsDevice::DeregisterMemory(uint64_t handle) {
  int ret = ibv_dereg_mr((struct ibv_mr *)(uintptr_t)handle);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(ret) + " deregistering memory");
  }
  return Status();
}

StatusOr<std::unique_ptr<transport::Channel>> VerbsDevice::Connect(const std::string &queue_name,
    const transport::ChannelOptions &opts) {
  if (this->remote_addr_.empty()) {
    return Status(StatusCode::kInvalidArgument, "no remote address configured");
  }
  if (queue_name.empty() || queue_name.size() > kHandshakeNameLength) {
    return Status(StatusCode::kInvalidArgument, "queue name does not fit the handshake");
  }

  QueueHello hello;
  memset(&hello, 0, sizeof hello);
  hello.magic = kHandshakeMagic;
  hello.version = kHandshakeVersion;
  hello.name_len = queue_name.size();
  memcpy(hello.name, queue_name.data(), queue_name.size());

  endpoint::Options ep_opts;
  memset(&ep_opts, 0, sizeof ep_opts);
  ep_opts.pd = this->pd_;
  ep_opts.qp_attr.qp_type = IBV_QPT_RC;
  ep_opts.qp_attr.cap.max_send_wr = opts.max_send_wr;
  ep_opts.qp_attr.cap.max_recv_wr = 1;
  ep_opts.qp_attr.cap.max_send_sge = 1;
  ep_opts.qp_attr.cap.max_recv_sge = 1;
  ep_opts.qp_attr.cap.max_inline_data = opts.max_inline_data;
  ep_opts.private_data = &hello;
  ep_opts.private_data_len = sizeof hello;
  ep_opts.src = this->source_addr_.empty() ? nullptr : this->source_addr_.c_str();
  ep_opts.responder_resources = 1;
  ep_opts.initiator_depth = 1;
  ep_opts.retry_count = opts.retry_count;
  ep_opts.rnr_retry_count = opts.rnr_retry_count;

  auto ep_s = endpoint::Dial(this->remote_addr_, this->remote_port_, ep_opts);
  if (!ep_s.ok()) {
    if (ep_s.status().code() == StatusCode::kInvalidArgument) {
      return ep_s.status();
    }
    return Status(StatusCode::kQueueUnavailable, ep_s.status().message());
  }
  std::unique_ptr<endpoint::Endpoint> ep(ep_s.value());

  void *buf;
  size_t len = ep->GetConnectionInfo(&buf);
  if (len < sizeof(QueueWelcome)) {
    auto stat = ep->Close();
    if (!stat.ok()) {
      debug(stderr, "closing rejected endpoint: %s\n", stat.message().c_str());
    }
    return Status(StatusCode::kQueueUnavailable, "server did not describe remote memory for " + queue_name);
  }
  QueueWelcome welcome;
  memcpy(&welcome, buf, sizeof welcome);
  if (welcome.magic != kHandshakeMagic || welcome.length == 0) {
    auto stat = ep->Close();
    if (!stat.ok()) {
      debug(stderr, "closing rejected endpoint: %s\n", stat.message().c_str());
    }
    return Status(StatusCode::kQueueUnavailable, "unexpected handshake reply for " + queue_name);
  }

  transport::RemoteRegion remote;
  remote.addr = welcome.addr;
  remote.rkey = welcome.rkey;
  remote.length = welcome.length;
  debug(stderr, "queue %s writes to [addr: %lu, rkey: %u, len: %u]\n", queue_name.c_str(), remote.addr,
      remote.rkey, remote.length);
  return std::unique_ptr<transport::Channel>(new VerbsChannel(std::move(ep), remote));
}

StatusOr<bool> VerbsDevice::GetAsyncEvent(transport::AsyncEvent *ev, int timeout_ms) {
  struct pollfd pfd;
  pfd.fd = this->ctx_->async_fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int ret = poll(&pfd, 1, timeout_ms);
  if (ret < 0) {
    if (errno == EINTR) {
      return false;
    }
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " polling async events");
  }
  if (ret == 0) {
    return false;
  }

  struct ibv_async_event iev;
  ret = ibv_get_async_event(this->ctx_, &iev);
  if (ret) {
    if (errno == EAGAIN) {
      return false;
    }
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " getting async event");
  }
  LogAsyncEvent(this->ctx_, iev);
  *ev = TranslateAsyncEvent(iev);
  ibv_ack_async_event(&iev);
  return true;
}

StatusOr<std::unique_ptr<transport::Device>> OpenVerbsDevice(const Options &opts) {
  int num_devices = 0;
  struct ibv_context **devices = rdma_get_devices(&num_devices);
  if (devices == nullptr) {
    return Status(StatusCode::kDeviceUnavailable, "error " + std::to_string(errno) + " listing RDMA devices");
  }
  struct ibv_context *ctx = nullptr;
  for (int i = 0; i < num_devices; i++) {
    if (opts.device_name.empty() || opts.device_name == ibv_get_device_name(devices[i]->device)) {
      ctx = devices[i];
      break;
    }
  }
  rdma_free_devices(devices);
  if (ctx == nullptr) {
    if (opts.device_name.empty()) {
      return Status(StatusCode::kDeviceUnavailable, "no RDMA device found");
    }
    return Status(StatusCode::kDeviceUnavailable, "RDMA device " + opts.device_name + " not found");
  }

  struct ibv_pd *pd = ibv_alloc_pd(ctx);
  if (pd == nullptr) {
    return Status(StatusCode::kDeviceUnavailable, "error " + std::to_string(errno) + " allocating protection domain on "
        + std::string(ibv_get_device_name(ctx->device)));
  }

  // async events are waited for with poll so the trail can be stopped
  int flags = fcntl(ctx->async_fd, F_GETFL);
  if (flags < 0 || fcntl(ctx->async_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    ibv_dealloc_pd(pd);
    return Status(StatusCode::kDeviceUnavailable, "error " + std::to_string(errno) + " configuring async event fd");
  }

  info_wtime(stderr, "[verbs] opened device %s\n", ibv_get_device_name(ctx->device));
  return std::unique_ptr<transport::Device>(new VerbsDevice(ctx, pd, opts));
}

}
