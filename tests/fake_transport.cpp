/*
 *
 *  fake_transport.cpp
 *
 */

#include "fake_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "rdc/error.hpp"

namespace rdc {
namespace fake {

namespace {
  const uint64_t kRemoteBase = 0x10000000;

  struct ibv_wc makeWc(uint64_t wr_id, enum ibv_wc_status status, uint32_t byte_len, uint32_t qp_num) {
    struct ibv_wc wc;
    memset(&wc, 0, sizeof wc);
    wc.wr_id = wr_id;
    wc.status = status;
    wc.opcode = IBV_WC_RDMA_WRITE;
    wc.byte_len = byte_len;
    wc.qp_num = qp_num;
    return wc;
  }

  void track(QueuePairState *qp) {
    qp->max_outstanding = std::max(qp->max_outstanding, qp->posted.size() + qp->completed.size());
  }
}

void Fabric::FailNextConnects(int n) {
  std::lock_guard<std::mutex> lock(this->mu_);
  this->fail_connects_ = n;
}

Status Fabric::Open() {
  std::lock_guard<std::mutex> lock(this->mu_);
  this->opens_++;
  if (!this->device_present) {
    return Status(StatusCode::kDeviceUnavailable, "no RDMA device found");
  }
  return Status();
}

int Fabric::Opens() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->opens_;
}

int Fabric::Connects(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto it = this->connects_.find(name);
  return it == this->connects_.end() ? 0 : it->second;
}

int Fabric::TotalConnects() {
  std::lock_guard<std::mutex> lock(this->mu_);
  int total = 0;
  for (auto &it : this->connects_) {
    total += it.second;
  }
  return total;
}

size_t Fabric::Registrations() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->registrations_.size();
}

int Fabric::RegisterCalls() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->register_calls_;
}

std::shared_ptr<QueuePairState> Fabric::Current(const std::string &name) {
  auto it = this->qps_.find(name);
  if (it == this->qps_.end()) {
    return nullptr;
  }
  return it->second;
}

uint32_t Fabric::QpNum(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  return qp ? qp->qp_num : 0;
}

size_t Fabric::Posted(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  return qp ? qp->posted.size() : 0;
}

size_t Fabric::MaxOutstanding(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  return qp ? qp->max_outstanding : 0;
}

std::vector<char> Fabric::Remote(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  return qp ? qp->remote : std::vector<char>();
}

void Fabric::CompleteAll(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  if (!qp) {
    return;
  }
  while (!qp->posted.empty()) {
    qp->completed.push_back(qp->posted.front());
    qp->posted.pop_front();
  }
}

void Fabric::CompleteNext(const std::string &name, enum ibv_wc_status status) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto qp = this->Current(name);
  if (!qp || qp->posted.empty()) {
    return;
  }
  struct ibv_wc wc = qp->posted.front();
  qp->posted.pop_front();
  wc.status = status;
  qp->completed.push_back(wc);
}

void Fabric::InjectAsyncEvent(transport::AsyncEvent ev) {
  std::lock_guard<std::mutex> lock(this->mu_);
  this->events_.push_back(ev);
}

Status Channel::Close() {
  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  if (this->qp_->closed) {
    return Status(StatusCode::kTransportError, "queue pair already disconnected");
  }
  this->qp_->closed = true;
  return Status();
}

uint32_t Channel::GetQpNum() {
  return this->qp_->qp_num;
}

transport::RemoteRegion Channel::GetRemoteRegion() {
  transport::RemoteRegion remote;
  remote.addr = kRemoteBase;
  remote.rkey = this->rkey_;
  remote.length = this->qp_->remote.size();
  return remote;
}

Status Channel::PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, uint32_t size,
    uint64_t remote_addr, uint32_t rkey) {
  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  if (this->qp_->closed) {
    return Status(StatusCode::kTransportError, "queue pair is disconnected");
  }
  enum ibv_wc_status status = IBV_WC_SUCCESS;
  auto reg = this->fabric_->registrations_.find(lkey);
  uint64_t start = (uint64_t)(uintptr_t)addr;
  if (reg == this->fabric_->registrations_.end() || start < reg->second.first
      || start + size > reg->second.first + reg->second.second) {
    status = IBV_WC_LOC_PROT_ERR;
  } else if (rkey != this->rkey_ || remote_addr < kRemoteBase
      || remote_addr + size > kRemoteBase + this->qp_->remote.size()) {
    status = IBV_WC_REM_ACCESS_ERR;
  } else {
    memcpy(this->qp_->remote.data() + (remote_addr - kRemoteBase), addr, size);
  }

  struct ibv_wc wc = makeWc(ctx, status, size, this->qp_->qp_num);
  if (this->fabric_->auto_complete || status != IBV_WC_SUCCESS) {
    this->qp_->completed.push_back(wc);
  } else {
    this->qp_->posted.push_back(wc);
  }
  track(this->qp_.get());
  return Status();
}

StatusOr<int> Channel::PollSendCq(int max_wc, struct ibv_wc *wcs) {
  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  int n = 0;
  while (n < max_wc && !this->qp_->completed.empty()) {
    wcs[n++] = this->qp_->completed.front();
    this->qp_->completed.pop_front();
  }
  return n;
}

Status Device::Close() {
  return Status();
}

std::string Device::GetName() {
  return "fake0";
}

StatusOr<transport::MemoryKeys> Device::RegisterMemory(void *addr, size_t length) {
  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  this->fabric_->register_calls_++;
  uint64_t handle = this->fabric_->next_handle_++;
  this->fabric_->registrations_[handle] = std::make_pair((uint64_t)(uintptr_t)addr, length);
  transport::MemoryKeys keys;
  keys.handle = handle;
  keys.lkey = handle;
  keys.rkey = handle + 1000;
  return keys;
}

Status Device::DeregisterMemory(uint64_t handle) {
  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  if (this->fabric_->registrations_.erase(handle) == 0) {
    return Status(StatusCode::kTransportError, "unknown registration " + std::to_string(handle));
  }
  return Status();
}

StatusOr<std::unique_ptr<transport::Channel>> Device::Connect(const std::string &queue_name,
    const transport::ChannelOptions &opts) {
  std::chrono::milliseconds delay;
  bool fail = false;
  {
    std::lock_guard<std::mutex> lock(this->fabric_->mu_);
    this->fabric_->connects_[queue_name]++;
    delay = this->fabric_->connect_delay;
    if (this->fabric_->fail_connects_ > 0) {
      this->fabric_->fail_connects_--;
      fail = true;
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  if (fail) {
    return Status(StatusCode::kQueueUnavailable, "connection to " + queue_name + " refused");
  }

  std::lock_guard<std::mutex> lock(this->fabric_->mu_);
  auto qp = std::make_shared<QueuePairState>();
  qp->name = queue_name;
  qp->qp_num = this->fabric_->next_qp_++;
  qp->closed = false;
  qp->remote.assign(this->fabric_->remote_length, 0);
  qp->max_outstanding = 0;
  this->fabric_->qps_[queue_name] = qp;
  (void)opts;
  return std::unique_ptr<transport::Channel>(new Channel(this->fabric_, qp, 0xbeef));
}

StatusOr<bool> Device::GetAsyncEvent(transport::AsyncEvent *ev, int timeout_ms) {
  {
    std::lock_guard<std::mutex> lock(this->fabric_->mu_);
    if (!this->fabric_->events_.empty()) {
      *ev = this->fabric_->events_.front();
      this->fabric_->events_.pop_front();
      return true;
    }
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 5)));
  return false;
}

DeviceOpener Opener(std::shared_ptr<Fabric> fabric) {
  return [fabric](const Options &opts) -> StatusOr<std::unique_ptr<transport::Device>> {
    (void)opts;
    auto stat = fabric->Open();
    if (!stat.ok()) {
      return stat;
    }
    return std::unique_ptr<transport::Device>(new Device(fabric));
  };
}

Options TestOptions() {
  Options opts;
  opts.remote_addr = "fake";
  opts.queue_depth = 4;
  opts.poll_idle_sleep = std::chrono::microseconds(20);
  opts.drain_timeout = std::chrono::milliseconds(200);
  return opts;
}

}
}
