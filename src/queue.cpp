/*
 *
 *  queue.cpp
 *
 */

#include "queue.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rdc {

Queue::Queue(std::string name, uint64_t generation, uint32_t depth)
  : name_(std::move(name)), generation_(generation), depth_(depth),
  state_(QueueState::kConnecting), credits_(depth), remote_({0, 0, 0}),
  remote_cursor_(0), qp_num_(0) {}

QueueState Queue::GetState() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->state_;
}

uint32_t Queue::GetQpNum() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->qp_num_;
}

size_t Queue::InFlight() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->inflight_.size();
}

uint32_t Queue::Credits() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->credits_;
}

Status Queue::WaitIdle(std::chrono::milliseconds timeout) {
  return this->WaitIdleUntil(std::chrono::steady_clock::now() + timeout);
}

Status Queue::WaitIdleUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(this->mu_);
  bool idle = this->cv_.wait_until(lock, deadline, [this]{ return this->inflight_.empty(); });
  if (!idle) {
    return Status(StatusCode::kTimeout, std::to_string(this->inflight_.size()) + " writes still in flight on "
        + this->name_);
  }
  return Status();
}

void Queue::Bind(std::unique_ptr<transport::Channel> channel) {
  std::lock_guard<std::mutex> lock(this->mu_);
  this->remote_ = channel->GetRemoteRegion();
  this->qp_num_ = channel->GetQpNum();
  this->channel_ = std::move(channel);
  this->remote_cursor_ = 0;
  this->state_ = QueueState::kConnected;
}

std::vector<PendingWrite> Queue::TakeAllLocked(QueueState state) {
  std::vector<PendingWrite> taken;
  taken.reserve(this->inflight_.size());
  for (auto &it : this->inflight_) {
    taken.push_back(std::move(it.second));
  }
  this->inflight_.clear();
  this->credits_ = this->depth_;
  this->state_ = state;
  this->cv_.notify_all();
  return taken;
}

StatusOr<uint64_t> Queue::ReserveRemoteLocked(uint32_t length) {
  if (length > this->remote_.length) {
    return Status(StatusCode::kInvalidArgument, "write of " + std::to_string(length)
        + " bytes exceeds the remote region of " + std::to_string(this->remote_.length) + " bytes");
  }
  if (this->remote_cursor_ + length > this->remote_.length) {
    this->remote_cursor_ = 0;
  }
  uint64_t offset = this->remote_cursor_;
  this->remote_cursor_ += length;
  return offset;
}

}
