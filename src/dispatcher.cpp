/*
 *
 *  dispatcher.cpp
 *
 */

#include "dispatcher.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "rdc/error.hpp"

#include "debug.h"

namespace rdc {

namespace {
  Status checkSubmittable(const Queue *queue, QueueState state) {
    switch (state) {
      case QueueState::kConnected:
        return Status();
      case QueueState::kDraining:
      case QueueState::kClosed:
        return Status(StatusCode::kShuttingDown, "queue " + queue->GetName() + " is shutting down");
      default:
        return Status(StatusCode::kQueueUnavailable, "queue " + queue->GetName() + " is "
            + QueueStateName(state));
    }
  }
}

Status Dispatcher::AcquireCreditLocked(Queue *queue, std::unique_lock<std::mutex> &lock) {
  auto stat = checkSubmittable(queue, queue->state_);
  if (!stat.ok()) {
    return stat;
  }
  if (queue->credits_ > 0) {
    return Status();
  }
  if (this->backpressure_ == BackpressureMode::kFailFast) {
    return Status(StatusCode::kCreditExhausted, "all " + std::to_string(queue->depth_)
        + " credits of queue " + queue->name_ + " in use");
  }

  auto ready = [queue]{ return queue->credits_ > 0 || queue->state_ != QueueState::kConnected; };
  if (this->credit_wait_timeout_.count() > 0) {
    if (!queue->cv_.wait_for(lock, this->credit_wait_timeout_, ready)) {
      return Status(StatusCode::kCreditExhausted, "timed out waiting for a credit on queue " + queue->name_);
    }
  } else {
    queue->cv_.wait(lock, ready);
  }
  // the queue may have been drained or failed while we waited
  return checkSubmittable(queue, queue->state_);
}

StatusOr<WriteTicket> Dispatcher::Submit(const std::shared_ptr<Queue> &queue, const memory::Region &region,
    uint64_t remote_offset, uint32_t length) {
  if (length == 0) {
    return Status(StatusCode::kInvalidArgument, "write length must be positive");
  }
  if (length > region.length) {
    return Status(StatusCode::kInvalidArgument, "write of " + std::to_string(length)
        + " bytes exceeds the source span of " + std::to_string(region.length) + " bytes");
  }
  auto stat = this->registry_->Acquire(region);
  if (!stat.ok()) {
    return stat;
  }

  std::unique_lock<std::mutex> lock(queue->mu_);
  stat = this->AcquireCreditLocked(queue.get(), lock);
  if (!stat.ok()) {
    lock.unlock();
    this->registry_->Release(region.id);
    return stat;
  }

  uint64_t offset = remote_offset;
  if (remote_offset == kAppendOffset) {
    auto off_s = queue->ReserveRemoteLocked(length);
    if (!off_s.ok()) {
      lock.unlock();
      this->registry_->Release(region.id);
      return off_s.status();
    }
    offset = off_s.value();
  } else if (remote_offset > queue->remote_.length || length > queue->remote_.length - remote_offset) {
    lock.unlock();
    this->registry_->Release(region.id);
    return Status(StatusCode::kInvalidArgument, "remote span [" + std::to_string(remote_offset) + ", +"
        + std::to_string(length) + ") outside the region of queue " + queue->name_);
  }

  WorkRequest wr;
  wr.id = this->next_id_++;
  wr.region = region;
  wr.remote_offset = offset;
  wr.length = length;

  PendingWrite &pending = queue->inflight_[wr.id];
  pending.wr = wr;
  std::shared_future<CompletionRecord> completion = pending.promise.get_future().share();

  stat = queue->channel_->PostWrite(wr.id, region.lkey, region.addr, length,
      queue->remote_.addr + offset, queue->remote_.rkey);
  if (!stat.ok()) {
    queue->inflight_.erase(wr.id);
    lock.unlock();
    this->registry_->Release(region.id);
    return Status(StatusCode::kTransportError, stat.message()).Wrap("posting write to queue " + queue->GetName());
  }
  queue->credits_--;
  // counted before the poller can retire the write
  this->counters_->writes_submitted++;
  lock.unlock();

  debug(stderr, "posted write %lu to %s [len: %u, offset: %lu]\n", wr.id, queue->GetName().c_str(), length, offset);

  WriteTicket ticket;
  ticket.id = wr.id;
  ticket.queue = queue->GetName();
  ticket.completion = completion;
  return ticket;
}

}
