/*
 *
 *  queue_pair_manager.cpp
 *
 */

#include "queue_pair_manager.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "rdc/error.hpp"

#include "debug.h"

namespace rdc {

QueuePairManager::QueuePairManager(transport::Device *device, memory::Registry *registry,
    const Options &opts, Counters *counters)
  : device_(device), registry_(registry), counters_(counters), depth_(opts.queue_depth),
  shutting_down_(false), next_generation_(1) {
  this->channel_opts_.max_send_wr = opts.queue_depth;
  this->channel_opts_.max_inline_data = 0;
  this->channel_opts_.retry_count = opts.retry_count;
  this->channel_opts_.rnr_retry_count = opts.rnr_retry_count;
}

StatusOr<std::shared_ptr<Queue>> QueuePairManager::ResolveOrCreate(const std::string &name) {
  if (name.empty() || name.size() > kMaxQueueNameLength) {
    return Status(StatusCode::kInvalidArgument, "queue name must be 1 to "
        + std::to_string(kMaxQueueNameLength) + " bytes");
  }

  std::unique_lock<std::mutex> lock(this->mu_);
  if (this->shutting_down_) {
    return Status(StatusCode::kShuttingDown, "client is shutting down");
  }
  auto it = this->queues_.find(name);
  if (it != this->queues_.end()) {
    Slot slot = it->second;
    lock.unlock();
    return this->Await(slot);
  }

  auto queue = std::make_shared<Queue>(name, this->next_generation_++, this->depth_);
  std::promise<Status> handshake;
  Slot slot;
  slot.queue = queue;
  slot.handshake = handshake.get_future().share();
  this->queues_[name] = slot;
  lock.unlock();

  info_wtime(stderr, "[qpm] connecting queue %s (generation %lu)\n", name.c_str(), queue->GetGeneration());
  auto ch_s = this->device_->Connect(name, this->channel_opts_);
  if (!ch_s.ok()) {
    Status stat = ch_s.status().Wrap("handshake for queue " + name + " failed");
    lock.lock();
    it = this->queues_.find(name);
    if (it != this->queues_.end() && it->second.queue == queue) {
      this->queues_.erase(it);
    }
    lock.unlock();
    {
      std::lock_guard<std::mutex> qlock(queue->mu_);
      queue->state_ = QueueState::kClosed;
    }
    info_wtime(stderr, "[qpm] %s\n", stat.message().c_str());
    handshake.set_value(stat);
    return stat;
  }
  this->counters_->handshakes++;

  lock.lock();
  if (this->shutting_down_) {
    lock.unlock();
    auto channel = std::move(ch_s.value());
    auto stat = channel->Close();
    if (!stat.ok()) {
      info_wtime(stderr, "[qpm] closing queue %s: %s\n", name.c_str(), stat.message().c_str());
    }
    {
      std::lock_guard<std::mutex> qlock(queue->mu_);
      queue->state_ = QueueState::kClosed;
    }
    Status down(StatusCode::kShuttingDown, "client shut down while connecting queue " + name);
    handshake.set_value(down);
    return down;
  }
  queue->Bind(std::move(ch_s.value()));
  lock.unlock();

  info_wtime(stderr, "[qpm] queue %s connected [qp: %u]\n", name.c_str(), queue->GetQpNum());
  handshake.set_value(Status());
  return queue;
}

StatusOr<std::shared_ptr<Queue>> QueuePairManager::Await(const Slot &slot) {
  Status stat = slot.handshake.get();
  if (!stat.ok()) {
    return stat;
  }
  switch (slot.queue->GetState()) {
    case QueueState::kConnected:
      return slot.queue;
    case QueueState::kDraining:
    case QueueState::kClosed:
      return Status(StatusCode::kShuttingDown, "queue " + slot.queue->GetName() + " is shutting down");
    default:
      return Status(StatusCode::kQueueUnavailable, "queue " + slot.queue->GetName() + " is "
          + QueueStateName(slot.queue->GetState()));
  }
}

std::shared_ptr<Queue> QueuePairManager::Find(const std::string &name) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto it = this->queues_.find(name);
  if (it == this->queues_.end()) {
    return nullptr;
  }
  return it->second.queue;
}

QueueState QueuePairManager::GetState(const std::string &name) {
  auto queue = this->Find(name);
  if (queue == nullptr) {
    return QueueState::kUnbound;
  }
  return queue->GetState();
}

void QueuePairManager::Complete(std::vector<PendingWrite> &failed, const Status &reason) {
  for (auto &pending : failed) {
    this->registry_->Release(pending.wr.region.id);
    this->counters_->writes_failed++;
    pending.promise.set_value(CompletionRecord{pending.wr.id, reason, 0});
  }
}

void QueuePairManager::FailQueue(const std::shared_ptr<Queue> &queue, const Status &reason) {
  {
    std::lock_guard<std::mutex> lock(this->mu_);
    auto it = this->queues_.find(queue->GetName());
    if (it != this->queues_.end() && it->second.queue == queue) {
      this->queues_.erase(it);
      this->counters_->evictions++;
    }
  }

  std::vector<PendingWrite> failed;
  {
    std::lock_guard<std::mutex> lock(queue->mu_);
    if (queue->state_ != QueueState::kConnected && queue->state_ != QueueState::kDraining) {
      return;
    }
    failed = queue->TakeAllLocked(QueueState::kError);
  }
  info_wtime(stderr, "[qpm] evicted queue %s (generation %lu), failing %zu writes: %s\n",
      queue->GetName().c_str(), queue->GetGeneration(), failed.size(), reason.message().c_str());

  auto stat = queue->channel_->Close();
  if (!stat.ok()) {
    debug(stderr, "closing failed queue %s: %s\n", queue->GetName().c_str(), stat.message().c_str());
  }
  this->Complete(failed, reason);
}

void QueuePairManager::FailQueueByQpNum(uint32_t qp_num, const Status &reason) {
  for (auto &queue : this->Snapshot()) {
    if (queue->GetQpNum() == qp_num) {
      this->FailQueue(queue, reason);
      return;
    }
  }
  debug(stderr, "no live queue for qp %u\n", qp_num);
}

void QueuePairManager::FailAll(const Status &reason) {
  for (auto &queue : this->Snapshot()) {
    this->FailQueue(queue, reason);
  }
}

std::vector<std::shared_ptr<Queue>> QueuePairManager::Snapshot() {
  std::vector<std::shared_ptr<Queue>> all;
  {
    std::lock_guard<std::mutex> lock(this->mu_);
    all.reserve(this->queues_.size());
    for (auto &it : this->queues_) {
      all.push_back(it.second.queue);
    }
  }
  std::vector<std::shared_ptr<Queue>> live;
  for (auto &queue : all) {
    QueueState state = queue->GetState();
    if (state == QueueState::kConnected || state == QueueState::kDraining) {
      live.push_back(queue);
    }
  }
  return live;
}

Status QueuePairManager::Shutdown(std::chrono::milliseconds drain_timeout) {
  std::vector<std::shared_ptr<Queue>> queues;
  {
    std::lock_guard<std::mutex> lock(this->mu_);
    this->shutting_down_ = true;
    for (auto &it : this->queues_) {
      queues.push_back(it.second.queue);
    }
    this->queues_.clear();
  }

  for (auto &queue : queues) {
    std::lock_guard<std::mutex> lock(queue->mu_);
    if (queue->state_ == QueueState::kConnected) {
      queue->state_ = QueueState::kDraining;
      // wakes writers blocked on credits
      queue->cv_.notify_all();
    }
  }

  auto deadline = std::chrono::steady_clock::now() + drain_timeout;
  Status result;
  for (auto &queue : queues) {
    if (queue->GetState() != QueueState::kDraining) {
      continue;
    }
    auto stat = queue->WaitIdleUntil(deadline);
    if (!stat.ok()) {
      info_wtime(stderr, "[qpm] drain timed out: %s\n", stat.message().c_str());
      result = stat;
    }
  }

  for (auto &queue : queues) {
    std::vector<PendingWrite> failed;
    {
      std::lock_guard<std::mutex> lock(queue->mu_);
      if (queue->state_ != QueueState::kDraining) {
        continue;
      }
      failed = queue->TakeAllLocked(QueueState::kClosed);
    }
    auto stat = queue->channel_->Close();
    if (!stat.ok()) {
      info_wtime(stderr, "[qpm] closing queue %s: %s\n", queue->GetName().c_str(), stat.message().c_str());
    }
    this->Complete(failed, Status(StatusCode::kShuttingDown, "queue " + queue->GetName() + " closed"));
  }
  return result;
}

}
