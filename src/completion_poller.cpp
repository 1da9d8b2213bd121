/*
 *
 *  completion_poller.cpp
 *
 */

#include "completion_poller.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <infiniband/verbs.h>

#include "rdc/error.hpp"
#include "rdc/write.hpp"

#include "debug.h"

namespace rdc {

bool IsConnectionFatal(enum ibv_wc_status status) {
  switch (status) {
    case IBV_WC_RETRY_EXC_ERR:
    case IBV_WC_RNR_RETRY_EXC_ERR:
    case IBV_WC_WR_FLUSH_ERR:
    case IBV_WC_REM_ACCESS_ERR:
    case IBV_WC_REM_OP_ERR:
    case IBV_WC_REM_INV_REQ_ERR:
    case IBV_WC_REM_ABORT_ERR:
    case IBV_WC_FATAL_ERR:
    case IBV_WC_RESP_TIMEOUT_ERR:
    case IBV_WC_GENERAL_ERR:
      return true;
    default:
      // local length, protection, QP operation and similar errors only concern one request
      return false;
  }
}

CompletionPoller::CompletionPoller(QueuePairManager *manager, memory::Registry *registry, Counters *counters,
    int poll_batch, std::chrono::microseconds idle_sleep)
  : manager_(manager), registry_(registry), counters_(counters), poll_batch_(poll_batch > 0 ? poll_batch : 1),
  idle_sleep_(idle_sleep), wcs_(poll_batch_), events_(64), running_(false) {}

CompletionPoller::~CompletionPoller() {
  this->Stop();
}

Status CompletionPoller::Start() {
  if (this->running_.exchange(true)) {
    return Status(StatusCode::kInternal, "completion poller already running");
  }
  this->thread_ = std::thread(&CompletionPoller::Run, this);
  return Status();
}

void CompletionPoller::Stop() {
  this->running_.store(false);
  if (this->thread_.joinable()) {
    this->thread_.join();
  }
}

void CompletionPoller::PushAsyncEvent(const transport::AsyncEvent &ev) {
  if (!this->events_.enqueue(ev)) {
    info_wtime(stderr, "[poller] dropped async event for qp %u\n", ev.qp_num);
  }
}

void CompletionPoller::Run() {
  info_wtime(stderr, "[poller] started\n");
  while (this->running_.load()) {
    if (this->PollOnce() == 0) {
      std::this_thread::sleep_for(this->idle_sleep_);
    }
  }
  // events left in the queue are handled so their queues do not linger
  transport::AsyncEvent ev;
  while (this->events_.try_dequeue(ev)) {
    this->HandleAsyncEvent(ev);
  }
  info_wtime(stderr, "[poller] stopped\n");
}

void CompletionPoller::HandleAsyncEvent(const transport::AsyncEvent &ev) {
  switch (ev.type) {
    case transport::AsyncEventType::kQpFatal:
      this->manager_->FailQueueByQpNum(ev.qp_num, Status(StatusCode::kConnectionLost,
            "queue pair " + std::to_string(ev.qp_num) + " reported a fatal error"));
      break;
    case transport::AsyncEventType::kCqError:
      this->counters_->cq_errors++;
      if (ev.qp_num != 0) {
        this->manager_->FailQueueByQpNum(ev.qp_num, Status(StatusCode::kConnectionLost,
              "completion queue of queue pair " + std::to_string(ev.qp_num) + " overran"));
      } else {
        this->manager_->FailAll(Status(StatusCode::kConnectionLost, "completion queue error"));
      }
      break;
    case transport::AsyncEventType::kDeviceFatal:
      this->manager_->FailAll(Status(StatusCode::kConnectionLost, "device reported a fatal error"));
      break;
    case transport::AsyncEventType::kPortError:
      info_wtime(stderr, "[poller] port error, waiting for completions to report affected queues\n");
      break;
    default:
      break;
  }
}

int CompletionPoller::PollOnce() {
  transport::AsyncEvent ev;
  while (this->events_.try_dequeue(ev)) {
    this->HandleAsyncEvent(ev);
  }

  int retired = 0;
  for (auto &queue : this->manager_->Snapshot()) {
    retired += this->DrainQueue(queue);
  }
  return retired;
}

int CompletionPoller::DrainQueue(const std::shared_ptr<Queue> &queue) {
  auto n_s = queue->channel_->PollSendCq(this->poll_batch_, this->wcs_.data());
  if (!n_s.ok()) {
    this->manager_->FailQueue(queue, Status(StatusCode::kConnectionLost, n_s.status().message()));
    return 0;
  }

  int retired = 0;
  for (int i = 0; i < n_s.value(); i++) {
    struct ibv_wc &wc = this->wcs_[i];
    PendingWrite pending;
    {
      std::lock_guard<std::mutex> lock(queue->mu_);
      auto it = queue->inflight_.find(wc.wr_id);
      if (it == queue->inflight_.end()) {
        // flushed after the queue was failed
        debug(stderr, "no pending write %lu on %s\n", (uint64_t)wc.wr_id, queue->GetName().c_str());
        continue;
      }
      pending = std::move(it->second);
      queue->inflight_.erase(it);
      queue->credits_++;
      // counted before WaitIdle can observe the empty queue
      if (wc.status == IBV_WC_SUCCESS) {
        this->counters_->writes_completed++;
      } else {
        this->counters_->writes_failed++;
      }
      queue->cv_.notify_all();
    }
    this->registry_->Release(pending.wr.region.id);
    retired++;

    if (wc.status == IBV_WC_SUCCESS) {
      pending.promise.set_value(CompletionRecord{pending.wr.id, Status(), pending.wr.length});
      continue;
    }

    Status err(StatusCode::kTransportError, "write " + std::to_string(pending.wr.id) + " on queue "
        + queue->GetName() + " failed: " + ibv_wc_status_str(wc.status));
    pending.promise.set_value(CompletionRecord{pending.wr.id, err, 0});
    if (IsConnectionFatal(wc.status)) {
      this->manager_->FailQueue(queue, Status(StatusCode::kConnectionLost, err.message()));
      break;
    }
    info_wtime(stderr, "[poller] %s\n", err.message().c_str());
  }
  return retired;
}

}
