/*
 *
 *  client.cpp
 *
 */

#include "rdc/client.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"
#include "rdc/options.hpp"
#include "rdc/write.hpp"

#include "async_events.hpp"
#include "completion_poller.hpp"
#include "counters.hpp"
#include "debug.h"
#include "dispatcher.hpp"
#include "memory_registry.hpp"
#include "queue_pair_manager.hpp"
#include "verbs_device.hpp"

namespace rdc {

Client::Client(Options opts) : Client(std::move(opts), OpenVerbsDevice) {}

Client::Client(Options opts, DeviceOpener opener)
  : opts_(std::move(opts)), opener_(std::move(opener)), counters_(std::make_unique<Counters>()),
  state_(State::kUninitialized) {}

Client::~Client() {
  auto stat = this->Shutdown();
  if (!stat.ok()) {
    info_wtime(stderr, "[client] shutdown: %s\n", stat.message().c_str());
  }
}

Status Client::Initialize() {
  std::lock_guard<std::mutex> life(this->lifecycle_mu_);
  if (this->state_ == State::kReady) {
    return Status();
  }
  if (this->state_ == State::kFailed) {
    return Status(StatusCode::kAlreadyFailed, this->failure_.message());
  }
  if (this->opts_.queue_depth == 0) {
    return Status(StatusCode::kInvalidArgument, "queue depth must be positive");
  }

  auto dev_s = this->opener_(this->opts_);
  if (!dev_s.ok()) {
    auto stat = dev_s.status().Wrap("error opening device");
    info_wtime(stderr, "[client] %s\n", stat.message().c_str());
    std::unique_lock<std::shared_timed_mutex> lock(this->mu_);
    this->state_ = State::kFailed;
    this->failure_ = stat;
    return stat;
  }

  {
    std::unique_lock<std::shared_timed_mutex> lock(this->mu_);
    this->device_ = std::move(dev_s.value());
    this->registry_ = std::make_unique<memory::Registry>(this->device_.get(), this->opts_.registration_policy,
          this->counters_.get());
    this->manager_ = std::make_unique<QueuePairManager>(this->device_.get(), this->registry_.get(), this->opts_,
          this->counters_.get());
    this->dispatcher_ = std::make_unique<Dispatcher>(this->registry_.get(), this->opts_, this->counters_.get());
    this->poller_ = std::make_unique<CompletionPoller>(this->manager_.get(), this->registry_.get(), this->counters_.get(),
          this->opts_.poll_batch, this->opts_.poll_idle_sleep);

    auto stat = this->poller_->Start();
    if (!stat.ok()) {
      this->TearDown();
      this->state_ = State::kFailed;
      this->failure_ = stat;
      return stat;
    }
    this->counters_->pollers_started++;

    CompletionPoller *poller = this->poller_.get();
    this->trail_ = std::make_unique<AsyncEventTrail>(this->device_.get(), [poller](const transport::AsyncEvent &ev){
          poller->PushAsyncEvent(ev);
    });
    this->trail_->Start();
  }

  for (auto &name : this->opts_.static_queues) {
    auto q_s = this->manager_->ResolveOrCreate(name);
    if (!q_s.ok()) {
      auto stat = q_s.status().Wrap("error connecting static queue " + name);
      info_wtime(stderr, "[client] %s\n", stat.message().c_str());
      auto down = this->manager_->Shutdown(std::chrono::milliseconds(0));
      if (!down.ok()) {
        debug(stderr, "%s\n", down.message().c_str());
      }
      std::unique_lock<std::shared_timed_mutex> lock(this->mu_);
      this->TearDown();
      this->state_ = State::kFailed;
      this->failure_ = stat;
      return stat;
    }
  }

  std::unique_lock<std::shared_timed_mutex> lock(this->mu_);
  this->state_ = State::kReady;
  info_wtime(stderr, "[client] ready on %s with %zu static queues\n", this->device_->GetName().c_str(),
      this->opts_.static_queues.size());
  return Status();
}

void Client::TearDown() {
  if (this->trail_) {
    this->trail_->Stop();
  }
  if (this->poller_) {
    this->poller_->Stop();
  }
  this->trail_.reset();
  this->poller_.reset();
  this->dispatcher_.reset();
  this->manager_.reset();
  if (this->registry_) {
    auto stat = this->registry_->DeregisterAll();
    if (!stat.ok()) {
      info_wtime(stderr, "[client] %s\n", stat.message().c_str());
    }
  }
  this->registry_.reset();
  if (this->device_) {
    auto stat = this->device_->Close();
    if (!stat.ok()) {
      info_wtime(stderr, "[client] closing device: %s\n", stat.message().c_str());
    }
  }
  this->device_.reset();
}

Status Client::Shutdown() {
  std::lock_guard<std::mutex> life(this->lifecycle_mu_);
  if (this->state_ != State::kReady) {
    return Status();
  }

  // Draining first wakes blocked writers, which hold mu_ shared
  auto stat = this->manager_->Shutdown(this->opts_.drain_timeout);

  std::unique_lock<std::shared_timed_mutex> lock(this->mu_);
  this->TearDown();
  this->state_ = State::kUninitialized;
  info_wtime(stderr, "[client] shut down [%s]\n", StatusCodeName(stat.code()));
  return stat;
}

Status Client::CheckReady() {
  if (this->state_ != State::kReady) {
    return Status(StatusCode::kNotInitialized, "client is not initialized");
  }
  return Status();
}

bool Client::Ready() {
  std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
  return this->state_ == State::kReady;
}

StatusOr<WriteTicket> Client::PostWrite(const std::string &queue, memory::ConstBuffer buffer, size_t length) {
  if (length == 0) {
    return Status(StatusCode::kInvalidArgument, "write length must be positive");
  }
  if (buffer.data() == nullptr) {
    return Status(StatusCode::kInvalidArgument, "buffer is null");
  }
  if (!buffer.Contains(0, length)) {
    return Status(StatusCode::kInvalidArgument, "write of " + std::to_string(length)
        + " bytes exceeds the buffer capacity of " + std::to_string(buffer.capacity()));
  }
  if (length > UINT32_MAX) {
    return Status(StatusCode::kInvalidArgument, "write exceeds the maximum message size");
  }

  std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
  auto stat = this->CheckReady();
  if (!stat.ok()) {
    return stat;
  }

  // the buffer is checked against the registry before any queue is connected
  auto span = buffer.Prefix(length);
  if (this->opts_.registration_mode == RegistrationMode::kExplicit) {
    auto reg_s = this->registry_->Find(span);
    if (!reg_s.ok()) {
      return reg_s.status();
    }
    auto q_s = this->manager_->ResolveOrCreate(queue);
    if (!q_s.ok()) {
      return q_s.status();
    }
    return this->dispatcher_->Submit(q_s.value(), reg_s.value(), kAppendOffset, length);
  }

  // pinned until the write took its own pin, a transient registration may
  // otherwise go away with the completion of an earlier write
  auto reg_s = this->registry_->RegisterTransient(span);
  if (!reg_s.ok()) {
    return reg_s.status();
  }
  StatusOr<WriteTicket> ticket_s;
  auto q_s = this->manager_->ResolveOrCreate(queue);
  if (q_s.ok()) {
    ticket_s = this->dispatcher_->Submit(q_s.value(), reg_s.value(), kAppendOffset, length);
  } else {
    ticket_s = q_s.status();
  }
  this->registry_->Release(reg_s.value().id);
  return ticket_s;
}

StatusOr<memory::Region> Client::RegisterMemory(memory::ConstBuffer buffer) {
  std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
  auto stat = this->CheckReady();
  if (!stat.ok()) {
    return stat;
  }
  return this->registry_->Register(buffer);
}

Status Client::DeregisterMemory(const memory::Region &region) {
  std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
  auto stat = this->CheckReady();
  if (!stat.ok()) {
    return stat;
  }
  return this->registry_->Deregister(region);
}

StatusOr<CompletionRecord> Client::Wait(const WriteTicket &ticket, std::chrono::milliseconds timeout) {
  if (!ticket.completion.valid()) {
    return Status(StatusCode::kInvalidArgument, "ticket carries no completion");
  }
  if (ticket.completion.wait_for(timeout) != std::future_status::ready) {
    return Status(StatusCode::kTimeout, "write " + std::to_string(ticket.id) + " on " + ticket.queue
        + " still in flight");
  }
  return ticket.completion.get();
}

Status Client::WaitIdle(const std::string &queue, std::chrono::milliseconds timeout) {
  std::shared_ptr<Queue> q;
  {
    std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
    auto stat = this->CheckReady();
    if (!stat.ok()) {
      return stat;
    }
    q = this->manager_->Find(queue);
  }
  if (q == nullptr) {
    return Status();
  }
  return q->WaitIdle(timeout);
}

QueueState Client::GetQueueState(const std::string &queue) {
  std::shared_lock<std::shared_timed_mutex> lock(this->mu_);
  if (this->state_ != State::kReady) {
    return QueueState::kUnbound;
  }
  return this->manager_->GetState(queue);
}

ClientStats Client::GetStats() {
  return this->counters_->Snapshot();
}

}
