#include "dispatcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "core_fixture.hpp"

using rdc::BackpressureMode;
using rdc::QueueState;
using rdc::Status;
using rdc::StatusCode;

class DispatcherTest : public CoreTest {};

TEST_F(DispatcherTest, PostsSignaledWriteAndTakesCredit) {
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 100);

  auto ticket = Submit(queue, region);
  ASSERT_TRUE(ticket.ok()) << ticket.status();
  EXPECT_EQ(ticket.value().queue, "q1");
  EXPECT_EQ(fabric_->Posted("q1"), 1u);
  EXPECT_EQ(queue->Credits(), 3u);
  EXPECT_EQ(queue->InFlight(), 1u);
  EXPECT_EQ(registry_->Pins(region.id), 1u);
  EXPECT_FALSE(Ready(ticket.value()));

  fabric_->CompleteAll("q1");
  EXPECT_EQ(poller_->PollOnce(), 1);
  ASSERT_TRUE(Ready(ticket.value()));
  auto record = ticket.value().completion.get();
  EXPECT_TRUE(record.status.ok()) << record.status;
  EXPECT_EQ(record.id, ticket.value().id);
  EXPECT_EQ(record.byte_len, 100u);
  EXPECT_EQ(queue->Credits(), 4u);
  EXPECT_EQ(registry_->Pins(region.id), 0u);

  auto remote = fabric_->Remote("q1");
  EXPECT_EQ(std::string(remote.data(), 100), std::string(buf_.data(), 100));
}

TEST_F(DispatcherTest, FailFastReportsExhaustedCredits) {
  opts_.backpressure = BackpressureMode::kFailFast;
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 16);

  for (int i = 0; i < 4; i++) {
    ASSERT_TRUE(Submit(queue, region).ok());
  }
  EXPECT_EQ(Submit(queue, region).status().code(), StatusCode::kCreditExhausted);
  EXPECT_EQ(fabric_->Posted("q1"), 4u);
  EXPECT_EQ(registry_->Pins(region.id), 4u);

  fabric_->CompleteAll("q1");
  poller_->PollOnce();
  EXPECT_TRUE(Submit(queue, region).ok());
}

TEST_F(DispatcherTest, BlockingSubmitWaitsForCredit) {
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 16);
  for (int i = 0; i < 4; i++) {
    ASSERT_TRUE(Submit(queue, region).ok());
  }

  std::atomic<bool> done(false);
  Status result(StatusCode::kInternal, "not run");
  std::thread writer([&]() {
    result = Submit(queue, region).status();
    done = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(done.load());
  EXPECT_EQ(fabric_->MaxOutstanding("q1"), 4u);

  fabric_->CompleteNext("q1", IBV_WC_SUCCESS);
  poller_->PollOnce();
  writer.join();
  EXPECT_TRUE(result.ok()) << result;
  EXPECT_EQ(queue->InFlight(), 4u);
  EXPECT_LE(fabric_->MaxOutstanding("q1"), 4u);
}

TEST_F(DispatcherTest, BoundedCreditWaitExpires) {
  opts_.credit_wait_timeout = std::chrono::milliseconds(20);
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 16);
  for (int i = 0; i < 4; i++) {
    ASSERT_TRUE(Submit(queue, region).ok());
  }
  EXPECT_EQ(Submit(queue, region).status().code(), StatusCode::kCreditExhausted);
  EXPECT_EQ(registry_->Pins(region.id), 4u);
}

TEST_F(DispatcherTest, ShutdownInterruptsBlockedSubmit) {
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 16);
  std::vector<rdc::WriteTicket> tickets;
  for (int i = 0; i < 4; i++) {
    auto ticket = Submit(queue, region);
    ASSERT_TRUE(ticket.ok());
    tickets.push_back(ticket.value());
  }

  std::promise<Status> blocked;
  std::thread writer([&]() {
    blocked.set_value(Submit(queue, region).status());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto stat = manager_->Shutdown(std::chrono::milliseconds(10));
  EXPECT_EQ(stat.code(), StatusCode::kTimeout);
  writer.join();
  EXPECT_EQ(blocked.get_future().get().code(), StatusCode::kShuttingDown);

  for (auto &ticket : tickets) {
    ASSERT_TRUE(Ready(ticket));
    EXPECT_EQ(ticket.completion.get().status.code(), StatusCode::kShuttingDown);
  }
  EXPECT_EQ(queue->GetState(), QueueState::kClosed);
  EXPECT_EQ(registry_->Pins(region.id), 0u);
}

TEST_F(DispatcherTest, ValidatesSpans) {
  opts_.queue_depth = 8;
  fabric_->remote_length = 256;
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 512);

  EXPECT_EQ(dispatcher_->Submit(queue, region, rdc::kAppendOffset, 0).status().code(),
      StatusCode::kInvalidArgument);
  EXPECT_EQ(dispatcher_->Submit(queue, region, rdc::kAppendOffset, 513).status().code(),
      StatusCode::kInvalidArgument);
  // larger than the remote region
  EXPECT_EQ(dispatcher_->Submit(queue, region, rdc::kAppendOffset, 300).status().code(),
      StatusCode::kInvalidArgument);
  // explicit offset running past the remote region
  EXPECT_EQ(dispatcher_->Submit(queue, region, 200, 100).status().code(), StatusCode::kInvalidArgument);
  EXPECT_TRUE(dispatcher_->Submit(queue, region, 156, 100).ok());

  rdc::memory::Region unknown = region;
  unknown.id = 999;
  EXPECT_EQ(dispatcher_->Submit(queue, unknown, rdc::kAppendOffset, 10).status().code(),
      StatusCode::kRegistrationRequired);

  EXPECT_EQ(queue->InFlight(), 1u);
  EXPECT_EQ(registry_->Pins(region.id), 1u);
}

TEST_F(DispatcherTest, RemoteCursorWrapsAround) {
  fabric_->remote_length = 256;
  fabric_->auto_complete = true;
  Build();
  auto queue = Resolve("q1");
  auto first = Register(0, 100);
  auto second = Register(100, 100);
  auto third = Register(200, 100);

  ASSERT_TRUE(Submit(queue, first).ok());
  ASSERT_TRUE(Submit(queue, second).ok());
  ASSERT_TRUE(Submit(queue, third).ok());

  auto remote = fabric_->Remote("q1");
  EXPECT_EQ(std::string(remote.data(), 100), std::string(buf_.data() + 200, 100));
  EXPECT_EQ(std::string(remote.data() + 100, 100), std::string(buf_.data() + 100, 100));
}

TEST_F(DispatcherTest, FailedQueueRejectsSubmissions) {
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 32);
  std::vector<rdc::WriteTicket> tickets;
  for (int i = 0; i < 3; i++) {
    tickets.push_back(Submit(queue, region).value());
  }

  manager_->FailQueue(queue, Status(StatusCode::kConnectionLost, "link down"));
  for (auto &ticket : tickets) {
    ASSERT_TRUE(Ready(ticket));
    EXPECT_EQ(ticket.completion.get().status.code(), StatusCode::kConnectionLost);
  }
  EXPECT_EQ(queue->Credits(), 4u);
  EXPECT_EQ(registry_->Pins(region.id), 0u);
  EXPECT_EQ(Submit(queue, region).status().code(), StatusCode::kQueueUnavailable);
  EXPECT_EQ(counters_.writes_failed.load(), 3u);
}

TEST_F(DispatcherTest, RequestIdsIncrease) {
  fabric_->auto_complete = true;
  Build();
  auto q1 = Resolve("q1");
  auto q2 = Resolve("q2");
  auto region = Register(0, 8);

  uint64_t last = 0;
  for (int i = 0; i < 6; i++) {
    auto ticket = Submit(i % 2 ? q1 : q2, region);
    ASSERT_TRUE(ticket.ok());
    EXPECT_GT(ticket.value().id, last);
    last = ticket.value().id;
    poller_->PollOnce();
  }
}

TEST_F(DispatcherTest, SubmittedNeverTrailsCompleted) {
  fabric_->auto_complete = true;
  Build();
  auto queue = Resolve("q1");
  auto region = Register(0, 8);
  ASSERT_TRUE(poller_->Start().ok());

  std::atomic<bool> stop(false);
  std::atomic<uint64_t> violations(0);
  std::thread observer([&]() {
    while (!stop) {
      uint64_t completed = counters_.writes_completed.load();
      uint64_t submitted = counters_.writes_submitted.load();
      if (completed > submitted) {
        violations++;
      }
    }
  });

  int posted = 0;
  while (posted < 500 && Submit(queue, region).ok()) {
    posted++;
  }
  auto idle = queue->WaitIdle(std::chrono::seconds(5));
  stop = true;
  observer.join();
  poller_->Stop();

  EXPECT_EQ(posted, 500);
  EXPECT_TRUE(idle.ok()) << idle;
  EXPECT_EQ(violations.load(), 0u);
  EXPECT_EQ(counters_.writes_submitted.load(), 500u);
  EXPECT_EQ(counters_.writes_completed.load(), 500u);
}
