#include "memory_registry.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "counters.hpp"
#include "fake_transport.hpp"

using rdc::Counters;
using rdc::RegistrationPolicy;
using rdc::StatusCode;
using rdc::memory::ConstBuffer;
using rdc::memory::Registry;

class RegistryTest : public ::testing::Test {
 protected:
   RegistryTest() : fabric_(std::make_shared<rdc::fake::Fabric>()), device_(fabric_), buf_(4096, 'x') {}

   std::unique_ptr<Registry> MakeRegistry(RegistrationPolicy policy) {
     return std::make_unique<Registry>(&device_, policy, &counters_);
   }

   ConstBuffer Span(size_t offset, size_t length) { return ConstBuffer(buf_.data() + offset, length); }

   std::shared_ptr<rdc::fake::Fabric> fabric_;
   rdc::fake::Device device_;
   Counters counters_;
   std::vector<char> buf_;
};

TEST_F(RegistryTest, ExactMatchReusesRegistration) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto first = registry->Register(Span(0, 100));
  auto second = registry->Register(Span(0, 100));
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_EQ(first.value().id, second.value().id);
  EXPECT_EQ(registry->Size(), 1u);
  EXPECT_EQ(fabric_->RegisterCalls(), 1);
  EXPECT_EQ(counters_.registrations.load(), 1u);
}

TEST_F(RegistryTest, ContainedSpanReusesRegistration) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto outer = registry->Register(Span(0, 100));
  ASSERT_TRUE(outer.ok());
  auto inner = registry->Register(Span(10, 20));
  ASSERT_TRUE(inner.ok()) << inner.status();
  EXPECT_EQ(inner.value().id, outer.value().id);
  EXPECT_EQ(inner.value().addr, buf_.data() + 10);
  EXPECT_EQ(inner.value().length, 20u);
  EXPECT_EQ(inner.value().lkey, outer.value().lkey);
  EXPECT_EQ(fabric_->RegisterCalls(), 1);
}

TEST_F(RegistryTest, StrictPolicyRejectsContainedSpan) {
  auto registry = MakeRegistry(RegistrationPolicy::kStrict);
  ASSERT_TRUE(registry->Register(Span(0, 100)).ok());
  auto inner = registry->Register(Span(10, 20));
  EXPECT_EQ(inner.status().code(), StatusCode::kRegionConflict);
  EXPECT_TRUE(registry->Register(Span(0, 100)).ok());
}

TEST_F(RegistryTest, PartialOverlapConflicts) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  ASSERT_TRUE(registry->Register(Span(100, 100)).ok());
  // runs past the end
  EXPECT_EQ(registry->Register(Span(150, 100)).status().code(), StatusCode::kRegionConflict);
  // starts before and reaches into it
  EXPECT_EQ(registry->Register(Span(50, 60)).status().code(), StatusCode::kRegionConflict);
  // spans it completely
  EXPECT_EQ(registry->Register(Span(0, 300)).status().code(), StatusCode::kRegionConflict);
  // adjacent spans do not overlap
  EXPECT_TRUE(registry->Register(Span(200, 10)).ok());
  EXPECT_TRUE(registry->Register(Span(90, 10)).ok());
  EXPECT_EQ(registry->Size(), 3u);
}

TEST_F(RegistryTest, DeregisterInFlightRegionFails) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(0, 256));
  ASSERT_TRUE(region.ok());
  ASSERT_TRUE(registry->Acquire(region.value()).ok());

  EXPECT_EQ(registry->Deregister(region.value()).code(), StatusCode::kRegionInUse);
  EXPECT_EQ(registry->Size(), 1u);

  registry->Release(region.value().id);
  EXPECT_TRUE(registry->Deregister(region.value()).ok());
  EXPECT_EQ(registry->Size(), 0u);
  EXPECT_EQ(fabric_->Registrations(), 0u);
}

TEST_F(RegistryTest, LastScopeReleasesRegistration) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(0, 64));
  ASSERT_TRUE(registry->Register(Span(0, 64)).ok());

  EXPECT_TRUE(registry->Deregister(region.value()).ok());
  EXPECT_EQ(fabric_->Registrations(), 1u);
  EXPECT_TRUE(registry->Deregister(region.value()).ok());
  EXPECT_EQ(fabric_->Registrations(), 0u);
  EXPECT_EQ(registry->Deregister(region.value()).code(), StatusCode::kRegistrationRequired);
}

TEST_F(RegistryTest, FindRequiresRegistration) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  EXPECT_EQ(registry->Find(Span(0, 10)).status().code(), StatusCode::kRegistrationRequired);
  ASSERT_TRUE(registry->Register(Span(0, 100)).ok());
  auto found = registry->Find(Span(40, 10));
  ASSERT_TRUE(found.ok());
  EXPECT_EQ(found.value().addr, buf_.data() + 40);
  EXPECT_EQ(registry->Find(Span(200, 20)).status().code(), StatusCode::kRegistrationRequired);
}

TEST_F(RegistryTest, SpanPastRegionEndIsInvalid) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  ASSERT_TRUE(registry->Register(Span(0, 100)).ok());

  EXPECT_EQ(registry->Find(Span(90, 20)).status().code(), StatusCode::kInvalidArgument);
  EXPECT_EQ(registry->Find(Span(0, 128)).status().code(), StatusCode::kInvalidArgument);
  EXPECT_EQ(registry->RegisterTransient(Span(0, 128)).status().code(), StatusCode::kInvalidArgument);

  ASSERT_TRUE(registry->Register(Span(1000, 100)).ok());
  // reaching into a region from below is a conflict
  EXPECT_EQ(registry->RegisterTransient(Span(950, 100)).status().code(), StatusCode::kRegionConflict);
  EXPECT_EQ(registry->Size(), 2u);
  EXPECT_EQ(fabric_->RegisterCalls(), 2);
}

TEST_F(RegistryTest, DeregisterChecksRegionIdentity) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(0, 64));
  ASSERT_TRUE(region.ok());

  rdc::memory::Region other_key = region.value();
  other_key.lkey++;
  EXPECT_EQ(registry->Deregister(other_key).code(), StatusCode::kRegistrationRequired);
  rdc::memory::Region other_addr = region.value();
  other_addr.addr = buf_.data() + 2048;
  EXPECT_EQ(registry->Deregister(other_addr).code(), StatusCode::kRegistrationRequired);
  EXPECT_EQ(registry->Size(), 1u);

  EXPECT_TRUE(registry->Deregister(region.value()).ok());
  EXPECT_EQ(registry->Size(), 0u);
}

TEST_F(RegistryTest, RegionIdsOutliveTheRegistry) {
  uint64_t first_id = 0;
  {
    auto registry = MakeRegistry(RegistrationPolicy::kReuse);
    auto region = registry->Register(Span(0, 64));
    ASSERT_TRUE(region.ok());
    first_id = region.value().id;
    EXPECT_TRUE(registry->DeregisterAll().ok());
  }
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(1024, 64));
  ASSERT_TRUE(region.ok());
  EXPECT_NE(region.value().id, first_id);

  rdc::memory::Region stale = region.value();
  stale.id = first_id;
  EXPECT_EQ(registry->Deregister(stale).code(), StatusCode::kRegistrationRequired);
  EXPECT_EQ(registry->Size(), 1u);
}

TEST_F(RegistryTest, TransientRegistrationGoesWithLastPin) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->RegisterTransient(Span(0, 128));
  ASSERT_TRUE(region.ok()) << region.status();
  EXPECT_EQ(registry->Pins(region.value().id), 1u);

  ASSERT_TRUE(registry->Acquire(region.value()).ok());
  registry->Release(region.value().id);
  EXPECT_EQ(registry->Size(), 1u);

  registry->Release(region.value().id);
  EXPECT_EQ(registry->Size(), 0u);
  EXPECT_EQ(fabric_->Registrations(), 0u);
}

TEST_F(RegistryTest, TransientUseOfExplicitRegistrationKeepsIt) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(0, 512));
  auto transient = registry->RegisterTransient(Span(100, 50));
  ASSERT_TRUE(transient.ok());
  EXPECT_EQ(transient.value().id, region.value().id);

  registry->Release(transient.value().id);
  EXPECT_EQ(registry->Size(), 1u);
  EXPECT_EQ(fabric_->RegisterCalls(), 1);
}

TEST_F(RegistryTest, AcquireRejectsSpanOutsideRegion) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto region = registry->Register(Span(0, 64));
  rdc::memory::Region wider = region.value();
  wider.length = 128;
  EXPECT_EQ(registry->Acquire(wider).code(), StatusCode::kRegistrationRequired);
  EXPECT_EQ(registry->Pins(region.value().id), 0u);
}

TEST_F(RegistryTest, EmptyBufferIsInvalid) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  EXPECT_EQ(registry->Register(ConstBuffer()).status().code(), StatusCode::kInvalidArgument);
  EXPECT_EQ(registry->Register(Span(0, 0)).status().code(), StatusCode::kInvalidArgument);
}

TEST_F(RegistryTest, DeregisterAllReleasesPinnedRegions) {
  auto registry = MakeRegistry(RegistrationPolicy::kReuse);
  auto a = registry->Register(Span(0, 64));
  auto b = registry->Register(Span(1024, 64));
  ASSERT_TRUE(registry->Acquire(b.value()).ok());

  EXPECT_TRUE(registry->DeregisterAll().ok());
  EXPECT_EQ(registry->Size(), 0u);
  EXPECT_EQ(fabric_->Registrations(), 0u);
  // releasing a pin of a dropped registration is harmless
  registry->Release(b.value().id);
}
