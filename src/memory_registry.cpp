/*
 *
 *  memory_registry.cpp
 *
 */

#include "memory_registry.hpp"

#include <cstdint>
#include <iterator>
#include <mutex>
#include <string>

#include "rdc/error.hpp"
#include "rdc/mm.hpp"

#include "debug.h"

namespace rdc {
namespace memory {

namespace {
  Region view(const Region &reg, ConstBuffer buffer) {
    Region v = reg;
    v.addr = const_cast<void *>(buffer.data());
    v.length = buffer.capacity();
    return v;
  }
}

std::map<uint64_t, Registry::Entry>::iterator Registry::Lookup(uint64_t start, size_t length, Overlap *overlap) {
  *overlap = Overlap::kNone;
  uint64_t end = start + length;
  auto it = this->entries_.upper_bound(start);
  if (it != this->entries_.begin()) {
    auto prev = std::prev(it);
    uint64_t prev_end = prev->first + prev->second.region.length;
    if (start < prev_end) {
      if (end <= prev_end) {
        return prev;
      }
      *overlap = Overlap::kPastEnd;
      return this->entries_.end();
    }
  }
  if (it != this->entries_.end() && it->first < end) {
    *overlap = Overlap::kPartial;
  }
  return this->entries_.end();
}

std::map<uint64_t, Registry::Entry>::iterator Registry::Resolve(const Region &region) {
  auto id_it = this->by_id_.find(region.id);
  if (id_it == this->by_id_.end()) {
    return this->entries_.end();
  }
  auto it = this->entries_.find(id_it->second);
  const Region &reg = it->second.region;
  if (reg.lkey != region.lkey || !RegionContains(reg, region.addr, region.length)) {
    return this->entries_.end();
  }
  return it;
}

StatusOr<Region> Registry::Create(ConstBuffer buffer, uint32_t scopes, uint32_t pins) {
  auto keys_s = this->device_->RegisterMemory(const_cast<void *>(buffer.data()), buffer.capacity());
  if (!keys_s.ok()) {
    return keys_s.status().Wrap("error registering " + std::to_string(buffer.capacity()) + " bytes");
  }
  auto keys = keys_s.value();

  Region reg;
  reg.id = this->counters_->next_region_id++;
  reg.addr = const_cast<void *>(buffer.data());
  reg.length = buffer.capacity();
  reg.lkey = keys.lkey;
  reg.rkey = keys.rkey;

  Entry entry;
  entry.region = reg;
  entry.handle = keys.handle;
  entry.scopes = scopes;
  entry.pins = pins;
  this->entries_[buffer.address()] = entry;
  this->by_id_[reg.id] = buffer.address();
  this->counters_->registrations++;
  debug(stderr, "registered region %lu [addr: %p, len: %zu, lkey: %u]\n", reg.id, reg.addr, reg.length, reg.lkey);
  return reg;
}

Status Registry::Remove(std::map<uint64_t, Entry>::iterator it) {
  uint64_t id = it->second.region.id;
  auto stat = this->device_->DeregisterMemory(it->second.handle);
  this->by_id_.erase(id);
  this->entries_.erase(it);
  if (!stat.ok()) {
    return stat.Wrap("error deregistering region " + std::to_string(id));
  }
  debug(stderr, "deregistered region %lu\n", id);
  return Status();
}

StatusOr<Region> Registry::Register(ConstBuffer buffer) {
  if (buffer.empty()) {
    return Status(StatusCode::kInvalidArgument, "cannot register an empty buffer");
  }
  std::lock_guard<std::mutex> lock(this->mu_);
  Overlap overlap;
  auto it = this->Lookup(buffer.address(), buffer.capacity(), &overlap);
  if (it != this->entries_.end()) {
    Entry &entry = it->second;
    bool exact = entry.region.addr == buffer.data() && entry.region.length == buffer.capacity();
    if (!exact && this->policy_ == RegistrationPolicy::kStrict) {
      return Status(StatusCode::kRegionConflict, "buffer lies inside region " + std::to_string(entry.region.id));
    }
    entry.scopes++;
    return view(entry.region, buffer);
  }
  if (overlap != Overlap::kNone) {
    return Status(StatusCode::kRegionConflict, "buffer partially overlaps a registered region");
  }
  return this->Create(buffer, 1, 0);
}

StatusOr<Region> Registry::RegisterTransient(ConstBuffer buffer) {
  if (buffer.empty()) {
    return Status(StatusCode::kInvalidArgument, "cannot register an empty buffer");
  }
  std::lock_guard<std::mutex> lock(this->mu_);
  Overlap overlap;
  auto it = this->Lookup(buffer.address(), buffer.capacity(), &overlap);
  if (it != this->entries_.end()) {
    it->second.pins++;
    return view(it->second.region, buffer);
  }
  if (overlap == Overlap::kPastEnd) {
    return Status(StatusCode::kInvalidArgument, std::to_string(buffer.capacity())
        + " bytes run past the end of the registered region");
  }
  if (overlap == Overlap::kPartial) {
    return Status(StatusCode::kRegionConflict, "buffer partially overlaps a registered region");
  }
  return this->Create(buffer, 0, 1);
}

Status Registry::Deregister(const Region &region) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto it = this->Resolve(region);
  if (it == this->entries_.end()) {
    return Status(StatusCode::kRegistrationRequired, "region " + std::to_string(region.id) + " is not registered");
  }
  Entry &entry = it->second;
  if (entry.pins > 0) {
    return Status(StatusCode::kRegionInUse, "region " + std::to_string(region.id) + " is referenced by "
        + std::to_string(entry.pins) + " outstanding writes");
  }
  if (entry.scopes > 0) {
    entry.scopes--;
  }
  if (entry.scopes == 0) {
    return this->Remove(it);
  }
  return Status();
}

StatusOr<Region> Registry::Find(ConstBuffer buffer) {
  std::lock_guard<std::mutex> lock(this->mu_);
  Overlap overlap;
  auto it = this->Lookup(buffer.address(), buffer.capacity(), &overlap);
  if (overlap == Overlap::kPastEnd) {
    return Status(StatusCode::kInvalidArgument, std::to_string(buffer.capacity())
        + " bytes run past the end of the registered region");
  }
  if (it == this->entries_.end()) {
    return Status(StatusCode::kRegistrationRequired, "buffer is not registered");
  }
  return view(it->second.region, buffer);
}

Status Registry::Acquire(const Region &region) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto it = this->Resolve(region);
  if (it == this->entries_.end()) {
    return Status(StatusCode::kRegistrationRequired, "span is not covered by registered region "
        + std::to_string(region.id));
  }
  it->second.pins++;
  return Status();
}

void Registry::Release(uint64_t id) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto id_it = this->by_id_.find(id);
  if (id_it == this->by_id_.end()) {
    return;
  }
  auto it = this->entries_.find(id_it->second);
  Entry &entry = it->second;
  if (entry.pins > 0) {
    entry.pins--;
  }
  if (entry.pins == 0 && entry.scopes == 0) {
    auto stat = this->Remove(it);
    if (!stat.ok()) {
      info_wtime(stderr, "[registry] %s\n", stat.message().c_str());
    }
  }
}

Status Registry::DeregisterAll() {
  std::lock_guard<std::mutex> lock(this->mu_);
  Status result;
  while (!this->entries_.empty()) {
    auto stat = this->Remove(this->entries_.begin());
    if (!stat.ok() && result.ok()) {
      result = stat;
    }
  }
  return result;
}

size_t Registry::Size() {
  std::lock_guard<std::mutex> lock(this->mu_);
  return this->entries_.size();
}

uint32_t Registry::Pins(uint64_t id) {
  std::lock_guard<std::mutex> lock(this->mu_);
  auto id_it = this->by_id_.find(id);
  if (id_it == this->by_id_.end()) {
    return 0;
  }
  return this->entries_.find(id_it->second)->second.pins;
}

}
}
