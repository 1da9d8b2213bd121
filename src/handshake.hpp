/*
 *
 *  handshake.hpp
 *
 *  Connection private data exchanged when a queue is connected
 *
 */

#ifndef RDC_HANDSHAKE_HPP_
#define RDC_HANDSHAKE_HPP_

#include <stddef.h>

#include <cstdint>

namespace rdc {

const uint32_t kHandshakeMagic = 0x52444331; // "RDC1"
const uint16_t kHandshakeVersion = 1;
const size_t kHandshakeNameLength = 32;

// Sent by the client with the connection request
struct QueueHello {
  uint32_t magic;
  uint16_t version;
  uint16_t name_len;
  char name[kHandshakeNameLength];
};

// Returned by the server when accepting. Describes the memory the queue writes into.
struct QueueWelcome {
  uint64_t addr;
  uint32_t rkey;
  uint32_t length;
  uint32_t magic;
};

// rdma_cm carries at most 56 bytes of private data on RC connect requests
static_assert(sizeof(QueueHello) <= 56, "hello exceeds rdma_cm private data");
static_assert(sizeof(QueueWelcome) <= 196, "welcome exceeds rdma_cm private data");

}

#endif // RDC_HANDSHAKE_HPP_
