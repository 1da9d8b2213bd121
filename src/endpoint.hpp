/*
 *
 *  endpoint.hpp
 *
 *  Thin wrapper around an rdma_cm endpoint and its queue pair
 *
 */

#ifndef RDC_ENDPOINT_HPP_
#define RDC_ENDPOINT_HPP_

#include <stddef.h>

#include <cstdint>
#include <string>

#include <infiniband/verbs.h>
#include <rdma/rdma_cma.h>
#include <rdma/rdma_verbs.h>

#include "rdc/error.hpp"

namespace rdc {
namespace endpoint {

struct Options {
  struct ibv_pd *pd;
  struct ibv_qp_init_attr qp_attr;

  const void *private_data; // Private data set here will be accessible to the other endpoint through GetConnectionInfo
  uint8_t private_data_len;

  const char *src; // Source ip to send from. Only relevant for client connections

  uint8_t responder_resources;
  uint8_t initiator_depth;
  uint8_t flow_control;
  uint8_t retry_count;    /* ignored when accepting */
  uint8_t rnr_retry_count;
};

class Endpoint {
  public:
    Endpoint(rdma_cm_id *id);
    Endpoint(rdma_cm_id *id, void *private_data, size_t private_data_len);
    ~Endpoint();

    // Active side of the connection establishment
    Status Connect(const Options &opts);
    // Passive side. Creates the queue pair on opts.pd and accepts the pending request.
    Status Accept(Options opts);
    Status Close();

    ibv_context *GetContext();
    ibv_pd *GetPd();
    uint32_t GetQpNum();

    // Returns the length of the received private data on connection establishment and returns a pointer to it in buf
    size_t GetConnectionInfo(void **buf);

    Status PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, size_t size, uint64_t remote_addr, uint32_t rkey);

    // Polls the send completion queue once. Returns the number of completions written to wcs.
    StatusOr<int> PollSendCq(int max_wc, struct ibv_wc *wcs);

  private:
    rdma_cm_id * const id_;

    void *private_data_;
    size_t private_data_len_;
};

class Listener {
  public:
    Listener(rdma_cm_id *id);
    ~Listener();

    Status Close();

    // Blocks until a connection request arrives. The returned endpoint carries
    // the requester's private data and must be accepted.
    StatusOr<Endpoint *> GetRequest();

  private:
    rdma_cm_id *id_;
};

StatusOr<Endpoint *> Create(const std::string &ip, int port, const Options &opts);
StatusOr<Endpoint *> Dial(const std::string &ip, int port, const Options &opts);
StatusOr<Listener *> Listen(const std::string &ip, int port);

}
}

#endif // RDC_ENDPOINT_HPP_
