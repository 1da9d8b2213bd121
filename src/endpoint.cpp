/*
 *
 *  endpoint.cpp
 *
 */

#include "endpoint.hpp"

#include <errno.h>
#include <stdlib.h>

#include <cstdint>
#include <cstring>
#include <string>

#include <infiniband/verbs.h>
#include <rdma/rdma_cma.h>
#include <rdma/rdma_verbs.h>

#include "rdc/error.hpp"

namespace rdc {
namespace endpoint {

namespace {
  int get_rdma_addr(const char *src, const char *dst, const char *port,
      struct rdma_addrinfo *hints, struct rdma_addrinfo **rai) {
    struct rdma_addrinfo rai_hints, *res;
    int ret;

    if (hints->ai_flags & RAI_PASSIVE)
      return rdma_getaddrinfo(src, port, hints, rai);

    rai_hints = *hints;
    if (src) {
      rai_hints.ai_flags |= RAI_PASSIVE;
      ret = rdma_getaddrinfo(src, NULL, &rai_hints, &res);
      if (ret)
        return ret;

      rai_hints.ai_src_addr = res->ai_src_addr;
      rai_hints.ai_src_len = res->ai_src_len;
      rai_hints.ai_flags &= ~RAI_PASSIVE;
    }

    ret = rdma_getaddrinfo(dst, port, &rai_hints, rai);
    if (src)
      rdma_freeaddrinfo(res);

    return ret;
  }

  void *copy_private_data(const struct rdma_cm_event *event, size_t *len) {
    *len = event->param.conn.private_data_len;
    if (*len == 0) {
      return nullptr;
    }
    void *data = calloc(1, *len);
    memcpy(data, event->param.conn.private_data, *len);
    return data;
  }

  struct rdma_conn_param conn_param_from(const Options &opts) {
    struct rdma_conn_param conn_param;
    memset(&conn_param, 0, sizeof conn_param);
    conn_param.responder_resources = opts.responder_resources;
    conn_param.initiator_depth = opts.initiator_depth;
    conn_param.retry_count = opts.retry_count;
    conn_param.rnr_retry_count = opts.rnr_retry_count;
    conn_param.private_data = opts.private_data;
    conn_param.private_data_len = opts.private_data_len;
    conn_param.flow_control = opts.flow_control;
    return conn_param;
  }
}

Endpoint::Endpoint(rdma_cm_id *id) : id_(id), private_data_(nullptr), private_data_len_(0) {}

Endpoint::Endpoint(rdma_cm_id *id, void *private_data, size_t private_data_len)
  : id_(id), private_data_(private_data), private_data_len_(private_data_len) {}

Endpoint::~Endpoint() {
  if (this->private_data_) {
    free(this->private_data_);
  }
  rdma_destroy_ep(this->id_);
}

Status Endpoint::Close() {
  int ret = rdma_disconnect(this->id_);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " disconnecting endpoint");
  }
  return Status();
}

ibv_context *Endpoint::GetContext() {
  return this->id_->verbs;
}

ibv_pd *Endpoint::GetPd() {
  return this->id_->pd;
}

uint32_t Endpoint::GetQpNum() {
  if (this->id_->qp == nullptr) {
    return 0;
  }
  return this->id_->qp->qp_num;
}

size_t Endpoint::GetConnectionInfo(void **buf) {
  *buf = this->private_data_;
  return this->private_data_len_;
}

Status Endpoint::PostWrite(uint64_t ctx, uint32_t lkey, const void *addr, size_t size, uint64_t remote_addr,
    uint32_t rkey) {
  struct ibv_sge sge;
  sge.addr = (uintptr_t)addr;
  sge.length = size;
  sge.lkey = lkey;

  struct ibv_send_wr wr, *bad;
  memset(&wr, 0, sizeof wr);
  wr.wr_id = ctx;
  wr.next = NULL;
  wr.sg_list = &sge;
  wr.num_sge = 1;
  wr.opcode = IBV_WR_RDMA_WRITE;
  wr.send_flags = IBV_SEND_SIGNALED;
  wr.wr.rdma.remote_addr = remote_addr;
  wr.wr.rdma.rkey = rkey;

  int ret = ibv_post_send(this->id_->qp, &wr, &bad);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(ret) + " posting write: "
        + std::string(strerror(ret)));
  }
  return Status();
}

StatusOr<int> Endpoint::PollSendCq(int max_wc, struct ibv_wc *wcs) {
  int ret = ibv_poll_cq(this->id_->qp->send_cq, max_wc, wcs);
  if (ret < 0) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(ret) + " polling send cq");
  }
  return ret;
}

Status Endpoint::Connect(const Options &opts) {
  struct rdma_conn_param conn_param = conn_param_from(opts);

  // connect to remote
  int ret = rdma_connect(this->id_, &conn_param);
  if (ret) {
    return Status(StatusCode::kConnectionLost, "error " + std::to_string(errno) + " connecting to remote");
  }
  if (this->private_data_) {
    free(this->private_data_);
  }
  this->private_data_ = copy_private_data(this->id_->event, &this->private_data_len_);
  return Status();
}

Status Endpoint::Accept(Options opts) {
  int ret = rdma_create_qp(this->id_, opts.pd, &opts.qp_attr);
  if (ret) {
    return Status(StatusCode::kTransportError, "accept: error " + std::to_string(errno) + " creating qp");
  }
  struct rdma_conn_param conn_param = conn_param_from(opts);
  ret = rdma_accept(this->id_, &conn_param);
  if (ret) {
    return Status(StatusCode::kTransportError, "accept: error " + std::to_string(errno) + " accepting connection");
  }
  return Status();
}

Listener::Listener(rdma_cm_id *id) : id_(id) {}

Listener::~Listener() {}

Status Listener::Close() {
  if (this->id_ == nullptr) {
    return Status(StatusCode::kInvalidArgument, "listener already closed");
  }
  rdma_destroy_ep(this->id_);
  this->id_ = nullptr;
  return Status();
}

StatusOr<Endpoint *> Listener::GetRequest() {
  struct rdma_cm_id *conn_id;
  int ret = rdma_get_request(this->id_, &conn_id);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " getting connection request");
  }
  size_t private_data_len;
  void *private_data = copy_private_data(conn_id->event, &private_data_len);
  return new Endpoint(conn_id, private_data, private_data_len);
}

StatusOr<Endpoint *> Create(const std::string &ip, int port, const Options &opts) {
  if (ip.empty()) {
    return Status(StatusCode::kInvalidArgument, "remote address cannot be empty");
  }
  int ret;

  struct rdma_addrinfo hints;
  struct rdma_addrinfo *addrinfo;

  memset(&hints, 0, sizeof hints);
  hints.ai_port_space = RDMA_PS_TCP;

  ret = get_rdma_addr(opts.src, ip.c_str(), std::to_string(port).c_str(), &hints, &addrinfo);
  if (ret) {
    return Status(StatusCode::kDeviceUnavailable, "error resolving " + ip + ":" + std::to_string(port));
  }

  struct rdma_cm_id *id;
  struct ibv_qp_init_attr qp_attr = opts.qp_attr;

  // setup endpoint, also creates qp
  ret = rdma_create_ep(&id, addrinfo, opts.pd, &qp_attr);
  rdma_freeaddrinfo(addrinfo);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " creating endpoint");
  }
  return new Endpoint(id);
}

StatusOr<Endpoint *> Dial(const std::string &ip, int port, const Options &opts) {
  auto ep_stat = Create(ip, port, opts);
  if (!ep_stat.ok()) {
    return ep_stat.status().Wrap("error setting up endpoint");
  }
  auto ep = ep_stat.value();
  auto stat = ep->Connect(opts);
  if (!stat.ok()) {
    delete ep;
    return stat;
  }
  return ep;
}

StatusOr<Listener *> Listen(const std::string &ip, int port) {
  int ret;
  struct rdma_addrinfo hints;
  struct rdma_addrinfo *addrinfo;

  memset(&hints, 0, sizeof hints);
  hints.ai_port_space = RDMA_PS_TCP;
  hints.ai_flags = RAI_PASSIVE;

  ret = get_rdma_addr(ip.c_str(), NULL, std::to_string(port).c_str(), &hints, &addrinfo);
  if (ret) {
    return Status(StatusCode::kDeviceUnavailable, "error getting address info for " + ip);
  }

  struct rdma_cm_id *id;
  ret = rdma_create_ep(&id, addrinfo, NULL, NULL);
  rdma_freeaddrinfo(addrinfo);
  if (ret) {
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " creating listening endpoint");
  }

  ret = rdma_listen(id, 16);
  if (ret) {
    rdma_destroy_ep(id);
    return Status(StatusCode::kTransportError, "error " + std::to_string(errno) + " listening");
  }
  return new Listener(id);
}

}
}
