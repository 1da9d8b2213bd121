/*
 *
 *  async_events.cpp
 *
 */

#include "async_events.hpp"

#include <chrono>
#include <thread>

#include <infiniband/verbs.h>
#include <rdma/rdma_cma.h>

#include "rdc/error.hpp"
#include "rdc/transport.hpp"

#include "debug.h"

namespace rdc {

namespace {
  // Polling interval of the trail, bounds how long Stop waits
  const int kAsyncEventTimeoutMs = 100;
}

void LogAsyncEvent(struct ibv_context *ctx, const struct ibv_async_event &ev) {
  switch (ev.event_type) {
  /* QP events */
  case IBV_EVENT_QP_FATAL:
    info_wtime(stderr, "[async_event]QP fatal event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_QP_REQ_ERR:
    info_wtime(stderr, "[async_event]QP Requestor error for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_QP_ACCESS_ERR:
    info_wtime(stderr, "[async_event]QP access error event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_COMM_EST:
    debug(stderr, "QP communication established event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_SQ_DRAINED:
    debug(stderr, "QP Send Queue drained event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_PATH_MIG:
    info_wtime(stderr, "[async_event]QP Path migration loaded event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_PATH_MIG_ERR:
    info_wtime(stderr, "[async_event]QP Path migration error event for QP %u\n", ev.element.qp->qp_num);
    break;
  case IBV_EVENT_QP_LAST_WQE_REACHED:
    debug(stderr, "QP last WQE reached event for QP %u\n", ev.element.qp->qp_num);
    break;

  /* CQ events */
  case IBV_EVENT_CQ_ERR:
    info_wtime(stderr, "[async_event]CQ error for CQ with handle %p\n", (void *)ev.element.cq);
    break;

  /* Port events */
  case IBV_EVENT_PORT_ACTIVE:
    info_wtime(stderr, "[async_event]Port active event for port number %d\n", ev.element.port_num);
    break;
  case IBV_EVENT_PORT_ERR:
    info_wtime(stderr, "[async_event]Port error event for port number %d\n", ev.element.port_num);
    break;
  case IBV_EVENT_LID_CHANGE:
  case IBV_EVENT_PKEY_CHANGE:
  case IBV_EVENT_GID_CHANGE:
  case IBV_EVENT_SM_CHANGE:
  case IBV_EVENT_CLIENT_REREGISTER:
    debug(stderr, "port %d configuration event %d\n", ev.element.port_num, ev.event_type);
    break;

  /* RDMA device events */
  case IBV_EVENT_DEVICE_FATAL:
    info_wtime(stderr, "[async_event]Fatal error event for device %s\n", ibv_get_device_name(ctx->device));
    break;

  default:
    info_wtime(stderr, "[async_event]Unknown event (%d)\n", ev.event_type);
  }
}

transport::AsyncEvent TranslateAsyncEvent(const struct ibv_async_event &ev) {
  transport::AsyncEvent out;
  out.type = transport::AsyncEventType::kOther;
  out.qp_num = 0;
  switch (ev.event_type) {
  case IBV_EVENT_QP_FATAL:
  case IBV_EVENT_QP_REQ_ERR:
  case IBV_EVENT_QP_ACCESS_ERR:
    out.type = transport::AsyncEventType::kQpFatal;
    out.qp_num = ev.element.qp->qp_num;
    break;
  case IBV_EVENT_CQ_ERR: {
    out.type = transport::AsyncEventType::kCqError;
    // rdma_cm creates the completion queues of an endpoint with its id as context
    auto id = static_cast<struct rdma_cm_id *>(ev.element.cq->cq_context);
    if (id != nullptr && id->qp != nullptr) {
      out.qp_num = id->qp->qp_num;
    }
    break;
  }
  case IBV_EVENT_PORT_ERR:
    out.type = transport::AsyncEventType::kPortError;
    break;
  case IBV_EVENT_DEVICE_FATAL:
    out.type = transport::AsyncEventType::kDeviceFatal;
    break;
  default:
    break;
  }
  return out;
}

AsyncEventTrail::~AsyncEventTrail() {
  this->Stop();
}

void AsyncEventTrail::Start() {
  if (this->running_.exchange(true)) {
    return;
  }
  this->thread_ = std::thread(&AsyncEventTrail::Run, this);
}

void AsyncEventTrail::Stop() {
  this->running_.store(false);
  if (this->thread_.joinable()) {
    this->thread_.join();
  }
}

void AsyncEventTrail::Run() {
  while (this->running_.load()) {
    transport::AsyncEvent ev;
    auto got_s = this->device_->GetAsyncEvent(&ev, kAsyncEventTimeoutMs);
    if (!got_s.ok()) {
      info_wtime(stderr, "[async_event]stopped trailing %s: %s\n", this->device_->GetName().c_str(),
          got_s.status().message().c_str());
      return;
    }
    if (got_s.value() && ev.type != transport::AsyncEventType::kOther) {
      this->handler_(ev);
    }
  }
}

}
