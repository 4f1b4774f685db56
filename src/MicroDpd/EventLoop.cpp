#include "EventLoop.h"

#include <event2/buffer.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace Dp {

EventLoop::EventLoop()
    : m_ev_base_(nullptr),
      m_ev_http_(nullptr),
      m_ev_sigint_(nullptr),
      m_ev_sigterm_(nullptr),
      m_ev_exit_fd_(-1),
      m_ev_exit_event_(nullptr),
      m_is_ending_now_(false) {}

EventLoop::~EventLoop() {
  if (m_ev_loop_thread_.joinable()) {
    Shutdown();
    m_ev_loop_thread_.join();
  }

  if (m_ev_http_) evhttp_free(m_ev_http_);
  if (m_ev_sigint_) event_free(m_ev_sigint_);
  if (m_ev_sigterm_) event_free(m_ev_sigterm_);
  if (m_ev_exit_event_) event_free(m_ev_exit_event_);
  if (m_ev_exit_fd_ >= 0) close(m_ev_exit_fd_);

  if (m_ev_base_) event_base_free(m_ev_base_);
}

MicrodpErr EventLoop::Start(uint16_t health_port) {
  m_ev_base_ = event_base_new();
  if (!m_ev_base_) {
    MICRODP_ERROR("Could not initialize libevent!");
    return MicrodpErr::kSystemErr;
  }

  {  // SIGINT and SIGTERM
    m_ev_sigint_ = evsignal_new(m_ev_base_, SIGINT, EvSignalCb_, this);
    m_ev_sigterm_ = evsignal_new(m_ev_base_, SIGTERM, EvSignalCb_, this);
    if (!m_ev_sigint_ || !m_ev_sigterm_) {
      MICRODP_ERROR("Failed to create the signal events!");
      return MicrodpErr::kSystemErr;
    }

    if (event_add(m_ev_sigint_, nullptr) < 0 ||
        event_add(m_ev_sigterm_, nullptr) < 0) {
      MICRODP_ERROR("Could not add the signal events to base!");
      return MicrodpErr::kSystemErr;
    }
  }

  {  // Exit event used by Shutdown() from other threads
    if ((m_ev_exit_fd_ = eventfd(0, EFD_CLOEXEC)) < 0) {
      MICRODP_ERROR("Failed to init the eventfd!");
      return MicrodpErr::kSystemErr;
    }

    m_ev_exit_event_ = event_new(m_ev_base_, m_ev_exit_fd_,
                                 EV_PERSIST | EV_READ, EvExitEventCb_, this);
    if (!m_ev_exit_event_) {
      MICRODP_ERROR("Failed to create the exit event!");
      return MicrodpErr::kSystemErr;
    }

    if (event_add(m_ev_exit_event_, nullptr) < 0) {
      MICRODP_ERROR("Could not add the exit event to base!");
      return MicrodpErr::kSystemErr;
    }
  }

  if (health_port != 0) {
    m_ev_http_ = evhttp_new(m_ev_base_);
    if (!m_ev_http_) {
      MICRODP_ERROR("Failed to create the http server!");
      return MicrodpErr::kSystemErr;
    }

    evhttp_set_allowed_methods(m_ev_http_, EVHTTP_REQ_GET);
    evhttp_set_cb(m_ev_http_, "/health", EvHealthCb_, this);

    if (evhttp_bind_socket(m_ev_http_, "0.0.0.0", health_port) != 0) {
      MICRODP_ERROR("Failed to bind the health endpoint on port {}",
                    health_port);
      return MicrodpErr::kSystemErr;
    }

    MICRODP_INFO("Health endpoint is listening on 0.0.0.0:{}", health_port);
  }

  m_ev_loop_thread_ =
      std::thread([this]() { event_base_dispatch(m_ev_base_); });

  return MicrodpErr::kOk;
}

void EventLoop::EvHealthCb_(struct evhttp_request* req, void* user_data) {
  struct evbuffer* body = evbuffer_new();
  if (!body) {
    evhttp_send_error(req, HTTP_INTERNAL, nullptr);
    return;
  }

  evbuffer_add_printf(body, "ok\n");
  evhttp_send_reply(req, HTTP_OK, "OK", body);
  evbuffer_free(body);
}

void EventLoop::EvSignalCb_(evutil_socket_t sig, short events,
                            void* user_data) {
  auto* this_ = reinterpret_cast<EventLoop*>(user_data);

  if (this_->m_is_ending_now_.exchange(true)) {
    MICRODP_INFO("Shutdown has been triggered already. Ignoring signal {}.",
                 sig);
    return;
  }

  MICRODP_INFO("Caught signal {}. Shutting down...", strsignal(sig));
  if (this_->m_signal_cb_) this_->m_signal_cb_();

  struct timeval delay = {0, 0};
  event_base_loopexit(this_->m_ev_base_, &delay);
}

void EventLoop::EvExitEventCb_(evutil_socket_t efd, short events,
                               void* user_data) {
  auto* this_ = reinterpret_cast<EventLoop*>(user_data);

  MICRODP_TRACE("Exit event triggered. Stop event loop.");

  uint64_t u;
  ssize_t s = read(efd, &u, sizeof(uint64_t));
  if (s != sizeof(uint64_t)) {
    if (errno != EAGAIN)
      MICRODP_ERROR("Failed to read exit_fd: errno {}, {}", errno,
                    strerror(errno));
    return;
  }

  struct timeval delay = {0, 0};
  event_base_loopexit(this_->m_ev_base_, &delay);
}

void EventLoop::Shutdown() {
  MICRODP_TRACE("Triggering exit event...");
  m_is_ending_now_ = true;

  if (m_ev_exit_fd_ < 0) return;

  eventfd_t u = 1;
  if (eventfd_write(m_ev_exit_fd_, u) < 0)
    MICRODP_ERROR("Failed to write to exit event fd: {}", strerror(errno));
}

void EventLoop::Wait() {
  if (m_ev_loop_thread_.joinable()) m_ev_loop_thread_.join();
}

}  // namespace Dp
