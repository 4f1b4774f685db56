#pragma once

#include <event2/event.h>
#include <event2/http.h>
#include <event2/util.h>
#include <sys/eventfd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <memory>
#include <thread>

#include "microdp/PublicHeader.h"

namespace Dp {

/**
 * The libevent loop of the daemon. It answers GET /health with 200 and
 * turns SIGINT and SIGTERM into the shutdown callback. The loop runs in its
 * own thread from Start() until Shutdown().
 */
class EventLoop {
 public:
  EventLoop();

  ~EventLoop();

  /***
   * @param health_port the TCP port of the /health endpoint. 0 disables it.
   * @return kSystemErr if an event can't be created or the port can't be
   * bound.
   */
  MicrodpErr Start(uint16_t health_port);

  // Called once in the loop thread on the first SIGINT or SIGTERM.
  void SetSignalCallback(std::function<void()> cb) {
    m_signal_cb_ = std::move(cb);
  }

  void Shutdown();

  void Wait();

 private:
  static void EvHealthCb_(struct evhttp_request* req, void* user_data);

  static void EvSignalCb_(evutil_socket_t sig, short events, void* user_data);

  static void EvExitEventCb_(evutil_socket_t efd, short events,
                             void* user_data);

  struct event_base* m_ev_base_;
  struct evhttp* m_ev_http_;
  struct event* m_ev_sigint_;
  struct event* m_ev_sigterm_;

  int m_ev_exit_fd_;
  struct event* m_ev_exit_event_;

  std::function<void()> m_signal_cb_;
  std::atomic_bool m_is_ending_now_;

  std::thread m_ev_loop_thread_;
};

}  // namespace Dp

inline std::unique_ptr<Dp::EventLoop> g_event_loop;
