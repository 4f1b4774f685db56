#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/notification.h>
#include <grpc++/grpc++.h>

#include <memory>
#include <optional>
#include <string>

#include "DeviceAllocator.h"
#include "DeviceManager.h"
#include "DpdPublicDefs.h"
#include "WorkloadResolver.h"
#include "microdp/Lock.h"
#include "protos/DevicePlugin.grpc.pb.h"
#include "protos/DevicePlugin.pb.h"

namespace Dp {

using grpc::Server;
using grpc::ServerContext;
using grpc::ServerWriter;
using grpc::Status;

class DevicePluginServer;

class DevicePluginServiceImpl : public v1beta1::DevicePlugin::Service {
 public:
  explicit DevicePluginServiceImpl(DevicePluginServer *server)
      : m_dp_server_(server) {}

  Status GetDevicePluginOptions(ServerContext *context,
                                const v1beta1::Empty *request,
                                v1beta1::DevicePluginOptions *response) override;

  Status ListAndWatch(
      ServerContext *context, const v1beta1::Empty *request,
      ServerWriter<v1beta1::ListAndWatchResponse> *writer) override;

  Status GetPreferredAllocation(
      ServerContext *context, const v1beta1::PreferredAllocationRequest *request,
      v1beta1::PreferredAllocationResponse *response) override;

  Status Allocate(ServerContext *context,
                  const v1beta1::AllocateRequest *request,
                  v1beta1::AllocateResponse *response) override;

  Status PreStartContainer(
      ServerContext *context, const v1beta1::PreStartContainerRequest *request,
      v1beta1::PreStartContainerResponse *response) override;

 private:
  DevicePluginServer *m_dp_server_;
};

/**
 * Serves one vendor's devices to kubelet under the resource name
 * "<vendor>.com/microgpu". The managers, the allocator and the resolver are
 * owned by the caller and must outlive the server.
 */
class DevicePluginServer {
 public:
  DevicePluginServer(IDeviceManager *manager, DeviceAllocator *allocator,
                     IWorkloadResolver *resolver, Config::CdiConf cdi_conf,
                     absl::Duration watch_tick_interval = kWatchTickInterval);

  ~DevicePluginServer();

  /***
   * Listen on the plugin socket and register with kubelet.
   * @return kSystemErr if the socket can't be served. kRpcFailure if kubelet
   * refused the registration.
   */
  MicrodpErr Start();

  // Ends every watch and shuts down the gRPC server. Can't be undone.
  void Stop() LOCKS_EXCLUDED(m_watch_mtx_);

  const std::string &ResourceName() const { return m_resource_name_; }

  const std::string &SocketPath() const { return m_socket_path_; }

  /***
   * Ask the watch loop for an immediate push.
   * @return false if a previous signal is still pending. The signal is
   * dropped in this case since the pending push will carry the new state.
   */
  bool SignalHealthChange(const std::string &device_id)
      LOCKS_EXCLUDED(m_watch_mtx_);

  /***
   * Push the device list, then push again on every tick or health change
   * until the server stops.
   * @return kOk if the server was stopped. kDiscoveryFailure or
   * KStreamBroken if a push failed.
   */
  MicrodpErr ListAndWatch(
      grpc::ServerWriterInterface<v1beta1::ListAndWatchResponse> *writer);

  /***
   * @return kNonExistent if a requested device wasn't in the last pushed
   * list. kAlreadyAllocated if a requested device belongs to a live workload.
   * Containers handled before the failing one keep their devices.
   */
  MicrodpErr Allocate(const v1beta1::AllocateRequest &request,
                      v1beta1::AllocateResponse *response);

  // Compare the health of every device with the value it was discovered with
  // and signal the watch loop on a mismatch.
  void HealthCheckOnce();

  void HealthCheckLoop(const absl::Notification &cancel,
                       absl::Duration interval = kHealthCheckInterval);

 private:
  using Mutex = util::mutex;
  using LockGuard = util::AbslMutexLockGuard;

  enum class WatchEvent { kTick, kHealthChange, kStop };

  WatchEvent WaitForWatchEvent_(absl::Time deadline, std::string *device_id)
      LOCKS_EXCLUDED(m_watch_mtx_);

  bool WatchEventPending_() const EXCLUSIVE_LOCKS_REQUIRED(m_watch_mtx_);

  MicrodpErr PushDeviceList_(
      grpc::ServerWriterInterface<v1beta1::ListAndWatchResponse> *writer)
      LOCKS_EXCLUDED(m_state_mtx_);

  MicrodpErr AllocateContainer_(const v1beta1::ContainerAllocateRequest &req,
                                v1beta1::ContainerAllocateResponse *response);

  MicrodpErr RegisterWithKubelet_();

  IDeviceManager *m_manager_;
  DeviceAllocator *m_allocator_;
  IWorkloadResolver *m_resolver_;
  Config::CdiConf m_cdi_conf_;
  absl::Duration m_watch_tick_interval_;

  std::string m_resource_name_;
  std::string m_socket_path_;

  Mutex m_watch_mtx_;
  std::optional<std::string> m_pending_health_change_ GUARDED_BY(m_watch_mtx_);
  bool m_stopping_ GUARDED_BY(m_watch_mtx_){false};

  Mutex m_state_mtx_;
  // Devices of the last push, used to resolve Allocate requests.
  absl::flat_hash_map<std::string, Device> m_device_map_
      GUARDED_BY(m_state_mtx_);
  // Health of the last push, for logging changes.
  absl::flat_hash_map<std::string, bool> m_last_health_
      GUARDED_BY(m_state_mtx_);

  std::unique_ptr<DevicePluginServiceImpl> m_service_impl_;
  std::unique_ptr<Server> m_server_ GUARDED_BY(m_watch_mtx_);

  friend class DevicePluginServiceImpl;
};

}  // namespace Dp
