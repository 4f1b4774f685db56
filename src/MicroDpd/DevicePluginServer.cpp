#include "DevicePluginServer.h"

#include <absl/container/flat_hash_set.h>
#include <absl/time/clock.h>
#include <fmt/format.h>
#include <unistd.h>

#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace Dp {

Status DevicePluginServiceImpl::GetDevicePluginOptions(
    ServerContext *context, const v1beta1::Empty *request,
    v1beta1::DevicePluginOptions *response) {
  response->set_pre_start_required(false);
  response->set_get_preferred_allocation_available(false);
  return Status::OK;
}

Status DevicePluginServiceImpl::ListAndWatch(
    ServerContext *context, const v1beta1::Empty *request,
    ServerWriter<v1beta1::ListAndWatchResponse> *writer) {
  MICRODP_INFO("kubelet {} starts watching {}", context->peer(),
               m_dp_server_->ResourceName());

  MicrodpErr err = m_dp_server_->ListAndWatch(writer);
  switch (err) {
    case MicrodpErr::kOk:
      return Status::OK;
    case MicrodpErr::kDiscoveryFailure:
      return Status(grpc::StatusCode::UNAVAILABLE,
                    std::string(MicrodpErrStr(err)));
    default:
      return Status(grpc::StatusCode::CANCELLED,
                    std::string(MicrodpErrStr(err)));
  }
}

Status DevicePluginServiceImpl::GetPreferredAllocation(
    ServerContext *context, const v1beta1::PreferredAllocationRequest *request,
    v1beta1::PreferredAllocationResponse *response) {
  return Status::OK;
}

Status DevicePluginServiceImpl::Allocate(ServerContext *context,
                                         const v1beta1::AllocateRequest *request,
                                         v1beta1::AllocateResponse *response) {
  MicrodpErr err = m_dp_server_->Allocate(*request, response);
  switch (err) {
    case MicrodpErr::kOk:
      return Status::OK;
    case MicrodpErr::kAlreadyAllocated:
      return Status(grpc::StatusCode::ALREADY_EXISTS,
                    std::string(MicrodpErrStr(err)));
    case MicrodpErr::kNonExistent:
      return Status(grpc::StatusCode::INVALID_ARGUMENT,
                    std::string(MicrodpErrStr(err)));
    default:
      return Status(grpc::StatusCode::INTERNAL,
                    std::string(MicrodpErrStr(err)));
  }
}

Status DevicePluginServiceImpl::PreStartContainer(
    ServerContext *context, const v1beta1::PreStartContainerRequest *request,
    v1beta1::PreStartContainerResponse *response) {
  return Status::OK;
}

DevicePluginServer::DevicePluginServer(IDeviceManager *manager,
                                       DeviceAllocator *allocator,
                                       IWorkloadResolver *resolver,
                                       Config::CdiConf cdi_conf,
                                       absl::Duration watch_tick_interval)
    : m_manager_(manager),
      m_allocator_(allocator),
      m_resolver_(resolver),
      m_cdi_conf_(std::move(cdi_conf)),
      m_watch_tick_interval_(watch_tick_interval) {
  m_resource_name_ = ResourceNameOf(m_manager_->Vendor());
  m_socket_path_ = fmt::format("{}{}.{}", kDevicePluginPath,
                               kPluginSocketPrefix, m_manager_->Vendor());
  m_service_impl_ = std::make_unique<DevicePluginServiceImpl>(this);
}

DevicePluginServer::~DevicePluginServer() { Stop(); }

MicrodpErr DevicePluginServer::Start() {
  std::error_code ec;
  std::filesystem::create_directories(std::string(kDevicePluginPath), ec);
  if (ec) {
    MICRODP_ERROR("Failed to create {}: {}", kDevicePluginPath, ec.message());
    return MicrodpErr::kSystemErr;
  }

  // A socket left by a previous run makes the bind fail.
  if (unlink(m_socket_path_.c_str()) != 0 && errno != ENOENT) {
    MICRODP_ERROR("Failed to remove stale socket {}: {}", m_socket_path_,
                  strerror(errno));
    return MicrodpErr::kSystemErr;
  }

  grpc::ServerBuilder builder;
  builder.AddListeningPort(fmt::format("unix://{}", m_socket_path_),
                           grpc::InsecureServerCredentials());
  builder.RegisterService(m_service_impl_.get());

  std::unique_ptr<Server> server = builder.BuildAndStart();
  if (!server) {
    MICRODP_ERROR("Failed to serve {} on {}", m_resource_name_,
                  m_socket_path_);
    return MicrodpErr::kSystemErr;
  }
  MICRODP_INFO("Device plugin of {} is listening on {}", m_resource_name_,
               m_socket_path_);

  MicrodpErr err = RegisterWithKubelet_();
  if (err != MicrodpErr::kOk) {
    server->Shutdown();
    return err;
  }

  {
    LockGuard guard(m_watch_mtx_);
    if (!m_stopping_) {
      m_server_ = std::move(server);
      return MicrodpErr::kOk;
    }
  }

  // Stop() was called while registering.
  server->Shutdown();
  return MicrodpErr::kOk;
}

MicrodpErr DevicePluginServer::RegisterWithKubelet_() {
  auto channel = grpc::CreateChannel(fmt::format("unix://{}", kKubeletSocket),
                                     grpc::InsecureChannelCredentials());
  auto stub = v1beta1::Registration::NewStub(channel);

  v1beta1::RegisterRequest request;
  v1beta1::Empty reply;
  grpc::ClientContext context;
  context.set_deadline(absl::ToChronoTime(absl::Now() + kRegisterTimeout));

  request.set_version(std::string(kDevicePluginApiVersion));
  request.set_endpoint(
      std::filesystem::path(m_socket_path_).filename().string());
  request.set_resource_name(m_resource_name_);
  request.mutable_options()->set_pre_start_required(false);

  Status status = stub->Register(&context, request, &reply);
  if (!status.ok()) {
    MICRODP_ERROR("Failed to register {} with kubelet: {}", m_resource_name_,
                  status.error_message());
    return MicrodpErr::kRpcFailure;
  }

  MICRODP_INFO("Registered {} with kubelet", m_resource_name_);
  return MicrodpErr::kOk;
}

void DevicePluginServer::Stop() {
  std::unique_ptr<Server> server;
  {
    LockGuard guard(m_watch_mtx_);
    m_stopping_ = true;
    server = std::move(m_server_);
  }

  // Only the first caller gets the server.
  if (server) {
    server->Shutdown();
    MICRODP_TRACE("gRPC server of {} was shut down.", m_resource_name_);
  }
}

bool DevicePluginServer::SignalHealthChange(const std::string &device_id) {
  LockGuard guard(m_watch_mtx_);

  if (m_pending_health_change_) {
    MICRODP_DEBUG("Health change of {} dropped: a push is already pending.",
                  device_id);
    return false;
  }

  m_pending_health_change_ = device_id;
  return true;
}

bool DevicePluginServer::WatchEventPending_() const {
  return m_stopping_ || m_pending_health_change_.has_value();
}

DevicePluginServer::WatchEvent DevicePluginServer::WaitForWatchEvent_(
    absl::Time deadline, std::string *device_id) {
  m_watch_mtx_.LockWhenWithDeadline(
      absl::Condition(this, &DevicePluginServer::WatchEventPending_), deadline);

  WatchEvent event;
  if (m_stopping_) {
    event = WatchEvent::kStop;
  } else if (m_pending_health_change_) {
    *device_id = std::move(m_pending_health_change_.value());
    m_pending_health_change_.reset();
    event = WatchEvent::kHealthChange;
  } else {
    event = WatchEvent::kTick;
  }

  m_watch_mtx_.Unlock();
  return event;
}

MicrodpErr DevicePluginServer::ListAndWatch(
    grpc::ServerWriterInterface<v1beta1::ListAndWatchResponse> *writer) {
  enum class WatchState { kInitial = 0, kStreaming, kStopped, kFaulted };

  MicrodpErr err = MicrodpErr::kOk;
  absl::Time next_tick;
  std::string device_id;

  WatchState state = WatchState::kInitial;
  while (true) {
    switch (state) {
      case WatchState::kInitial:
        err = PushDeviceList_(writer);
        next_tick = absl::Now() + m_watch_tick_interval_;
        state =
            err == MicrodpErr::kOk ? WatchState::kStreaming : WatchState::kFaulted;
        break;

      case WatchState::kStreaming: {
        WatchEvent event = WaitForWatchEvent_(next_tick, &device_id);
        if (event == WatchEvent::kStop) {
          state = WatchState::kStopped;
          break;
        }

        if (event == WatchEvent::kHealthChange) {
          MICRODP_INFO("Health of {} device {} changed. Pushing device list.",
                       m_manager_->Vendor(), device_id);
        } else {
          // Keep a fixed cadence regardless of the pushes in between.
          absl::Time now = absl::Now();
          while (next_tick <= now) next_tick += m_watch_tick_interval_;
        }

        err = PushDeviceList_(writer);
        if (err != MicrodpErr::kOk) state = WatchState::kFaulted;
        break;
      }

      case WatchState::kStopped:
        MICRODP_INFO("Watch of {} stopped.", m_resource_name_);
        return MicrodpErr::kOk;

      case WatchState::kFaulted:
        MICRODP_ERROR("Watch of {} ended: {}", m_resource_name_,
                      MicrodpErrStr(err));
        return err;
    }
  }
}

MicrodpErr DevicePluginServer::PushDeviceList_(
    grpc::ServerWriterInterface<v1beta1::ListAndWatchResponse> *writer) {
  std::vector<Device> devices;
  MicrodpErr err = m_manager_->DiscoverDevices(&devices);
  if (err != MicrodpErr::kOk) return MicrodpErr::kDiscoveryFailure;

  absl::flat_hash_set<std::string> discovered_ids;
  for (auto &&d : devices) discovered_ids.emplace(d.id);
  m_allocator_->CleanupOrphanedDevices(discovered_ids);

  // Health queries may run the vendor tool. Don't hold the lock for them.
  std::vector<bool> health;
  health.reserve(devices.size());
  for (auto &&d : devices) health.push_back(m_manager_->CheckHealth(d.id));

  v1beta1::ListAndWatchResponse response;
  {
    LockGuard guard(m_state_mtx_);

    m_device_map_.clear();
    for (size_t i = 0; i < devices.size(); i++) {
      const Device &d = devices[i];
      m_device_map_.emplace(d.id, d);

      auto iter = m_last_health_.find(d.id);
      if (iter == m_last_health_.end()) {
        MICRODP_INFO("New {} device {}: {}", m_manager_->Vendor(), d.id,
                     health[i] ? kHealthy : kUnhealthy);
      } else if (iter->second != health[i]) {
        MICRODP_WARN("{} device {} became {}", m_manager_->Vendor(), d.id,
                     health[i] ? kHealthy : kUnhealthy);
      }

      v1beta1::Device *dev = response.add_devices();
      dev->set_id(d.id);
      dev->set_health(std::string(health[i] ? kHealthy : kUnhealthy));
    }

    m_last_health_.clear();
    for (size_t i = 0; i < devices.size(); i++)
      m_last_health_.emplace(devices[i].id, health[i]);
  }

  if (!writer->Write(response)) {
    MICRODP_ERROR("Failed to send the device list of {}", m_resource_name_);
    return MicrodpErr::KStreamBroken;
  }

  MICRODP_DEBUG("Pushed {} {} device(s) to kubelet", devices.size(),
                m_manager_->Vendor());
  return MicrodpErr::kOk;
}

MicrodpErr DevicePluginServer::Allocate(const v1beta1::AllocateRequest &request,
                                        v1beta1::AllocateResponse *response) {
  MICRODP_INFO("Allocate request for {} with {} container(s)",
               m_resource_name_, request.container_requests_size());

  for (auto &&container_req : request.container_requests()) {
    MicrodpErr err = AllocateContainer_(container_req,
                                        response->add_container_responses());
    if (err != MicrodpErr::kOk) return err;
  }

  return MicrodpErr::kOk;
}

MicrodpErr DevicePluginServer::AllocateContainer_(
    const v1beta1::ContainerAllocateRequest &req,
    v1beta1::ContainerAllocateResponse *response) {
  std::vector<std::string> ids(req.devices_ids().begin(),
                               req.devices_ids().end());

  std::vector<Device> devices;
  {
    LockGuard guard(m_state_mtx_);
    for (auto &&id : ids) {
      auto iter = m_device_map_.find(id);
      if (iter == m_device_map_.end()) {
        MICRODP_ERROR("Requested {} device {} is unknown", m_manager_->Vendor(),
                      id);
        return MicrodpErr::kNonExistent;
      }
      devices.push_back(iter->second);
    }
  }

  for (auto &&id : ids) {
    if (m_allocator_->IsAvailable(id)) continue;

    std::string owner = m_allocator_->GetOwner(id);
    if (!owner.empty() && m_resolver_->IsWorkloadActive(owner)) {
      MICRODP_WARN("Device {} is still used by {}", id, owner);
      return MicrodpErr::kAlreadyAllocated;
    }

    MICRODP_INFO("Reclaiming device {} from inactive owner \"{}\"", id, owner);
    m_allocator_->Deallocate({id});
  }

  std::string identity = m_resolver_->ResolveWorkloadIdentity(ids);
  MicrodpErr err = m_allocator_->Allocate(ids, identity);
  if (err != MicrodpErr::kOk) {
    MICRODP_ERROR("Allocation of [{}] failed: {}", boost::join(ids, ", "),
                  MicrodpErrStr(err));
    return err;
  }

  if (m_cdi_conf_.Enabled) {
    std::vector<std::string> cdi_names;
    for (auto &&id : ids) {
      cdi_names.emplace_back(
          fmt::format("{}/{}={}", m_cdi_conf_.Prefix, kResourceClass, id));
      response->add_cdi_devices()->set_name(cdi_names.back());
    }

    auto *envs = response->mutable_envs();
    (*envs)["CDI_DEVICES"] = boost::join(cdi_names, ",");
    (*envs)[std::string(m_manager_->VisibleDevicesEnv())] =
        boost::join(ids, ",");
  } else {
    m_manager_->BuildContainerResponse(devices, response);
  }

  MICRODP_INFO("Devices [{}] allocated to \"{}\"", boost::join(ids, ", "),
               identity);
  return MicrodpErr::kOk;
}

void DevicePluginServer::HealthCheckOnce() {
  std::vector<Device> devices;
  if (m_manager_->DiscoverDevices(&devices) != MicrodpErr::kOk) {
    MICRODP_ERROR("Health check of {} skipped: discovery failed.",
                  m_resource_name_);
    return;
  }

  for (auto &&d : devices) {
    bool healthy = m_manager_->CheckHealth(d.id);
    if (healthy == d.healthy) continue;

    MICRODP_WARN("{} device {} is {}", m_manager_->Vendor(), d.id,
                 healthy ? kHealthy : kUnhealthy);
    SignalHealthChange(d.id);
  }
}

void DevicePluginServer::HealthCheckLoop(const absl::Notification &cancel,
                                         absl::Duration interval) {
  while (!cancel.WaitForNotificationWithTimeout(interval)) HealthCheckOnce();
  MICRODP_TRACE("Health check loop of {} exited.", m_resource_name_);
}

}  // namespace Dp
