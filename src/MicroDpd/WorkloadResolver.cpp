#include "WorkloadResolver.h"

#include <absl/container/flat_hash_set.h>
#include <fmt/format.h>

#include <chrono>

namespace Dp {

using grpc::ClientContext;
using grpc::Status;

std::string FindPodHoldingDevices(const v1::ListPodResourcesResponse& pods,
                                  const std::string& resource_name,
                                  const std::vector<std::string>& device_ids) {
  absl::flat_hash_set<std::string> wanted(device_ids.begin(),
                                          device_ids.end());

  for (auto&& pod : pods.pod_resources()) {
    for (auto&& container : pod.containers()) {
      for (auto&& devices : container.devices()) {
        if (devices.resource_name() != resource_name) continue;

        for (auto&& id : devices.device_ids()) {
          if (wanted.contains(id))
            return fmt::format("{}/{}", pod.namespace_(), pod.name());
        }
      }
    }
  }

  return {};
}

bool PodListed(const v1::ListPodResourcesResponse& pods,
               const std::string& identity) {
  for (auto&& pod : pods.pod_resources()) {
    if (fmt::format("{}/{}", pod.namespace_(), pod.name()) == identity)
      return true;
  }
  return false;
}

PodResourcesResolver::PodResourcesResolver(const std::string& socket_path,
                                           std::string resource_name)
    : m_resource_name_(std::move(resource_name)) {
  m_channel_ = grpc::CreateChannel(fmt::format("unix://{}", socket_path),
                                   grpc::InsecureChannelCredentials());
  m_stub_ = v1::PodResourcesLister::NewStub(m_channel_);
}

MicrodpErr PodResourcesResolver::ListPodResources_(
    v1::ListPodResourcesResponse* response) {
  using namespace std::chrono_literals;

  v1::ListPodResourcesRequest request;
  ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + 5s);

  Status status = m_stub_->List(&context, request, response);
  if (!status.ok()) {
    MICRODP_WARN("Failed to list pod resources from kubelet: {}",
                 status.error_message());
    return MicrodpErr::kRpcFailure;
  }

  return MicrodpErr::kOk;
}

std::string PodResourcesResolver::ResolveWorkloadIdentity(
    const std::vector<std::string>& device_ids) {
  v1::ListPodResourcesResponse response;
  if (ListPodResources_(&response) != MicrodpErr::kOk) return {};

  return FindPodHoldingDevices(response, m_resource_name_, device_ids);
}

bool PodResourcesResolver::IsWorkloadActive(const std::string& identity) {
  if (identity.empty()) return false;

  v1::ListPodResourcesResponse response;
  if (ListPodResources_(&response) != MicrodpErr::kOk) return false;

  return PodListed(response, identity);
}

}  // namespace Dp
