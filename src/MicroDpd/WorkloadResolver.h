#pragma once

#include <grpc++/grpc++.h>

#include <memory>
#include <string>
#include <vector>

#include "microdp/PublicHeader.h"
#include "protos/PodResources.grpc.pb.h"
#include "protos/PodResources.pb.h"

namespace Dp {

/**
 * Answers who is using a device and whether that workload still runs.
 * An identity is "<namespace>/<pod name>".
 */
class IWorkloadResolver {
 public:
  virtual ~IWorkloadResolver() = default;

  // Empty if no workload can be found for the devices.
  virtual std::string ResolveWorkloadIdentity(
      const std::vector<std::string>& device_ids) = 0;

  // Any lookup failure reports inactive.
  virtual bool IsWorkloadActive(const std::string& identity) = 0;
};

// Used when the pod-resources socket is not configured. Knows nobody.
class NullWorkloadResolver : public IWorkloadResolver {
 public:
  std::string ResolveWorkloadIdentity(
      const std::vector<std::string>& device_ids) override {
    return {};
  }

  bool IsWorkloadActive(const std::string& identity) override { return false; }
};

/**
 * Queries the kubelet pod-resources API. A pod is active as long as kubelet
 * still lists it with resources assigned.
 */
class PodResourcesResolver : public IWorkloadResolver {
 public:
  PodResourcesResolver(const std::string& socket_path,
                       std::string resource_name);

  std::string ResolveWorkloadIdentity(
      const std::vector<std::string>& device_ids) override;

  bool IsWorkloadActive(const std::string& identity) override;

 private:
  MicrodpErr ListPodResources_(v1::ListPodResourcesResponse* response);

  std::string m_resource_name_;

  std::shared_ptr<grpc::Channel> m_channel_;
  std::unique_ptr<v1::PodResourcesLister::Stub> m_stub_;
};

// The pod holding any of `device_ids` of `resource_name`, or empty.
std::string FindPodHoldingDevices(const v1::ListPodResourcesResponse& pods,
                                  const std::string& resource_name,
                                  const std::vector<std::string>& device_ids);

bool PodListed(const v1::ListPodResourcesResponse& pods,
               const std::string& identity);

}  // namespace Dp
