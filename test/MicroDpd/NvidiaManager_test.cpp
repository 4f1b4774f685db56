#include "NvidiaManager.h"

#include <absl/synchronization/notification.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

#include "MockDefs.h"
#include "SampleOutputs.h"

using testing::_;
using testing::ElementsAre;
using testing::Invoke;
using testing::StrictMock;

namespace {

constexpr const char* kGpuQueryArgs[] = {
    "--query-gpu=index,uuid,memory.total,mig.mode.current",
    "--format=csv,noheader"};

constexpr const char* kTwoGpus =
    "0, GPU-aaaa, 40960 MiB, Disabled\n"
    "1, GPU-bbbb, 40960 MiB, Enabled\n";

}  // namespace

class NvidiaManagerTest : public ::testing::Test {
 public:
  void CreateManager(absl::Duration ttl) {
    auto runner = std::make_unique<StrictMock<MockCommandRunner>>();
    m_runner_ = runner.get();
    m_manager_ = std::make_unique<Dp::NvidiaManager>(
        std::move(runner), Dp::Config::MigConf{}, ttl, absl::ZeroDuration());
  }

  void ExpectWholeGpusQuery(int times) {
    EXPECT_CALL(*m_runner_,
                Run(ElementsAre(kGpuQueryArgs[0], kGpuQueryArgs[1]), _))
        .Times(times)
        .WillRepeatedly(Invoke(ToolOutput("0, GPU-aaaa, 40960 MiB, Disabled\n")));
  }

  StrictMock<MockCommandRunner>* m_runner_{nullptr};
  std::unique_ptr<Dp::NvidiaManager> m_manager_;
};

TEST_F(NvidiaManagerTest, DiscoverWholeAndPartitionedGpus) {
  CreateManager(absl::Hours(1));

  EXPECT_CALL(*m_runner_,
              Run(ElementsAre(kGpuQueryArgs[0], kGpuQueryArgs[1]), _))
      .WillOnce(Invoke(ToolOutput(kTwoGpus)));
  EXPECT_CALL(*m_runner_, Run(ElementsAre("mig", "-lgip"), _))
      .WillOnce(Invoke(ToolOutput(kLgipA100)));
  EXPECT_CALL(*m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "1"), _))
      .WillOnce(Invoke(ToolOutput(kLgiTwoInstances)));
  EXPECT_CALL(*m_runner_,
              Run(ElementsAre("mig", "-lci", "-i", "1", "-gi", "1"), _))
      .WillOnce(Invoke(ToolOutput(kLciGi1)));
  EXPECT_CALL(*m_runner_,
              Run(ElementsAre("mig", "-lci", "-i", "1", "-gi", "2"), _))
      .WillOnce(Invoke(ToolOutput(kLciGi2)));

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);

  ASSERT_EQ(devices.size(), 3);
  EXPECT_EQ(devices[0].id, "GPU-aaaa");
  EXPECT_EQ(devices[0].physical_id, "0");
  EXPECT_FALSE(devices[0].is_partition);
  EXPECT_EQ(devices[0].device_path, "/dev/nvidia0");

  EXPECT_EQ(devices[1].id, "1-GI1-CI0");
  EXPECT_EQ(devices[2].id, "1-GI2-CI0");
  EXPECT_EQ(devices[2].physical_id, "1");
  EXPECT_EQ(devices[2].profile.value_or(""), "3g.20gb");
}

TEST_F(NvidiaManagerTest, OversizedIdsInListingAreSkipped) {
  CreateManager(absl::Hours(1));

  constexpr const char* kLgiOversized = R"(
|   0  MIG 3g.20gb          9   99999999999999999999999   4:4     |
|   0  MIG 3g.20gb          9        2          0:4     |
)";

  EXPECT_CALL(*m_runner_,
              Run(ElementsAre(kGpuQueryArgs[0], kGpuQueryArgs[1]), _))
      .Times(2)
      .WillRepeatedly(Invoke(ToolOutput("1, GPU-bbbb, 40960 MiB, Enabled\n")));
  EXPECT_CALL(*m_runner_, Run(ElementsAre("mig", "-lgip"), _))
      .WillOnce(Invoke(ToolOutput(kLgipA100)));
  EXPECT_CALL(*m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "1"), _))
      .Times(2)
      .WillRepeatedly(Invoke(ToolOutput(kLgiOversized)));
  EXPECT_CALL(*m_runner_,
              Run(ElementsAre("mig", "-lci", "-i", "1", "-gi", "2"), _))
      .Times(2)
      .WillRepeatedly(Invoke(ToolOutput(kLciGi2)));

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
  ASSERT_EQ(devices.size(), 1);
  EXPECT_EQ(devices[0].id, "1-GI2-CI0");

  // The catalog still refreshes afterwards.
  m_manager_->InvalidateCache();
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
  EXPECT_EQ(devices.size(), 1);
}

TEST_F(NvidiaManagerTest, DiscoveryFailure) {
  CreateManager(absl::Hours(1));

  EXPECT_CALL(*m_runner_,
              Run(ElementsAre(kGpuQueryArgs[0], kGpuQueryArgs[1]), _))
      .WillOnce(Invoke(ToolOutput("NVIDIA-SMI has failed", 9)));

  std::vector<Dp::Device> devices;
  EXPECT_EQ(m_manager_->DiscoverDevices(&devices),
            MicrodpErr::kDiscoveryFailure);
}

TEST_F(NvidiaManagerTest, CacheServesWithinTtl) {
  CreateManager(absl::Hours(1));
  ExpectWholeGpusQuery(1);

  std::vector<Dp::Device> first, second;
  ASSERT_EQ(m_manager_->DiscoverDevices(&first), MicrodpErr::kOk);
  ASSERT_EQ(m_manager_->DiscoverDevices(&second), MicrodpErr::kOk);

  ASSERT_EQ(second.size(), 1);
  EXPECT_EQ(first[0].id, second[0].id);
}

TEST_F(NvidiaManagerTest, CacheExpiresAfterTtl) {
  CreateManager(absl::Milliseconds(50));
  ExpectWholeGpusQuery(2);

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
  absl::SleepFor(absl::Milliseconds(120));
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
}

TEST_F(NvidiaManagerTest, InvalidateCacheForcesDiscovery) {
  CreateManager(absl::Hours(1));
  ExpectWholeGpusQuery(2);

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
  m_manager_->InvalidateCache();
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);
}

TEST_F(NvidiaManagerTest, ConcurrentCallersShareOneRefresh) {
  CreateManager(absl::Hours(1));

  absl::Notification tool_may_return;
  EXPECT_CALL(*m_runner_,
              Run(ElementsAre(kGpuQueryArgs[0], kGpuQueryArgs[1]), _))
      .WillOnce(Invoke([&](const std::list<std::string>&,
                           util::CommandResult* result) {
        tool_may_return.WaitForNotification();
        result->exit_code = 0;
        result->output = "0, GPU-aaaa, 40960 MiB, Disabled\n";
        return MicrodpErr::kOk;
      }));

  std::atomic_int succeeded = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&] {
      std::vector<Dp::Device> devices;
      if (m_manager_->DiscoverDevices(&devices) == MicrodpErr::kOk &&
          devices.size() == 1)
        succeeded++;
    });
  }

  absl::SleepFor(absl::Milliseconds(50));
  tool_may_return.Notify();
  for (auto&& t : threads) t.join();

  EXPECT_EQ(succeeded, 4);
}

TEST_F(NvidiaManagerTest, CheckHealth) {
  CreateManager(absl::Hours(1));
  ExpectWholeGpusQuery(1);

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);

  EXPECT_CALL(*m_runner_, Run(ElementsAre("-i", "0",
                                          "--query-gpu=utilization.gpu",
                                          "--format=csv,noheader"),
                              _))
      .WillOnce(Invoke(ToolOutput("35 %\n")))
      .WillOnce(Invoke(ToolOutput("\n")))
      .WillOnce(Invoke(ToolOutput("GPU is lost", 15)));

  EXPECT_TRUE(m_manager_->CheckHealth("GPU-aaaa"));
  EXPECT_FALSE(m_manager_->CheckHealth("GPU-aaaa"));
  EXPECT_FALSE(m_manager_->CheckHealth("GPU-aaaa"));

  // Never discovered: no query at all.
  EXPECT_FALSE(m_manager_->CheckHealth("GPU-zzzz"));
}

TEST_F(NvidiaManagerTest, ContainerResponseOfPartitions) {
  CreateManager(absl::Hours(1));

  Dp::Device a, b;
  a.id = "1-GI1-CI0";
  a.physical_id = "1";
  a.is_partition = true;
  b.id = "1-GI2-CI0";
  b.physical_id = "1";
  b.is_partition = true;

  v1beta1::ContainerAllocateResponse response;
  m_manager_->BuildContainerResponse({a, b}, &response);

  EXPECT_EQ(response.envs().at("NVIDIA_VISIBLE_DEVICES"),
            "1-GI1-CI0,1-GI2-CI0");
  EXPECT_EQ(response.envs().at("NVIDIA_DRIVER_CAPABILITIES"),
            "compute,utility");

  std::vector<std::string> paths;
  for (auto&& spec : response.devices()) paths.push_back(spec.host_path());
  EXPECT_THAT(paths, ElementsAre("/dev/nvidia1", "/dev/nvidiactl",
                                 "/dev/nvidia-uvm", "/dev/nvidia-uvm-tools",
                                 "/dev/nvidia-modeset", "/dev/nvidia-caps"));
  EXPECT_EQ(response.devices(5).permissions(), "rw");

  ASSERT_EQ(response.mounts_size(), 2);
  EXPECT_EQ(response.mounts(0).host_path(), "/usr/bin");
  EXPECT_EQ(response.mounts(0).container_path(), "/usr/local/nvidia/bin");
  EXPECT_TRUE(response.mounts(1).read_only());
}

TEST_F(NvidiaManagerTest, ContainerResponseOfWholeGpus) {
  CreateManager(absl::Hours(1));

  Dp::Device a, b;
  a.id = "GPU-bbbb";
  a.physical_id = "3";
  b.id = "GPU-aaaa";
  b.physical_id = "0";

  v1beta1::ContainerAllocateResponse response;
  m_manager_->BuildContainerResponse({a, b}, &response);

  std::vector<std::string> paths;
  for (auto&& spec : response.devices()) paths.push_back(spec.host_path());
  EXPECT_THAT(paths, ElementsAre("/dev/nvidia0", "/dev/nvidia3",
                                 "/dev/nvidiactl", "/dev/nvidia-uvm",
                                 "/dev/nvidia-uvm-tools",
                                 "/dev/nvidia-modeset"));
  EXPECT_EQ(response.envs().at("NVIDIA_VISIBLE_DEVICES"), "GPU-bbbb,GPU-aaaa");
}
