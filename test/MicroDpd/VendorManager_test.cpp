#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "AscendManager.h"
#include "MockDefs.h"
#include "SimulatorManager.h"

using testing::_;
using testing::ElementsAre;
using testing::Invoke;
using testing::StrictMock;

namespace {

constexpr const char* kNpuList =
    "        Total Count                    : 2\n"
    "\n"
    "        NPU ID                         : 0\n"
    "        Product Name                   : IT21PDDA01\n"
    "\n"
    "        NPU ID                         : 3\n"
    "        Product Name                   : IT21PDDA01\n";

std::string HealthOf(const std::string& status) {
  return "        Health Status                  : " + status + "\n";
}

}  // namespace

class AscendManagerTest : public ::testing::Test {
 public:
  void SetUp() override {
    auto runner = std::make_unique<StrictMock<MockCommandRunner>>();
    m_runner_ = runner.get();
    m_manager_ = std::make_unique<Dp::AscendManager>(std::move(runner),
                                                     absl::Hours(1));
  }

  StrictMock<MockCommandRunner>* m_runner_{nullptr};
  std::unique_ptr<Dp::AscendManager> m_manager_;
};

TEST_F(AscendManagerTest, Discover) {
  EXPECT_CALL(*m_runner_, Run(ElementsAre("info", "-l"), _))
      .WillOnce(Invoke(ToolOutput(kNpuList)));

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);

  ASSERT_EQ(devices.size(), 2);
  EXPECT_EQ(devices[0].id, "0");
  EXPECT_EQ(devices[0].device_path, "/dev/davinci0");
  EXPECT_EQ(devices[1].id, "3");
  EXPECT_EQ(devices[1].device_path, "/dev/davinci3");
  EXPECT_FALSE(devices[1].is_partition);
}

TEST_F(AscendManagerTest, CheckHealth) {
  EXPECT_CALL(*m_runner_, Run(ElementsAre("info", "-l"), _))
      .WillOnce(Invoke(ToolOutput(kNpuList)));
  EXPECT_CALL(*m_runner_,
              Run(ElementsAre("info", "-t", "health", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput(HealthOf("OK"))))
      .WillOnce(Invoke(ToolOutput(HealthOf("Warning"))))
      .WillOnce(Invoke(ToolOutput(HealthOf("Alarm"))))
      .WillOnce(Invoke(ToolOutput("", 1)));

  std::vector<Dp::Device> devices;
  ASSERT_EQ(m_manager_->DiscoverDevices(&devices), MicrodpErr::kOk);

  EXPECT_TRUE(m_manager_->CheckHealth("0"));
  EXPECT_TRUE(m_manager_->CheckHealth("0"));
  EXPECT_FALSE(m_manager_->CheckHealth("0"));
  EXPECT_FALSE(m_manager_->CheckHealth("0"));

  // Not in the last discovery.
  EXPECT_FALSE(m_manager_->CheckHealth("7"));
}

TEST_F(AscendManagerTest, ContainerResponse) {
  std::vector<Dp::Device> devices(2);
  devices[0].id = "0";
  devices[0].device_path = "/dev/davinci0";
  devices[1].id = "3";
  devices[1].device_path = "/dev/davinci3";

  v1beta1::ContainerAllocateResponse response;
  m_manager_->BuildContainerResponse(devices, &response);

  EXPECT_EQ(response.envs().at("ASCEND_VISIBLE_DEVICES"), "0,3");

  std::vector<std::string> paths;
  for (auto&& spec : response.devices()) paths.emplace_back(spec.host_path());
  EXPECT_THAT(paths, ElementsAre("/dev/davinci0", "/dev/davinci3",
                                 "/dev/davinci_manager", "/dev/devmm_svm",
                                 "/dev/hisi_hdc"));
}

TEST(SimulatorManager, FixedDevices) {
  Dp::SimulatorManager manager(0.0);

  std::vector<Dp::Device> devices;
  ASSERT_EQ(manager.DiscoverDevices(&devices), MicrodpErr::kOk);
  ASSERT_EQ(devices.size(), 3);
  EXPECT_EQ(devices[2].id, "2");
  EXPECT_EQ(devices[2].device_path, "/dev/sim_gpu2");

  for (int i = 0; i < 100; i++) EXPECT_TRUE(manager.CheckHealth("1"));

  v1beta1::ContainerAllocateResponse response;
  manager.BuildContainerResponse({devices[0], devices[2]}, &response);
  EXPECT_EQ(response.envs().at("SIM_VISIBLE_DEVICES"), "0,2");
  ASSERT_EQ(response.devices_size(), 2);
  EXPECT_EQ(response.devices(1).host_path(), "/dev/sim_gpu2");
}

TEST(SimulatorManager, FailureRateIsClamped) {
  Dp::SimulatorManager manager(5.0);
  for (int i = 0; i < 100; i++) EXPECT_FALSE(manager.CheckHealth("0"));
}
