#include "MigManager.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "MockDefs.h"
#include "SampleOutputs.h"

using testing::_;
using testing::ElementsAre;
using testing::InSequence;
using testing::Invoke;

class MigManagerTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_conf_.Enabled = true;
    m_conf_.Profile = "3g.20gb";
    m_conf_.InstanceCount = 0;
    m_conf_.SkipConfigured = false;
  }

  std::unique_ptr<Dp::MigManager> MakeManager() {
    return std::make_unique<Dp::MigManager>(&m_runner_, m_conf_,
                                            absl::ZeroDuration());
  }

  void ExpectGpuList(const std::string& output) {
    EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgip"), _))
        .WillOnce(Invoke(ToolOutput(kLgipA100)));
    EXPECT_CALL(m_runner_,
                Run(ElementsAre("--query-gpu=index", "--format=csv,noheader"), _))
        .WillOnce(Invoke(ToolOutput(output)));
  }

  testing::StrictMock<MockCommandRunner> m_runner_;
  Dp::Config::MigConf m_conf_;
};

TEST_F(MigManagerTest, RecreatesInstancesInOrder) {
  InSequence seq;

  ExpectGpuList("0\n");
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0",
                                         "--query-gpu=mig.mode.current",
                                         "--format=csv,noheader"),
                             _))
      .WillOnce(Invoke(ToolOutput("Enabled\n")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput(kLgiTwoInstances)));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-i", "0", "-dci"), _))
      .WillOnce(Invoke(ToolOutput("Successfully destroyed compute instance")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-i", "0", "-dgi"), _))
      .WillOnce(Invoke(ToolOutput("Successfully destroyed GPU instance")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0", "--query-gpu=memory.total",
                                         "--format=csv,noheader,nounits"),
                             _))
      .WillOnce(Invoke(ToolOutput("40960\n")));
  EXPECT_CALL(m_runner_,
              Run(ElementsAre("mig", "-i", "0", "-cgi", "9,9", "-C"), _))
      .WillOnce(Invoke(ToolOutput("Successfully created GPU instance")));

  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);
}

TEST_F(MigManagerTest, SkipsConfiguredGpu) {
  m_conf_.SkipConfigured = true;

  ExpectGpuList("0\n");
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0",
                                         "--query-gpu=mig.mode.current",
                                         "--format=csv,noheader"),
                             _))
      .WillOnce(Invoke(ToolOutput("Enabled\n")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput(kLgiTwoInstances)));

  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);
}

TEST_F(MigManagerTest, ContinuesAfterFailedGpu) {
  m_conf_.InstanceCount = 5;

  ExpectGpuList("0\n1\n");

  // GPU 0 can't even report its mode.
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0",
                                         "--query-gpu=mig.mode.current",
                                         "--format=csv,noheader"),
                             _))
      .WillOnce(Invoke(ToolOutput("Unknown Error", 255)));

  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "1",
                                         "--query-gpu=mig.mode.current",
                                         "--format=csv,noheader"),
                             _))
      .WillOnce(Invoke(ToolOutput("Disabled\n")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "1", "-mig", "1"), _))
      .WillOnce(Invoke(ToolOutput("Enabled MIG Mode for GPU 00000000:00:05.0")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "1"), _))
      .WillOnce(Invoke(ToolOutput("No GPU instances found: Not Found", 6)));
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "1", "--query-gpu=memory.total",
                                         "--format=csv,noheader,nounits"),
                             _))
      .WillOnce(Invoke(ToolOutput("40960\n")));
  // 5 requested, only 2 fit.
  EXPECT_CALL(m_runner_,
              Run(ElementsAre("mig", "-i", "1", "-cgi", "9,9", "-C"), _))
      .WillOnce(Invoke(ToolOutput("Successfully created GPU instance")));

  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);
}

TEST_F(MigManagerTest, GpuTooSmallForProfile) {
  ExpectGpuList("0\n");
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0",
                                         "--query-gpu=mig.mode.current",
                                         "--format=csv,noheader"),
                             _))
      .WillOnce(Invoke(ToolOutput("Enabled\n")));
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput("No GPU instances found: Not Found", 6)));
  EXPECT_CALL(m_runner_, Run(ElementsAre("-i", "0", "--query-gpu=memory.total",
                                         "--format=csv,noheader,nounits"),
                             _))
      .WillOnce(Invoke(ToolOutput("16384\n")));

  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);
}

TEST_F(MigManagerTest, UnsupportedHardware) {
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgip"), _))
      .WillOnce(Invoke(ToolOutput("No MIG-supported devices found.", 6)));

  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);
}

TEST_F(MigManagerTest, DisabledOrInvalidProfileRunsNothing) {
  m_conf_.Enabled = false;
  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kOk);

  m_conf_.Enabled = true;
  m_conf_.Profile = "3g";
  EXPECT_EQ(MakeManager()->Reconcile(), MicrodpErr::kPartitionConfigFailure);
}

TEST_F(MigManagerTest, DiscoverPartitions) {
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput(kLgiTwoInstances)));
  EXPECT_CALL(m_runner_,
              Run(ElementsAre("mig", "-lci", "-i", "0", "-gi", "1"), _))
      .WillOnce(Invoke(ToolOutput(kLciGi1)));
  EXPECT_CALL(m_runner_,
              Run(ElementsAre("mig", "-lci", "-i", "0", "-gi", "2"), _))
      .WillOnce(Invoke(ToolOutput("Failed to get compute instances", 3)));

  std::vector<Dp::Device> devices;
  ASSERT_EQ(MakeManager()->DiscoverPartitions(
                "0", Dp::ParseGpuInstanceProfiles(kLgipA100), &devices),
            MicrodpErr::kOk);

  ASSERT_EQ(devices.size(), 1);
  EXPECT_EQ(devices[0].id, "0-GI1-CI0");
  EXPECT_EQ(devices[0].index, "1");
  EXPECT_EQ(devices[0].physical_id, "0");
  EXPECT_TRUE(devices[0].is_partition);
  EXPECT_EQ(devices[0].profile.value_or(""), "3g.20gb");
  EXPECT_EQ(devices[0].device_path, "/dev/nvidia0");
}

TEST_F(MigManagerTest, DiscoverPartitionsOfEmptyGpu) {
  EXPECT_CALL(m_runner_, Run(ElementsAre("mig", "-lgi", "-i", "0"), _))
      .WillOnce(Invoke(ToolOutput("No GPU instances found: Not Found", 6)));

  std::vector<Dp::Device> devices;
  EXPECT_EQ(MakeManager()->DiscoverPartitions("0", {}, &devices),
            MicrodpErr::kOk);
  EXPECT_TRUE(devices.empty());
}
