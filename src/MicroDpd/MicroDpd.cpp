#include <absl/strings/str_split.h>
#include <absl/synchronization/notification.h>
#include <event2/thread.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <yaml-cpp/yaml.h>

#include <boost/algorithm/string/join.hpp>
#include <cxxopts.hpp>
#include <filesystem>
#include <list>
#include <thread>

#include "AscendManager.h"
#include "CommandRunner.h"
#include "DevicePluginServer.h"
#include "DpdConfig.h"
#include "EventLoop.h"
#include "NvidiaManager.h"
#include "ResourceRecycler.h"
#include "SimulatorManager.h"
#include "WorkloadResolver.h"
#include "microdp/PublicHeader.h"

// Everything serving one vendor. Members are destroyed in reverse order, so
// the server goes before the objects it points to.
struct VendorPlugin {
  std::unique_ptr<Dp::IDeviceManager> manager;
  std::unique_ptr<Dp::DeviceAllocator> allocator;
  std::unique_ptr<Dp::IWorkloadResolver> resolver;
  std::unique_ptr<Dp::ResourceRecycler> recycler;
  std::unique_ptr<Dp::DevicePluginServer> server;
};

Dp::Config g_config;

void GlobalVariableInit() {
  // Enable inter-thread custom event notification.
  evthread_use_pthreads();

  spdlog::level::level_enum level;
  if (g_config.DebugLevel == "trace")
    level = spdlog::level::trace;
  else if (g_config.DebugLevel == "debug")
    level = spdlog::level::debug;
  else if (g_config.DebugLevel == "info")
    level = spdlog::level::info;
  else if (g_config.DebugLevel == "warn")
    level = spdlog::level::warn;
  else
    level = spdlog::level::err;

  auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      g_config.LogFile, 1048576 * 5, 3);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

  file_sink->set_level(level);
  console_sink->set_level(level);

  spdlog::init_thread_pool(256, 1);
  auto logger = std::make_shared<spdlog::async_logger>(
      "default", spdlog::sinks_init_list{file_sink, console_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(1));

  spdlog::set_level(spdlog::level::trace);

  g_event_loop = std::make_unique<Dp::EventLoop>();
}

std::unique_ptr<Dp::IDeviceManager> CreateDeviceManager(
    const std::string& vendor) {
  if (vendor == "nvidia") {
    auto runner = std::make_unique<Dp::ToolCommandRunner>(
        g_config.NvidiaSmiPath, Dp::DriverToolEnv());
    return std::make_unique<Dp::NvidiaManager>(std::move(runner),
                                               g_config.Mig);
  }

  if (vendor == "huawei") {
    auto runner = std::make_unique<Dp::ToolCommandRunner>(
        g_config.NpuSmiPath, Dp::DriverToolEnv());
    return std::make_unique<Dp::AscendManager>(std::move(runner));
  }

  return std::make_unique<Dp::SimulatorManager>(
      g_config.SimulatorFailureRate);
}

std::unique_ptr<VendorPlugin> CreateVendorPlugin(const std::string& vendor) {
  auto plugin = std::make_unique<VendorPlugin>();

  plugin->manager = CreateDeviceManager(vendor);
  plugin->allocator = std::make_unique<Dp::DeviceAllocator>();

  if (g_config.PodResourcesSocket.empty()) {
    MICRODP_WARN("Pod resources lookup is disabled. Allocations of {} have "
                 "no owner and are recycled on the next scan.",
                 vendor);
    plugin->resolver = std::make_unique<Dp::NullWorkloadResolver>();
  } else {
    plugin->resolver = std::make_unique<Dp::PodResourcesResolver>(
        g_config.PodResourcesSocket, Dp::ResourceNameOf(vendor));
  }

  plugin->recycler = std::make_unique<Dp::ResourceRecycler>(
      plugin->allocator.get(), plugin->resolver.get());
  plugin->server = std::make_unique<Dp::DevicePluginServer>(
      plugin->manager.get(), plugin->allocator.get(), plugin->resolver.get(),
      g_config.Cdi);

  return plugin;
}

void StartServer() {
  GlobalVariableInit();

  std::list<std::unique_ptr<VendorPlugin>> plugins;
  for (auto&& vendor : g_config.Vendors) {
    auto plugin = CreateVendorPlugin(vendor);

    if (Dp::IPartitionConfigurator* configurator =
            plugin->manager->PartitionConfigurator()) {
      MicrodpErr err = configurator->ConfigurePartitions();
      if (err != MicrodpErr::kOk)
        MICRODP_ERROR("Partition setup of {} failed: {}", vendor,
                      MicrodpErrStr(err));
    }

    plugins.emplace_back(std::move(plugin));
  }

  absl::Notification cancel;
  auto stop_all = [&] {
    if (!cancel.HasBeenNotified()) cancel.Notify();
    for (auto&& plugin : plugins) plugin->server->Stop();
  };

  g_event_loop->SetSignalCallback(stop_all);
  if (g_event_loop->Start(g_config.HealthPort) != MicrodpErr::kOk) {
    MICRODP_ERROR("Failed to start the event loop. Exiting...");
    std::exit(1);
  }

  for (auto&& plugin : plugins) {
    MicrodpErr err = plugin->server->Start();
    if (err != MicrodpErr::kOk) {
      MICRODP_ERROR("Failed to start the device plugin of {}: {}. Exiting...",
                    plugin->server->ResourceName(), MicrodpErrStr(err));
      stop_all();
      g_event_loop->Shutdown();
      g_event_loop->Wait();
      std::exit(1);
    }
  }

  std::list<std::thread> threads;
  for (auto&& plugin : plugins) {
    threads.emplace_back([&cancel, server = plugin->server.get()] {
      server->HealthCheckLoop(cancel);
    });
    threads.emplace_back([&cancel, recycler = plugin->recycler.get()] {
      recycler->RecycleLoop(cancel);
    });
  }

  MICRODP_INFO("microdpd is serving [{}]",
               boost::join(g_config.Vendors, ", "));

  g_event_loop->Wait();

  for (auto&& thread : threads) thread.join();

  // Free global variables
  plugins.clear();
  g_event_loop.reset();

  MICRODP_INFO("microdpd exited.");
  spdlog::shutdown();
}

int main(int argc, char** argv) {
  cxxopts::Options options("microdpd");

  // clang-format off
  options.add_options()
      ("C,config", "Path to the config file",
       cxxopts::value<std::string>()->default_value(kDefaultConfigPath))
      ("D,debug-level", "[trace|debug|info|warn|error]", cxxopts::value<std::string>())
      ("v,vendors", "Comma separated vendors: [nvidia,huawei,simulator]",
       cxxopts::value<std::string>())
      ("p,health-port", "Port of the /health endpoint. 0 disables it.",
       cxxopts::value<uint16_t>())
      ("h,help", "Show help")
      ;
  // clang-format on

  try {
    cxxopts::ParseResult parsed_args = options.parse(argc, argv);

    if (parsed_args.count("help") > 0) {
      fmt::print("{}\n", options.help());
      return 0;
    }

    std::string config_path = parsed_args["config"].as<std::string>();
    if (std::filesystem::exists(config_path)) {
      try {
        YAML::Node config = YAML::LoadFile(config_path);
        if (Dp::ParseConfigNode(config, &g_config) != MicrodpErr::kOk)
          return 1;
      } catch (YAML::Exception& e) {
        MICRODP_ERROR("Can't load config file {}: {}", config_path, e.what());
        return 1;
      }
    } else if (parsed_args.count("config") > 0) {
      MICRODP_ERROR("Config file {} doesn't exist.", config_path);
      return 1;
    }

    if (Dp::ApplyEnvOverrides(&g_config) != MicrodpErr::kOk) return 1;

    if (parsed_args.count("debug-level") > 0)
      g_config.DebugLevel = parsed_args["debug-level"].as<std::string>();

    if (parsed_args.count("vendors") > 0) {
      std::vector<std::string> vendors =
          absl::StrSplit(parsed_args["vendors"].as<std::string>(), ',',
                         absl::SkipWhitespace());
      g_config.Vendors = std::move(vendors);
    }

    if (parsed_args.count("health-port") > 0)
      g_config.HealthPort = parsed_args["health-port"].as<uint16_t>();
  } catch (const cxxopts::OptionException& e) {
    fmt::print("Invalid arguments: {}\n{}\n", e.what(), options.help());
    return 1;
  }

  if (Dp::ValidateConfig(g_config) != MicrodpErr::kOk) return 1;

  StartServer();

  return 0;
}
