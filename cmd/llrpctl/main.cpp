#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "client/cpp/reader_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "llrp/engine/v1.hpp"

using namespace llrp::engine::v1;
using llrp::engine::client::ReaderClient;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  llrpctl <config.yaml> capabilities\n"
            << "  llrpctl <config.yaml> config\n"
            << "  llrpctl <config.yaml> rospecs\n"
            << "  llrpctl <config.yaml> accessspecs\n"
            << "  llrpctl <config.yaml> inventory [seconds]\n";
}

static int Fail(const char* what, const Error& error) {
  std::cerr << what << " failed: " << ToString(error) << "\n";
  return 1;
}

static void PrintCapabilities(const ReaderCapabilities& caps) {
  if (caps.general) {
    const auto& general = *caps.general;
    std::cout << "manufacturer:   " << general.manufacturer << "\n"
              << "model:          " << general.model << "\n"
              << "firmware:       " << general.firmware_version << "\n"
              << "max antennas:   " << general.max_antennas << "\n"
              << "utc clock:      " << (general.has_utc_clock ? "yes" : "no") << "\n"
              << "gpi/gpo ports:  " << general.gpio.num_gpis << "/" << general.gpio.num_gpos << "\n";
  }
  if (caps.llrp) {
    std::cout << "max rospecs:    " << caps.llrp->max_rospecs << "\n"
              << "max accessspecs:" << caps.llrp->max_accessspecs << "\n";
  }
  if (caps.regulatory) {
    std::cout << "country code:   " << caps.regulatory->country_code << "\n";
    if (caps.regulatory->uhf_band) {
      for (const auto& level : caps.regulatory->uhf_band->transmit_power_table) {
        std::cout << "tx power " << level.index << ": " << level.power / 100.0 << " dBm\n";
      }
    }
  }
}

static void PrintConfig(const ReaderConfig& config) {
  if (config.identification) {
    std::cout << "reader id:      " << ToHex(config.identification->reader_id) << "\n";
  }
  for (const auto& antenna : config.antenna_properties) {
    std::cout << "antenna " << antenna.antenna_id << ": " << (antenna.connected ? "connected" : "disconnected")
              << " gain " << antenna.gain / 100.0 << " dBi\n";
  }
  if (config.keepalive_spec) {
    std::cout << "keepalive:      "
              << (config.keepalive_spec->trigger == KeepaliveTriggerType::kPeriodic
                      ? std::to_string(config.keepalive_spec->period_ms) + "ms"
                      : std::string("off"))
              << "\n";
  }
  for (const auto& gpi : config.gpi_port_states) {
    std::cout << "gpi " << gpi.port << ": " << (gpi.enabled ? "enabled" : "disabled") << " state "
              << static_cast<int>(gpi.state) << "\n";
  }
}

static int RunInventory(ReaderClient& client, const llrp::runtime::config::RuntimeConfig& config, int seconds) {
  client.session().AddReportObserver(
      [](const TagReportData& tag) { std::cout << FormatTagReport(tag) << std::endl; });

  if (auto status = client.ScrubConfiguration(); !status) {
    return Fail("scrub", status.error());
  }
  if (auto status = client.SetReaderConfig(llrp::factory::BuildSessionReaderConfig(config)); !status) {
    return Fail("set reader config", status.error());
  }

  auto caps = client.GetReaderCapabilities();
  if (!caps) {
    return Fail("get capabilities", caps.error());
  }

  auto rospec = llrp::factory::BuildInventoryRoSpec(config.inventory(), caps.value().get());
  if (auto status = client.AddROSpec(rospec); !status) {
    return Fail("add rospec", status.error());
  }
  if (auto status = client.EnableROSpec(rospec.id); !status) {
    return Fail("enable rospec", status.error());
  }
  if (auto status = client.StartROSpec(rospec.id); !status) {
    return Fail("start rospec", status.error());
  }

  const auto deadline = SteadyNow() + std::chrono::seconds(seconds);
  while (g_running && SteadyNow() < deadline &&
         client.session().State() == SessionState::kOperational) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (client.session().State() != SessionState::kOperational) {
    auto error = client.session().LastError();
    std::cerr << "session lost: " << (error ? ToString(*error) : std::string("unknown")) << "\n";
    return 1;
  }

  if (client.session().rospecs().State(rospec.id) == RoSpecState::kActive) {
    if (auto status = client.StopROSpec(rospec.id); !status) {
      return Fail("stop rospec", status.error());
    }
  }
  if (auto status = client.DeleteROSpec(rospec.id); !status) {
    return Fail("delete rospec", status.error());
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = llrp::config::ConfigLoader::LoadFromYaml(config_path);
    llrp::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Connect
    // ------------------------------------------------------------
    ReaderClient client(llrp::factory::BuildSession(config));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (auto status = client.Connect(); !status) {
      return Fail("connect", status.error());
    }

    int rc = 0;
    if (cmd == "capabilities") {
      auto caps = client.GetReaderCapabilities();
      rc        = caps ? (PrintCapabilities(*caps.value()), 0) : Fail("get capabilities", caps.error());
    } else if (cmd == "config") {
      auto reader_config = client.GetReaderConfig();
      rc                 = reader_config ? (PrintConfig(reader_config.value()), 0)
                                         : Fail("get reader config", reader_config.error());
    } else if (cmd == "rospecs") {
      auto rospecs = client.GetROSpecs();
      if (rospecs) {
        for (const auto& rospec : rospecs.value()) {
          std::cout << "rospec " << rospec.id << " priority " << static_cast<int>(rospec.priority) << " "
                    << RoSpecStateName(rospec.current_state) << "\n";
        }
      } else {
        rc = Fail("get rospecs", rospecs.error());
      }
    } else if (cmd == "accessspecs") {
      auto accessspecs = client.GetAccessSpecs();
      if (accessspecs) {
        for (const auto& accessspec : accessspecs.value()) {
          std::cout << "accessspec " << accessspec.id << " rospec " << accessspec.rospec_id << " antenna "
                    << accessspec.antenna_id << " " << AccessSpecStateName(accessspec.current_state) << " ops "
                    << accessspec.command.op_specs.size() << "\n";
        }
      } else {
        rc = Fail("get accessspecs", accessspecs.error());
      }
    } else if (cmd == "inventory") {
      int seconds = argc > 3 ? std::atoi(argv[3]) : 10;
      rc          = RunInventory(client, config, seconds > 0 ? seconds : 10);
    } else {
      Usage();
      rc = 1;
    }

    if (auto status = client.Close(); !status) {
      std::cerr << "close: " << ToString(status.error()) << "\n";
    }
    llrp::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
