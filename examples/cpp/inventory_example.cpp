#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "client/cpp/reader_client.h"
#include "internal/factory.hpp"
#include "llrp/engine/v1.hpp"

int main(int argc, char** argv) {
  // Reader host and an optional inventory duration in seconds.
  const std::string host    = argc > 1 ? argv[1] : "127.0.0.1";
  const int         seconds = argc > 2 ? std::atoi(argv[2]) : 5;

  llrp::runtime::config::RuntimeConfig config;
  config.mutable_reader()->set_host(host);
  config.mutable_keepalive()->set_period_ms(10000);
  config.mutable_inventory()->set_include_peak_rssi(true);
  config.mutable_inventory()->set_include_seen_count(true);

  llrp::engine::client::ReaderClient client(llrp::factory::BuildSession(config));

  std::atomic<int> tags{0};
  client.session().AddReportObserver([&tags](const llrp::engine::v1::TagReportData& tag) {
    ++tags;
    std::cout << llrp::engine::v1::FormatTagReport(tag) << '\n';
  });

  if (auto status = client.Connect(); !status) {
    std::cerr << "Connect failed: " << status.error().message << '\n';
    return 1;
  }

  // Start from a clean reader so the ROSpec id below cannot collide.
  if (auto status = client.ScrubConfiguration(); !status) {
    std::cerr << "ScrubConfiguration failed: " << status.error().message << '\n';
    return 1;
  }
  if (auto status = client.SetReaderConfig(llrp::factory::BuildSessionReaderConfig(config)); !status) {
    std::cerr << "SetReaderConfig failed: " << status.error().message << '\n';
    return 1;
  }

  auto capabilities = client.GetReaderCapabilities();
  const auto rospec =
      llrp::factory::BuildInventoryRoSpec(config.inventory(), capabilities.ok() ? capabilities.value().get() : nullptr);

  auto status = client.AddROSpec(rospec);
  if (status) {
    status = client.EnableROSpec(rospec.id);
  }
  if (status) {
    status = client.StartROSpec(rospec.id);
  }
  if (!status) {
    std::cerr << "ROSpec setup failed: " << status.error().message << '\n';
    return 1;
  }

  std::this_thread::sleep_for(std::chrono::seconds(seconds));

  if (auto status = client.StopROSpec(rospec.id); !status) {
    std::cerr << "StopROSpec failed: " << status.error().message << '\n';
  }
  if (auto status = client.Close(); !status) {
    std::cerr << "Close failed: " << status.error().message << '\n';
    return 1;
  }

  std::cout << "Read " << tags.load() << " tag reports\n";
  return 0;
}
