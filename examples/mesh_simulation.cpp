#include <mh/active_completion_queue.hpp>
#include <mh/log.hpp>
#include <mh/loopback_transport.hpp>
#include <mh/mesh_host.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
bool interrupt = false;
extern "C" void signal_handler(int sig) {
  interrupt = true;
}

char const usage[] = " [--log-level=<severity>] [--fail-host-after=<seconds>] <peer-id> [peer-id...]";

bool starts_with(std::string const& arg, std::string const& prefix) {
  return arg.compare(0, prefix.size(), prefix) == 0;
}
} // anonymous namespace

/**
 * Simulate a mesh of peers in a single process, and print the host election results.
 *
 * Each peer gets its own event loop and a loopback transport.  With --fail-host-after the host is disconnected after
 * the given number of seconds, and the remaining peers elect a new host.
 */
int main(int argc, char* argv[]) try {
  using namespace std::chrono_literals;

  mh::severity level = mh::severity::info;
  int fail_host_after = 0;
  std::vector<std::string> ids;
  for (int i = 1; i != argc; ++i) {
    std::string arg = argv[i];
    if (starts_with(arg, "--log-level=")) {
      level = mh::parse_severity(arg.substr(std::string("--log-level=").size()));
    } else if (starts_with(arg, "--fail-host-after=")) {
      fail_host_after = std::atoi(arg.substr(std::string("--fail-host-after=").size()).c_str());
    } else if (starts_with(arg, "--")) {
      std::cerr << "Unknown option " << arg << "\nUsage: " << argv[0] << usage << std::endl;
      return 1;
    } else {
      ids.push_back(arg);
    }
  }
  if (ids.empty()) {
    std::cerr << "Usage: " << argv[0] << usage << std::endl;
    return 1;
  }

  mh::log::instance().min_severity(level);
  mh::log::instance().add_sink(
      mh::make_log_sink([](mh::severity sev, std::string&& x) { std::cerr << x << std::endl; }));

  auto hub = std::make_shared<mh::loopback_hub>();
  std::map<std::string, std::shared_ptr<mh::loopback_transport>> transports;
  std::map<std::string, std::unique_ptr<mh::mesh_host>> peers;
  for (auto const& id : ids) {
    mh::mesh_config config;
    config.self_id = id;
    config.room_id = "simulation";
    config.device_name = "simulated-" + id;
    auto transport = hub->connect(id);
    transports[id] = transport;
    std::unique_ptr<mh::mesh_host> peer(
        new mh::mesh_host(std::make_shared<mh::active_completion_queue>(id), transport, config));
    peer->subscribe([id](mh::host_event const& e) { std::cout << id << ": " << e << std::endl; });
    peers[id] = std::move(peer);
  }
  peers.begin()->second->start_election();

  // ... block here until a signal is received ...
  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  auto fail_at = std::chrono::steady_clock::now() + std::chrono::seconds(fail_host_after);
  bool failed = fail_host_after <= 0;
  while (not interrupt) {
    std::this_thread::sleep_for(20ms);
    if (failed or std::chrono::steady_clock::now() < fail_at) {
      continue;
    }
    failed = true;
    for (auto& p : peers) {
      if (p.second and p.second->is_host()) {
        std::cout << "disconnecting host " << p.first << std::endl;
        transports[p.first]->disconnect();
        p.second.reset();
        break;
      }
    }
  }

  for (auto& p : peers) {
    if (p.second) {
      p.second->shutdown();
    }
  }
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
} catch (...) {
  std::cerr << "unknown exception raised" << std::endl;
  return 1;
}
