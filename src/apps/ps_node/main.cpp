// File: src/apps/ps_node/main.cpp
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "ps/adapters/mqtt/mqtt_status_sink.hpp"
#include "ps/adapters/sim/simulated_distance_source.hpp"
#include "ps/core/events/jsonl_bus_sink.hpp"
#include "ps/core/model/node_runner.hpp"
#include "ps/core/model/publisher_loop.hpp"
#include "ps/core/util/config_loader.hpp"
#include "ps/core/util/rng.hpp"
#include "ps/core/util/signal_stopper.hpp"
#include "ps/core/util/stop_flag.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
  bool bad{false};

  bool has_seed{false};
  std::uint32_t seed{0};
  bool has_max_ticks{false};
  std::int64_t max_ticks{0};

  std::string sink_type;  // empty = use output.type
};

bool parse_int(const std::string& s, std::int64_t& out) {
  try {
    std::size_t pos = 0;
    out = std::stoll(s, &pos);
    return pos == s.size();
  } catch (const std::exception&) {
    return false;
  }
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--seed" && i + 1 < argc) {
      std::int64_t v = 0;
      if (!parse_int(argv[++i], v) || v < 0 || v > 0xFFFFFFFFll) {
        a.bad = true;
        return a;
      }
      a.has_seed = true;
      a.seed = static_cast<std::uint32_t>(v);
      continue;
    }
    if (s == "--max-ticks" && i + 1 < argc) {
      if (!parse_int(argv[++i], a.max_ticks)) {
        a.bad = true;
        return a;
      }
      a.has_max_ticks = true;
      continue;
    }
    if (s == "--sink" && i + 1 < argc) {
      a.sink_type = argv[++i];
      continue;
    }
    a.bad = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "ps_node\n"
            << "  --config <path>\n"
            << "  [--seed <n>]        override world.seed (0 = random)\n"
            << "  [--max-ticks <n>]   override loop.max_ticks (0 = run until signalled)\n"
            << "  [--sink mqtt|jsonl] override output.type\n";
}

std::unique_ptr<ps::StatusSink> make_sink_from_config(const ps::Config& cfg) {
  if (cfg.output.type == "mqtt") return std::make_unique<ps::MqttStatusSink>(cfg.broker);
  if (cfg.output.type == "jsonl") return std::make_unique<ps::JsonlBusSink>();
  return nullptr;
}

void print_sink(const ps::Config& cfg, const ps::StatusSink& sink) {
  if (const auto* bus = dynamic_cast<const ps::JsonlBusSink*>(&sink)) {
    std::cout << "Bus: " << bus->path() << " (latest: " << bus->latest_path()
              << ", retained: " << bus->retained_path() << ")\n";
    return;
  }
  if (const auto* mqtt = dynamic_cast<const ps::MqttStatusSink*>(&sink)) {
    std::cout << "Broker: " << mqtt->endpoint() << "  keepalive_s=" << cfg.broker.keepalive_s
              << "  topics=" << cfg.topic_namespace << "/spots/<id>/status\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = ps::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  ps::Config cfg = cfg_r.take_value();

  if (args.has_seed) cfg.world.seed = args.seed;
  if (args.has_max_ticks) cfg.loop.max_ticks = args.max_ticks;
  if (!args.sink_type.empty()) cfg.output.type = args.sink_type;

  const ps::Status st_valid = ps::validate_config(cfg);
  if (!st_valid.ok()) {
    std::cerr << "invalid config: " << st_valid.message() << "\n";
    return 1;
  }

  // Resolve a random seed now so the run header and config hash record the one actually used.
  ps::Rng rng = ps::Rng::from_config_seed(cfg.world.seed);
  cfg.world.seed = rng.seed();

  ps::StopFlag stop;
  ps::SignalStopper signals(stop);
  if (!signals.status().ok()) {
    std::cerr << signals.status().message() << "\n";
    return 2;
  }

  std::unique_ptr<ps::StatusSink> sink = make_sink_from_config(cfg);
  if (!sink) {
    std::cerr << "Unknown output.type: " << cfg.output.type << "\n";
    return 1;
  }

  ps::NodeRunner runner(cfg, args.config_path);
  const ps::Status st_start = runner.start(*sink);
  if (!st_start.ok()) {
    std::cerr << st_start.message() << "\n";
    return 2;
  }

  // Ensure we always flush/close exactly once.
  struct Guard {
    ps::NodeRunner& r;
    ps::StatusSink& s;
    ~Guard() { r.stop(s); }
  } guard{runner, *sink};

  ps::SimSourceConfig sc;
  sc.spot_count = ps::resolve_spot_ids(cfg.spots).size();
  sc.world = cfg.world;
  sc.sensor = cfg.sensor;
  ps::SimulatedDistanceSource source(sc, std::move(rng), runner.since_start_ns());

  auto loop_r = ps::PublisherLoop::create(cfg, source, *sink, &std::cout);
  if (!loop_r.ok()) {
    std::cerr << loop_r.status().message() << "\n";
    return 2;
  }
  ps::PublisherLoop loop = loop_r.take_value();

  print_sink(cfg, *sink);
  std::cout << "Client: " << cfg.client_id << "  spots=" << sc.spot_count
            << "  threshold_cm=" << cfg.detection.threshold_cm
            << "  debounce_n=" << cfg.detection.debounce_n
            << "  interval_s=" << cfg.loop.interval_s << "  seed=" << cfg.world.seed << "\n\n";

  auto reason_r = runner.run(loop, *sink, stop);
  if (!reason_r.ok()) {
    std::cerr << reason_r.status().message() << "\n";
    return 2;
  }

  const ps::LoopStats& stats = loop.stats();
  std::cout << "shutdown: " << ps::to_string(reason_r.value()) << "  ticks=" << stats.ticks
            << "  events=" << stats.events << "  publish_failures=" << stats.publish_failures
            << "\n";
  return 0;
}
