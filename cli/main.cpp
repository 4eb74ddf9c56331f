/**
 * @file main.cpp
 * @brief relaymesh CLI — Linux one-shot runner around relaymesh::MeshNode.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into a NodeConfig and a list of operations.
 *  - Simulate the node's mediums with a StaticChannelProvider (--channels).
 *  - Restore the peer roster (and optionally the node id) from a state file under
 *    XDG config (~/.config/relaymesh/relaymesh-state.json); save it back on exit.
 *  - Run, in order: --inject-frame, --send / --emit-frame, --component transfer,
 *    then --ticks heartbeat ticks.
 *  - Print a report (pretty or JSON) to stdout; errors go to stderr.
 *
 * Notes:
 *  - A fresh node id is generated each run unless --node-id or --keep-id is given.
 *  - Exit codes: 0 ok, 1 an operation failed, 2 bad input.
 */

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "relaymesh/node.hpp"
#include "relaymesh/state_json.hpp"
#include "relaymesh/transport/static_provider.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace relaymesh;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static fs::path default_state_dir() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return base / "relaymesh";
}

// Missing or unparsable file -> empty object.
static json read_json_file(const fs::path& p) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return json::object();
  std::ifstream in(p);
  if (!in) return json::object();
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return json::object();
  return j;
}

static bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  fs::create_directories(p.parent_path(), ec);
  if (ec) return false;
  auto tmp = p; tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2);
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::optional<Bytes> from_hex(const std::string& s) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  if (s.size() % 2 != 0) return std::nullopt;
  Bytes out;
  out.reserve(s.size() / 2);
  for (size_t i = 0; i < s.size(); i += 2) {
    const int hi = nibble(s[i]);
    const int lo = nibble(s[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

// Print one labelled section of the report.
static void print_section(const std::string& title, const json& body, const Ansi& ansi) {
  std::cout << ansi.bold(title) << "\n";
  if (body.is_object()) {
    for (auto it = body.begin(); it != body.end(); ++it) {
      std::cout << "  " << it.key() << ": ";
      if (it->is_null()) std::cout << ansi.dim("(none)") << "\n";
      else if (it->is_string()) std::cout << it->get<std::string>() << "\n";
      else std::cout << it->dump() << "\n";
    }
  } else {
    std::cout << "  " << body.dump() << "\n";
  }
  std::cout << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json
  bool opt_no_color = false;
  std::string opt_state_dir;
  std::string opt_config;
  bool opt_no_save = false;

  std::string opt_node_id;
  bool opt_keep_id = false;
  uint32_t opt_seed = 0;

  std::vector<std::string> opt_channels;
  std::vector<std::string> opt_peers;

  std::string opt_send;
  std::string opt_to;
  std::string opt_proximity = "unknown";
  int opt_priority_class = 0;       // 0 => classify
  bool opt_emit_frame = false;
  bool opt_emergency = false;
  size_t opt_frame_slice = 0;       // 0 => one frame

  std::vector<std::string> opt_components;
  std::string opt_inject_frame;
  double opt_novelty = 0.5;
  std::string opt_inject_channel = "lora";

  uint32_t opt_ticks = 0;
  std::vector<std::string> opt_show;

  CLI::App app{"relaymesh CLI — multi-channel mesh transport node"};

  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--state-dir", opt_state_dir, "Override state directory");
  app.add_option("--config", opt_config, "JSON config file ({\"relay\":{...}})")->check(CLI::ExistingFile);
  app.add_flag("--no-save", opt_no_save, "Do not write the state file");

  app.add_option("--node-id", opt_node_id, "Use this node id instead of a generated one");
  app.add_flag("--keep-id", opt_keep_id, "Reuse the node id saved in the state file");
  app.add_option("--seed", opt_seed, "Seed for ids and gossip (0 = random)");

  app.add_option("--channels", opt_channels, "Available channels, comma separated")->delimiter(',');
  app.add_option("--peer", opt_peers, "Register a reachable peer id (repeatable)");

  app.add_option("--send", opt_send, "Content to send (text or JSON)");
  app.add_option("--to", opt_to, "Destination node id (default broadcast)");
  app.add_option("--proximity", opt_proximity, "local|nearby|remote|unknown")
      ->check(CLI::IsMember({"local","nearby","remote","unknown"}));
  app.add_option("--priority-class", opt_priority_class, "Relay priority class 1..5")
      ->check(CLI::Range(1, 5));
  app.add_flag("--emit-frame", opt_emit_frame, "Encode --send as a wire frame instead of routing it");
  app.add_flag("--emergency", opt_emergency, "Set the emergency flag on --emit-frame");
  app.add_option("--frame-slice", opt_frame_slice, "Split --emit-frame into frames of this many payload bytes")
      ->check(CLI::Range(static_cast<size_t>(1), MAX_FRAME_PAYLOAD));

  app.add_option("--component", opt_components, "Transfer component (repeatable)");
  app.add_option("--inject-frame", opt_inject_frame, "Hex wire frame to receive");
  app.add_option("--novelty", opt_novelty, "Gossip novelty of the injected frame")->check(CLI::Range(0.0, 1.0));
  app.add_option("--inject-channel", opt_inject_channel, "Channel the frame arrived on");

  app.add_option("--ticks", opt_ticks, "Heartbeat ticks to run");
  app.add_option("--show", opt_show, "Extra sections: metrics,stats,topology,pending,channels,sync")
      ->delimiter(',')
      ->check(CLI::IsMember({"metrics","stats","topology","pending","channels","sync"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  // Channels
  ChannelList channels;
  for (const auto& name : opt_channels) {
    auto id = channel_from_name(name);
    if (!id) {
      std::cerr << ansi.red("error: unknown channel '" + name + "'\n");
      return 2;
    }
    if (!channels.full()) channels.push_back(*id);
  }
  const auto inject_channel = channel_from_name(opt_inject_channel);
  if (!inject_channel) {
    std::cerr << ansi.red("error: unknown channel '" + opt_inject_channel + "'\n");
    return 2;
  }

  // State + config
  fs::path state_dir  = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);
  fs::path state_file = state_dir / "relaymesh-state.json";
  json st = read_json_file(state_file);

  NodeConfig cfg;
  cfg.seed = opt_seed;
  if (!opt_config.empty()) {
    json conf = read_json_file(opt_config);
    cfg.relay = state::relay_update_from_json(conf);
  }
  if (!opt_node_id.empty()) {
    if (!is_valid_node_id(opt_node_id)) {
      std::cerr << "status=error reason=" << to_string(InitError::InvalidNodeId) << "\n";
      return 2;
    }
    cfg.node_id = opt_node_id;
  } else if (opt_keep_id && st.contains("node_id") && st["node_id"].is_string()) {
    // A damaged saved id is ignored; a fresh one is generated and saved.
    const std::string saved = st["node_id"].get<std::string>();
    if (is_valid_node_id(saved)) cfg.node_id = saved;
  }

  const uint64_t now = now_ms_system();

  MeshNode node(cfg);
  transport::StaticChannelProvider provider(channels);
  transport::MemoryContentStore store;
  InitResult init = node.init(provider, &store, now);
  if (!init.ok) {
    std::cerr << "status=error reason=" << to_string(init.error) << "\n";
    return 2;
  }

  size_t restored = 0;
  if (st.contains("peers")) {
    for (const auto& info : state::peers_from_json(st["peers"])) {
      if (node.register_peer(info, now)) ++restored;
    }
  }
  for (const auto& id : opt_peers) {
    PeerInfo info;
    info.node_id        = id;
    info.channels       = channels;
    info.discovered_via = "cli";
    node.register_peer(info, now);
  }

  json report;
  report["init"] = state::to_json(init);
  report["init"]["peers_restored"] = restored;
  int rc = 0;

  // Inbound first, so a frame and a send in one run read naturally.
  if (!opt_inject_frame.empty()) {
    auto bytes = from_hex(opt_inject_frame);
    if (!bytes) {
      std::cerr << ansi.red("error: --inject-frame is not valid hex\n");
      return 2;
    }
    ReceiveResult rr = node.receive_frame(*bytes, *inject_channel, opt_novelty, now);
    report["receive"] = state::to_json(rr);
    if (!rr.ok) {
      std::cerr << "status=error reason=" << to_string(rr.error) << "\n";
      rc = 1;
    }
  }

  if (!opt_send.empty() || opt_emit_frame) {
    const Bytes content = to_bytes(opt_send);
    if (opt_emit_frame) {
      FrameOptions fo;
      fo.emergency = opt_emergency;
      if (opt_emergency) fo.priority = priority::EMERGENCY;
      if (opt_frame_slice > 0) {
        FragmentFrames ff = node.build_frames(content, opt_frame_slice, fo, now);
        if (!ff.ok) {
          std::cerr << "status=error reason=" << to_string(ff.error) << "\n";
          rc = 1;
        } else {
          json hexes = json::array();
          for (const auto& f : ff.frames) hexes.push_back(to_hex(f.data(), f.size()));
          report["frames"] = {
            {"count", ff.frames.size()},
            {"message_hash", to_hex(ff.message_hash.data(), ff.message_hash.size())},
            {"hex", hexes}
          };
        }
      } else {
        EncodeResult e = node.build_frame(content, fo, now);
        if (!e.ok) {
          std::cerr << "status=error reason=" << to_string(e.error) << "\n";
          rc = 1;
        } else {
          report["frame"] = {
            {"hex", to_hex(e.bytes.data(), e.bytes.size())},
            {"bytes", e.bytes.size()},
            {"header", state::to_json(e.header)}
          };
        }
      }
    } else {
      SendOptions so;
      so.proximity = proximity_from_name(opt_proximity);
      if (opt_priority_class > 0) so.priority_class = static_cast<uint8_t>(opt_priority_class);
      SendResult sr = node.send_dtu(content, opt_to, so, now);
      report["send"] = state::to_json(sr);
      if (!sr.ok) {
        std::cerr << "status=error reason=" << to_string(sr.error) << "\n";
        rc = 1;
      }
    }
  }

  if (!opt_components.empty()) {
    std::vector<Bytes> parts;
    parts.reserve(opt_components.size());
    for (const auto& c : opt_components) parts.push_back(to_bytes(c));
    TransferResult tr = node.initiate_transfer(parts, opt_to,
                                               proximity_from_name(opt_proximity), now);
    report["transfer"] = state::to_json(tr);
    if (!tr.ok) {
      std::cerr << "status=error reason=" << to_string(tr.error) << "\n";
      rc = 1;
    }
  }

  if (opt_ticks > 0) {
    json ticks = json::array();
    for (uint32_t n = 1; n <= opt_ticks; ++n) {
      HeartbeatReport h = node.tick(n, now + static_cast<uint64_t>(n) * 1000u);
      if (h.relay.delivered || h.relay.expired || h.beacon || h.peers_pruned || n == opt_ticks) {
        ticks.push_back(state::to_json(h));
      }
    }
    report["ticks"] = ticks;
  }

  for (const auto& s : opt_show) {
    if (s == "metrics")  report["metrics"]  = state::to_json(node.metrics(now));
    if (s == "stats")    report["stats"]    = state::to_json(node.transmission_stats());
    if (s == "topology") report["topology"] = state::to_json(node.topology());
    if (s == "pending")  report["pending"]  = state::pending_to_json(node.pending_queue());
    if (s == "channels") report["channels"] = state::channel_table_to_json(node.channels());
    if (s == "sync")     report["sync"]     = state::to_json(node.plan_offline_sync({}));
  }

  // Output
  if (opt_format == "json") {
    std::cout << report.dump(2) << "\n";
  } else {
    std::cout << "node: " << ansi.bold(node.node_id())
              << "  state: " << ansi.dim(state_file.string()) << "\n\n";
    for (auto it = report.begin(); it != report.end(); ++it) {
      print_section(it.key(), it.value(), ansi);
    }
    std::cout << (rc == 0 ? ansi.green("ok") : ansi.red("failed")) << "\n";
  }

  // Persist roster (and the id, which --keep-id reads back)
  if (!opt_no_save) {
    json out;
    out["node_id"]    = node.node_id();
    out["saved_ms"]   = now;
    out["peers"]      = state::peers_to_json(node.peers().peers(1000));
    if (!atomic_write_json(state_file, out)) {
      std::cerr << ansi.red("error: could not write " + state_file.string() + "\n");
      if (rc == 0) rc = 1;
    }
  }

  return rc;
}
