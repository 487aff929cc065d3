/**
 * @file main.cpp
 * @brief chunkwire CLI: loopback file transfer through two Cores.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); resolve the transfer profile and an optional
 *    JSON config file on top of it.
 *  - Open the input as a stream or slice source.
 *  - Join two chunkwire::Core instances with a LoopbackLink, optionally
 *    rate-limited, and run offer -> accept -> chunks -> complete.
 *  - Build the receiver's sink chain from --sink (file, stream, memory tiers).
 *  - Print `status=progress` lines while running and one final status line.
 *
 * Notes:
 *  - All status output goes to stderr; stdout is reserved for file bytes
 *    when `--sink stream` is used without `--out`.
 *  - Exit codes: 0 ok, 1 bad config/arguments, 2 transfer failed, 3 input
 *    could not be opened.
 *  - `--json` prints the final summary as one JSON object instead.
 */

#include <cstdint>
#include <cstdio>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "chunkwire/config.hpp"
#include "chunkwire/core.hpp"
#include "chunkwire/log.hpp"
#include "chunkwire/obfuscator.hpp"
#include "chunkwire/sink.hpp"
#include "chunkwire/source.hpp"
#include "chunkwire/throughput.hpp"
#include "chunkwire/transport/loopback_channel.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace chunkwire;

// ---------- small utilities ----------

static uint64_t now_ms_steady() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

static std::string pct_text(double pct) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << pct;
  return ss.str();
}

static bool save_blob(const std::string& path, const std::vector<uint8_t>& blob, std::string& err) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { err = "cannot open " + path; return false; }
  out.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
  out.flush();
  if (!out) { err = "write failed for " + path; return false; }
  return true;
}

// Throttled progress printer, one per side.
struct ProgressLine {
  const char* side;
  bool        quiet;
  uint64_t    last_ms{0};
  double      last_pct{-1.0};

  void print(double pct, double bps) {
    if (quiet) return;
    const uint64_t now = now_ms_steady();
    if (pct < 100.0 && now - last_ms < 250 && last_pct >= 0.0) return;
    last_ms  = now;
    last_pct = pct;
    std::cerr << "status=progress side=" << side << " pct=" << pct_text(pct)
              << " speed=\"" << format_bytes(static_cast<uint64_t>(bps)) << "/s\"\n";
  }
};

// Outcome of one side of the transfer.
struct SideResult {
  bool  done{false};
  bool  ok{false};
  Error error;
};

int main(int argc, char** argv) {
  std::string opt_input;
  std::string opt_out;
  std::string opt_profile = "unified";
  std::string opt_config;
  std::string opt_sink = "file";     // file|stream|memory
  std::string opt_read = "stream";   // stream|slice
  uint64_t    opt_rate = 0;          // wire bytes/s, 0 = unlimited
  std::string opt_id;
  std::string opt_key;
  bool        opt_quiet = false;
  bool        opt_verbose = false;
  bool        opt_json = false;

  CLI::App app{"chunkwire loopback transfer"};

  app.add_option("input", opt_input, "File to send")->required()->check(CLI::ExistingFile);
  app.add_option("--out", opt_out, "Destination file or directory");
  app.add_option("--profile", opt_profile, "Transfer profile")
      ->capture_default_str()->check(CLI::IsMember(preset_names()));
  app.add_option("--config", opt_config, "JSON config applied over the profile")->check(CLI::ExistingFile);
  app.add_option("--sink", opt_sink, "Preferred sink: file|stream|memory")
      ->capture_default_str()->check(CLI::IsMember({"file", "stream", "memory"}));
  app.add_option("--read", opt_read, "Source shape: stream|slice")
      ->capture_default_str()->check(CLI::IsMember({"stream", "slice"}));
  app.add_option("--rate", opt_rate, "Loopback wire rate in bytes/s (0 = unlimited)")->capture_default_str();
  app.add_option("--id", opt_id, "Transfer id (default: derived from file name)");
  app.add_option("--key", opt_key, "Obfuscation key as hex (default: random)");
  app.add_flag("--quiet", opt_quiet, "Only warnings, errors and the final status");
  app.add_flag("--verbose", opt_verbose, "Debug logging");
  app.add_flag("--json", opt_json, "Final summary as JSON");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (opt_quiet)        set_log_level(LogLevel::Warn);
  else if (opt_verbose) set_log_level(LogLevel::Debug);

  // ---------- config ----------
  TransferConfig cfg;
  Error err;
  if (!preset(opt_profile, cfg)) {
    std::cerr << "status=error reason=\"unknown profile " << opt_profile << "\"\n";
    return 1;
  }
  if (!opt_config.empty() && !load_config_file(opt_config, cfg, err)) {
    std::cerr << "status=error reason=\"" << err.describe() << "\"\n";
    return 1;
  }
  if (!cfg.validate(err)) {
    std::cerr << "status=error reason=\"" << err.describe() << "\"\n";
    return 1;
  }

  ObfuscationKey key;
  if (opt_key.empty()) {
    key = generate_key();
  } else {
    std::string why;
    if (!parse_key_hex(opt_key, key, why)) {
      std::cerr << "status=error reason=" << why << "\n";
      return 1;
    }
  }

  const std::string file_name = fs::path(opt_input).filename().string();
  TransferId id;
  {
    std::string why;
    const std::string wanted = opt_id.empty() ? ("file-" + file_name) : opt_id;
    if (!make_transfer_id(wanted.substr(0, TRANSFER_ID_MAX), id, why)) {
      std::cerr << "status=error reason=" << why << "\n";
      return 1;
    }
  }

  // ---------- source ----------
  std::unique_ptr<ISource> source;
  {
    std::string why;
    const SourceMode mode = (opt_read == "slice") ? SourceMode::Slice : SourceMode::Stream;
    const size_t block = (mode == SourceMode::Slice) ? cfg.chunk_size : StreamSource::DEFAULT_BLOCK;
    if (!open_file_source(opt_input, mode, block, source, why)) {
      std::cerr << "status=error reason=\"" << why << "\"\n";
      return 3;
    }
  }
  const uint64_t total = source->total_size();

  // ---------- destination ----------
  // Directory (or empty) -> file named after the offer; anything else is the exact path.
  std::string out_dir = ".";
  std::string out_path;
  if (!opt_out.empty()) {
    std::error_code ec;
    if (fs::is_directory(opt_out, ec)) out_dir = opt_out;
    else out_path = opt_out;
  }
  const std::string final_path =
      out_path.empty() ? (fs::path(out_dir) / sanitize_file_name(file_name)).string() : out_path;

  std::unique_ptr<std::ofstream> stream_out;
  std::ostream* stream_target = &std::cout;
  {
    std::error_code ec;
    if (fs::exists(final_path, ec) && fs::equivalent(final_path, opt_input, ec)) {
      std::cerr << "status=error reason=\"output would overwrite input " << final_path << "\"\n";
      return 1;
    }
  }

  if (opt_sink == "stream" && !opt_out.empty()) {
    stream_out = std::make_unique<std::ofstream>(final_path, std::ios::binary | std::ios::trunc);
    if (!*stream_out) {
      std::cerr << "status=error reason=\"cannot open " << final_path << "\"\n";
      return 1;
    }
    stream_target = stream_out.get();
  }

  auto build_sinks = [&]() {
    SinkChain chain;
    if (opt_sink == "file") {
      chain.add(std::make_unique<FileSinkProvider>(out_dir, out_path));
    }
    if (opt_sink == "file" || opt_sink == "stream") {
      // stdout only when the user asked for a stream; a file run never spills onto the terminal
      chain.add(std::make_unique<StreamSinkProvider>(opt_sink == "stream" ? stream_target : nullptr));
    }
    chain.add(std::make_unique<MemorySinkProvider>(
        [final_path](const std::string&, const std::vector<uint8_t>& blob, std::string& why) {
          return save_blob(final_path, blob, why);
        }));
    return chain;
  };

  // ---------- link + cores ----------
  transport::LoopbackLink::Options lopts;
  lopts.max_message_size = cfg.max_message_size;
  transport::LoopbackLink link(lopts);

  Core tx(link.a(), cfg, key);
  Core rx(link.b(), cfg, key);

  SideResult tx_res, rx_res;
  ProgressLine tx_line{"send", opt_quiet};
  ProgressLine rx_line{"recv", opt_quiet};
  std::shared_ptr<Receiver> rx_session;     // outlives deregistration, read for the summary

  rx.set_offer_handler([&](const Offer& offer) {
    TransferCallbacks cb;
    cb.on_progress = [&](double pct, double bps) { rx_line.print(pct, bps); };
    cb.on_complete = [&]() { rx_res.done = true; rx_res.ok = true; };
    cb.on_error    = [&](const Error& e) { rx_res.done = true; rx_res.error = e; };
    Error aerr;
    if (!rx.accept(offer, build_sinks(), cb, now_ms_steady(), aerr, &rx_session)) {
      rx_res.done  = true;
      rx_res.error = aerr;
    }
  });

  TransferCallbacks send_cb;
  send_cb.on_progress = [&](double pct, double bps) { tx_line.print(pct, bps); };
  send_cb.on_complete = [&]() { tx_res.done = true; tx_res.ok = true; };
  send_cb.on_error    = [&](const Error& e) { tx_res.done = true; tx_res.error = e; };

  const uint64_t t0 = now_ms_steady();
  if (!tx.send(std::move(source), id, file_name, send_cb, t0, err)) {
    std::cerr << "status=error side=send reason=\"" << err.describe() << "\"\n";
    return 2;
  }

  // ---------- drive ----------
  int64_t  budget  = 0;               // token bucket for --rate
  uint64_t last_ms = t0;
  bool     cancel_sent = false;

  while (true) {
    const uint64_t now = now_ms_steady();

    tx.tick(now);

    size_t allowance = std::numeric_limits<size_t>::max();
    if (opt_rate > 0) {
      budget += static_cast<int64_t>(opt_rate * (now - last_ms) / 1000);
      const int64_t cap = static_cast<int64_t>(opt_rate);   // at most one second of burst
      if (budget > cap) budget = cap;
      allowance = budget > 0 ? static_cast<size_t>(budget) : 0;
    }
    last_ms = now;
    const size_t moved = link.pump(allowance);
    if (opt_rate > 0) budget -= static_cast<int64_t>(moved);

    rx.tick(now);

    // A failed side tells the other one to stop.
    if (tx_res.done && !tx_res.ok && !cancel_sent) {
      cancel_sent = true;
      if (!tx.send_cancel(id)) {
        log_line(LogLevel::Warn, "cli", "event=cancel_not_sent side=send");
        rx.cancel(id);
      }
      continue;
    }
    if (rx_res.done && !rx_res.ok && !tx_res.done) {
      if (!rx.send_cancel(id)) log_line(LogLevel::Warn, "cli", "event=cancel_not_sent side=recv");
      tx.cancel(id);
      tx_res.done  = true;
      tx_res.error = Error(ErrorKind::Sink, "receiver failed");
    }

    // Both sides settled and nothing left on the wire.
    const bool wire_empty = link.a().queued() == 0 && link.b().queued() == 0;
    if (tx.idle() && rx.idle() && wire_empty) break;

    const uint64_t wake = std::min(tx.next_wakeup_ms(), rx.next_wakeup_ms());
    uint64_t sleep_ms = wake > now ? wake - now : 0;
    if (opt_rate > 0 && (link.a().queued() || link.b().queued())) sleep_ms = std::min<uint64_t>(sleep_ms, 10);
    if (sleep_ms > 50) sleep_ms = 50;
    if (sleep_ms) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
  }

  const uint64_t elapsed = now_ms_steady() - t0;
  const std::string sink_used = rx_session ? rx_session->sink_kind() : "none";
  const bool ok = tx_res.ok && rx_res.ok;
  const Error& why = !tx_res.ok && !tx_res.error.ok() ? tx_res.error : rx_res.error;

  if (opt_json) {
    json j;
    j["status"]     = ok ? "ok" : "error";
    j["id"]         = id_text(id);
    j["bytes"]      = total;
    j["elapsed_ms"] = elapsed;
    j["sink"]       = sink_used;
    j["profile"]    = opt_profile;
    if (!ok) j["reason"] = why.ok() ? std::string("incomplete") : why.describe();
    std::cerr << j.dump() << "\n";
  } else if (ok) {
    std::cerr << "status=ok id=" << id_text(id) << " bytes=" << total
              << " size=\"" << format_bytes(total) << "\" sink=" << sink_used
              << " elapsed_ms=" << elapsed << "\n";
  } else {
    std::cerr << "status=error id=" << id_text(id) << " reason=\""
              << (why.ok() ? std::string("incomplete") : why.describe()) << "\"\n";
  }
  return ok ? 0 : 2;
}
