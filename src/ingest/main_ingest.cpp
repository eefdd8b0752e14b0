#include "artifact_queue.hpp"
#include "collaborators.hpp"
#include "dispatcher.hpp"
#include "logging.hpp"
#include "pipeline.hpp"
#include "stream_receiver.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>

using namespace goesrx;

namespace {

void usage() {
  std::cerr
      << "usage: goesrx [--connect host:port | --replay file] [options]\n"
         "  --out dir              output directory (default ./out)\n"
         "  --dry-run              keep artifacts in memory only\n"
         "  --profile name         goes-r-hrit | goes-lrit\n"
         "  --frame-size n         transport unit size in bytes\n"
         "  --scid n               accepted spacecraft id (repeatable)\n"
         "  --stall-timeout s      flush files idle for s seconds\n"
         "  --queue-capacity n     persistence queue bound\n"
         "  --write-retries n      write attempts per artifact\n"
         "  --drain-grace ms       shutdown drain budget\n"
         "  --reconnect-delay s    wait before reconnecting\n"
         "  --no-reconnect         exit when the socket is lost\n"
         "  --stats-interval s     counter summary period, 0 disables\n"
         "  --dump-headers         write a .hdr.txt beside each artifact\n"
         "  --log-level level      trace|debug|info|warn|error\n";
}

} // namespace

int main(int argc, char **argv) {
  std::string connect = "127.0.0.1:5004";
  std::string replay;
  std::string out_dir = "out";
  std::string profile_name = "goes-r-hrit";
  std::string log_level = "info";
  size_t frame_size = 0;
  std::vector<uint8_t> scids;
  int stall_timeout = 120;
  size_t queue_capacity = 256;
  int write_retries = 3;
  int drain_grace_ms = 5000;
  int reconnect_delay = 5;
  bool reconnect = true;
  bool dry_run = false;
  bool dump_headers = false;
  int stats_interval = 60;

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--connect")
        connect = next(i);
      else if (a == "--replay")
        replay = next(i);
      else if (a == "--out")
        out_dir = next(i);
      else if (a == "--dry-run")
        dry_run = true;
      else if (a == "--profile")
        profile_name = next(i);
      else if (a == "--frame-size")
        frame_size = (size_t)std::stoul(next(i));
      else if (a == "--scid") {
        std::string v = next(i);
        uint8_t id;
        if (!parse_scid(v, id)) {
          std::cerr << "bad spacecraft id " << v << " (0..255)" << std::endl;
          return 1;
        }
        scids.push_back(id);
      } else if (a == "--stall-timeout")
        stall_timeout = std::stoi(next(i));
      else if (a == "--queue-capacity")
        queue_capacity = (size_t)std::stoul(next(i));
      else if (a == "--write-retries")
        write_retries = std::stoi(next(i));
      else if (a == "--drain-grace")
        drain_grace_ms = std::stoi(next(i));
      else if (a == "--reconnect-delay")
        reconnect_delay = std::stoi(next(i));
      else if (a == "--no-reconnect")
        reconnect = false;
      else if (a == "--stats-interval")
        stats_interval = std::stoi(next(i));
      else if (a == "--dump-headers")
        dump_headers = true;
      else if (a == "--log-level")
        log_level = next(i);
      else if (a == "--help" || a == "-h") {
        usage();
        return 0;
      } else {
        std::cerr << "unknown option " << a << "\n";
        usage();
        return 1;
      }
    }
  } catch (const std::logic_error &e) {
    std::cerr << "bad option value: " << e.what() << std::endl;
    return 1;
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  PipelineConfig pcfg;
  if (!profile_by_name(profile_name, pcfg.profile)) {
    std::cerr << "unknown profile " << profile_name << std::endl;
    return 1;
  }
  if (frame_size) {
    if (frame_size <= kVcduHeaderLen + kMpduHeaderLen) {
      std::cerr << "frame size too small" << std::endl;
      return 1;
    }
    pcfg.profile.frame_len = frame_size;
  }
  pcfg.profile.spacecraft_ids = scids;
  pcfg.stall_timeout = std::chrono::seconds(std::max(1, stall_timeout));

  ReceiverConfig rcfg;
  if (!parse_host_port(connect, rcfg.host, rcfg.port)) {
    std::cerr << "bad connect address" << std::endl;
    return 1;
  }
  rcfg.reconnect_delay = std::chrono::seconds(std::max(0, reconnect_delay));

  QueueConfig qcfg;
  qcfg.capacity = std::max<size_t>(1, queue_capacity);
  qcfg.max_attempts = std::max(1, write_retries);

  DispatchConfig dcfg;
  dcfg.dump_headers = dump_headers;

  std::unique_ptr<Storage> storage;
  if (dry_run)
    storage.reset(new MemoryStorage());
  else
    storage.reset(new DirectoryStorage(out_dir));

  Stats stats;
  PgmImageCodec codec;
  ZlibDecompressor inflater;
  ArtifactQueue queue(qcfg, *storage, stats);
  queue.start();
  Dispatcher dispatcher(dcfg, codec, inflater, queue, stats);
  Pipeline pipeline(pcfg, dispatcher, stats);
  UnitFramer framer(pcfg.profile, stats, [&](TransportUnit &&u) {
    pipeline.on_unit(std::move(u));
  });

  Logger::instance().log(LogLevel::INFO, "goesrx: profile %s, frame %zu, out %s",
                         pcfg.profile.name.c_str(), pcfg.profile.frame_len,
                         dry_run ? "(memory)" : out_dir.c_str());

  int rc = 0;
  if (!replay.empty()) {
    std::string err;
    if (!replay_file(replay, framer, err)) {
      Logger::instance().log(LogLevel::ERROR, "replay: %s", err.c_str());
      rc = 1;
    }
  } else {
    asio::io_context io;
    auto receiver = std::make_shared<TcpStreamReceiver>(io, rcfg, framer);
    asio::steady_timer sweep_timer(io);
    asio::steady_timer stats_timer(io);
    asio::signal_set signals(io, SIGINT, SIGTERM);

    auto stop_all = [&]() {
      receiver->stop();
      sweep_timer.cancel();
      stats_timer.cancel();
      signals.cancel();
    };

    receiver->on_connect([&](bool again) {
      if (again)
        pipeline.on_reconnect();
    });
    receiver->on_disconnect([&](const std::error_code &) {
      if (reconnect)
        return true;
      rc = 1;
      stop_all();
      return false;
    });

    std::function<void()> arm_sweep = [&]() {
      sweep_timer.expires_after(std::chrono::seconds(1));
      sweep_timer.async_wait([&](std::error_code ec) {
        if (ec)
          return;
        pipeline.sweep(std::chrono::steady_clock::now());
        arm_sweep();
      });
    };
    std::function<void()> arm_stats = [&]() {
      stats_timer.expires_after(std::chrono::seconds(stats_interval));
      stats_timer.async_wait([&](std::error_code ec) {
        if (ec)
          return;
        Logger::instance().log(LogLevel::INFO, "stats: %s",
                               stats.summary().c_str());
        arm_stats();
      });
    };

    signals.async_wait([&](std::error_code ec, int sig) {
      if (ec)
        return;
      Logger::instance().log(LogLevel::INFO, "signal %d, shutting down", sig);
      stop_all();
    });

    receiver->start();
    arm_sweep();
    if (stats_interval > 0)
      arm_stats();

    io.run();
    framer.finish();
  }

  pipeline.shutdown();
  if (!queue.drain(std::chrono::milliseconds(std::max(0, drain_grace_ms))))
    Logger::instance().log(LogLevel::WARN, "persistence backlog not drained");
  Logger::instance().log(LogLevel::INFO, "stats: %s", stats.summary().c_str());
  return rc;
}
