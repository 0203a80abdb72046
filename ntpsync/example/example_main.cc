// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Example program for SyncService with simple CLI options.
 *
 * Usage:
 *   ntpsync_example --server 127.0.0.1:9123 --server 192.0.2.10:123 \
 *     --minpoll 4 --maxpoll 10 --step 128 --panic 1000 --window 8
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ntpsync/sync_service.hpp"

namespace {
/**
 * @brief Thread-safe logger for engine messages.
 */
class Logger {
 public:
  explicit Logger(bool debug) : debug_(debug) {}

  void Log(ntpsync::LogLevel level, const std::string& msg) {
    if (level == ntpsync::LogLevel::Debug && !debug_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s %s\n", ntpsync::ToString(level), msg.c_str());
  }

 private:
  bool debug_;
  std::mutex mutex_;
};

void ShowCur() {
  std::printf("\x1b[?25h");
  std::fflush(stdout);
}

void SignalHandler(int sig) {
  (void)sig;
  ShowCur();
  std::exit(0);
}

void HideCur() { std::printf("\x1b[?25l"); }
void MoveRow(int row) { std::printf("\x1b[%d;1H", row); }
void AtExitShowCur() { ShowCur(); }

/** Split "A.B.C.D:port"; the port defaults to 123. */
bool ParseServer(const std::string& s, std::string* ip, uint16_t* port) {
  const size_t colon = s.rfind(':');
  *ip = s.substr(0, colon);
  *port = 123;
  if (colon != std::string::npos) {
    const int p = std::atoi(s.c_str() + colon + 1);
    if (p <= 0 || p > 65535) return false;
    *port = static_cast<uint16_t>(p);
  }
  return !ip->empty();
}

std::string NowLine(double now_s, bool utc) {
  const int offset = utc ? 0 : 9 * 3600;
  const char* tzlabel = utc ? "UTC" : "JST";
  const int64_t isec = static_cast<int64_t>(now_s);
  const time_t t = static_cast<time_t>(isec + offset);
  std::tm tm = *std::gmtime(&t);
  double frac = now_s - static_cast<double>(isec);
  if (frac < 0) frac = 0;
  int ms = static_cast<int>(frac * 1000.0 + 0.5);
  if (ms >= 1000) ms -= 1000;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "now=%04d-%02d-%02d %02d:%02d:%02d.%03d %s",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, ms, tzlabel);
  return buf;
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: ntpsync_example --server A.B.C.D[:port] [options]\n"
               "Options:\n"
               "  --server A.B.C.D[:N]  Source to poll (repeatable)\n"
               "  --minpoll n           (default 4, log2 s)\n"
               "  --maxpoll n           (default 10, log2 s)\n"
               "  --step ms             (default 128)\n"
               "  --panic s             (default 1000)\n"
               "  --window n            (default 8)\n"
               "  --quorum n            (default 3)\n"
               "  --utc                 (default: JST)\n"
               "  --debug               Enable debug logging\n");
}
}  // namespace

int main(int argc, char** argv) {
  bool opt_utc = false;  // default: JST
  bool debug = false;
  size_t servers = 0;

  auto builder = ntpsync::Options::Builder();

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--server" && need(1)) {
      std::string ip;
      uint16_t port = 0;
      if (!ParseServer(argv[++i], &ip, &port)) {
        std::fprintf(stderr, "Bad server: %s\n", argv[i]);
        return 2;
      }
      builder.AddSource(ip, port);
      ++servers;
    } else if (a == "--minpoll" && need(1)) {
      builder.MinPoll(std::atoi(argv[++i]));
    } else if (a == "--maxpoll" && need(1)) {
      builder.MaxPoll(std::atoi(argv[++i]));
    } else if (a == "--step" && need(1)) {
      builder.StepThresholdMs(std::atof(argv[++i]));
    } else if (a == "--panic" && need(1)) {
      builder.PanicThresholdS(std::atof(argv[++i]));
    } else if (a == "--window" && need(1)) {
      builder.WindowSize(std::atoi(argv[++i]));
    } else if (a == "--quorum" && need(1)) {
      builder.Quorum(std::atoi(argv[++i]));
    } else if (a == "--utc") {
      opt_utc = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (servers == 0) {
    PrintUsage();
    return 2;
  }

  Logger logger(debug);
  builder.LogSink([&logger](ntpsync::LogLevel level, const std::string& msg) {
    logger.Log(level, msg);
  });

  ntpsync::SyncService svc;
  const ntpsync::Options opt = builder.Build();
  std::printf("Starting sync with %zu source(s)\n", servers);
  HideCur();
  std::atexit(AtExitShowCur);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (!svc.Start(opt)) {
    std::fprintf(stderr, "Failed to start SyncService\n");
    return 1;
  }

  // Redraw only the lines that changed.
  std::vector<std::string> prev;
  std::printf("\x1b[2J\x1b[H");
  while (true) {
    const ntpsync::Status st = svc.GetStatus();
    char buf[256];
    std::vector<std::string> cur;
    cur.emplace_back(NowLine(svc.NowUnix().ToDouble(), opt_utc));
    std::snprintf(buf, sizeof(buf),
                  "sync=%s  stratum=%d  mode=%s  peer=%u%s",
                  st.synchronized ? "true" : "false", st.stratum,
                  ntpsync::ToString(st.mode),
                  static_cast<unsigned>(st.system_peer),
                  st.alarm ? "  ALARM" : "");
    cur.emplace_back(buf);
    std::snprintf(buf, sizeof(buf),
                  "offset_s=%.6f  jitter_s=%.6f  freq_ppm=%.3f", st.offset_s,
                  st.jitter_s, st.frequency_ppm);
    cur.emplace_back(buf);
    std::snprintf(buf, sizeof(buf),
                  "rounds=%llu  truechimers=%d  survivors=%d  last_corr=%s "
                  "amount=%.6f",
                  static_cast<unsigned long long>(st.rounds), st.truechimers,
                  st.survivors, ntpsync::ToString(st.last_correction),
                  st.last_correction_amount_s);
    cur.emplace_back(buf);
    cur.emplace_back(std::string("error=") + st.last_error);
    cur.emplace_back(
        "  id  source                 reach poll  offset_s    delay_s  "
        "  disp_s    jitter_s  flags");
    for (const auto& s : st.sources) {
      const std::string ep =
          s.endpoint.address + ":" + std::to_string(s.endpoint.port);
      std::snprintf(buf, sizeof(buf),
                    "%4u  %-21s  %03o  %4d  %+.6f  %.6f  %.6f  %.6f  %s%s",
                    static_cast<unsigned>(s.id), ep.c_str(),
                    static_cast<unsigned>(s.reach), s.poll_exponent,
                    s.offset_s, s.delay_s, s.dispersion_s, s.jitter_s,
                    s.survivor ? "*" : (s.falseticker ? "x" : " "),
                    s.has_stat ? "" : " (no data)");
      cur.emplace_back(buf);
    }
    while (cur.size() < prev.size()) cur.emplace_back("");
    prev.resize(cur.size());
    for (size_t i = 0; i < cur.size(); ++i) {
      if (prev[i] == cur[i]) continue;
      MoveRow(static_cast<int>(i) + 1);
      std::printf("\x1b[2K");
      std::fwrite(cur[i].data(), 1, cur[i].size(), stdout);
      std::printf("\n");
    }
    std::fflush(stdout);
    prev.swap(cur);
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  // not reached
  return 0;
}
