/**
 * @file meshlink_cli.cpp
 * @brief Interactive terminal client for a mesh radio on a serial port.
 *
 * Usage:
 *   meshlink_cli [-c meshlink.ini] [--set section.key=value]...
 *
 * Lines typed on stdin are sent as text messages. Commands:
 *   /report <person> <green|yellow|red> <recommendation>
 *   /connect   /disconnect   /status   /quit
 */

#include "meshlink/config.hpp"
#include "meshlink/connection_manager.hpp"
#include "meshlink/device_provider.hpp"
#include "meshlink/link_config.hpp"
#include "meshlink/log.hpp"
#include "meshlink/message_pipeline.hpp"
#include "meshlink/messages.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <variant>

// ============================================================================
// Output
// ============================================================================

static void PrintStatus(const meshlink::LinkStatus& st, void* /*ctx*/) {
  if (st.has_error) {
    std::printf("[link] %s: %s (%s)\n", meshlink::LinkStateName(st.state),
                st.text.c_str(), meshlink::LinkErrorName(st.last_error));
  } else {
    std::printf("[link] %s: %s\n", meshlink::LinkStateName(st.state),
                st.text.c_str());
  }
  std::fflush(stdout);
}

static void PrintMessage(uint64_t seq, const meshlink::InboundMessage& msg) {
  if (const auto* t = std::get_if<meshlink::TextMessage>(&msg)) {
    std::printf("#%llu text [%u]: %s\n", static_cast<unsigned long long>(seq),
                t->packet_id, t->text.c_str());
  } else if (const auto* h = std::get_if<meshlink::HealthReport>(&msg)) {
    std::printf("#%llu health: %s risk=%s%s \"%s\"\n",
                static_cast<unsigned long long>(seq), h->person.c_str(),
                meshlink::RiskLevelName(h->risk), h->alert ? " ALERT" : "",
                h->recommendation.c_str());
  } else if (const auto* c = std::get_if<meshlink::ConfigComplete>(&msg)) {
    std::printf("#%llu config complete: id=%u\n",
                static_cast<unsigned long long>(seq), c->config_id);
  } else if (const auto* n = std::get_if<meshlink::NodeInfo>(&msg)) {
    std::printf("#%llu node: !%08x %s\n", static_cast<unsigned long long>(seq),
                n->node_num, n->long_name.c_str());
  } else if (const auto* u = std::get_if<meshlink::UnrecognizedMessage>(&msg)) {
    std::printf("#%llu unrecognized: type=0x%02x size=%u (%s)\n",
                static_cast<unsigned long long>(seq), u->type, u->size,
                meshlink::DecodeFailureName(u->reason));
  }
  std::fflush(stdout);
}

using SendResult = meshlink::expected<void, meshlink::LinkError>;

static void ReportSendResult(const SendResult& r) {
  if (!r) {
    std::printf("failed: %s\n", meshlink::LinkErrorName(r.get_error()));
  }
}

// ============================================================================
// Commands
// ============================================================================

static bool ParseRisk(const char* word, meshlink::RiskLevel& out) {
  static const meshlink::RiskLevel kLevels[] = {meshlink::RiskLevel::kGreen,
                                                meshlink::RiskLevel::kYellow,
                                                meshlink::RiskLevel::kRed};
  for (meshlink::RiskLevel lvl : kLevels) {
    if (std::strcmp(word, meshlink::RiskLevelName(lvl)) == 0) {
      out = lvl;
      return true;
    }
  }
  return false;
}

static void SendReport(meshlink::MessagePipeline& pipeline, char* args) {
  char* person = std::strtok(args, " ");
  char* risk = std::strtok(nullptr, " ");
  char* text = std::strtok(nullptr, "");
  meshlink::HealthReport report;
  if (person == nullptr || risk == nullptr ||
      !ParseRisk(risk, report.risk)) {
    std::printf("usage: /report <person> <green|yellow|red> <text>\n");
    return;
  }
  meshlink::AssignUtf8(report.person, person);
  meshlink::AssignUtf8(report.recommendation, (text != nullptr) ? text : "");
  report.alert = (report.risk == meshlink::RiskLevel::kRed);
  report.timestamp_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  ReportSendResult(pipeline.SendHealthReport(report));
}

static void PrintLinkStatus(const meshlink::ConnectionManager& mgr,
                            const meshlink::MessagePipeline& pipeline) {
  const meshlink::LinkStatus st = mgr.GetStatus();
  const meshlink::LinkManagerStats ls = mgr.GetStats();
  const meshlink::PipelineStats ps = pipeline.GetStats();
  std::printf("state=%s text=\"%s\" session=%u\n",
              meshlink::LinkStateName(st.state), st.text.c_str(),
              st.session_id.value());
  std::printf("sent=%llu failed=%llu received=%llu unrecognized=%llu "
              "keepalives=%llu dropped_bytes_events=%llu\n",
              static_cast<unsigned long long>(ps.sent),
              static_cast<unsigned long long>(ps.send_failures),
              static_cast<unsigned long long>(ps.received),
              static_cast<unsigned long long>(ps.unrecognized),
              static_cast<unsigned long long>(ls.keepalives_sent),
              static_cast<unsigned long long>(ls.bytes_events_dropped));
}

static void StripNewline(char* line) {
  size_t n = std::strlen(line);
  while (n > 0U && (line[n - 1U] == '\n' || line[n - 1U] == '\r')) {
    line[--n] = '\0';
  }
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char* argv[]) {
  meshlink::log::Init();

  meshlink::MultiConfig cfg;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
      auto r = cfg.LoadFile(argv[++i]);
      if (!r) {
        std::fprintf(stderr, "cannot load config %s\n", argv[i]);
        return 1;
      }
    } else if (std::strcmp(argv[i], "--set") == 0 && i + 1 < argc) {
      if (!cfg.ApplyOverride(argv[++i])) {
        std::fprintf(stderr, "bad override '%s', expected section.key=value\n",
                     argv[i]);
        return 1;
      }
    } else {
      std::fprintf(stderr,
                   "usage: %s [-c config] [--set section.key=value]...\n",
                   argv[0]);
      return 1;
    }
  }

  meshlink::LinkSettings settings;
  (void)meshlink::LoadLinkSettings(cfg, settings);
  meshlink::log::SetLevel(settings.log_level);

  meshlink::TtyDeviceProvider provider(meshlink::ToProviderConfig(settings));
  meshlink::ConnectionManager mgr(provider,
                                  meshlink::ToManagerConfig(settings));
  meshlink::MessagePipeline pipeline(mgr);
  pipeline.SetMessageHandler(&PrintMessage);
  (void)mgr.AddStatusObserver(&PrintStatus, nullptr);

  mgr.Start();
  ReportSendResult(mgr.Connect());

  char line[meshlink::kMaxTextLength + 64U];
  while (std::fgets(line, sizeof(line), stdin) != nullptr) {
    StripNewline(line);
    if (std::strcmp(line, "/quit") == 0) {
      break;
    }
    if (std::strcmp(line, "/connect") == 0) {
      ReportSendResult(mgr.Connect());
    } else if (std::strcmp(line, "/disconnect") == 0) {
      ReportSendResult(mgr.Disconnect());
    } else if (std::strcmp(line, "/status") == 0) {
      PrintLinkStatus(mgr, pipeline);
    } else if (std::strncmp(line, "/report ", 8) == 0) {
      SendReport(pipeline, line + 8);
    } else if (line[0] == '/') {
      std::printf("unknown command %s\n", line);
    } else if (line[0] != '\0') {
      ReportSendResult(pipeline.SendText(line));
    }
  }

  mgr.Stop();
  meshlink::log::Shutdown();
  return 0;
}
