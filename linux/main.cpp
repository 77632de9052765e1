#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "cJSON.h"
#include "config.hpp"
#include "linux_platform.hpp"
#include "protocol.hpp"
#include "ptz_device.hpp"
#include "transport_factory.hpp"

using namespace pan_tilt;

namespace {

std::mutex g_out_mutex;

/** Напечатать JSON одной строкой в stdout и освободить объект. */
void PrintJson(cJSON* json) {
  if (json == nullptr) {
    return;
  }
  char* str = cJSON_PrintUnformatted(json);
  if (str) {
    std::lock_guard lock(g_out_mutex);
    std::printf("%s\n", str);
    std::fflush(stdout);
    std::free(str);
  }
  cJSON_Delete(json);
}

cJSON* PositionToJson(const RelativePosition& pos) {
  cJSON* json = cJSON_CreateObject();
  if (json == nullptr) {
    return nullptr;
  }
  cJSON_AddNumberToObject(json, "pan", pos.pan_deg);
  cJSON_AddNumberToObject(json, "tilt", pos.tilt_deg);
  cJSON_AddNumberToObject(json, "abs_pan", pos.absolute.pan_deg);
  cJSON_AddNumberToObject(json, "abs_tilt", pos.absolute.tilt_deg);
  cJSON_AddBoolToObject(json, "pan_valid", pos.status.pan_valid);
  cJSON_AddBoolToObject(json, "tilt_valid", pos.status.tilt_valid);
  cJSON_AddBoolToObject(json, "estimated", pos.status.estimated);
  return json;
}

void PrintTelemetry(const TelemetrySample& sample) {
  cJSON* json = PositionToJson(sample.position);
  if (json == nullptr) {
    return;
  }
  cJSON_AddStringToObject(json, "type", "telemetry");
  cJSON_AddNumberToObject(json, "seq", static_cast<double>(sample.seq));
  cJSON_AddNumberToObject(json, "ts", static_cast<double>(sample.timestamp_ms));
  cJSON_AddBoolToObject(json, "degraded", sample.degraded);
  PrintJson(json);
}

void PrintOutcome(const CommandOutcome& outcome) {
  cJSON* json = cJSON_CreateObject();
  if (json == nullptr) {
    return;
  }
  cJSON_AddStringToObject(json, "type", "done");
  cJSON_AddNumberToObject(json, "seq", static_cast<double>(outcome.seq));
  cJSON_AddStringToObject(json, "command", outcome.name.c_str());
  cJSON_AddBoolToObject(json, "ok", outcome.ok);
  if (!outcome.error.empty()) {
    cJSON_AddStringToObject(json, "error", outcome.error.c_str());
  }
  PrintJson(json);
}

void PrintError(const char* message) {
  cJSON* json = cJSON_CreateObject();
  if (json == nullptr) {
    return;
  }
  cJSON_AddStringToObject(json, "type", "error");
  cJSON_AddStringToObject(json, "message", message);
  PrintJson(json);
}

void PrintUsage(const char* argv0) {
  std::fprintf(stderr,
               "Usage: %s [--sim | --serial PORT [--baud N] | --tcp HOST:PORT]\n"
               "          [--address N] [--blocking] [--telemetry] "
               "[--verbose]\n"
               "\n"
               "Commands (stdin):\n"
               "  up|down|left|right|left-up|left-down|right-up|right-down "
               "[speed]\n"
               "  stop | pan DEG | tilt DEG | abs PAN TILT | home | pos\n"
               "  preset set|call|clear ID | aux on|off ID\n"
               "  zoom in|out | focus far|near | iris open|close\n"
               "  cruise | scan start|end|run | guard on|off | reset | quit\n",
               argv0);
}

struct Options {
  ConnectionConfig connection{};
  ControllerConfig controller{};
  bool telemetry{false};
  bool verbose{false};
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options opts;
  opts.connection.kind = TransportKind::Simulator;

  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (std::strcmp(arg, "--sim") == 0) {
      opts.connection.kind = TransportKind::Simulator;
    } else if (std::strcmp(arg, "--serial") == 0 && has_value) {
      opts.connection.kind = TransportKind::Serial;
      opts.connection.serial.port = argv[++i];
    } else if (std::strcmp(arg, "--baud") == 0 && has_value) {
      opts.connection.serial.baud_rate =
          static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
    } else if (std::strcmp(arg, "--tcp") == 0 && has_value) {
      const std::string target = argv[++i];
      const auto colon = target.rfind(':');
      if (colon == std::string::npos) {
        return std::nullopt;
      }
      opts.connection.kind = TransportKind::Network;
      opts.connection.network.host = target.substr(0, colon);
      opts.connection.network.port = static_cast<uint16_t>(
          std::strtoul(target.c_str() + colon + 1, nullptr, 10));
    } else if (std::strcmp(arg, "--address") == 0 && has_value) {
      const auto address =
          static_cast<uint8_t>(std::strtoul(argv[++i], nullptr, 10));
      opts.controller.address = address;
      opts.connection.simulator.address = address;
    } else if (std::strcmp(arg, "--blocking") == 0) {
      opts.controller.blocking = true;
    } else if (std::strcmp(arg, "--telemetry") == 0) {
      opts.telemetry = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      return std::nullopt;
    }
  }

  if (!opts.connection.IsValid() || !opts.controller.IsValid()) {
    return std::nullopt;
  }
  return opts;
}

std::optional<Direction> ParseDirection(const std::string& word) {
  if (word == "up") return Direction::Up;
  if (word == "down") return Direction::Down;
  if (word == "left") return Direction::Left;
  if (word == "right") return Direction::Right;
  if (word == "left-up") return Direction::LeftUp;
  if (word == "left-down") return Direction::LeftDown;
  if (word == "right-up") return Direction::RightUp;
  if (word == "right-down") return Direction::RightDown;
  return std::nullopt;
}

/** Поставить операцию в очередь и сообщить об ошибке постановки. */
void Submit(PtzDevice& device, const std::string& name, CommandFn operation) {
  const auto result = device.Enqueue(name, std::move(operation), PrintOutcome);
  if (IsError(result)) {
    PrintError(ToString(GetError(result)));
  }
}

/**
 * Выполнить одну строку консоли.
 * @return false, если пользователь запросил выход
 */
bool HandleLine(PtzDevice& device, const Options& opts,
                const std::string& line) {
  std::istringstream in(line);
  std::string cmd;
  if (!(in >> cmd)) {
    return true;
  }

  if (cmd == "quit" || cmd == "exit") {
    return false;
  }

  if (const auto direction = ParseDirection(cmd)) {
    int speed = 0;
    if (!(in >> speed)) {
      speed = opts.controller.default_speed;
    }
    const auto result = device.Move(
        *direction, protocol::Protocol::ClampSpeed(speed), PrintOutcome);
    if (IsError(result)) {
      PrintError(ToString(GetError(result)));
    }
  } else if (cmd == "stop") {
    if (!device.Stop()) {
      PrintError("stop failed");
    }
  } else if (cmd == "pan" || cmd == "tilt") {
    double angle = 0.0;
    if (!(in >> angle)) {
      PrintError("angle expected");
      return true;
    }
    const auto result =
        cmd == "pan" ? device.Absolute(angle, std::nullopt, PrintOutcome)
                     : device.Absolute(std::nullopt, angle, PrintOutcome);
    if (IsError(result)) {
      PrintError(ToString(GetError(result)));
    }
  } else if (cmd == "abs") {
    double pan = 0.0;
    double tilt = 0.0;
    if (!(in >> pan >> tilt)) {
      PrintError("pan and tilt expected");
      return true;
    }
    const auto result = device.Absolute(pan, tilt, PrintOutcome);
    if (IsError(result)) {
      PrintError(ToString(GetError(result)));
    }
  } else if (cmd == "home") {
    const auto result = device.Home(PrintOutcome);
    if (IsError(result)) {
      PrintError(ToString(GetError(result)));
    }
  } else if (cmd == "pos") {
    const auto result = device.Position();
    if (IsError(result)) {
      PrintError(ToString(GetError(result)));
    } else {
      cJSON* json = PositionToJson(GetValue(result));
      if (json) {
        cJSON_AddStringToObject(json, "type", "position");
      }
      PrintJson(json);
    }
  } else if (cmd == "preset" || cmd == "aux") {
    std::string action;
    int id = -1;
    if (!(in >> action >> id) || id < 0 || id > 0xFF) {
      PrintError("action and id expected");
      return true;
    }
    const auto preset_id = static_cast<uint8_t>(id);
    if (cmd == "preset" && action == "set") {
      Submit(device, "set_preset",
             [preset_id](PtzController& c) { c.SetPreset(preset_id); });
    } else if (cmd == "preset" && action == "call") {
      Submit(device, "call_preset",
             [preset_id](PtzController& c) { c.CallPreset(preset_id); });
    } else if (cmd == "preset" && action == "clear") {
      Submit(device, "clear_preset",
             [preset_id](PtzController& c) { c.ClearPreset(preset_id); });
    } else if (cmd == "aux" && action == "on") {
      Submit(device, "aux_on",
             [preset_id](PtzController& c) { c.AuxOn(preset_id); });
    } else if (cmd == "aux" && action == "off") {
      Submit(device, "aux_off",
             [preset_id](PtzController& c) { c.AuxOff(preset_id); });
    } else {
      PrintError("unknown action");
    }
  } else if (cmd == "zoom" || cmd == "focus" || cmd == "iris") {
    std::string arg;
    in >> arg;
    if (cmd == "zoom" && arg == "in") {
      Submit(device, "zoom_in", [](PtzController& c) { c.ZoomIn(); });
    } else if (cmd == "zoom" && arg == "out") {
      Submit(device, "zoom_out", [](PtzController& c) { c.ZoomOut(); });
    } else if (cmd == "focus" && arg == "far") {
      Submit(device, "focus_far", [](PtzController& c) { c.FocusFar(); });
    } else if (cmd == "focus" && arg == "near") {
      Submit(device, "focus_near", [](PtzController& c) { c.FocusNear(); });
    } else if (cmd == "iris" && arg == "open") {
      Submit(device, "iris_open", [](PtzController& c) { c.IrisOpen(); });
    } else if (cmd == "iris" && arg == "close") {
      Submit(device, "iris_close", [](PtzController& c) { c.IrisClose(); });
    } else {
      PrintError("unknown optics command");
    }
  } else if (cmd == "cruise") {
    Submit(device, "cruise", [](PtzController& c) { c.StartCruise(); });
  } else if (cmd == "scan") {
    std::string arg;
    in >> arg;
    if (arg == "start") {
      Submit(device, "scan_start",
             [](PtzController& c) { c.SetLineScanStart(); });
    } else if (arg == "end") {
      Submit(device, "scan_end", [](PtzController& c) { c.SetLineScanEnd(); });
    } else if (arg == "run") {
      Submit(device, "scan_run", [](PtzController& c) { c.RunLineScan(); });
    } else {
      PrintError("scan start|end|run expected");
    }
  } else if (cmd == "guard") {
    std::string arg;
    in >> arg;
    const bool enable = arg == "on";
    Submit(device, "guard",
           [enable](PtzController& c) { c.SetGuard(enable); });
  } else if (cmd == "reset") {
    Submit(device, "reset", [](PtzController& c) { c.RemoteReset(); });
  } else {
    PrintError("unknown command");
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  const auto opts = ParseArgs(argc, argv);
  if (!opts) {
    PrintUsage(argv[0]);
    return 2;
  }

  LinuxPlatform platform(opts->verbose ? LogLevel::Debug : LogLevel::Info);
  PtzDevice device(platform, MakeTransport(platform, opts->connection),
                   opts->controller);

  const auto opened = device.Open(opts->telemetry);
  if (IsError(opened)) {
    LogFormat(platform, LogLevel::Error, LogEvent::Generic,
              "Device open failed: %s", ToString(GetError(opened)));
    return 1;
  }
  if (opts->telemetry) {
    device.SubscribeTelemetry(PrintTelemetry);
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    if (!HandleLine(device, *opts, line)) {
      break;
    }
  }

  device.Close();
  return 0;
}
