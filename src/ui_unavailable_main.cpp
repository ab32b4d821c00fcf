#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "shipcoord/core/enum_strings.h"
#include "shipcoord/core/serialization.h"
#include "shipcoord/core/session_config.h"
#include "shipcoord/util/file_io.h"

#ifndef SHIPCOORD_VERSION
#define SHIPCOORD_VERSION "unknown"
#endif

#ifndef SHIPCOORD_UI_UNAVAILABLE_REASON
#define SHIPCOORD_UI_UNAVAILABLE_REASON "SDL2 or Dear ImGui was not found when this build was configured."
#endif

namespace {

constexpr const char* kStatusCodeUiUnavailable = "SC-UI-001";
constexpr const char* kStatusCodeUiRequiredUnavailable = "SC-UI-002";
constexpr int kExitCodeOk = 0;
constexpr int kExitCodeBadInput = 1;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && flag == argv[i]) return true;
  }
  return false;
}

std::string get_str_arg(int argc, char** argv, std::string_view key) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] && key == argv[i]) return argv[i + 1];
  }
  return {};
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "shipcoord";
  std::cout << "shipcoord crew console v" << SHIPCOORD_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--config PATH | --load PATH] [--require-ui] [--help] [--version]\n\n";
  std::cout << "This build has no hot-seat crew console.\n";
  std::cout << "Reason: " << SHIPCOORD_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "A --config or --load argument is still checked, so launch scripts\n";
  std::cout << "report a broken session file the same way the console would.\n\n";
  std::cout << "Sessions can be played headless with scripted crews:\n";
  std::cout << "  shipcoord_cli --strategy scout --rounds-csv rounds.csv\n\n";
  std::cout << "Install SDL2 and Dear ImGui (with its SDL2 backends) and reconfigure\n";
  std::cout << "to get the interactive console.\n";
  std::cout << "\nLauncher status codes:\n";
  std::cout << "  " << kStatusCodeUiUnavailable << " (exit " << kExitCodeOk << "): console unavailable.\n";
  std::cout << "  " << kStatusCodeUiRequiredUnavailable << " (exit " << kExitCodeUiRequiredUnavailable
            << "): console required via --require-ui but unavailable.\n";
  std::cout << "  exit " << kExitCodeBadInput << ": the --config or --load file was rejected.\n";
}

// Returns false after printing why the session file would not open.
bool check_session_input(int argc, char** argv) {
  using namespace shipcoord;

  const std::string load_path = get_str_arg(argc, argv, "--load");
  const std::string config_path = get_str_arg(argc, argv, "--config");
  try {
    if (!load_path.empty()) {
      const SessionSnapshot snap = deserialize_session_from_json(read_text_file(load_path));
      std::cerr << "Snapshot OK: crew " << snap.state.crew_id << ", "
                << session_status_to_string(snap.state.status) << ", round " << snap.state.round.number << "\n";
    } else if (!config_path.empty()) {
      const SessionConfig cfg = load_session_config_from_file(config_path);
      std::cerr << "Config OK: " << cfg.rounds.scored << " scored rounds, pressure "
                << pressure_to_string(cfg.pressure) << ", complexity " << complexity_to_string(cfg.complexity)
                << "\n";
    }
  } catch (const ConfigurationError& e) {
    std::cerr << "Config validation failed:\n";
    for (const auto& err : e.errors()) std::cerr << "  - " << err << "\n";
    return false;
  } catch (const std::exception& e) {
    std::cerr << "Cannot open session file: " << e.what() << "\n";
    return false;
  }
  return true;
}

void print_unavailable(const char* code) {
  std::cerr << "[" << code << "] shipcoord crew console is unavailable in this build.\n";
  std::cerr << "Reason: " << SHIPCOORD_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << SHIPCOORD_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  if (!check_session_input(argc, argv)) return kExitCodeBadInput;

  if (has_flag(argc, argv, "--require-ui")) {
    print_unavailable(kStatusCodeUiRequiredUnavailable);
    return kExitCodeUiRequiredUnavailable;
  }

  print_unavailable(kStatusCodeUiUnavailable);
  return kExitCodeOk;
}
