#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "shipcoord/util/file_io.h"

#define SC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "shipcoord_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  fs::create_directories(dir, ec);
  SC_ASSERT(!ec);

  // Parent directories are created on demand.
  const fs::path target = dir / "saves" / "session.json";
  shipcoord::write_text_file(target.string(), "{\"a\": 1}\n");
  SC_ASSERT(shipcoord::read_text_file(target.string()) == "{\"a\": 1}\n");

  // Overwrite goes through a temp sibling and rename.
  shipcoord::write_text_file(target.string(), "{\"a\": 2}\n");
  SC_ASSERT(shipcoord::read_text_file(target.string()) == "{\"a\": 2}\n");

  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    SC_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  const fs::path log_path = dir / "events.csv";
  shipcoord::append_text_file(log_path.string(), "a\n");
  shipcoord::append_text_file(log_path.string(), "b\n");
  SC_ASSERT(shipcoord::read_text_file(log_path.string()) == "a\nb\n");

  bool threw = false;
  try {
    (void)shipcoord::read_text_file((dir / "missing.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SC_ASSERT(threw);

  // The default config resolves from a working directory outside the repo.
  {
    const fs::path old_cwd = fs::current_path(ec);
    SC_ASSERT(!ec);
    CwdGuard cwd_guard(old_cwd);
    fs::current_path(dir, ec);
    SC_ASSERT(!ec);

    const std::string rel = "data/config/default_session.json";
    const std::string resolved = shipcoord::resolve_data_path(rel);
    SC_ASSERT(resolved != rel);
    SC_ASSERT(fs::exists(resolved));

    const std::string cfg = shipcoord::read_text_file(rel);
    SC_ASSERT(cfg.find("\"probability_matrix\"") != std::string::npos);

    // Absolute and unresolvable paths come back unchanged.
    SC_ASSERT(shipcoord::resolve_data_path(resolved) == resolved);
    SC_ASSERT(shipcoord::resolve_data_path("no/such/file.json") == "no/such/file.json");
  }

  fs::remove_all(dir, ec);
  return 0;
}
