#include "shipcoord/util/file_io.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace shipcoord {
namespace fs = std::filesystem;

namespace {

constexpr int kParentSearchDepth = 8;

bool exists_quietly(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec) && !ec;
}

void create_parent_dirs(const fs::path& file) {
  const fs::path dir = file.parent_path();
  if (dir.empty()) return;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw std::runtime_error("Cannot create directory " + dir.string() + ": " + ec.message());
}

// Several crew hosts may snapshot into the same directory at once.
fs::path temp_sibling(const fs::path& target) {
  static std::atomic<unsigned long> counter{0};
  fs::path tmp = target;
  tmp += ".tmp" + std::to_string(counter.fetch_add(1));
  return tmp;
}

void write_all(std::ofstream& out, const std::string& contents, const fs::path& p) {
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  out.flush();
  if (!out) throw std::runtime_error("Write failed: " + p.string());
}

} // namespace

std::string resolve_data_path(const std::string& path) {
  const fs::path requested(path);
  if (requested.empty() || requested.is_absolute() || exists_quietly(requested)) return path;

  std::vector<fs::path> roots;
#ifdef SHIPCOORD_SOURCE_DIR
  roots.emplace_back(SHIPCOORD_SOURCE_DIR);
#endif
  std::error_code ec;
  fs::path dir = fs::current_path(ec);
  for (int depth = 0; !ec && depth < kParentSearchDepth && !dir.empty(); ++depth) {
    roots.push_back(dir);
    if (dir == dir.parent_path()) break;
    dir = dir.parent_path();
  }

  for (const auto& root : roots) {
    const fs::path candidate = root / requested;
    if (exists_quietly(candidate)) return candidate.string();
  }
  return path;
}

std::string read_text_file(const std::string& path) {
  const std::string resolved = resolve_data_path(path);
  std::ifstream in(resolved, std::ios::binary);
  if (!in) {
    std::string msg = "Cannot open " + path;
    if (resolved != path) msg += " (tried " + resolved + ")";
    throw std::runtime_error(msg);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  create_parent_dirs(target);

  const fs::path tmp = temp_sibling(target);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
    try {
      write_all(out, contents, tmp);
    } catch (const std::exception&) {
      out.close();
      std::error_code rm_ec;
      fs::remove(tmp, rm_ec);
      throw;
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code retry_ec;
    fs::remove(target, retry_ec);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) {
    std::error_code rm_ec;
    fs::remove(tmp, rm_ec);
    throw std::runtime_error("Cannot replace " + path + ": " + ec.message());
  }
}

void append_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  create_parent_dirs(target);
  std::ofstream out(target, std::ios::binary | std::ios::app);
  if (!out) throw std::runtime_error("Cannot open " + path + " for appending");
  write_all(out, contents, target);
}

} // namespace shipcoord
