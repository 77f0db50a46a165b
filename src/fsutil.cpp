#include "reclaim/fsutil.hpp"

#include "reclaim/error_taxonomy.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <unistd.h>  // getpid, gethostname

namespace fs = std::filesystem;

namespace reclaim {

namespace {

FsStatus fail(std::string_view op, const fs::path& p, const std::error_code& ec) {
  FsStatus st;
  st.ok = false;
  st.ec = ec;
  st.message = describe_fs_error(op, p.string(), ec);
  return st;
}

}  // namespace

bool path_exists(const fs::path& p) {
  std::error_code ec;
  const auto st = fs::symlink_status(p, ec);
  return !ec && st.type() != fs::file_type::not_found;
}

FsStatus ensure_dir(const fs::path& p) {
  std::error_code ec;
  fs::create_directories(p, ec);
  if (ec) return fail("mkdir", p, ec);
  return {};
}

FsStatus copy_then_remove(const fs::path& src, const fs::path& dest) {
  std::error_code ec;
  fs::copy(src, dest,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks |
               fs::copy_options::overwrite_existing,
           ec);
  if (ec) return fail("copy", src, ec);
  return remove_path(src);
}

FsStatus move_path(const fs::path& src, const fs::path& dest) {
  if (dest.has_parent_path()) {
    FsStatus dir = ensure_dir(dest.parent_path());
    if (!dir.ok) return dir;
  }
  std::error_code ec;
  fs::rename(src, dest, ec);
  if (!ec) return {};
  if (ec.value() != EXDEV) return fail("rename", src, ec);
  return copy_then_remove(src, dest);
}

FsStatus remove_path(const fs::path& p) {
  std::error_code ec;
  fs::remove_all(p, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) return fail("remove", p, ec);
  return {};
}

uint64_t directory_size(const fs::path& p) {
  std::error_code ec;
  const auto top = fs::symlink_status(p, ec);
  if (ec || top.type() == fs::file_type::not_found) return 0;
  if (top.type() == fs::file_type::regular) {
    const auto n = fs::file_size(p, ec);
    return ec ? 0 : static_cast<uint64_t>(n);
  }
  if (top.type() != fs::file_type::directory) return 0;

  uint64_t total = 0;
  fs::recursive_directory_iterator it(p, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
      const auto n = it->file_size(entry_ec);
      if (!entry_ec) total += static_cast<uint64_t>(n);
    }
    it.increment(ec);
  }
  return total;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

int64_t current_pid() {
  return static_cast<int64_t>(::getpid());
}

std::string expand_home(const std::string& p) {
  if (p == "~" || p.rfind("~/", 0) == 0) {
    const char* home = std::getenv("HOME");
    if (home && home[0]) return std::string(home) + p.substr(1);
  }
  return p;
}

}  // namespace reclaim
