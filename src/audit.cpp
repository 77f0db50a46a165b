#include "reclaim/audit.hpp"

#include "reclaim/fsutil.hpp"
#include "reclaim/hash.hpp"
#include "reclaim/jsonlite.hpp"
#include "reclaim/version.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace reclaim {

namespace {

void strip_cr(std::string& line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
}

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t") == std::string::npos;
}

// Digest of the last non-blank line, or genesis for an empty / absent file.
// `terminated` is false when the file does not end in '\n', i.e. an earlier
// write was torn.
AuditLog::Tail read_tail(const std::string& path) {
  AuditLog::Tail tail{audit_genesis_digest(), true};
  const auto raw = read_file(path);
  if (!raw || raw->empty()) return tail;
  tail.terminated = raw->back() == '\n';

  std::istringstream in(*raw);
  std::string line;
  std::string last;
  while (std::getline(in, line)) {
    strip_cr(line);
    if (!is_blank(line)) last = line;
  }
  if (!last.empty()) tail.digest = audit_line_digest(last);
  return tail;
}

bool write_all(int fd, const std::string& data) {
  // One write(2) per record. A short write is a failure, not a retry: a
  // second write could interleave with another appender.
  ssize_t n;
  do {
    n = ::write(fd, data.data(), data.size());
  } while (n < 0 && errno == EINTR);
  return n == static_cast<ssize_t>(data.size());
}

}  // namespace

AuditLog::AuditLog(std::string path) : path_(std::move(path)) {}

bool AuditLog::append(const AuditRecord& record) {
  if (path_.empty()) {
    ++failure_count_;
    return false;
  }
  const fs::path p(path_);
  if (p.has_parent_path() && !ensure_dir(p.parent_path()).ok) {
    ++failure_count_;
    return false;
  }
  if (!tail_) tail_ = read_tail(path_);

  jsonlite::Object obj = audit_record_to_object(record);
  obj["prev"] = jsonlite::Value{tail_->digest};
  obj["v"] = jsonlite::Value{static_cast<std::uint64_t>(version::AUDIT_LOG_VERSION)};
  const std::string line = jsonlite::serialize(obj);
  // A torn tail gets its own line; the new record never shares it.
  const std::string framed = (tail_->terminated ? "" : "\n") + line + "\n";

  const int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    ++failure_count_;
    return false;
  }
  const bool written = write_all(fd, framed);
  const bool synced = written && ::fdatasync(fd) == 0;
  ::close(fd);

  if (!written) {
    ++failure_count_;
    // Whatever reached the file is now the tail; re-read it next time.
    tail_.reset();
    return false;
  }
  tail_ = Tail{audit_line_digest(line), true};
  ++entry_count_;
  if (!synced) {
    ++failure_count_;
    return false;
  }
  return true;
}

std::vector<AuditRecord> AuditLog::read_all() const {
  return read_audit_log(path_);
}

std::vector<AuditRecord> read_audit_log(const std::string& path) {
  std::vector<AuditRecord> out;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return out;
  std::string line;
  while (std::getline(ifs, line)) {
    strip_cr(line);
    if (is_blank(line)) continue;
    std::optional<jsonlite::JsonError> err;
    jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) continue;
    if (!version::audit_version_supported(jsonlite::get_u64(obj, "v", version::AUDIT_LOG_VERSION))) {
      continue;
    }
    out.push_back(audit_record_from_object(obj));
  }
  return out;
}

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------

std::string ChainReport::to_json() const {
  jsonlite::Object o;
  o["lines"] = jsonlite::Value{lines};
  o["records"] = jsonlite::Value{records};
  o["malformed"] = jsonlite::Value{malformed};
  o["unchained"] = jsonlite::Value{unchained};
  o["breaks"] = jsonlite::Value{breaks};
  o["first_break_line"] = jsonlite::Value{first_break_line};
  o["ok"] = jsonlite::Value{ok()};
  return jsonlite::serialize(o);
}

ChainReport verify_chain(const std::string& path) {
  ChainReport report;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return report;

  std::string expected = audit_genesis_digest();
  std::string line;
  uint64_t line_no = 0;
  while (std::getline(ifs, line)) {
    ++line_no;
    strip_cr(line);
    if (is_blank(line)) continue;
    ++report.lines;

    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) {
      ++report.malformed;
    } else {
      ++report.records;
      if (!jsonlite::has_string(obj, "prev")) {
        ++report.unchained;
      } else if (jsonlite::get_string(obj, "prev") != expected) {
        ++report.breaks;
        if (report.first_break_line == 0) report.first_break_line = line_no;
      }
    }
    // The next appended line chains over whatever text this line holds,
    // malformed or not.
    expected = audit_line_digest(line);
  }
  return report;
}

}  // namespace reclaim
