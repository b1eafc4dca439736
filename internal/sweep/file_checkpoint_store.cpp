#include "internal/sweep/file_checkpoint_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sweep/checkpoint.pb.h"

namespace rowsweep::sweep {

namespace {

using observability::StringField;

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

void WriteDurably(const std::filesystem::path& path, const std::string& content) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw util::CheckpointError(ErrnoMessage("open", path));
  }

  const char* data      = content.data();
  std::size_t remaining = content.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      auto msg = ErrnoMessage("write", path);
      ::close(fd);
      throw util::CheckpointError(msg);
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }

  if (::fsync(fd) != 0) {
    auto msg = ErrnoMessage("fsync", path);
    ::close(fd);
    throw util::CheckpointError(msg);
  }
  if (::close(fd) != 0) {
    throw util::CheckpointError(ErrnoMessage("close", path));
  }
}

void SyncDirectory(const std::filesystem::path& dir) {
  int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw util::CheckpointError(ErrnoMessage("open directory", dir));
  }
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw util::CheckpointError(ErrnoMessage("fsync directory", dir));
  }
}

} // namespace

FileCheckpointStore::FileCheckpointStore(std::filesystem::path path) : path_(std::move(path)) {
}

std::string FileCheckpointStore::Location() const {
  return path_.string();
}

std::optional<Checkpoint> FileCheckpointStore::Load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path_);
  if (!in) {
    ROWSWEEP_LOG_WARN("checkpoint unreadable, ignoring", {StringField("path", path_.string())});
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  v1::SweepCheckpoint message;
  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &message);
  if (!status.ok()) {
    ROWSWEEP_LOG_WARN("checkpoint corrupt, ignoring",
                      {StringField("path", path_.string()), StringField("error", std::string(status.message()))});
    return std::nullopt;
  }

  Checkpoint checkpoint;
  switch (message.status()) {
    case v1::CHECKPOINT_STATUS_IN_PROGRESS:
      checkpoint.status = CheckpointStatus::kInProgress;
      break;
    case v1::CHECKPOINT_STATUS_COMPLETE:
      checkpoint.status = CheckpointStatus::kComplete;
      break;
    default:
      ROWSWEEP_LOG_WARN("checkpoint has no status, ignoring", {StringField("path", path_.string())});
      return std::nullopt;
  }

  checkpoint.last_committed_page = message.last_committed_page();
  checkpoint.total_pages         = message.total_pages();
  checkpoint.page_size           = message.page_size();
  checkpoint.stop_cause          = message.stop_cause();
  checkpoint.updated_at          = util::FromProto(message.updated_at());
  return checkpoint;
}

void FileCheckpointStore::Save(const Checkpoint& checkpoint) {
  v1::SweepCheckpoint message;
  message.set_last_committed_page(checkpoint.last_committed_page);
  message.set_total_pages(checkpoint.total_pages);
  message.set_page_size(checkpoint.page_size);
  message.set_status(checkpoint.status == CheckpointStatus::kComplete ? v1::CHECKPOINT_STATUS_COMPLETE
                                                                      : v1::CHECKPOINT_STATUS_IN_PROGRESS);
  message.set_stop_cause(checkpoint.stop_cause);
  *message.mutable_updated_at() = util::ToProto(checkpoint.updated_at);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::CheckpointError("serialize checkpoint: " + std::string(status.message()));
  }

  const auto parent = path_.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::CheckpointError("create " + parent.string() + ": " + ec.message());
    }
  }

  auto tmp = path_;
  tmp += ".tmp";
  WriteDurably(tmp, json);

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    throw util::CheckpointError("rename " + tmp.string() + " -> " + path_.string() + ": " + ec.message());
  }
  SyncDirectory(parent);
}

} // namespace rowsweep::sweep
