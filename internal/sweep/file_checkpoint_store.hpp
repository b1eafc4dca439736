#pragma once

#include <filesystem>

#include "internal/sweep/checkpoint_store.hpp"

namespace rowsweep::sweep {

/*
  JSON checkpoint file (protobuf SweepCheckpoint).

  Save() writes <path>.tmp, fsyncs it and renames it over <path>, so a
  crash leaves either the old or the new checkpoint, never a torn one.
*/
class FileCheckpointStore final : public CheckpointStore {
 public:
  explicit FileCheckpointStore(std::filesystem::path path);

  std::optional<Checkpoint> Load() override;
  void                      Save(const Checkpoint& checkpoint) override;
  std::string               Location() const override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace rowsweep::sweep
