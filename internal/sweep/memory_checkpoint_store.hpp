#pragma once

#include <optional>
#include <vector>

#include "internal/sweep/checkpoint_store.hpp"

namespace rowsweep::sweep {

// Process-local checkpoint; keeps every saved value in order.
class MemoryCheckpointStore final : public CheckpointStore {
 public:
  std::optional<Checkpoint> Load() override {
    ++loads_;
    return current_;
  }

  void Save(const Checkpoint& checkpoint) override {
    current_ = checkpoint;
    history_.push_back(checkpoint);
  }

  std::string Location() const override {
    return "memory";
  }

  const std::vector<Checkpoint>& History() const {
    return history_;
  }

  int Loads() const {
    return loads_;
  }

 private:
  std::optional<Checkpoint> current_;
  std::vector<Checkpoint>   history_;
  int                       loads_ = 0;
};

} // namespace rowsweep::sweep
