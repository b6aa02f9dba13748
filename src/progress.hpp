#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Raw events emitted by a transfer engine for one in-flight operation.
struct DeclaredSize {
  uint64_t sub_item_id = 0;
  uint64_t bytes = 0;
};

struct Processed {
  uint64_t sub_item_id = 0;
  uint64_t bytes = 0; // increment, not an offset
};

struct Completed {};

using ProgressEvent = std::variant<DeclaredSize, Processed, Completed>;

// Displayable progress: a ratio in [0,1], or indeterminate while nothing has
// declared a size yet.
struct Progress {
  std::optional<float> ratio;

  static Progress indeterminate() { return Progress{}; }
  static Progress of(float value) { return Progress{value}; }

  bool determinate() const { return ratio.has_value(); }

  bool operator==(const Progress& other) const { return ratio == other.ratio; }
  bool operator!=(const Progress& other) const { return !(*this == other); }
};

std::string format_progress(const Progress& progress);

// Running totals for a single operation. Never shared between operations.
class ProgressAggregator {
public:
  Progress apply(const ProgressEvent& event);
  Progress current() const;

  uint64_t declared_bytes() const { return declared_; }
  uint64_t processed_bytes() const { return processed_; }
  bool completed() const { return completed_; }

private:
  uint64_t declared_ = 0;
  uint64_t processed_ = 0;
  bool completed_ = false;
};
