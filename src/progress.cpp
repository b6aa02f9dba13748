#include "progress.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

std::string format_progress(const Progress& progress) {
  if(!progress.determinate()) return "?";
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << (*progress.ratio * 100.0f) << "%";
  return oss.str();
}

Progress ProgressAggregator::apply(const ProgressEvent& event) {
  if(auto* declared = std::get_if<DeclaredSize>(&event)) {
    declared_ += declared->bytes;
  } else if(auto* processed = std::get_if<Processed>(&event)) {
    processed_ += processed->bytes;
  } else {
    completed_ = true;
  }
  return current();
}

Progress ProgressAggregator::current() const {
  if(declared_ == 0) return Progress::indeterminate();
  double ratio = static_cast<double>(processed_) / static_cast<double>(declared_);
  return Progress::of(static_cast<float>(std::clamp(ratio, 0.0, 1.0)));
}
