#include "io/batch_loader.h"

#include <sstream>
#include <utility>

#include "core/logging.h"

namespace dynamix {

size_t BatchReport::successCount() const {
  size_t count = 0;
  for (const auto& entry : entries) {
    if (entry.ok) ++count;
  }
  return count;
}

size_t BatchReport::failureCount() const { return entries.size() - successCount(); }

std::string BatchReport::toTextReport() const {
  std::ostringstream ss;
  ss << "Loaded " << successCount() << " of " << entries.size() << " tracks";
  if (failureCount() > 0) {
    ss << " (" << failureCount() << " failed)";
  }
  ss << "\n";
  for (const auto& entry : entries) {
    if (!entry.ok) {
      ss << "  ! " << entry.track_ref << ": " << entry.error << "\n";
    }
  }
  return ss.str();
}

BatchReport BatchLoader::load(const std::vector<std::string>& track_refs,
                              const ExtractionOptions& options) {
  BatchReport report;
  report.entries.reserve(track_refs.size());

  for (const auto& ref : track_refs) {
    BatchEntry entry;
    entry.track_ref = ref;

    TrackFeatureSet track;
    if (extractor_.extract(ref, options, track)) {
      entry.ok = true;
      report.tracks.push_back(std::move(track));
    } else {
      entry.error = extractor_.getError();
      DYNAMIX_LOG_WARN("Skipping " << ref << ": " << entry.error);
    }
    report.entries.push_back(std::move(entry));
  }

  DYNAMIX_LOG_INFO("Loaded " << report.successCount() << "/" << track_refs.size() << " tracks");
  return report;
}

}  // namespace dynamix
