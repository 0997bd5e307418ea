#include "core/gap_interpolator.hpp"

#include <stdexcept>
#include <string>

namespace psp {

const char* ToString(EntryKind k) {
  switch (k) {
    case EntryKind::Direct: return "direct";
    case EntryKind::Interpolated: return "interpolated";
    case EntryKind::Unavailable: return "unavailable";
  }
  return "unknown";
}

std::vector<GapRun> FindGapRuns(const VerdictSequence& verdicts, int max_gap) {
  std::vector<GapRun> runs;
  const std::size_t n = verdicts.size();

  std::size_t i = 0;
  while (i < n) {
    if (verdicts[i] == QualityVerdict::Accepted) {
      ++i;
      continue;
    }

    GapRun run;
    run.first = i;
    while (i < n && verdicts[i] != QualityVerdict::Accepted) ++i;
    run.last = i - 1;

    if (run.first > 0) run.left = run.first - 1;
    if (i < n) run.right = i;

    run.resolved = run.left && run.right &&
                   run.size() <= static_cast<std::size_t>(max_gap);
    runs.push_back(run);
  }

  return runs;
}

GapInterpolator::GapInterpolator(int max_gap) : max_gap_(max_gap) {
  if (max_gap_ < 0) throw std::invalid_argument("max_gap must be >= 0");
}

LogicalFrameMap GapInterpolator::interpolate(const RawSequence& raw, const VerdictSequence& verdicts) const {
  GapReport unused;
  return interpolate(raw, verdicts, unused);
}

LogicalFrameMap GapInterpolator::interpolate(const RawSequence& raw, const VerdictSequence& verdicts, GapReport& report) const {
  if (verdicts.size() != raw.size()) {
    throw std::invalid_argument("verdict count " + std::to_string(verdicts.size()) +
                                " does not match sequence length " + std::to_string(raw.size()));
  }

  LogicalFrameMap entries(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (verdicts[i] == QualityVerdict::Accepted) {
      if (!raw[i]) throw std::invalid_argument("frame " + std::to_string(i) + " is Accepted but has no observation");
      entries[i] = LogicalFrameEntry::Direct(i);
    } else if ((verdicts[i] == QualityVerdict::Absent) != !raw[i]) {
      throw std::invalid_argument("frame " + std::to_string(i) + " has verdict '" + ToString(verdicts[i]) +
                                  "' that contradicts its slot");
    }
  }

  report = GapReport{};
  report.total_frames = raw.size();
  report.runs = FindGapRuns(verdicts, max_gap_);

  for (const auto& run : report.runs) {
    if (!run.left) report.has_start_gap = true;
    if (!run.right) report.has_end_gap = true;

    if (!run.resolved) {
      // Default-constructed entries are already Unavailable
      report.unavailable += run.size();
      continue;
    }

    const std::size_t L = *run.left;
    const std::size_t R = *run.right;
    const double span = static_cast<double>(R - L);
    for (std::size_t i = run.first; i <= run.last; ++i) {
      InterpolationRecipe r;
      r.left_source_index = L;
      r.right_source_index = R;
      r.weight = static_cast<double>(i - L) / span;
      entries[i] = LogicalFrameEntry::Interpolated(r);
    }
    report.interpolated += run.size();
  }

  report.direct = raw.size() - report.interpolated - report.unavailable;
  return entries;
}

LogicalFrameMap Interpolate(const RawSequence& raw, const VerdictSequence& verdicts, int max_gap) {
  return GapInterpolator(max_gap).interpolate(raw, verdicts);
}

} // namespace psp
