#include "runner_shared.hpp"

#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <cstdio>
#include <iomanip>

namespace tid_music::runner {

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

std::vector<core::EventId>
select_events(catalog::EventCatalog &cat,
              const std::vector<std::string> &radars, EpochSeconds start,
              EpochSeconds end) {
  if (end <= start) {
    throw ConfigurationError("end must be after start");
  }

  std::vector<core::EventId> ids;
  for (const auto &radar : radars) {
    catalog::EventQuery q;
    q.where("radar", catalog::FilterOp::EQ, radar)
        .where("start_epoch", catalog::FilterOp::GE, start)
        .where("start_epoch", catalog::FilterOp::LT, end)
        .sort_by("start_epoch");
    for (const auto &doc : cat.query(q)) {
      ids.push_back(catalog::event_id_from_document(doc));
    }
  }
  return ids;
}

std::vector<std::string> expand_stage_argument(const std::string &stage) {
  const std::string s = core::to_lower(stage);
  if (s == "all") {
    return {"rti_interp", "fft", "classify", "music"};
  }
  if (s == "rti_interp" || s == "fft" || s == "classify" || s == "music") {
    return {s};
  }
  throw ConfigurationError("unknown stage '" + stage + "'");
}

void print_batch_report(std::ostream &out, const pipeline::BatchReport &report) {
  out << "[" << core::process_level_to_string(report.stage) << "] "
      << report.results.size() << " events: " << report.succeeded << " ok, "
      << report.skipped << " skipped, " << report.rejected << " rejected, "
      << report.no_data << " no data, " << report.failed << " failed"
      << std::endl;
  for (const auto &r : report.results) {
    if (r.status != pipeline::EventStatus::FAILED)
      continue;
    out << "  FAILED " << r.id.key() << " (" << r.error_type
        << "): " << r.reason << std::endl;
  }
}

void print_classify_report(std::ostream &out,
                           const pipeline::ClassifyReport &report) {
  for (const auto &[radar, thr] : report.thresholds) {
    out << "[classify] " << radar << ": threshold " << std::setprecision(6)
        << thr.value << " (" << thr.mode;
    if (thr.mode == "percentile")
      out << " " << thr.percentile;
    out << ", batch " << thr.batch_size << ")" << std::endl;
  }
  out << "[classify] " << report.disturbed << " disturbed, " << report.quiet
      << " quiet, " << report.ineligible << " not eligible" << std::endl;
}

} // namespace tid_music::runner
