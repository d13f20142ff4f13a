#pragma once

#include "tid_music/catalog/event_catalog.hpp"
#include "tid_music/config/configuration.hpp"
#include "tid_music/core/event_id.hpp"
#include "tid_music/pipeline/orchestrator.hpp"

#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace tid_music::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Catalog events of the given radars whose window starts in [start, end),
// ordered by start time.
std::vector<core::EventId>
select_events(catalog::EventCatalog &cat,
              const std::vector<std::string> &radars, EpochSeconds start,
              EpochSeconds end);

// Accepts "rti_interp", "fft", "classify", "music" and "all".
std::vector<std::string> expand_stage_argument(const std::string &stage);

void print_batch_report(std::ostream &out, const pipeline::BatchReport &report);
void print_classify_report(std::ostream &out,
                           const pipeline::ClassifyReport &report);

} // namespace tid_music::runner
