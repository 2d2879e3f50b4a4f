#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// One acquisition collaborator. fetch_quotes() may throw or block; the
// collector bounds it with a deadline.
class OddsSource {
public:
    virtual ~OddsSource() = default;

    virtual std::string id() const = 0;
    virtual std::vector<OddsQuote> fetch_quotes() = 0;
};

struct CycleSnapshot {
    uint64_t cycle_id = 0;
    TimePoint started_at;
    std::vector<OddsQuote> quotes;
    std::vector<std::string> reported_sources;
    std::vector<std::string> absent_sources;
};

class SourceCollector {
public:
    SourceCollector(std::vector<std::shared_ptr<OddsSource>> sources, std::chrono::milliseconds timeout);

    // Polls every source concurrently. A source that throws or misses the
    // deadline is absent for this cycle; a late answer is discarded.
    CycleSnapshot collect(uint64_t cycle_id) const;

    size_t source_count() const { return sources_.size(); }

private:
    std::vector<std::shared_ptr<OddsSource>> sources_;
    std::chrono::milliseconds timeout_;
};
