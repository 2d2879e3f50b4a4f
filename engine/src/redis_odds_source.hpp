#pragma once

#include "config.hpp"
#include "source_collector.hpp"
#include <memory>
#include <string>

// Reads the latest quote snapshot a collector published under
// ODDS_SNAPSHOT_PREFIX + source id (a JSON array of quotes)
class RedisOddsSource : public OddsSource {
public:
    RedisOddsSource(const Config& config, std::string source_id);
    ~RedisOddsSource() override;

    std::string id() const override { return source_id_; }

    // Throws when the snapshot is missing or unreadable
    std::vector<OddsQuote> fetch_quotes() override;

private:
    class Impl;
    std::string source_id_;
    std::unique_ptr<Impl> pImpl_;
};
