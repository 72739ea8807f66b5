// concurrency_oracle.hpp
#ifndef CONCURRENCY_ORACLE_HPP
#define CONCURRENCY_ORACLE_HPP

#include "event_log.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * Decides when an activity instance became enabled, skipping over events of
 * activities that run concurrently with it.
 *
 * The concurrency table maps an activity name to the names of the activities
 * it is concurrent with. Queries for an activity missing from the table throw
 * std::invalid_argument; callers register unknown activities first. Table
 * access is serialized, so one oracle can be shared by several workers.
 */
class ConcurrencyOracle {
public:
    explicit ConcurrencyOracle(std::map<std::string, std::set<std::string>> concurrency = {});
    virtual ~ConcurrencyOracle() = default;

    ConcurrencyOracle(const ConcurrencyOracle&) = delete;
    ConcurrencyOracle& operator=(const ConcurrencyOracle&) = delete;

    bool has_activity(const std::string& activity) const;

    // Adds an empty entry; no-op for known activities.
    void register_activity(const std::string& activity);

    std::set<std::string> concurrent_with(const std::string& activity) const;

    // End time of the latest history event that finished no later than
    // `event` started and is not concurrent with it.
    virtual std::optional<Timestamp> enabled_since(const std::vector<Event>& history, const Event& event) const;

    std::map<std::string, std::set<std::string>> table() const;

protected:
    mutable std::mutex mutex_;
    std::map<std::string, std::set<std::string>> concurrency_;
};

// Two activities are concurrent when each directly follows the other in some
// case of the log.
class DirectlyFollowsConcurrencyOracle : public ConcurrencyOracle {
public:
    explicit DirectlyFollowsConcurrencyOracle(const std::vector<Event>& log);

private:
    static std::map<std::string, std::set<std::string>> discover(const std::vector<Event>& log);
};

#endif
