#pragma once

#include "record.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relaysave::network {

using RecordHandler = std::function<void(const Record&)>;
using EndOfInitialResultsHandler = std::function<void()>;

struct SubscriptionHandlers {
    RecordHandler on_record;
    EndOfInitialResultsHandler on_end_of_initial_results;
};

// Live query handle. close() blocks until a handler that is already running
// returns; no handler is invoked after close() returns.
class Subscription {
public:
    virtual ~Subscription() = default;
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// Peer query service. Handlers may be invoked on a thread other than the
// caller's, and records may arrive duplicated and in any order.
class RecordSource {
public:
    virtual ~RecordSource() = default;
    
    // One shot query; returns false when the source could not be queried.
    virtual bool query(const std::vector<std::string>& endpoints,
                       const RecordFilter& filter,
                       std::vector<Record>& out_records) = 0;
    
    virtual std::unique_ptr<Subscription> subscribe(const std::vector<std::string>& endpoints,
                                                     const RecordFilter& filter,
                                                     SubscriptionHandlers handlers) = 0;
};

extern const std::vector<std::string> BUILTIN_DEFAULT_ENDPOINTS;

// relays.default from the configuration, or the built-in list.
std::vector<std::string> default_endpoints();

}
