#include "server/tracked_connection.hpp"
#include "server/connection_tracker.hpp"
#include "core/utils.hpp"

#include <format>

namespace handoff {

TrackedConnection::TrackedConnection(ConnectionTracker& tracker, uint64_t id)
    : tracker_(tracker),
      id_(id) {}

TrackedConnection::~TrackedConnection() {
    close();
}

bool TrackedConnection::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    utils::log::info(std::format("connection #{} closed", id_));
    tracker_.on_close();
    return true;
}

} // namespace handoff
