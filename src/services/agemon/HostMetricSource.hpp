#pragma once

#include "HostSnapshot.hpp"

class HostMetricSource {
public:
    virtual ~HostMetricSource() = default;

    // Reads the host once. Never fails as a whole; unreadable resources are
    // left out of the returned snapshot.
    virtual Snapshot Refresh() = 0;
};
