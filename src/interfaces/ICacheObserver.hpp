#pragma once

#include "../models/CacheEvent.hpp"

// Receives engine events synchronously on the thread that performed the operation.
// Some events fire while the engine holds internal locks, so implementations must
// not call back into the engine.
class ICacheObserver {
public:
    virtual ~ICacheObserver() = default;
    virtual void onCacheEvent(const CacheEvent& event) = 0;
};
