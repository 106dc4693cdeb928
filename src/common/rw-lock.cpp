// standard
#include <shared_mutex>
#include <string>
#include <mutex>

// rebuf
#include <src/common/exceptions.hpp>

// local
#include "rw-lock.hpp"

using namespace rebuf;


RWLock::SharedLock RWLock::shared() const {
    return SharedLock(lock_);
}

RWLock::ExclusiveLock RWLock::exclusive() {
    return ExclusiveLock(lock_);
}

ClosedFlag::ClosedFlag(std::string owner)
    : owner_(std::move(owner))
    , closed_(false)
{}

RWLock::SharedLock ClosedFlag::ensureOpen() const {
    auto locked = lock_.shared();
    if (closed_) {
        throw RebufClosed(owner_ + " is already closed");
    }

    return locked;
}

void ClosedFlag::close() {
    auto locked = lock_.exclusive();
    if (closed_) {
        throw RebufClosed(owner_ + " is already closed");
    }

    closed_ = true;
}

bool ClosedFlag::isClosed() const {
    auto locked = lock_.shared();
    return closed_;
}
