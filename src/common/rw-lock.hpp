#pragma once

// standard
#include <shared_mutex>
#include <string>
#include <mutex>


namespace rebuf {

    // Many shared holders or one exclusive holder.
    class RWLock {
    public:

        using SharedLock = std::shared_lock<std::shared_mutex>;
        using ExclusiveLock = std::unique_lock<std::shared_mutex>;

        RWLock() = default;
        RWLock(const RWLock&) = delete;
        RWLock& operator=(const RWLock&) = delete;

        SharedLock shared() const;
        ExclusiveLock exclusive();

    private:
        mutable std::shared_mutex lock_;
    };

    // One-way closed flag guarded by its own lock. Operations hold
    // the lock returned by ensureOpen() for their whole duration, so close()
    // waits for in-flight operations and no one sees a half-closed owner.
    class ClosedFlag {
    public:

        ClosedFlag(std::string owner);

        // throws RebufClosed if already closed
        RWLock::SharedLock ensureOpen() const;
        // throws RebufClosed on second call
        void close();
        bool isClosed() const;

    private:
        std::string owner_;
        RWLock lock_;
        bool closed_;
    };

}
