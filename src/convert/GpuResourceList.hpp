/**
 * @file GpuResourceList.hpp
 * @brief Scoped ownership of GPU objects released in reverse order.
 *
 * Each acquire() records a release callback. releaseAll() (also run by the
 * destructor) invokes them newest first, exactly once. A process-wide
 * counter tracks how many acquired objects are still alive so tests can
 * check that failing constructors leak nothing.
 *
 * The caller is responsible for making the owning GL context current
 * before releaseAll() runs.
 */

#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "util/Types.hpp"

namespace mw {

class GpuResourceList {
public:
    using Release = std::function<void()>;

    GpuResourceList() = default;
    ~GpuResourceList();

    GpuResourceList(const GpuResourceList&) = delete;
    GpuResourceList& operator=(const GpuResourceList&) = delete;

    void acquire(std::string label, Release release);
    void releaseAll();
    // Forgets every entry without running its release, for when the
    // owning context is already gone and took the objects with it.
    void abandonAll();

    usize size() const {
        return entries_.size();
    }
    bool empty() const {
        return entries_.empty();
    }

    static i64 liveCount();

private:
    struct Entry {
        std::string label;
        Release release;
    };

    std::vector<Entry> entries_;

    static std::atomic<i64> live_;
};

} // namespace mw
