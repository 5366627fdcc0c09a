#include "GpuResourceList.hpp"
#include "core/Logger.hpp"

namespace mw {

std::atomic<i64> GpuResourceList::live_{0};

GpuResourceList::~GpuResourceList() {
    releaseAll();
}

void GpuResourceList::acquire(std::string label, Release release) {
    entries_.push_back({std::move(label), std::move(release)});
    ++live_;
}

void GpuResourceList::releaseAll() {
    while (!entries_.empty()) {
        Entry entry = std::move(entries_.back());
        entries_.pop_back();
        LOG_TRACE("Releasing GPU resource: {}", entry.label);
        if (entry.release)
            entry.release();
        --live_;
    }
}

void GpuResourceList::abandonAll() {
    live_ -= static_cast<i64>(entries_.size());
    entries_.clear();
}

i64 GpuResourceList::liveCount() {
    return live_.load();
}

} // namespace mw
