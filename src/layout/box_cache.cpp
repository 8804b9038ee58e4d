#include <trellis/layout/box_cache.h>

namespace trellis::layout {

bool LayoutInputs::matches(const LayoutInputs& other) const {
    if (attributes != other.attributes) return false;
    if (available != other.available) return false;
    if (items.size() != other.items.size()) return false;
    for (size_t i = 0; i < items.size(); ++i) {
        const auto& mine = items[i];
        const auto& theirs = other.items[i];
        if (mine.index() != theirs.index()) return false;
        if (const auto* box = std::get_if<BoxRef>(&mine)) {
            if (!box->same_allocation(std::get<BoxRef>(theirs))) return false;
        } else if (std::get<std::string>(mine) != std::get<std::string>(theirs)) {
            return false;
        }
    }
    return true;
}

void BoxCache::begin_frame() {
    ++frame_;
    frame_hits_ = 0;
    frame_misses_ = 0;
}

void BoxCache::end_frame() {
    last_evicted_ = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.frame != frame_) {
            it = entries_.erase(it);
            ++last_evicted_;
        } else {
            ++it;
        }
    }
}

BoxRef BoxCache::lookup(uint64_t key, const LayoutInputs& inputs) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.inputs.matches(inputs)) {
        it->second.frame = frame_;
        ++hits_;
        ++frame_hits_;
        return it->second.box;
    }
    ++misses_;
    ++frame_misses_;
    return BoxRef();
}

void BoxCache::store(uint64_t key, LayoutInputs inputs, const BoxRef& box) {
    Entry& entry = entries_[key];
    entry.inputs = std::move(inputs);
    entry.box = box;
    entry.frame = frame_;
}

void BoxCache::clear() {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
    frame_hits_ = 0;
    frame_misses_ = 0;
    last_evicted_ = 0;
}

} // namespace trellis::layout
