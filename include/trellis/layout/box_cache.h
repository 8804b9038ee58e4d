#pragma once
#include <trellis/layout/box.h>
#include <trellis/style/resolved_attributes.h>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace trellis::layout {

// Everything a box depends on besides the element's identity.
struct LayoutInputs {
    style::ResolvedAttributes attributes;
    Size available;
    // Contiguous text runs and element child boxes, interleaved in document
    // order.
    std::vector<std::variant<std::string, BoxRef>> items;

    // Items match position by position. Child boxes must be the very same
    // allocations; everything else compares by value.
    bool matches(const LayoutInputs& other) const;
};

// Retains last frame's boxes keyed by element key. A box is handed back only
// when its inputs are unchanged and all of its children were themselves
// reused, so an unchanged subtree keeps its allocation across frames.
class BoxCache {
public:
    void begin_frame();
    // Drops entries for elements not visited since begin_frame().
    void end_frame();

    // Returns the cached box for `key` when `inputs` match, else an empty ref.
    BoxRef lookup(uint64_t key, const LayoutInputs& inputs);
    void store(uint64_t key, LayoutInputs inputs, const BoxRef& box);

    void clear();

    size_t size() const { return entries_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    size_t frame_hits() const { return frame_hits_; }
    size_t frame_misses() const { return frame_misses_; }
    size_t last_evicted() const { return last_evicted_; }

private:
    struct Entry {
        LayoutInputs inputs;
        BoxRef box;
        uint64_t frame = 0;
    };

    std::unordered_map<uint64_t, Entry> entries_;
    uint64_t frame_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t frame_hits_ = 0;
    size_t frame_misses_ = 0;
    size_t last_evicted_ = 0;
};

} // namespace trellis::layout
