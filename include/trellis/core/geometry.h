#pragma once

namespace trellis {

// All lengths are abstract, resolution-independent units.

struct Size {
    float width = 0;
    float height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

struct Point {
    float x = 0;
    float y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

struct SideOffsets {
    float top = 0, right = 0, bottom = 0, left = 0;

    static SideOffsets all(float v) { return {v, v, v, v}; }

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }

    bool operator==(const SideOffsets& other) const {
        return top == other.top && right == other.right &&
               bottom == other.bottom && left == other.left;
    }
    bool operator!=(const SideOffsets& other) const { return !(*this == other); }
};

} // namespace trellis
