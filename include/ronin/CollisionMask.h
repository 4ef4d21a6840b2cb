#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ronin {

// Per-pixel opaque map of one sprite frame, row major, one byte per pixel.
class CollisionMask {
public:
    CollisionMask() {}
    CollisionMask(int w, int h);

    static CollisionMask solid(int w, int h);
    static CollisionMask ellipse(int w, int h);
    // Convex polygon given in pixel coordinates, filled by even-odd scanline.
    static CollisionMask polygon(int w, int h, const std::vector<float> &xy);

    int width() const { return w; }
    int height() const { return h; }
    bool empty() const { return w == 0 || h == 0; }
    bool get(int x, int y) const;
    void set(int x, int y, bool v=true);
    size_t count() const;

    // True when any opaque pixel of `other`, placed with its origin at (dx,dy) in this
    // mask's space, lands on an opaque pixel of this mask.
    bool overlaps(const CollisionMask &other, int dx, int dy) const;

private:
    int w = 0, h = 0;
    std::vector<uint8_t> bits;
};

} // namespace ronin
