#include "ronin/CollisionMask.h"

#include <algorithm>

using namespace std;

namespace ronin {

CollisionMask::CollisionMask(int ww, int hh) : w(max(0, ww)), h(max(0, hh)), bits((size_t)max(0, ww) * (size_t)max(0, hh), 0) {}

CollisionMask CollisionMask::solid(int w, int h) {
    CollisionMask m(w, h);
    fill(m.bits.begin(), m.bits.end(), 1);
    return m;
}

CollisionMask CollisionMask::ellipse(int w, int h) {
    CollisionMask m(w, h);
    float rx = w * 0.5f, ry = h * 0.5f;
    for(int y=0;y<h;++y) for(int x=0;x<w;++x) {
        float nx = (x + 0.5f - rx) / rx, ny = (y + 0.5f - ry) / ry;
        if(nx*nx + ny*ny <= 1.0f) m.set(x, y);
    }
    return m;
}

CollisionMask CollisionMask::polygon(int w, int h, const vector<float> &xy) {
    CollisionMask m(w, h);
    size_t n = xy.size() / 2;
    if(n < 3) return m;
    for(int y=0;y<h;++y) {
        float py = y + 0.5f;
        for(int x=0;x<w;++x) {
            float px = x + 0.5f;
            bool inside = false;
            for(size_t i=0, j=n-1; i<n; j=i++) {
                float xi = xy[2*i], yi = xy[2*i+1], xj = xy[2*j], yj = xy[2*j+1];
                if(((yi > py) != (yj > py)) && (px < (xj - xi) * (py - yi) / (yj - yi) + xi)) inside = !inside;
            }
            if(inside) m.set(x, y);
        }
    }
    return m;
}

bool CollisionMask::get(int x, int y) const {
    if(x < 0 || y < 0 || x >= w || y >= h) return false;
    return bits[(size_t)y * w + x] != 0;
}

void CollisionMask::set(int x, int y, bool v) {
    if(x < 0 || y < 0 || x >= w || y >= h) return;
    bits[(size_t)y * w + x] = v ? 1 : 0;
}

size_t CollisionMask::count() const {
    return (size_t)std::count(bits.begin(), bits.end(), (uint8_t)1);
}

bool CollisionMask::overlaps(const CollisionMask &other, int dx, int dy) const {
    int x0 = max(0, dx), y0 = max(0, dy);
    int x1 = min(w, dx + other.w), y1 = min(h, dy + other.h);
    if(x0 >= x1 || y0 >= y1) return false;
    for(int y=y0;y<y1;++y) {
        const uint8_t *a = &bits[(size_t)y * w];
        const uint8_t *b = &other.bits[(size_t)(y - dy) * other.w];
        for(int x=x0;x<x1;++x) if(a[x] && b[x - dx]) return true;
    }
    return false;
}

} // namespace ronin
