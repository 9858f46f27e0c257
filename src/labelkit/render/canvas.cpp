#include <labelkit/canvas.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cmath>

namespace labelkit {

//=============================================================================
// Transform
//=============================================================================

Transform Transform::rotation(float degrees, float px, float py) {
    float rad = degrees * (3.14159265358979323846f / 180.0f);
    float cosA = std::cos(rad);
    float sinA = std::sin(rad);
    Transform t;
    t.a = cosA;
    t.b = sinA;
    t.c = -sinA;
    t.d = cosA;
    t.e = px - cosA * px + sinA * py;
    t.f = py - sinA * px - cosA * py;
    return t;
}

Transform Transform::concat(const Transform& o) const {
    Transform r;
    r.a = a * o.a + c * o.b;
    r.b = b * o.a + d * o.b;
    r.c = a * o.c + c * o.d;
    r.d = b * o.c + d * o.d;
    r.e = a * o.e + c * o.f + e;
    r.f = b * o.e + d * o.f + f;
    return r;
}

bool Transform::invertible() const {
    return std::abs(a * d - b * c) > 1e-12f;
}

Transform Transform::inverted() const {
    float det = a * d - b * c;
    Transform r;
    r.a = d / det;
    r.b = -b / det;
    r.c = -c / det;
    r.d = a / det;
    r.e = (c * f - d * e) / det;
    r.f = (b * e - a * f) / det;
    return r;
}

//=============================================================================
// Blitting - inverse-map every covered device pixel back into the source grid
//=============================================================================

// sample(sx, sy, color, coverage) -> false to skip the pixel
template<typename Sampler>
static void blitRect(Pixmap& target, const Transform& xform, const Rect& dst,
                     int srcW, int srcH, Sampler&& sample) {
    if (dst.width <= 0 || dst.height <= 0 || srcW <= 0 || srcH <= 0) return;
    if (!xform.invertible()) return;

    // Device-space bounding box of the transformed rect
    const float cornersX[4] = {dst.x, dst.right(), dst.right(), dst.x};
    const float cornersY[4] = {dst.y, dst.y, dst.bottom(), dst.bottom()};
    float minX = INFINITY, minY = INFINITY, maxX = -INFINITY, maxY = -INFINITY;
    for (int i = 0; i < 4; i++) {
        float dx, dy;
        xform.apply(cornersX[i], cornersY[i], dx, dy);
        minX = std::min(minX, dx); maxX = std::max(maxX, dx);
        minY = std::min(minY, dy); maxY = std::max(maxY, dy);
    }

    int x0 = std::max(0, static_cast<int>(std::floor(minX)));
    int y0 = std::max(0, static_cast<int>(std::floor(minY)));
    int x1 = std::min(target.width(), static_cast<int>(std::ceil(maxX)));
    int y1 = std::min(target.height(), static_cast<int>(std::ceil(maxY)));
    if (x0 >= x1 || y0 >= y1) return;

    Transform inv = xform.inverted();
    float scaleX = srcW / dst.width;
    float scaleY = srcH / dst.height;

    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            float ux, uy;
            inv.apply(px + 0.5f, py + 0.5f, ux, uy);
            if (ux < dst.x || uy < dst.y || ux >= dst.right() || uy >= dst.bottom()) {
                continue;
            }
            int sx = std::min(srcW - 1, static_cast<int>((ux - dst.x) * scaleX));
            int sy = std::min(srcH - 1, static_cast<int>((uy - dst.y) * scaleY));
            Color color;
            uint8_t coverage;
            if (sample(sx, sy, color, coverage)) {
                target.blend(px, py, color, coverage);
            }
        }
    }
}

//=============================================================================
// Canvas
//=============================================================================

Result<Canvas::Ptr> Canvas::createImpl(Pixmap::Ptr target, RenderBackend::Ptr backend) {
    if (!target) {
        return Err<Ptr>("Canvas::create: null target pixmap");
    }
    if (!backend) {
        return Err<Ptr>("Canvas::create: null render backend");
    }
    return Ok(Ptr(new Canvas(std::move(target), std::move(backend))));
}

void Canvas::clear(Color color) {
    _target->fill(color);
}

void Canvas::save() {
    _stack.push_back(_transform);
}

Result<void> Canvas::restore() {
    if (_stack.empty()) {
        return Err<void>("Canvas::restore: no matching save()");
    }
    _transform = _stack.back();
    _stack.pop_back();
    return Ok();
}

void Canvas::rotate(float degrees, float pivotX, float pivotY) {
    _transform = _transform.concat(Transform::rotation(degrees, pivotX, pivotY));
}

Result<void> Canvas::drawText(const std::string& text, float x, float baselineY,
                              const Font::Ptr& font, float size, Color color) {
    if (text.empty()) return Ok();

    auto res = _backend->rasterizeText(text, font, size);
    if (!res) {
        return Err<void>("Canvas::drawText: rasterization failed", res);
    }
    const TextCoverage& cov = *res;
    if (cov.empty()) return Ok();

    Rect dst{x + cov.left, baselineY + cov.top,
             static_cast<float>(cov.width), static_cast<float>(cov.height)};
    blitRect(*_target, _transform, dst, cov.width, cov.height,
             [&](int sx, int sy, Color& out, uint8_t& coverage) {
                 coverage = cov.alpha[static_cast<size_t>(sy) * cov.width + sx];
                 out = color;
                 return coverage != 0;
             });
    return Ok();
}

void Canvas::drawPixmap(const Pixmap& pixmap, const Rect& dst) {
    blitRect(*_target, _transform, dst, pixmap.width(), pixmap.height(),
             [&](int sx, int sy, Color& out, uint8_t& coverage) {
                 out = pixmap.pixel(sx, sy);
                 coverage = 255;
                 return colorA(out) != 0;
             });
}

//=============================================================================
// RenderBackend
//=============================================================================

Result<Canvas::Ptr> RenderBackend::newCanvas(int width, int height) {
    auto pixmap = Pixmap::create(width, height);
    if (!pixmap) {
        return Err<Canvas::Ptr>("RenderBackend::newCanvas: failed to allocate", pixmap);
    }
    ytrace("RenderBackend: new canvas {}x{}", width, height);
    return Canvas::create(*pixmap, sharedAs<RenderBackend>());
}

} // namespace labelkit
