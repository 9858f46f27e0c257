#pragma once

#include <labelkit/base/object.h>
#include <labelkit/base/factory.h>
#include <labelkit/font.h>
#include <labelkit/pixmap.h>
#include <labelkit/render-backend.h>
#include <labelkit/result.hpp>
#include <labelkit/types.h>
#include <memory>
#include <string>
#include <vector>

namespace labelkit {

//=============================================================================
// Transform - 2D affine map: x' = a*x + c*y + e, y' = b*x + d*y + f
//=============================================================================
struct Transform {
    float a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    // Clockwise (y-down) rotation by degrees around (px, py)
    static Transform rotation(float degrees, float px, float py);

    // this ∘ other: other is applied first
    Transform concat(const Transform& other) const;

    bool invertible() const;
    Transform inverted() const;

    void apply(float x, float y, float& outX, float& outY) const {
        outX = a * x + c * y + e;
        outY = b * x + d * y + f;
    }

    bool isIdentity() const {
        return a == 1 && b == 0 && c == 0 && d == 1 && e == 0 && f == 0;
    }
};

//=============================================================================
// Canvas - CPU rasterizer drawing into a Pixmap
//
// Keeps a transform stack (save/restore) so elements can rotate around their
// own origin. Sampling is nearest-neighbour; compositing is source-over.
//=============================================================================
class Canvas : public base::Object,
               public base::ObjectFactory<Canvas> {
public:
    using Ptr = std::shared_ptr<Canvas>;

    static Result<Ptr> createImpl(Pixmap::Ptr target, RenderBackend::Ptr backend);

    ~Canvas() override = default;
    const char* typeName() const override { return "Canvas"; }

    int width() const { return _target->width(); }
    int height() const { return _target->height(); }
    const Pixmap::Ptr& target() const { return _target; }
    const RenderBackend::Ptr& backend() const { return _backend; }

    void clear(Color color);

    void save();
    Result<void> restore();
    size_t saveDepth() const { return _stack.size(); }

    void rotate(float degrees, float pivotX, float pivotY);
    const Transform& transform() const { return _transform; }

    // Draw text with its pen origin at (x, baselineY)
    Result<void> drawText(const std::string& text, float x, float baselineY,
                          const Font::Ptr& font, float size, Color color);

    // Scale pixmap into dst under the current transform
    void drawPixmap(const Pixmap& pixmap, const Rect& dst);

private:
    Canvas(Pixmap::Ptr target, RenderBackend::Ptr backend)
        : _target(std::move(target)), _backend(std::move(backend)) {}

    Pixmap::Ptr _target;
    RenderBackend::Ptr _backend;
    Transform _transform;
    std::vector<Transform> _stack;
};

} // namespace labelkit
