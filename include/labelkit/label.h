#pragma once

#include <labelkit/base/object.h>
#include <labelkit/base/factory.h>
#include <labelkit/context.h>
#include <labelkit/element.h>
#include <labelkit/pixmap.h>
#include <labelkit/render-backend.h>
#include <labelkit/result.hpp>
#include <labelkit/types.h>
#include <functional>
#include <memory>
#include <vector>

namespace labelkit {

// Receives the finished pixel buffer of a render
using RenderSink = std::function<void(const Pixmap&)>;

//=============================================================================
// Label - fixed-size canvas plus an ordered element sequence
//
// Insertion order is paint order: later elements cover earlier ones.
//=============================================================================
class Label : public base::Object,
              public base::ObjectFactory<Label> {
public:
    using Ptr = std::shared_ptr<Label>;

    // Both dimensions must be > 0
    static Result<Ptr> createImpl(float width, float height);

    ~Label() override = default;
    const char* typeName() const override { return "Label"; }

    float width() const { return _width; }
    float height() const { return _height; }

    Color background() const { return _background; }
    void setBackground(Color color) { _background = color; }

    void addElement(Element element);

    size_t elementCount() const { return _elements.size(); }
    const std::vector<Element>& elements() const { return _elements; }
    std::vector<Element>& elements() { return _elements; }

    // Scales the dimensions and every element together (factor > 0)
    Result<void> scale(float factor);

    // Replaces the dimensions only; elements are not moved
    void setSize(float width, float height) {
        _width = width;
        _height = height;
    }

    // Allocates a width x height pixmap, clears it to the background, draws
    // every element in order with the same context, then hands it to sink.
    // The first failing element aborts the render; sink is not called.
    Result<void> render(RenderBackend& backend, const Context& context,
                        const RenderSink& sink) const;

private:
    Label(float width, float height) : _width(width), _height(height) {}

    float _width;
    float _height;
    Color _background = COLOR_WHITE;
    std::vector<Element> _elements;
};

} // namespace labelkit
