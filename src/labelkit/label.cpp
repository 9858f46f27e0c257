#include <labelkit/label.h>
#include <labelkit/canvas.h>
#include <ytrace/ytrace.hpp>

namespace labelkit {

Result<Label::Ptr> Label::createImpl(float width, float height) {
    if (!(width > 0) || !(height > 0)) {
        return Err<Ptr>("Label::create: dimensions must be > 0, got " +
                        std::to_string(width) + "x" + std::to_string(height));
    }
    return Ok(Ptr(new Label(width, height)));
}

void Label::addElement(Element element) {
    _elements.push_back(std::move(element));
}

Result<void> Label::scale(float factor) {
    if (!(factor > 0)) {
        return Err<void>("Label::scale: factor must be > 0, got " + std::to_string(factor));
    }
    _width *= factor;
    _height *= factor;
    for (auto& element : _elements) {
        if (auto res = element.scale(factor); !res) {
            return Err<void>("Label::scale", res);
        }
    }
    ydebug("Label: scaled by {} to {}x{}", factor, _width, _height);
    return Ok();
}

Result<void> Label::render(RenderBackend& backend, const Context& context,
                           const RenderSink& sink) const {
    if (!sink) {
        return Err<void>("Label::render: sink is null");
    }
    int pixelWidth = static_cast<int>(_width);
    int pixelHeight = static_cast<int>(_height);

    auto canvasRes = backend.newCanvas(pixelWidth, pixelHeight);
    if (!canvasRes) {
        return Err<void>("Label::render: cannot create canvas", canvasRes);
    }
    Canvas& canvas = **canvasRes;
    canvas.clear(_background);

    for (size_t i = 0; i < _elements.size(); ++i) {
        if (auto res = _elements[i].draw(canvas, context); !res) {
            yerror("Label: element {} ({}) failed to draw: {}", i,
                   elementKindName(_elements[i].kind()), res.error().to_string());
            return Err<void>("Label::render: element " + std::to_string(i), res);
        }
    }

    ydebug("Label: rendered {} elements into {}x{}", _elements.size(), pixelWidth, pixelHeight);
    sink(*canvas.target());
    return Ok();
}

} // namespace labelkit
