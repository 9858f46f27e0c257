#include <labelkit/element.h>
#include <labelkit/canvas.h>
#include <ytrace/ytrace.hpp>

namespace labelkit {

const char* elementKindName(Element::Kind kind) {
    switch (kind) {
        case Element::Kind::Text:        return "text";
        case Element::Kind::Image:       return "image";
        case Element::Kind::Barcode:     return "barcode";
        case Element::Kind::Conditional: return "conditional";
    }
    return "unknown";
}

//=============================================================================
// Construction
//=============================================================================

Result<Element> Element::text(std::string text, float x, float y,
                              Font::Ptr font, float size, Color color,
                              float rotation) {
    if (!(size > 0)) {
        return Err<Element>("Element::text: font size must be > 0, got " + std::to_string(size));
    }
    TextData data;
    data.text = std::move(text);
    data.font = std::move(font);
    data.size = size;
    data.color = color;
    return Ok(Element(x, y, rotation, std::move(data)));
}

Result<Element> Element::image(Pixmap::Ptr image, float x, float y,
                               float width, float height, float rotation) {
    if (!image) {
        return Err<Element>("Element::image: image is null");
    }
    if (!(width > 0) || !(height > 0)) {
        return Err<Element>("Element::image: size must be > 0");
    }
    return Ok(Element(x, y, rotation, ImageData{std::move(image), width, height}));
}

Result<Element> Element::barcode(std::string payload, float x, float y,
                                 float width, float height, float rotation,
                                 Symbology symbology) {
    if (!(width > 0) || !(height > 0)) {
        return Err<Element>("Element::barcode: size must be > 0");
    }
    BarcodeData data;
    data.payload = std::move(payload);
    data.symbology = symbology;
    data.width = width;
    data.height = height;
    return Ok(Element(x, y, rotation, std::move(data)));
}

Result<Element> Element::conditional(Element inner, Condition condition) {
    if (!condition.valid()) {
        return Err<Element>("Element::conditional: condition is null");
    }
    ConditionalData data;
    data.inner = std::make_unique<Element>(std::move(inner));
    data.condition = std::move(condition);
    return Ok(Element(0, 0, 0, std::move(data)));
}

//=============================================================================
// Geometry
//=============================================================================

Element& Element::leaf() {
    Element* e = this;
    while (auto* cond = std::get_if<ConditionalData>(&e->_data)) {
        e = cond->inner.get();
    }
    return *e;
}

const Element& Element::leaf() const {
    const Element* e = this;
    while (auto* cond = std::get_if<ConditionalData>(&e->_data)) {
        e = cond->inner.get();
    }
    return *e;
}

Result<void> Element::scale(float factor) {
    if (!(factor > 0)) {
        return Err<void>("Element::scale: factor must be > 0, got " + std::to_string(factor));
    }

    switch (kind()) {
        case Kind::Text: {
            auto& t = std::get<TextData>(_data);
            t.size *= factor;
            t.cachedWidth.reset();
            break;
        }
        case Kind::Image: {
            auto& img = std::get<ImageData>(_data);
            img.width *= factor;
            img.height *= factor;
            break;
        }
        case Kind::Barcode: {
            auto& bc = std::get<BarcodeData>(_data);
            bc.width *= factor;
            bc.height *= factor;
            break;
        }
        case Kind::Conditional:
            return std::get<ConditionalData>(_data).inner->scale(factor);
    }
    _x *= factor;
    _y *= factor;
    return Ok();
}

float Element::measuredHeight() const {
    switch (kind()) {
        case Kind::Text:        return std::get<TextData>(_data).size;
        case Kind::Image:       return std::get<ImageData>(_data).height;
        case Kind::Barcode:     return std::get<BarcodeData>(_data).height;
        case Kind::Conditional: return std::get<ConditionalData>(_data).inner->measuredHeight();
    }
    return 0;
}

Result<float> Element::measuredWidth(RenderBackend& backend) {
    switch (kind()) {
        case Kind::Text: {
            auto& t = std::get<TextData>(_data);
            if (!t.cachedWidth) {
                auto width = backend.measureTextWidth(t.text, t.font, t.size);
                if (!width) {
                    return Err<float>("Element::measuredWidth: cannot measure '" + t.text + "'", width);
                }
                t.cachedWidth = *width;
            }
            return Ok(*t.cachedWidth);
        }
        case Kind::Image:
            return Ok(std::get<ImageData>(_data).width);
        case Kind::Barcode:
            return Ok(std::get<BarcodeData>(_data).width);
        case Kind::Conditional:
            return std::get<ConditionalData>(_data).inner->measuredWidth(backend);
    }
    return Ok(0.0f);
}

//=============================================================================
// Drawing
//=============================================================================

Result<void> Element::draw(Canvas& canvas, const Context& context) const {
    if (auto* cond = asConditional()) {
        if (!cond->condition.evaluate(context)) {
            return Ok();
        }
        return cond->inner->draw(canvas, context);
    }

    if (_rotation == 0) {
        return drawLeaf(canvas);
    }

    canvas.save();
    canvas.rotate(_rotation, _x, _y);
    auto res = drawLeaf(canvas);
    if (auto restored = canvas.restore(); !restored) {
        return restored;
    }
    return res;
}

Result<void> Element::drawLeaf(Canvas& canvas) const {
    switch (kind()) {
        case Kind::Text: {
            const auto& t = std::get<TextData>(_data);
            // Top of the run sits at y; baseline one font size below
            if (auto res = canvas.drawText(t.text, _x, _y + t.size, t.font, t.size, t.color); !res) {
                return Err<void>("Element::draw: text '" + t.text + "'", res);
            }
            return Ok();
        }
        case Kind::Image: {
            const auto& img = std::get<ImageData>(_data);
            canvas.drawPixmap(*img.image, Rect{_x, _y, img.width, img.height});
            return Ok();
        }
        case Kind::Barcode: {
            const auto& bc = std::get<BarcodeData>(_data);
            auto symbol = encodeBarcode(bc.payload, bc.symbology,
                                        static_cast<int>(bc.width), static_cast<int>(bc.height));
            if (!symbol) {
                return Err<void>("Element::draw: barcode", symbol);
            }
            canvas.drawPixmap(**symbol, Rect{_x, _y, bc.width, bc.height});
            return Ok();
        }
        case Kind::Conditional:
            break;
    }
    return Err<void>("Element::drawLeaf: not a leaf element");
}

} // namespace labelkit
