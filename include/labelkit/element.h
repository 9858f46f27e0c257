#pragma once

#include <labelkit/barcode.h>
#include <labelkit/context.h>
#include <labelkit/font.h>
#include <labelkit/pixmap.h>
#include <labelkit/render-backend.h>
#include <labelkit/result.hpp>
#include <labelkit/types.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace labelkit {

class Canvas;
class Element;

//=============================================================================
// Element payloads
//=============================================================================

struct TextData {
    std::string text;
    Font::Ptr font;                     // null = backend default
    float size = 0;
    Color color = COLOR_BLACK;
    std::optional<float> cachedWidth;   // cleared by scale()
};

struct ImageData {
    Pixmap::Ptr image;                  // never null
    float width = 0;
    float height = 0;
};

// Symbol is encoded at draw time, never cached
struct BarcodeData {
    std::string payload;
    Symbology symbology = Symbology::Code128;
    float width = 0;
    float height = 0;
};

struct ConditionalData {
    std::unique_ptr<Element> inner;     // never null
    Condition condition;
};

//=============================================================================
// Element - one drawable unit of a label
//
// Tagged variant over the four kinds. Position and rotation live on the leaf
// element; a Conditional forwards geometry, scaling and measuring to the
// element it wraps and only gates draw().
//=============================================================================
class Element {
public:
    enum class Kind : uint8_t {
        Text = 0,
        Image = 1,
        Barcode = 2,
        Conditional = 3,
    };

    // Font size must be > 0
    static Result<Element> text(std::string text, float x, float y,
                                Font::Ptr font, float size, Color color,
                                float rotation = 0);
    // Image must be non-null, size > 0
    static Result<Element> image(Pixmap::Ptr image, float x, float y,
                                 float width, float height, float rotation = 0);
    // Size > 0; the payload is validated only when drawn
    static Result<Element> barcode(std::string payload, float x, float y,
                                   float width, float height, float rotation = 0,
                                   Symbology symbology = Symbology::Code128);
    // Condition must be valid
    static Result<Element> conditional(Element inner, Condition condition);

    Element(Element&&) noexcept = default;
    Element& operator=(Element&&) noexcept = default;
    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    Kind kind() const { return static_cast<Kind>(_data.index()); }

    float x() const { return leaf()._x; }
    float y() const { return leaf()._y; }
    void setX(float x) { leaf()._x = x; }
    void setY(float y) { leaf()._y = y; }
    float rotation() const { return leaf()._rotation; }

    // Paint honoring rotation about (x, y); no-op for an unmet conditional
    Result<void> draw(Canvas& canvas, const Context& context) const;

    // Multiply position, size and size-derived state by factor (> 0)
    Result<void> scale(float factor);

    float measuredHeight() const;
    Result<float> measuredWidth(RenderBackend& backend);

    // Payload access; null when the element is of another kind
    const TextData* asText() const { return std::get_if<TextData>(&_data); }
    const ImageData* asImage() const { return std::get_if<ImageData>(&_data); }
    const BarcodeData* asBarcode() const { return std::get_if<BarcodeData>(&_data); }
    const ConditionalData* asConditional() const { return std::get_if<ConditionalData>(&_data); }

private:
    using Data = std::variant<TextData, ImageData, BarcodeData, ConditionalData>;

    Element(float x, float y, float rotation, Data data)
        : _x(x), _y(y), _rotation(rotation), _data(std::move(data)) {}

    Element& leaf();
    const Element& leaf() const;

    Result<void> drawLeaf(Canvas& canvas) const;

    float _x = 0;
    float _y = 0;
    float _rotation = 0;  // degrees, clockwise, around (x, y)
    Data _data;
};

const char* elementKindName(Element::Kind kind);

} // namespace labelkit
