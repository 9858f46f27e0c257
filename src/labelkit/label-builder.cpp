#include <labelkit/label-builder.h>
#include "utf8.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace labelkit {

Result<std::vector<std::string>> splitText(const std::string& text, int maxLength) {
    if (maxLength <= 0) {
        return Err<std::vector<std::string>>(
            "splitText: maxLength must be > 0, got " + std::to_string(maxLength));
    }
    std::vector<std::string> lines;
    auto bounds = utf8Boundaries(text);
    size_t count = bounds.size() - 1;
    if (count == 0) {
        lines.emplace_back();
        return Ok(std::move(lines));
    }
    size_t step = static_cast<size_t>(maxLength);
    for (size_t i = 0; i < count; i += step) {
        size_t stop = std::min(i + step, count);
        lines.push_back(text.substr(bounds[i], bounds[stop] - bounds[i]));
    }
    return Ok(std::move(lines));
}

//=============================================================================
// DecisionChain
//=============================================================================

DecisionChain& DecisionChain::elseWhen(const Condition& condition, const Configure& configure) {
    if (_fired || !_builder.ok()) return *this;
    _fired = _builder.runBranch(condition, configure, "elseWhen");
    return *this;
}

LabelBuilder& DecisionChain::otherwise(const Configure& configure) {
    if (_fired || !_builder.ok()) return _builder;
    if (!configure) {
        return _builder.fail(Error("LabelBuilder::otherwise: configure is null"));
    }
    _fired = true;
    configure(_builder);
    return _builder;
}

//=============================================================================
// LabelBuilder
//=============================================================================

Result<LabelBuilder::Ptr> LabelBuilder::createImpl(float width, float height,
                                                   RenderBackend::Ptr backend) {
    if (!backend) {
        return Err<Ptr>("LabelBuilder::create: backend is null");
    }
    auto labelRes = Label::create(width, height);
    if (!labelRes) {
        return Err<Ptr>("LabelBuilder::create", labelRes);
    }
    ydebug("LabelBuilder: new {}x{} label", width, height);
    return Ok(Ptr(new LabelBuilder(*labelRes, std::move(backend), 0)));
}

Result<LabelBuilder::Ptr> LabelBuilder::edit(Label::Ptr label, RenderBackend::Ptr backend) {
    if (!label) {
        return Err<Ptr>("LabelBuilder::edit: label is null");
    }
    if (!backend) {
        return Err<Ptr>("LabelBuilder::edit: backend is null");
    }
    float lastY = 0;
    for (const auto& element : label->elements()) {
        lastY = std::max(lastY, element.y() + element.measuredHeight());
    }
    ydebug("LabelBuilder: editing label with {} elements, lastY {}",
           label->elementCount(), lastY);
    return Ok(Ptr(new LabelBuilder(std::move(label), std::move(backend), lastY)));
}

LabelBuilder& LabelBuilder::fail(Error error) {
    if (_error) {
        ytrace("LabelBuilder: already failed, dropping: {}", error.to_string());
        return *this;
    }
    yerror("LabelBuilder: {}", error.to_string());
    _error = std::move(error);
    return *this;
}

LabelBuilder& LabelBuilder::withContext(Context context) {
    if (!ok()) return *this;
    _context = std::move(context);
    return *this;
}

Result<void> LabelBuilder::place(Element& element, HAlign align) {
    auto widthRes = element.measuredWidth(*_backend);
    if (!widthRes) {
        return Err<void>("cannot measure element", widthRes);
    }
    float w = *widthRes;
    float h = element.measuredHeight();
    float labelWidth = _label->width();
    float labelHeight = _label->height();

    switch (align) {
        case HAlign::Left:
            element.setX(MARGIN);
            break;
        case HAlign::Center:
            element.setX((labelWidth - w) / 2);
            break;
        case HAlign::Right:
            element.setX(labelWidth - w - MARGIN);
            break;
        case HAlign::None:
            break;
    }

    if (element.x() < 0) element.setX(0);
    if (element.y() < 0) element.setY(0);
    if (element.x() + w > labelWidth) element.setX(labelWidth - w);
    if (element.y() + h > labelHeight) element.setY(labelHeight - h);

    _lastY = std::max(_lastY, element.y() + h);
    return Ok();
}

LabelBuilder& LabelBuilder::insert(const char* op, Result<Element> element, HAlign align) {
    if (!element) {
        return fail(Error(std::string("LabelBuilder::") + op, std::make_shared<const Error>(element.error())));
    }
    Element placed = std::move(*element);
    if (auto res = place(placed, align); !res) {
        return fail(Error(std::string("LabelBuilder::") + op, std::make_shared<const Error>(res.error())));
    }
    ytrace("LabelBuilder: {} {} at ({}, {})", op, elementKindName(placed.kind()),
           placed.x(), placed.y());
    _label->addElement(std::move(placed));
    return *this;
}

LabelBuilder& LabelBuilder::addText(const std::string& text, float x, float y,
                                    Font::Ptr font, float size, Color color,
                                    HAlign align, float rotation) {
    if (!ok()) return *this;
    return insert("addText",
                  Element::text(text, x, y, std::move(font), size, color, rotation), align);
}

LabelBuilder& LabelBuilder::addBarcode(const std::string& code, float x, float y,
                                       float width, float height,
                                       HAlign align, float rotation) {
    if (!ok()) return *this;
    return insert("addBarcode", Element::barcode(code, x, y, width, height, rotation), align);
}

LabelBuilder& LabelBuilder::addImage(Pixmap::Ptr image, float x, float y,
                                     float width, float height,
                                     HAlign align, float rotation) {
    if (!ok()) return *this;
    return insert("addImage",
                  Element::image(std::move(image), x, y, width, height, rotation), align);
}

LabelBuilder& LabelBuilder::addSplitText(const std::string& text, float x, float y,
                                         Font::Ptr font, float size, int maxLength,
                                         float lineSpacing, Color color, HAlign align) {
    if (!ok()) return *this;
    auto linesRes = splitText(text, maxLength);
    if (!linesRes) {
        return fail(Error("LabelBuilder::addSplitText",
                          std::make_shared<const Error>(linesRes.error())));
    }
    const auto& lines = *linesRes;
    for (size_t i = 0; i < lines.size() && ok(); ++i) {
        float lineY = y + static_cast<float>(i) * lineSpacing;
        insert("addSplitText", Element::text(lines[i], x, lineY, font, size, color), align);
    }
    return *this;
}

LabelBuilder& LabelBuilder::addElement(Element element, HAlign align) {
    if (!ok()) return *this;
    return insert("addElement", Result<Element>(Ok(std::move(element))), align);
}

LabelBuilder& LabelBuilder::addConditional(Element element, const Condition& condition,
                                           HAlign align) {
    if (!ok()) return *this;
    return insert("addConditional", Element::conditional(std::move(element), condition), align);
}

LabelBuilder& LabelBuilder::onlyWhen(const Condition& condition, const Configure& configure) {
    if (!ok()) return *this;
    if (!condition.valid()) {
        return fail(Error("LabelBuilder::onlyWhen: condition is null"));
    }
    if (!configure) {
        return fail(Error("LabelBuilder::onlyWhen: configure is null"));
    }
    auto& elements = _label->elements();
    size_t first = elements.size();
    float lastY = _lastY;
    configure(*this);
    if (!ok()) {
        // Nothing from a failed block may stay in unconditionally
        elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(first), elements.end());
        _lastY = lastY;
        return *this;
    }

    for (size_t i = first; i < elements.size(); ++i) {
        auto wrapped = Element::conditional(std::move(elements[i]), condition);
        if (!wrapped) {
            return fail(Error("LabelBuilder::onlyWhen",
                              std::make_shared<const Error>(wrapped.error())));
        }
        elements[i] = std::move(*wrapped);
    }
    ydebug("LabelBuilder: onlyWhen wrapped {} elements", elements.size() - first);
    return *this;
}

bool LabelBuilder::runBranch(const Condition& condition, const Configure& configure,
                             const char* op) {
    if (!condition.valid()) {
        fail(Error(std::string("LabelBuilder::") + op + ": condition is null"));
        return true;
    }
    if (!configure) {
        fail(Error(std::string("LabelBuilder::") + op + ": configure is null"));
        return true;
    }
    if (!condition.evaluate(_context)) {
        return false;
    }
    ytrace("LabelBuilder: {} branch taken", op);
    configure(*this);
    return true;
}

DecisionChain LabelBuilder::when(const Condition& condition, const Configure& configure) {
    if (!ok()) return DecisionChain(*this, true);
    bool fired = runBranch(condition, configure, "when");
    return DecisionChain(*this, fired);
}

LabelBuilder& LabelBuilder::repeat(int start, int end,
                                   const std::function<void(LabelBuilder&, int)>& configure) {
    if (!ok()) return *this;
    if (!configure) {
        return fail(Error("LabelBuilder::repeat: configure is null"));
    }
    for (int i = start; i < end && ok(); ++i) {
        configure(*this, i);
    }
    return *this;
}

LabelBuilder& LabelBuilder::scale(float factor) {
    if (!ok()) return *this;
    if (auto res = _label->scale(factor); !res) {
        return fail(Error("LabelBuilder::scale", std::make_shared<const Error>(res.error())));
    }
    _lastY *= factor;
    return *this;
}

LabelBuilder& LabelBuilder::scaleToFit(float targetWidth, float targetHeight) {
    if (!ok()) return *this;
    if (!(targetWidth > 0) || !(targetHeight > 0)) {
        return fail(Error("LabelBuilder::scaleToFit: target must be > 0, got " +
                          std::to_string(targetWidth) + "x" + std::to_string(targetHeight)));
    }
    float widthFactor = targetWidth / _label->width();
    float heightFactor = targetHeight / _label->height();
    float factor = std::min(widthFactor, heightFactor);
    ydebug("LabelBuilder: scaleToFit {}x{} -> factor {}", targetWidth, targetHeight, factor);
    if (!scale(factor).ok()) return *this;

    // W * (targetW / W) may land an ulp past the target in float
    if (widthFactor <= heightFactor) {
        _label->setSize(targetWidth, std::min(_label->height(), targetHeight));
    } else {
        _label->setSize(std::min(_label->width(), targetWidth), targetHeight);
    }
    return *this;
}

LabelBuilder& LabelBuilder::centerVertically() {
    if (!ok()) return *this;
    auto& elements = _label->elements();
    if (elements.empty()) return *this;

    float offset = (_label->height() - _lastY) / 2;
    for (auto& element : elements) {
        element.setY(element.y() + offset);
    }
    _lastY += offset;
    ydebug("LabelBuilder: centered vertically, offset {}", offset);
    return *this;
}

LabelBuilder& LabelBuilder::setBackground(Color color) {
    if (!ok()) return *this;
    _label->setBackground(color);
    return *this;
}

Result<Label::Ptr> LabelBuilder::build() {
    if (_error) {
        return Err<Label::Ptr>("LabelBuilder::build", *_error);
    }
    return Ok(_label);
}

LabelBuilder& LabelBuilder::generate(const RenderSink& sink) {
    if (!ok()) return *this;
    if (auto res = _label->render(*_backend, _context, sink); !res) {
        return fail(Error("LabelBuilder::generate", std::make_shared<const Error>(res.error())));
    }
    return *this;
}

} // namespace labelkit
