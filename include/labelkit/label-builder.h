#pragma once

#include <labelkit/base/object.h>
#include <labelkit/base/factory.h>
#include <labelkit/context.h>
#include <labelkit/element.h>
#include <labelkit/label.h>
#include <labelkit/render-backend.h>
#include <labelkit/result.hpp>
#include <labelkit/types.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace labelkit {

class LabelBuilder;

using Configure = std::function<void(LabelBuilder&)>;

namespace detail {
template<typename T> struct IsStdFunction : std::false_type {};
template<typename R, typename... Args>
struct IsStdFunction<std::function<R(Args...)>> : std::true_type {};
} // namespace detail

// Greedy left-to-right chunks of at most maxLength characters (UTF-8
// codepoints); empty text yields one empty line. maxLength must be > 0.
Result<std::vector<std::string>> splitText(const std::string& text, int maxLength);

//=============================================================================
// DecisionChain - one when / elseWhen / otherwise sequence
//
// Owns its single-fire flag, so a chain started inside another chain's branch
// never affects the outer one.
//=============================================================================
class DecisionChain {
public:
    template<typename T>
    DecisionChain& elseWhen(std::function<bool(const T&)> predicate,
                            const Configure& configure) {
        return elseWhen(Condition::make<T>(std::move(predicate)), configure);
    }
    DecisionChain& elseWhen(const Condition& condition, const Configure& configure);

    // Runs configure if no branch fired, then ends the chain
    LabelBuilder& otherwise(const Configure& configure);

    LabelBuilder& end() { return _builder; }

    bool fired() const { return _fired; }

private:
    friend class LabelBuilder;
    DecisionChain(LabelBuilder& builder, bool fired) : _builder(builder), _fired(fired) {}

    LabelBuilder& _builder;
    bool _fired;
};

//=============================================================================
// LabelBuilder - fluent layout session over a private Label
//
// Every add* call measures the new element, applies the horizontal alignment
// (LEFT = margin, CENTER, RIGHT = width - w - margin), clamps it inside the
// canvas and raises lastY to the element's bottom edge.
//
// The first rejected call latches its error: the label is left untouched,
// later mutating calls are skipped and build()/generate() report the error.
//=============================================================================
class LabelBuilder : public base::Object,
                     public base::ObjectFactory<LabelBuilder> {
public:
    using Ptr = std::shared_ptr<LabelBuilder>;

    static constexpr float MARGIN = 5.0f;

    // Dimensions must be > 0, backend non-null
    static Result<Ptr> createImpl(float width, float height, RenderBackend::Ptr backend);

    // Continue laying out an existing label; lastY starts at its lowest bottom edge
    static Result<Ptr> edit(Label::Ptr label, RenderBackend::Ptr backend);

    ~LabelBuilder() override = default;
    const char* typeName() const override { return "LabelBuilder"; }

    //=========================================================================
    // Context
    //=========================================================================
    LabelBuilder& withContext(Context context);

    template<typename T>
    LabelBuilder& withContext(std::shared_ptr<T> value) {
        return withContext(Context::shared(std::move(value)));
    }

    const Context& context() const { return _context; }

    //=========================================================================
    // Elements
    //=========================================================================
    LabelBuilder& addText(const std::string& text, float x, float y,
                          Font::Ptr font, float size, Color color,
                          HAlign align = HAlign::Left, float rotation = 0);

    LabelBuilder& addBarcode(const std::string& code, float x, float y,
                             float width, float height,
                             HAlign align = HAlign::Left, float rotation = 0);

    LabelBuilder& addImage(Pixmap::Ptr image, float x, float y,
                           float width, float height,
                           HAlign align = HAlign::Left, float rotation = 0);

    // One text element per chunk, line i at y + i * lineSpacing
    LabelBuilder& addSplitText(const std::string& text, float x, float y,
                               Font::Ptr font, float size, int maxLength,
                               float lineSpacing, Color color,
                               HAlign align = HAlign::Left);

    LabelBuilder& addElement(Element element, HAlign align = HAlign::None);

    // Draw-time conditional: element is painted only when the render context
    // is a T and predicate holds
    template<typename T>
    LabelBuilder& addConditional(Element element, std::function<bool(const T&)> predicate,
                                 HAlign align = HAlign::None) {
        return addConditional(std::move(element), Condition::make<T>(std::move(predicate)), align);
    }
    LabelBuilder& addConditional(Element element, const Condition& condition,
                                 HAlign align = HAlign::None);

    // Every element configure adds becomes a draw-time conditional
    template<typename T>
    LabelBuilder& onlyWhen(std::function<bool(const T&)> predicate, const Configure& configure) {
        return onlyWhen(Condition::make<T>(std::move(predicate)), configure);
    }
    LabelBuilder& onlyWhen(const Condition& condition, const Configure& configure);

    //=========================================================================
    // Build-time composition against the bound context
    //=========================================================================
    template<typename T>
    DecisionChain when(std::function<bool(const T&)> predicate, const Configure& configure) {
        return when(Condition::make<T>(std::move(predicate)), configure);
    }
    DecisionChain when(const Condition& condition, const Configure& configure);

    // configure(builder, i) for i in [start, end)
    LabelBuilder& repeat(int start, int end,
                         const std::function<void(LabelBuilder&, int)>& configure);

    template<typename Range, typename F>
    LabelBuilder& forEach(const Range& items, F&& configure) {
        if (!ok()) return *this;
        using Fn = std::decay_t<F>;
        if constexpr (detail::IsStdFunction<Fn>::value || std::is_pointer_v<Fn>) {
            if (!static_cast<bool>(configure)) {
                return fail(Error("LabelBuilder::forEach: configure is null"));
            }
        }
        for (const auto& item : items) {
            if (!ok()) break;
            configure(*this, item);
        }
        return *this;
    }

    //=========================================================================
    // Scaling and centering
    //=========================================================================
    LabelBuilder& scale(float factor);

    // Uniform factor min(targetWidth / width, targetHeight / height)
    LabelBuilder& scaleToFit(float targetWidth, float targetHeight);

    // Shift every element by (height - lastY) / 2; no-op without elements
    LabelBuilder& centerVertically();

    LabelBuilder& setBackground(Color color);

    float lastY() const { return _lastY; }

    //=========================================================================
    // Result
    //=========================================================================
    bool ok() const { return !_error.has_value(); }
    const std::optional<Error>& error() const { return _error; }

    Result<Label::Ptr> build();

    // Render with the bound context and hand the pixels to sink
    LabelBuilder& generate(const RenderSink& sink);

private:
    friend class DecisionChain;

    LabelBuilder(Label::Ptr label, RenderBackend::Ptr backend, float lastY)
        : _label(std::move(label)), _backend(std::move(backend)), _lastY(lastY) {}

    LabelBuilder& fail(Error error);
    Result<void> place(Element& element, HAlign align);
    LabelBuilder& insert(const char* op, Result<Element> element, HAlign align);
    bool runBranch(const Condition& condition, const Configure& configure, const char* op);

    Label::Ptr _label;
    RenderBackend::Ptr _backend;
    Context _context;
    float _lastY = 0;
    std::optional<Error> _error;
};

} // namespace labelkit
