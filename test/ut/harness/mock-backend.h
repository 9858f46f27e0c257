#pragma once

//=============================================================================
// MockBackend - font-free RenderBackend for layout and render tests
//
// Every codepoint advances 0.5 * size; a run rasterizes to a solid box of
// ceil(width) x ceil(size) whose top edge sits size above the baseline.
//=============================================================================

#include <labelkit/render-backend.h>
#include <cmath>
#include <string>

namespace labelkit::test {

class MockBackend : public RenderBackend {
public:
    using Ptr = std::shared_ptr<MockBackend>;

    static constexpr float ADVANCE = 0.5f;

    static Ptr make() { return std::make_shared<MockBackend>(); }

    Result<float> measureTextWidth(const std::string& text, const Font::Ptr&,
                                   float size) override {
        _measureCalls++;
        if (!_failText.empty() && text == _failText) {
            return Err<float>("MockBackend: refusing to measure '" + text + "'");
        }
        return Ok(static_cast<float>(codepoints(text)) * ADVANCE * size);
    }

    // The whole em box sits above the baseline
    Result<float> fontAscent(const Font::Ptr&, float size) override {
        if (size <= 0) {
            return Err<float>("MockBackend: size must be > 0");
        }
        return Ok(size);
    }

    Result<TextCoverage> rasterizeText(const std::string& text, const Font::Ptr&,
                                       float size) override {
        _rasterizeCalls++;
        if (!_failText.empty() && text == _failText) {
            return Err<TextCoverage>("MockBackend: refusing to rasterize '" + text + "'");
        }
        TextCoverage cov;
        cov.width = static_cast<int>(std::ceil(codepoints(text) * ADVANCE * size));
        cov.height = static_cast<int>(std::ceil(size));
        cov.left = 0;
        cov.top = -cov.height;
        cov.alpha.assign(static_cast<size_t>(cov.width) * cov.height, 255);
        return Ok(std::move(cov));
    }

    Font::Ptr defaultFont() const override { return nullptr; }

    // Measuring or rasterizing exactly this text fails
    void failOn(std::string text) { _failText = std::move(text); }

    int measureCalls() const { return _measureCalls; }
    int rasterizeCalls() const { return _rasterizeCalls; }

    static size_t codepoints(const std::string& text) {
        size_t n = 0;
        for (unsigned char c : text) {
            if ((c & 0xC0) != 0x80) n++;
        }
        return n;
    }

private:
    std::string _failText;
    int _measureCalls = 0;
    int _rasterizeCalls = 0;
};

} // namespace labelkit::test
