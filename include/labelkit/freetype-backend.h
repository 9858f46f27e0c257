#pragma once

#include <labelkit/base/factory.h>
#include <labelkit/render-backend.h>
#include <memory>

namespace labelkit {

//=============================================================================
// FreeTypeBackend - RenderBackend on FreeType 2
//
// Every measure/rasterize call opens the font face, uses it and closes it
// again; no face outlives the call. Glyphs are anti-aliased 8-bit coverage.
//=============================================================================
class FreeTypeBackend : public RenderBackend,
                        public base::ObjectFactory<FreeTypeBackend> {
public:
    using Ptr = std::shared_ptr<FreeTypeBackend>;

    // defaultFont may be null; text without a font then fails to measure
    static Result<Ptr> createImpl(Font::Ptr defaultFont);

    const char* typeName() const override { return "FreeTypeBackend"; }

protected:
    FreeTypeBackend() = default;
};

} // namespace labelkit
