#pragma once

#include <labelkit/base/object.h>
#include <labelkit/base/factory.h>
#include <labelkit/result.hpp>
#include <memory>
#include <string>

namespace labelkit {

//=============================================================================
// Font - reference to a typeface (family name + TTF/OTF file)
//
// Only a descriptor: the render backend opens the face when it measures or
// rasterizes. A null Font::Ptr stands for the backend's default font.
//=============================================================================
class Font : public base::Object,
             public base::ObjectFactory<Font> {
public:
    using Ptr = std::shared_ptr<Font>;

    // At least one of family / path must be non-empty
    static Result<Ptr> createImpl(const std::string& family,
                                  const std::string& path);

    ~Font() override = default;
    const char* typeName() const override { return "Font"; }

    const std::string& family() const { return _family; }
    const std::string& path() const { return _path; }

private:
    Font(std::string family, std::string path)
        : _family(std::move(family)), _path(std::move(path)) {}

    std::string _family;
    std::string _path;
};

} // namespace labelkit
