#include <labelkit/font.h>
#include <filesystem>

namespace labelkit {

Result<Font::Ptr> Font::createImpl(const std::string& family,
                                   const std::string& path) {
    if (family.empty() && path.empty()) {
        return Err<Ptr>("Font::create: family and path are both empty");
    }
    std::string name = family.empty()
        ? std::filesystem::path(path).stem().string()
        : family;
    return Ok(Ptr(new Font(std::move(name), path)));
}

} // namespace labelkit
