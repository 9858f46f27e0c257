#pragma once

typedef struct FT_LibraryRec_* FT_Library;

namespace labelkit::render {

// Thread-local FreeType library instance, created on first use
FT_Library ftLibrary();

} // namespace labelkit::render
