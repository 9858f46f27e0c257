#pragma once

#include <labelkit/label.h>
#include <labelkit/result.hpp>
#include <string>

namespace labelkit {

//=============================================================================
// Persisted label form (YAML)
//
//   label:
//     width: 400
//     height: 200
//     background: "#FFFFFFFF"
//     elements:
//       - text: {x: 5, y: 10, text: "Hello", size: 12, color: "#000000FF",
//                font: {family: DejaVuSans, path: /usr/share/fonts/...}}
//       - barcode: {x: 5, y: 40, width: 200, height: 60, payload: "123456",
//                   symbology: CODE_128}
//       - image: {x: 300, y: 10, width: 64, height: 64, png: !!binary ...}
//       - conditional:
//           when: {field: country, equals: ES}
//           element: {text: {...}}
//
// Every element carries an optional `rotation` (degrees). Only conditionals
// built with Condition::fieldEquals can be written.
//=============================================================================

Result<std::string> serializeLabel(const Label& label);
// defaultBackground applies when the document has no `background`
Result<Label::Ptr> parseLabel(const std::string& yaml,
                              Color defaultBackground = COLOR_WHITE);

Result<Label::Ptr> loadLabelFile(const std::string& path,
                                 Color defaultBackground = COLOR_WHITE);
Result<void> saveLabelFile(const Label& label, const std::string& path);

} // namespace labelkit
