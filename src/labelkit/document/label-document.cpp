#include <labelkit/label-document.h>
#include <labelkit/image-codec.h>
#include <yaml-cpp/yaml.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>

namespace labelkit {

namespace {

//=============================================================================
// Writing
//=============================================================================

Result<YAML::Node> elementToYaml(const Element& element);

YAML::Node fontToYaml(const Font& font) {
    YAML::Node node(YAML::NodeType::Map);
    node["family"] = font.family();
    if (!font.path().empty()) node["path"] = font.path();
    return node;
}

void writeGeometry(YAML::Node& node, const Element& element) {
    node["x"] = element.x();
    node["y"] = element.y();
    if (element.rotation() != 0) node["rotation"] = element.rotation();
}

Result<YAML::Node> elementToYaml(const Element& element) {
    YAML::Node body(YAML::NodeType::Map);
    YAML::Node wrapper(YAML::NodeType::Map);

    switch (element.kind()) {
        case Element::Kind::Text: {
            const auto* text = element.asText();
            writeGeometry(body, element);
            body["text"] = text->text;
            body["size"] = text->size;
            body["color"] = formatColor(text->color);
            if (text->font) body["font"] = fontToYaml(*text->font);
            wrapper["text"] = body;
            break;
        }
        case Element::Kind::Barcode: {
            const auto* barcode = element.asBarcode();
            writeGeometry(body, element);
            body["width"] = barcode->width;
            body["height"] = barcode->height;
            body["payload"] = barcode->payload;
            body["symbology"] = symbologyName(barcode->symbology);
            wrapper["barcode"] = body;
            break;
        }
        case Element::Kind::Image: {
            const auto* image = element.asImage();
            auto pngRes = encodePng(*image->image);
            if (!pngRes) {
                return Err<YAML::Node>("cannot encode image", pngRes);
            }
            writeGeometry(body, element);
            body["width"] = image->width;
            body["height"] = image->height;
            body["png"] = YAML::Binary(pngRes->data(), pngRes->size());
            wrapper["image"] = body;
            break;
        }
        case Element::Kind::Conditional: {
            const auto* conditional = element.asConditional();
            const auto& match = conditional->condition.fieldMatch();
            if (!match) {
                return Err<YAML::Node>(
                    "conditional element has a non-declarative condition");
            }
            auto innerRes = elementToYaml(*conditional->inner);
            if (!innerRes) {
                return Err<YAML::Node>("conditional element", innerRes);
            }
            YAML::Node when(YAML::NodeType::Map);
            when["field"] = match->field;
            when["equals"] = match->equals;
            body["when"] = when;
            body["element"] = *innerRes;
            wrapper["conditional"] = body;
            break;
        }
    }
    return Ok(wrapper);
}

//=============================================================================
// Reading
//=============================================================================

template<typename T>
Result<T> required(const YAML::Node& node, const char* key, const char* what) {
    if (!node[key]) {
        return Err<T>(std::string(what) + ": missing '" + key + "'");
    }
    return Ok(node[key].as<T>());
}

Result<Color> colorField(const YAML::Node& node, const char* key, Color fallback) {
    if (!node[key]) return Ok(fallback);
    return parseColor(node[key].as<std::string>());
}

Result<Element> elementFromYaml(const YAML::Node& node);

Result<Element> textFromYaml(const YAML::Node& node) {
    auto text = required<std::string>(node, "text", "text");
    if (!text) return Err<Element>("text", text);
    auto size = required<float>(node, "size", "text");
    if (!size) return Err<Element>("text", size);
    auto color = colorField(node, "color", COLOR_BLACK);
    if (!color) return Err<Element>("text", color);

    Font::Ptr font;
    if (const auto& fontNode = node["font"]) {
        auto fontRes = Font::create(fontNode["family"].as<std::string>(""),
                                    fontNode["path"].as<std::string>(""));
        if (!fontRes) return Err<Element>("text", fontRes);
        font = *fontRes;
    }
    return Element::text(*text, node["x"].as<float>(0), node["y"].as<float>(0),
                         std::move(font), *size, *color, node["rotation"].as<float>(0));
}

Result<Element> barcodeFromYaml(const YAML::Node& node) {
    auto payload = required<std::string>(node, "payload", "barcode");
    if (!payload) return Err<Element>("barcode", payload);
    auto width = required<float>(node, "width", "barcode");
    if (!width) return Err<Element>("barcode", width);
    auto height = required<float>(node, "height", "barcode");
    if (!height) return Err<Element>("barcode", height);
    auto symbology = parseSymbology(node["symbology"].as<std::string>("CODE_128"));
    if (!symbology) return Err<Element>("barcode", symbology);

    return Element::barcode(*payload, node["x"].as<float>(0), node["y"].as<float>(0),
                            *width, *height, node["rotation"].as<float>(0), *symbology);
}

Result<Element> imageFromYaml(const YAML::Node& node) {
    auto width = required<float>(node, "width", "image");
    if (!width) return Err<Element>("image", width);
    auto height = required<float>(node, "height", "image");
    if (!height) return Err<Element>("image", height);
    auto png = required<YAML::Binary>(node, "png", "image");
    if (!png) return Err<Element>("image", png);

    auto pixmap = decodeImage(png->data(), png->size());
    if (!pixmap) return Err<Element>("image", pixmap);

    return Element::image(*pixmap, node["x"].as<float>(0), node["y"].as<float>(0),
                          *width, *height, node["rotation"].as<float>(0));
}

Result<Element> conditionalFromYaml(const YAML::Node& node) {
    const auto& when = node["when"];
    if (!when) return Err<Element>("conditional: missing 'when'");
    auto field = required<std::string>(when, "field", "conditional.when");
    if (!field) return Err<Element>("conditional", field);
    auto equals = required<std::string>(when, "equals", "conditional.when");
    if (!equals) return Err<Element>("conditional", equals);

    if (!node["element"]) return Err<Element>("conditional: missing 'element'");
    auto inner = elementFromYaml(node["element"]);
    if (!inner) return Err<Element>("conditional", inner);

    return Element::conditional(std::move(*inner), Condition::fieldEquals(*field, *equals));
}

Result<Element> elementFromYaml(const YAML::Node& node) {
    if (!node.IsMap() || node.size() != 1) {
        return Err<Element>("element must be a single-key map");
    }
    auto it = node.begin();
    std::string kind = it->first.as<std::string>();
    const YAML::Node& body = it->second;

    if (kind == "text") return textFromYaml(body);
    if (kind == "barcode") return barcodeFromYaml(body);
    if (kind == "image") return imageFromYaml(body);
    if (kind == "conditional") return conditionalFromYaml(body);
    return Err<Element>("unknown element kind '" + kind + "'");
}

} // namespace

Result<std::string> serializeLabel(const Label& label) {
    YAML::Node root(YAML::NodeType::Map);
    YAML::Node body(YAML::NodeType::Map);
    body["width"] = label.width();
    body["height"] = label.height();
    body["background"] = formatColor(label.background());

    YAML::Node elements(YAML::NodeType::Sequence);
    const auto& items = label.elements();
    for (size_t i = 0; i < items.size(); ++i) {
        auto res = elementToYaml(items[i]);
        if (!res) {
            return Err<std::string>("serializeLabel: element " + std::to_string(i), res);
        }
        elements.push_back(*res);
    }
    body["elements"] = elements;
    root["label"] = body;
    return Ok(YAML::Dump(root));
}

Result<Label::Ptr> parseLabel(const std::string& yaml, Color defaultBackground) {
    try {
        YAML::Node root = YAML::Load(yaml);
        const auto& body = root["label"];
        if (!body || !body.IsMap()) {
            return Err<Label::Ptr>("parseLabel: missing 'label' map");
        }
        auto width = required<float>(body, "width", "label");
        if (!width) return Err<Label::Ptr>("parseLabel", width);
        auto height = required<float>(body, "height", "label");
        if (!height) return Err<Label::Ptr>("parseLabel", height);

        auto labelRes = Label::create(*width, *height);
        if (!labelRes) return Err<Label::Ptr>("parseLabel", labelRes);
        auto label = *labelRes;

        auto background = colorField(body, "background", defaultBackground);
        if (!background) return Err<Label::Ptr>("parseLabel", background);
        label->setBackground(*background);

        if (const auto& elements = body["elements"]) {
            if (!elements.IsSequence()) {
                return Err<Label::Ptr>("parseLabel: 'elements' must be a sequence");
            }
            for (size_t i = 0; i < elements.size(); ++i) {
                auto element = elementFromYaml(elements[i]);
                if (!element) {
                    return Err<Label::Ptr>("parseLabel: element " + std::to_string(i), element);
                }
                label->addElement(std::move(*element));
            }
        }
        ydebug("parseLabel: {}x{} with {} elements", label->width(), label->height(),
               label->elementCount());
        return Ok(label);
    } catch (const YAML::Exception& e) {
        return Err<Label::Ptr>(std::string("parseLabel: YAML error: ") + e.what());
    }
}

Result<Label::Ptr> loadLabelFile(const std::string& path, Color defaultBackground) {
    std::ifstream file(path);
    if (!file) {
        return Err<Label::Ptr>("loadLabelFile: cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto res = parseLabel(buffer.str(), defaultBackground);
    if (!res) {
        return Err<Label::Ptr>("loadLabelFile: " + path, res);
    }
    yinfo("Loaded label from {}", path);
    return res;
}

Result<void> saveLabelFile(const Label& label, const std::string& path) {
    auto text = serializeLabel(label);
    if (!text) {
        return Err<void>("saveLabelFile", text);
    }
    std::ofstream file(path);
    if (!file) {
        return Err<void>("saveLabelFile: cannot open " + path);
    }
    file << *text;
    if (!file) {
        return Err<void>("saveLabelFile: write failed for " + path);
    }
    yinfo("Saved label to {}", path);
    return Ok();
}

} // namespace labelkit
