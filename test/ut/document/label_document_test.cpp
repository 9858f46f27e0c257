//=============================================================================
// Label document (YAML) Unit Tests
//=============================================================================

#include <boost/ut.hpp>

#include <labelkit/label-document.h>

#include <cmath>
#include <filesystem>
#include <string>

using namespace boost::ut;
using namespace labelkit;

namespace {

bool near(float a, float b) { return std::abs(a - b) < 1e-3f; }

Label::Ptr sampleLabel() {
    auto label = *Label::create(300.0f, 150.0f);
    label->setBackground(rgba(250, 250, 240));

    auto font = *Font::create("DejaVuSans", "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    label->addElement(*Element::text("Hello \xc3\xa9", 5, 10, font, 14, rgba(200, 0, 0), 0));
    label->addElement(*Element::barcode("ABC-123", 20, 40, 200, 50, 90));

    auto pixmap = *Pixmap::create(2, 2);
    pixmap->fill(COLOR_WHITE);
    pixmap->setPixel(1, 0, rgba(0, 0, 255));
    label->addElement(*Element::image(pixmap, 250, 10, 32, 32));

    auto inner = *Element::text("ES only", 5, 120, nullptr, 10, COLOR_BLACK);
    label->addElement(*Element::conditional(std::move(inner),
                                            Condition::fieldEquals("country", "ES")));
    return label;
}

} // namespace

suite document_roundtrip_tests = [] {
    "label survives serialize and parse"_test = [] {
        auto original = sampleLabel();
        auto yaml = serializeLabel(*original);
        expect(yaml.has_value() >> fatal);
        expect(yaml->find("CODE_128") != std::string::npos);

        auto parsed = parseLabel(*yaml);
        expect(parsed.has_value() >> fatal) << error_msg(parsed);
        const auto& label = **parsed;
        expect(near(label.width(), 300));
        expect(near(label.height(), 150));
        expect(label.background() == rgba(250, 250, 240));
        expect((label.elementCount() == 4_u) >> fatal);

        const auto& text = label.elements()[0];
        expect(text.kind() == Element::Kind::Text);
        expect(text.asText()->text == std::string("Hello \xc3\xa9"));
        expect(near(text.asText()->size, 14));
        expect(text.asText()->color == rgba(200, 0, 0));
        expect((text.asText()->font != nullptr) >> fatal);
        expect(text.asText()->font->family() == std::string("DejaVuSans"));

        const auto& barcode = label.elements()[1];
        expect(barcode.kind() == Element::Kind::Barcode);
        expect(barcode.asBarcode()->payload == std::string("ABC-123"));
        expect(barcode.asBarcode()->symbology == Symbology::Code128);
        expect(near(barcode.x(), 20));
        expect(near(barcode.y(), 40));
        expect(near(barcode.rotation(), 90));

        const auto& image = label.elements()[2];
        expect(image.kind() == Element::Kind::Image);
        expect(near(image.asImage()->width, 32));
        expect(image.asImage()->image->pixel(1, 0) == rgba(0, 0, 255));

        const auto& cond = label.elements()[3];
        expect(cond.kind() == Element::Kind::Conditional);
        const auto& match = cond.asConditional()->condition.fieldMatch();
        expect(match.has_value() >> fatal);
        expect(match->field == std::string("country"));
        expect(match->equals == std::string("ES"));
        expect(near(cond.y(), 120));
        expect(cond.asConditional()->condition.evaluate(Context::of(Fields{{"country", "ES"}})));
    };

    "file save and load"_test = [] {
        auto path = (std::filesystem::temp_directory_path() / "labelkit_document_test.yaml").string();
        auto original = sampleLabel();
        expect(saveLabelFile(*original, path).has_value() >> fatal);
        auto loaded = loadLabelFile(path);
        expect(loaded.has_value() >> fatal);
        expect((*loaded)->elementCount() == 4_u);
        std::filesystem::remove(path);
    };
};

suite document_error_tests = [] {
    "predicate conditions cannot be persisted"_test = [] {
        auto label = *Label::create(10.0f, 10.0f);
        auto inner = *Element::text("x", 0, 0, nullptr, 5, COLOR_BLACK);
        label->addElement(*Element::conditional(
            std::move(inner), Condition::make<int>([](const int& v) { return v > 0; })));
        expect(!serializeLabel(*label).has_value());
    };

    "missing label map is rejected"_test = [] {
        expect(!parseLabel("something: else\n").has_value());
    };

    "malformed YAML is rejected"_test = [] {
        expect(!parseLabel("label: {width: [1, 2\n").has_value());
    };

    "missing dimensions are rejected"_test = [] {
        expect(!parseLabel("label: {width: 10}\n").has_value());
        expect(!parseLabel("label: {width: 0, height: 10}\n").has_value());
    };

    "unknown element kind is rejected"_test = [] {
        auto res = parseLabel(R"(
label:
  width: 100
  height: 50
  elements:
    - circle: {x: 1, y: 2}
)");
        expect(!res.has_value() >> fatal);
        expect(res.error().to_string().find("circle") != std::string::npos);
    };

    "unsupported symbology is rejected"_test = [] {
        expect(!parseLabel(R"(
label:
  width: 100
  height: 50
  elements:
    - barcode: {x: 0, y: 0, width: 80, height: 20, payload: "1", symbology: QR_CODE}
)").has_value());
    };

    "bad color is rejected"_test = [] {
        expect(!parseLabel("label: {width: 10, height: 10, background: white}\n").has_value());
    };

    "missing file is rejected"_test = [] {
        expect(!loadLabelFile("/nonexistent/label.yaml").has_value());
    };
};

suite document_defaults_tests = [] {
    "hand-written document uses defaults"_test = [] {
        auto res = parseLabel(R"(
label:
  width: 120
  height: 40
  elements:
    - text: {x: 5, y: 5, text: "Hi", size: 12}
    - barcode: {x: 5, y: 20, width: 100, height: 15, payload: "42"}
)");
        expect(res.has_value() >> fatal) << error_msg(res);
        const auto& label = **res;
        expect(label.background() == COLOR_WHITE);
        expect(label.elements()[0].asText()->color == COLOR_BLACK);
        expect(label.elements()[0].asText()->font == nullptr);
        expect(near(label.elements()[0].rotation(), 0));
        expect(label.elements()[1].asBarcode()->symbology == Symbology::Code128);
    };

    "caller default background applies when omitted"_test = [] {
        auto res = parseLabel("label: {width: 10, height: 10}\n", rgba(1, 2, 3));
        expect(res.has_value() >> fatal);
        expect((*res)->background() == rgba(1, 2, 3));

        auto explicitBg = parseLabel("label: {width: 10, height: 10, background: '#000000'}\n",
                                     rgba(1, 2, 3));
        expect((*explicitBg)->background() == COLOR_BLACK);
    };
};
