//=============================================================================
// Canvas, Transform and Pixmap Unit Tests
//=============================================================================

#include <boost/ut.hpp>

#include "../harness/mock-backend.h"
#include <labelkit/canvas.h>
#include <labelkit/image-codec.h>

#include <cmath>

using namespace boost::ut;
using namespace labelkit;
using labelkit::test::MockBackend;

suite pixmap_tests = [] {
    "new pixmap is transparent"_test = [] {
        auto pm = *Pixmap::create(3, 2);
        expect(pm->byteSize() == 24_u);
        expect(pm->pixel(2, 1) == COLOR_TRANSPARENT);
    };

    "zero size is rejected"_test = [] {
        expect(!Pixmap::create(0, 5).has_value());
    };

    "out of range access is ignored"_test = [] {
        auto pm = *Pixmap::create(2, 2);
        pm->setPixel(5, 5, COLOR_BLACK);
        expect(pm->pixel(-1, 0) == COLOR_TRANSPARENT);
    };

    "half coverage blends towards the source"_test = [] {
        auto pm = *Pixmap::create(1, 1);
        pm->fill(COLOR_WHITE);
        pm->blend(0, 0, COLOR_BLACK, 128);
        Color c = pm->pixel(0, 0);
        expect(colorR(c) > 100 && colorR(c) < 160);
        expect(colorA(c) == 255_u);
    };
};

suite color_tests = [] {
    "parse accepts short, opaque and alpha forms"_test = [] {
        expect(*parseColor("#FFF") == COLOR_WHITE);
        expect(*parseColor("#000000") == COLOR_BLACK);
        expect(*parseColor("#00000000") == COLOR_TRANSPARENT);
        expect(*parseColor("#ff8000") == rgba(255, 128, 0));
    };

    "parse rejects malformed colors"_test = [] {
        expect(!parseColor("FFFFFF").has_value());
        expect(!parseColor("#12345").has_value());
        expect(!parseColor("#GGGGGG").has_value());
    };

    "format always writes eight digits"_test = [] {
        expect(formatColor(rgba(255, 128, 0)) == std::string("#FF8000FF"));
    };
};

suite transform_tests = [] {
    "quarter turn maps x axis to y axis"_test = [] {
        auto t = Transform::rotation(90, 0, 0);
        float x, y;
        t.apply(10, 0, x, y);
        expect(std::abs(x) < 1e-4f);
        expect(std::abs(y - 10) < 1e-4f);
    };

    "pivot stays fixed"_test = [] {
        auto t = Transform::rotation(37, 15, 25);
        float x, y;
        t.apply(15, 25, x, y);
        expect(std::abs(x - 15) < 1e-3f);
        expect(std::abs(y - 25) < 1e-3f);
    };

    "inverse undoes the transform"_test = [] {
        auto t = Transform::rotation(30, 5, 5);
        float x, y, bx, by;
        t.apply(12, 3, x, y);
        t.inverted().apply(x, y, bx, by);
        expect(std::abs(bx - 12) < 1e-3f);
        expect(std::abs(by - 3) < 1e-3f);
    };
};

suite canvas_tests = [] {
    "restore without save fails"_test = [] {
        auto backend = MockBackend::make();
        auto canvas = *backend->newCanvas(4, 4);
        expect(!canvas->restore().has_value());
    };

    "save and restore bracket a rotation"_test = [] {
        auto backend = MockBackend::make();
        auto canvas = *backend->newCanvas(4, 4);
        canvas->save();
        canvas->rotate(45, 2, 2);
        expect(!canvas->transform().isIdentity());
        expect(canvas->restore().has_value());
        expect(canvas->transform().isIdentity());
    };

    "drawPixmap scales into the destination"_test = [] {
        auto backend = MockBackend::make();
        auto canvas = *backend->newCanvas(8, 8);
        canvas->clear(COLOR_WHITE);
        auto src = *Pixmap::create(2, 1);
        src->setPixel(0, 0, COLOR_BLACK);
        src->setPixel(1, 0, rgba(255, 0, 0));
        canvas->drawPixmap(*src, Rect{0, 0, 8, 4});
        const auto& pm = *canvas->target();
        expect(pm.pixel(1, 1) == COLOR_BLACK);
        expect(pm.pixel(6, 3) == rgba(255, 0, 0));
        expect(pm.pixel(6, 5) == COLOR_WHITE);
    };

    "transparent source pixels leave the target untouched"_test = [] {
        auto backend = MockBackend::make();
        auto canvas = *backend->newCanvas(4, 4);
        canvas->clear(COLOR_WHITE);
        auto src = *Pixmap::create(1, 1);
        canvas->drawPixmap(*src, Rect{0, 0, 4, 4});
        expect(canvas->target()->pixel(2, 2) == COLOR_WHITE);
    };

    "drawText surfaces backend failures"_test = [] {
        auto backend = MockBackend::make();
        backend->failOn("bad");
        auto canvas = *backend->newCanvas(20, 20);
        expect(!canvas->drawText("bad", 0, 10, nullptr, 10, COLOR_BLACK).has_value());
        expect(canvas->drawText("good", 0, 10, nullptr, 10, COLOR_BLACK).has_value());
    };
};

suite image_codec_tests = [] {
    "png encode and decode keep pixels"_test = [] {
        auto pm = *Pixmap::create(3, 2);
        pm->fill(COLOR_WHITE);
        pm->setPixel(1, 1, rgba(10, 20, 30, 255));
        auto png = encodePng(*pm);
        expect(png.has_value() >> fatal);
        expect(png->size() > 8_u);
        auto back = decodeImage(png->data(), png->size());
        expect(back.has_value() >> fatal);
        expect((*back)->width() == 3_i);
        expect((*back)->pixel(1, 1) == rgba(10, 20, 30, 255));
        expect((*back)->pixel(0, 0) == COLOR_WHITE);
    };

    "garbage data fails to decode"_test = [] {
        const uint8_t junk[] = {1, 2, 3, 4, 5};
        expect(!decodeImage(junk, sizeof(junk)).has_value());
    };

    "missing file fails to load"_test = [] {
        expect(!loadImage("/nonexistent/labelkit.png").has_value());
    };
};
