//=============================================================================
// Element Unit Tests
//
// Construction validation, geometry forwarding through conditionals,
// scaling, measuring and the draw-time condition gate.
//=============================================================================

#include <boost/ut.hpp>

#include "../harness/mock-backend.h"
#include <labelkit/canvas.h>
#include <labelkit/element.h>

#include <cmath>

using namespace boost::ut;
using namespace labelkit;
using labelkit::test::MockBackend;

namespace {

bool near(float a, float b) { return std::abs(a - b) < 1e-4f; }

struct Order {
    std::string country;
    int quantity = 0;
};

Pixmap::Ptr solidPixmap(int w, int h, Color color) {
    auto pm = *Pixmap::create(w, h);
    pm->fill(color);
    return pm;
}

} // namespace

suite element_construction_tests = [] {
    "text requires a positive size"_test = [] {
        expect(!Element::text("x", 0, 0, nullptr, 0, COLOR_BLACK).has_value());
        expect(!Element::text("x", 0, 0, nullptr, -3, COLOR_BLACK).has_value());
        expect(Element::text("x", 0, 0, nullptr, 10, COLOR_BLACK).has_value());
    };

    "image requires a pixmap and positive size"_test = [] {
        expect(!Element::image(nullptr, 0, 0, 10, 10).has_value());
        expect(!Element::image(solidPixmap(2, 2, COLOR_BLACK), 0, 0, 0, 10).has_value());
        expect(Element::image(solidPixmap(2, 2, COLOR_BLACK), 0, 0, 10, 10).has_value());
    };

    "barcode defers payload validation to draw"_test = [] {
        auto res = Element::barcode("", 0, 0, 100, 20);
        expect(res.has_value());
        expect(!Element::barcode("123", 0, 0, 100, -1).has_value());
    };

    "conditional requires a valid condition"_test = [] {
        auto inner = *Element::text("x", 0, 0, nullptr, 10, COLOR_BLACK);
        expect(!Element::conditional(std::move(inner), Condition()).has_value());
    };

    "kinds are reported by name"_test = [] {
        expect(std::string(elementKindName(Element::Kind::Text)) == "text");
        expect(std::string(elementKindName(Element::Kind::Conditional)) == "conditional");
    };
};

suite element_geometry_tests = [] {
    "conditional forwards position to its inner element"_test = [] {
        auto inner = *Element::text("hi", 12, 34, nullptr, 10, COLOR_BLACK);
        auto cond = *Element::conditional(
            std::move(inner), Condition::make<Order>([](const Order&) { return true; }));
        expect(near(cond.x(), 12));
        expect(near(cond.y(), 34));

        cond.setX(50);
        cond.setY(60);
        const auto* data = cond.asConditional();
        expect((data != nullptr) >> fatal);
        expect(near(data->inner->x(), 50));
        expect(near(data->inner->y(), 60));
    };

    "text height is its font size"_test = [] {
        auto e = *Element::text("hello", 0, 0, nullptr, 14, COLOR_BLACK);
        expect(near(e.measuredHeight(), 14));
    };

    "text width is measured once and cached"_test = [] {
        auto backend = MockBackend::make();
        auto e = *Element::text("abcd", 0, 0, nullptr, 10, COLOR_BLACK);
        auto w1 = e.measuredWidth(*backend);
        auto w2 = e.measuredWidth(*backend);
        expect(w1.has_value() && w2.has_value());
        expect(near(*w1, 20));
        expect(near(*w2, 20));
        expect(backend->measureCalls() == 1_i);
    };

    "scaling text resets the cached width"_test = [] {
        auto backend = MockBackend::make();
        auto e = *Element::text("abcd", 10, 20, nullptr, 10, COLOR_BLACK);
        expect(e.measuredWidth(*backend).has_value());
        expect(e.scale(2).has_value());
        expect(near(e.x(), 20));
        expect(near(e.y(), 40));
        expect(near(e.measuredHeight(), 20));
        auto w = e.measuredWidth(*backend);
        expect(near(*w, 40));
        expect(backend->measureCalls() == 2_i);
    };

    "scaling image scales position and size"_test = [] {
        auto backend = MockBackend::make();
        auto e = *Element::image(solidPixmap(4, 4, COLOR_BLACK), 10, 10, 40, 30);
        expect(e.scale(0.5f).has_value());
        expect(near(e.x(), 5));
        expect(near(e.y(), 5));
        expect(near(*e.measuredWidth(*backend), 20));
        expect(near(e.measuredHeight(), 15));
    };

    "scaling a conditional scales the inner element once"_test = [] {
        auto inner = *Element::barcode("123", 10, 10, 100, 40);
        auto cond = *Element::conditional(std::move(inner), Condition::fieldEquals("a", "b"));
        expect(cond.scale(2).has_value());
        expect(near(cond.x(), 20));
        expect(near(cond.measuredHeight(), 80));
    };

    "non-positive scale factor is rejected"_test = [] {
        auto e = *Element::text("x", 0, 0, nullptr, 10, COLOR_BLACK);
        expect(!e.scale(0).has_value());
        expect(!e.scale(-1).has_value());
    };
};

suite element_draw_tests = [] {
    auto makeCanvas = [](const MockBackend::Ptr& backend, int w, int h) {
        auto canvas = *backend->newCanvas(w, h);
        canvas->clear(COLOR_WHITE);
        return canvas;
    };

    "text is drawn below its y position"_test = [&] {
        auto backend = MockBackend::make();
        auto canvas = makeCanvas(backend, 40, 40);
        auto e = *Element::text("ab", 5, 10, nullptr, 10, COLOR_BLACK);
        expect(e.draw(*canvas, Context()).has_value());
        const auto& pm = *canvas->target();
        expect(pm.pixel(5, 10) == COLOR_BLACK);
        expect(pm.pixel(14, 19) == COLOR_BLACK);
        expect(pm.pixel(5, 9) == COLOR_WHITE);
        expect(pm.pixel(15, 10) == COLOR_WHITE);
        expect(pm.pixel(5, 20) == COLOR_WHITE);
    };

    "conditional draws only when the context matches"_test = [&] {
        auto backend = MockBackend::make();
        auto inner = *Element::image(solidPixmap(1, 1, COLOR_BLACK), 0, 0, 4, 4);
        auto cond = *Element::conditional(
            std::move(inner),
            Condition::make<Order>([](const Order& o) { return o.country == "ES"; }));

        auto miss = makeCanvas(backend, 8, 8);
        expect(cond.draw(*miss, Context::of(Order{"FR", 1})).has_value());
        expect(miss->target()->pixel(1, 1) == COLOR_WHITE);

        auto wrongType = makeCanvas(backend, 8, 8);
        expect(cond.draw(*wrongType, Context::of(std::string("ES"))).has_value());
        expect(wrongType->target()->pixel(1, 1) == COLOR_WHITE);

        auto empty = makeCanvas(backend, 8, 8);
        expect(cond.draw(*empty, Context()).has_value());
        expect(empty->target()->pixel(1, 1) == COLOR_WHITE);

        auto hit = makeCanvas(backend, 8, 8);
        expect(cond.draw(*hit, Context::of(Order{"ES", 1})).has_value());
        expect(hit->target()->pixel(1, 1) == COLOR_BLACK);
    };

    "rotated image turns around its origin"_test = [&] {
        auto backend = MockBackend::make();
        auto canvas = makeCanvas(backend, 40, 40);
        // 10x2 bar at (20, 20) rotated 90 degrees clockwise hangs downwards
        auto e = *Element::image(solidPixmap(1, 1, COLOR_BLACK), 20, 20, 10, 2, 90);
        expect(e.draw(*canvas, Context()).has_value());
        const auto& pm = *canvas->target();
        expect(pm.pixel(18, 25) == COLOR_BLACK);
        expect(pm.pixel(25, 20) == COLOR_WHITE);
        expect(canvas->saveDepth() == 0_u);
    };

    "barcode with an empty payload fails to draw"_test = [&] {
        auto backend = MockBackend::make();
        auto canvas = makeCanvas(backend, 120, 40);
        auto e = *Element::barcode("", 0, 0, 100, 20);
        expect(!e.draw(*canvas, Context()).has_value());
    };
};
