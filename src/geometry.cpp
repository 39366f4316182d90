#include <doctest/doctest.h>
#include "geometry.h"
#include "random.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace Particula::Geometry {

Cell::Cell() : Cell(1.0) {}

Cell::Cell(const double side_length, const Eigen::Index dimension) {
    if (dimension < 1) {
        throw ConfigurationError("cell dimension must be at least one");
    }
    setSide(Point::Constant(dimension, side_length));
}

Cell::Cell(const Point& side_length) { setSide(side_length); }

const Point& Cell::getSide() const { return side; }

void Cell::setSide(const Point& side_length) {
    if (side_length.size() < 1) {
        throw ConfigurationError("cell must have at least one side");
    }
    if ((side_length.array() <= 0.0).any() || !side_length.allFinite()) {
        throw ConfigurationError("cell sides must be positive and finite");
    }
    side = side_length;
}

Eigen::Index Cell::dimension() const { return side.size(); }

double Cell::volume() const { return side.prod(); }

/**
 * Each coordinate is shifted by an integer number of sides so that it
 * ends up in `[-side/2, side/2]`.
 */
void Cell::boundary(Point& point) const {
    if (point.size() != side.size()) {
        throw ConfigurationError("cannot fold {}D point into {}D cell", point.size(), side.size());
    }
    for (Eigen::Index d = 0; d < side.size(); ++d) {
        point[d] -= side[d] * std::round(point[d] / side[d]);
    }
}

Point Cell::vdist(const Point& a, const Point& b) const {
    Point distance = a - b;
    boundary(distance);
    return distance;
}

Point Cell::randomPosition(Random& random) const {
    Point position(side.size());
    for (Eigen::Index d = 0; d < side.size(); ++d) {
        position[d] = (random() - 0.5) * side[d];
    }
    return position;
}

void from_json(const json& j, Cell& cell) {
    try {
        const auto& side = j.at("side");
        if (side.is_number()) {
            cell = Cell(side.get<double>(), j.value("dimension", 3));
            return;
        }
        if (side.is_array() && !side.empty()) {
            cell = Cell(side.get<Point>());
            return;
        }
        throw ConfigurationError("side length syntax error");
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigurationError("cell: {}", e.what()).attachJson(j);
    }
}

void to_json(json& j, const Cell& cell) { j = {{"side", cell.getSide()}, {"volume", cell.volume()}}; }

TEST_SUITE_BEGIN("Geometry");

TEST_CASE("[Particula] Cell") {
    using doctest::Approx;

    SUBCASE("scalar side") {
        Cell cell(2.0);
        CHECK(cell.dimension() == 3);
        CHECK(cell.volume() == Approx(8.0));
        Cell square(3.0, 2);
        CHECK(square.dimension() == 2);
        CHECK(square.volume() == Approx(9.0));
    }

    SUBCASE("vector side") {
        Point side(3);
        side << 1.0, 2.0, 3.0;
        Cell cell(side);
        CHECK(cell.volume() == Approx(6.0));
        side << 2.0, 2.0, 3.0;
        cell.setSide(side);
        CHECK(cell.volume() == Approx(12.0)); // volume is not cached
    }

    SUBCASE("non-positive sides") {
        CHECK_THROWS_AS(Cell(0.0), ConfigurationError);
        CHECK_THROWS_AS(Cell(-1.0), ConfigurationError);
        Point side(2);
        side << 1.0, -2.0;
        CHECK_THROWS_AS((Cell(side)), ConfigurationError);
        Cell cell(1.0);
        CHECK_THROWS_AS(cell.setSide(side), ConfigurationError);
        CHECK(cell.volume() == Approx(1.0)); // unchanged
    }

    SUBCASE("boundary") {
        Point side(3);
        side << 2.0, 4.0, 6.0;
        Cell cell(side);
        Point a(3);
        a << 1.5, -2.5, 10.0;
        cell.boundary(a);
        CHECK(a.x() == Approx(-0.5));
        CHECK(a.y() == Approx(1.5));
        CHECK(a.z() == Approx(-2.0));
        Point wrong_dimension = zeroPoint(2);
        CHECK_THROWS_AS(cell.boundary(wrong_dimension), ConfigurationError);
    }

    SUBCASE("vdist") {
        Cell cell(10.0);
        Point a(3), b(3);
        a << 4.0, 0.0, -4.5;
        b << -4.0, 1.0, 4.5;
        const Point distance = cell.vdist(a, b);
        CHECK(distance.x() == Approx(-2.0));
        CHECK(distance.y() == Approx(-1.0));
        CHECK(distance.z() == Approx(1.0));
    }

    SUBCASE("randomPosition") {
        Random slump;
        Cell cell(4.0, 2);
        for (int i = 0; i < 1000; i++) {
            const auto position = cell.randomPosition(slump);
            CHECK(position.size() == 2);
            CHECK(position.cwiseAbs().maxCoeff() <= 2.0);
        }
    }

    SUBCASE("json") {
        Cell cell = R"( {"side": 10.0} )"_json;
        CHECK(cell.volume() == Approx(1000.0));
        cell = R"( {"side": [2.0, 5.0]} )"_json;
        CHECK(cell.dimension() == 2);
        CHECK(cell.volume() == Approx(10.0));
        CHECK(json(cell)["side"] == R"([2.0, 5.0])"_json);
        CHECK_THROWS_AS(cell = R"( {"side": -1.0} )"_json, ConfigurationError);
        CHECK_THROWS_AS(cell = R"( {"length": 1.0} )"_json, ConfigurationError);
    }
}

TEST_SUITE_END();

} // namespace Particula::Geometry
