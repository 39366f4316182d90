#pragma once

#include "core.h"
#include "aux/eigensupport.h"

/** @brief Particula main namespace */
namespace Particula {

class Random;

/**
 * @brief Simulation geometries and related operations.
 *
 * Only an axis-aligned, periodic box of arbitrary dimensionality is provided. The box is
 * centered at the origin, i.e. the canonical image of a coordinate `x` along dimension `d`
 * lies in `[-side[d]/2, side[d]/2]`.
 */
namespace Geometry {

/**
 * @brief Axis-aligned periodic cell defined by per-dimension side lengths
 *
 * Construction from a scalar broadcasts the value to all dimensions. All sides
 * must be strictly positive; otherwise a `ConfigurationError` is thrown.
 *
 * Json (de)serialization:
 *
 * ```{.cpp}
 *     Cell a = R"( {"side": 10.0} )"_json;        // 10 x 10 x 10
 *     Cell b = R"( {"side": [10.0, 20.0]} )"_json; // 2D
 * ```
 */
class Cell {
    Point side; //!< Side lengths

  public:
    Cell();
    explicit Cell(double side_length, Eigen::Index dimension = 3);
    explicit Cell(const Point& side_length);

    const Point& getSide() const;              //!< Side lengths
    void setSide(const Point& side_length);    //!< Set side lengths (must be positive)
    Eigen::Index dimension() const;            //!< Number of dimensions
    double volume() const;                     //!< Product of all sides; recomputed on each call
    void boundary(Point& point) const;         //!< Fold point into the canonical cell
    Point vdist(const Point& a, const Point& b) const; //!< Minimum image separation `a - b`
    Point randomPosition(Random& random) const; //!< Uniform random position inside the cell

    template <class Archive> void serialize(Archive& archive) { archive(side); } //!< Cereal serialisation
};

void from_json(const json& j, Cell& cell);
void to_json(json& j, const Cell& cell);

} // namespace Geometry

using Geometry::Cell;

} // namespace Particula
