#pragma once

#include <Eigen/Core>
#include <cereal/cereal.hpp>
#include <cstdint>

// Cereal (de)serialization of dynamic Eigen vectors and matrices
namespace cereal {

template <class Archive, class T, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void save(Archive& archive, const Eigen::Matrix<T, Rows, Cols, Options, MaxRows, MaxCols>& m) {
    const std::int64_t rows = m.rows();
    const std::int64_t cols = m.cols();
    archive(rows, cols);
    for (Eigen::Index i = 0; i < m.size(); ++i) {
        archive(m.data()[i]);
    }
}

template <class Archive, class T, int Rows, int Cols, int Options, int MaxRows, int MaxCols>
void load(Archive& archive, Eigen::Matrix<T, Rows, Cols, Options, MaxRows, MaxCols>& m) {
    std::int64_t rows = 0;
    std::int64_t cols = 0;
    archive(rows, cols);
    m.resize(rows, cols);
    for (Eigen::Index i = 0; i < m.size(); ++i) {
        archive(m.data()[i]);
    }
}

} // namespace cereal
