#pragma once

// ─── bubblepie ↔ Eigen Integration ─────────────────────────────────────────
//
// Pass Eigen vectors and matrices straight to the pie builder and the chart.
// Pie data is naturally a matrix: one row per point, one column per category.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DBUBBLEPIE_USE_EIGEN=ON
//
// Usage:
//
//   #include <bubblepie/eigen.hpp>
//
//   Eigen::VectorXd x(3), y(3);
//   Eigen::MatrixXd p(3, 4);
//   ...
//   bubblepie::BubblePieChart chart;
//   bubblepie::set_data(chart, x, y, p);
//
// ─────────────────────────────────────────────────────────────────────────────

#include <bubblepie/chart.hpp>
#include <bubblepie/pie_geometry.hpp>
#include <eigen3/Eigen/Core>
#include <span>
#include <type_traits>
#include <vector>

namespace bubblepie
{

namespace eigen_detail
{

// Any Eigen dense expression with double scalar and one column (or dynamic).
template <typename T, typename = void>
struct is_eigen_double_vector : std::false_type
{
};

template <typename T>
struct is_eigen_double_vector<
    T,
    std::enable_if_t<std::is_base_of_v<Eigen::DenseBase<std::decay_t<T>>, std::decay_t<T>>
                     && std::is_same_v<typename std::decay_t<T>::Scalar, double>
                     && (std::decay_t<T>::ColsAtCompileTime == 1
                         || std::decay_t<T>::RowsAtCompileTime == 1
                         || std::decay_t<T>::ColsAtCompileTime == Eigen::Dynamic)>>
    : std::true_type
{
};

template <typename T>
inline constexpr bool is_eigen_double_vector_v = is_eigen_double_vector<T>::value;

// Copy any Eigen expression into a std::vector (expressions are evaluated,
// strided views are handled element by element).
template <typename Derived>
std::vector<double> to_vector(const Eigen::DenseBase<Derived>& v)
{
    static_assert(std::is_same_v<typename Derived::Scalar, double>,
                  "bubblepie Eigen adapter requires double scalar type. "
                  "Use .cast<double>() to convert.");
    std::vector<double> out;
    out.reserve(static_cast<size_t>(v.size()));
    for (Eigen::Index i = 0; i < v.size(); ++i)
        out.push_back(v.derived().coeff(i));
    return out;
}

// One std::vector per matrix row.
template <typename Derived>
std::vector<std::vector<double>> to_rows(const Eigen::DenseBase<Derived>& m)
{
    static_assert(std::is_same_v<typename Derived::Scalar, double>,
                  "bubblepie Eigen adapter requires double scalar type. "
                  "Use .cast<double>() to convert.");
    std::vector<std::vector<double>> rows;
    rows.reserve(static_cast<size_t>(m.rows()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
    {
        std::vector<double> row;
        row.reserve(static_cast<size_t>(m.cols()));
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            row.push_back(m.derived().coeff(r, c));
        rows.push_back(std::move(row));
    }
    return rows;
}

}   // namespace eigen_detail

// Wedges from an Eigen vector expression.
template <typename Derived>
auto build_pie_wedges(const Eigen::DenseBase<Derived>& composition,
                      int                              resolution = DEFAULT_PIE_RESOLUTION)
    -> std::enable_if_t<eigen_detail::is_eigen_double_vector_v<Derived>, std::vector<Wedge>>
{
    auto values = eigen_detail::to_vector(composition);
    return build_pie_wedges(std::span<const double>(values), resolution);
}

// Positions as vectors, pies as a matrix with one row per point; auto sizes.
template <typename XDerived, typename YDerived, typename PDerived>
BubblePieChart& set_data(BubblePieChart&                   chart,
                         const Eigen::DenseBase<XDerived>& x,
                         const Eigen::DenseBase<YDerived>& y,
                         const Eigen::DenseBase<PDerived>& pies)
{
    auto xs = eigen_detail::to_vector(x);
    auto ys = eigen_detail::to_vector(y);
    return chart.set_data(xs, ys, eigen_detail::to_rows(pies));
}

// As above with per-point sizes.
template <typename XDerived, typename YDerived, typename PDerived, typename SDerived>
BubblePieChart& set_data(BubblePieChart&                   chart,
                         const Eigen::DenseBase<XDerived>& x,
                         const Eigen::DenseBase<YDerived>& y,
                         const Eigen::DenseBase<PDerived>& pies,
                         const Eigen::DenseBase<SDerived>& sizes)
{
    auto xs = eigen_detail::to_vector(x);
    auto ys = eigen_detail::to_vector(y);
    auto ss = eigen_detail::to_vector(sizes);
    return chart.set_data(xs, ys, eigen_detail::to_rows(pies), ss);
}

}   // namespace bubblepie
