#include "chromanet/nn/matrix.hpp"

#include <algorithm>
#include <string>

namespace chromanet::nn {

namespace {

void require(bool ok, const char* what) {
  if (!ok) throw std::invalid_argument(std::string("Matrix shape mismatch in ") + what);
}

}  // namespace

Matrix::Matrix(std::initializer_list<std::initializer_list<float>> init)
    : rows_(init.size()), cols_(init.size() ? init.begin()->size() : 0) {
  data_.reserve(rows_ * cols_);
  for (const auto& r : init) {
    if (r.size() != cols_) throw std::invalid_argument("Matrix initializer rows differ in length");
    data_.insert(data_.end(), r.begin(), r.end());
  }
}

Matrix Matrix::slice_rows(std::size_t begin, std::size_t end) const {
  end = std::min(end, rows_);
  if (begin > end) begin = end;
  Matrix out(end - begin, cols_);
  std::copy(data_.begin() + static_cast<std::ptrdiff_t>(begin * cols_),
            data_.begin() + static_cast<std::ptrdiff_t>(end * cols_), out.data_.begin());
  return out;
}

void Matrix::fill(float v) { std::fill(data_.begin(), data_.end(), v); }

Matrix matmul(const Matrix& a, const Matrix& b) {
  require(a.cols() == b.rows(), "matmul");
  Matrix out(a.rows(), b.cols());
  for (std::size_t i = 0; i < a.rows(); ++i) {
    auto o = out.row(i);
    for (std::size_t k = 0; k < a.cols(); ++k) {
      const float aik = a(i, k);
      const auto br = b.row(k);
      for (std::size_t j = 0; j < b.cols(); ++j) o[j] += aik * br[j];
    }
  }
  return out;
}

Matrix matmul_transposed(const Matrix& a, const Matrix& b) {
  require(a.cols() == b.cols(), "matmul_transposed");
  Matrix out(a.rows(), b.rows());
  for (std::size_t i = 0; i < a.rows(); ++i) {
    const auto ar = a.row(i);
    for (std::size_t j = 0; j < b.rows(); ++j) {
      const auto br = b.row(j);
      float acc = 0.0f;
      for (std::size_t k = 0; k < a.cols(); ++k) acc += ar[k] * br[k];
      out(i, j) = acc;
    }
  }
  return out;
}

void add_scaled_transposed_product(Matrix& out, const Matrix& a, const Matrix& b, float scale) {
  require(a.rows() == b.rows() && out.rows() == a.cols() && out.cols() == b.cols(),
          "add_scaled_transposed_product");
  // Accumulate a^T . b first so the update is applied once per entry.
  Matrix prod(a.cols(), b.cols());
  for (std::size_t n = 0; n < a.rows(); ++n) {
    const auto ar = a.row(n);
    const auto br = b.row(n);
    for (std::size_t i = 0; i < a.cols(); ++i) {
      auto pr = prod.row(i);
      for (std::size_t j = 0; j < b.cols(); ++j) pr[j] += ar[i] * br[j];
    }
  }
  auto& o = out.data();
  const auto& p = prod.data();
  for (std::size_t i = 0; i < o.size(); ++i) o[i] += scale * p[i];
}

void add_scaled_column_sums(Matrix& out, const Matrix& m, float scale) {
  require(out.rows() == 1 && out.cols() == m.cols(), "add_scaled_column_sums");
  std::vector<float> sums(m.cols(), 0.0f);
  for (std::size_t i = 0; i < m.rows(); ++i) {
    const auto r = m.row(i);
    for (std::size_t j = 0; j < m.cols(); ++j) sums[j] += r[j];
  }
  for (std::size_t j = 0; j < m.cols(); ++j) out(0, j) += scale * sums[j];
}

void add_row_bias(Matrix& m, const Matrix& bias) {
  require(bias.rows() == 1 && bias.cols() == m.cols(), "add_row_bias");
  const auto b = bias.row(0);
  for (std::size_t i = 0; i < m.rows(); ++i) {
    auto r = m.row(i);
    for (std::size_t j = 0; j < m.cols(); ++j) r[j] += b[j];
  }
}

double mean_squared_error(const Matrix& a, const Matrix& b) {
  require(a.same_shape(b), "mean_squared_error");
  if (a.empty()) return 0.0;
  double sum = 0.0;
  const auto& x = a.data();
  const auto& y = b.data();
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double d = static_cast<double>(x[i]) - static_cast<double>(y[i]);
    sum += d * d;
  }
  return sum / static_cast<double>(x.size());
}

}  // namespace chromanet::nn
