#pragma once
#include <cstddef>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <vector>

namespace chromanet::nn {

// Dense row-major float32 matrix. A bias vector is stored as a 1 x n matrix.
class Matrix {
 public:
  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols, float fill = 0.0f)
      : rows_(rows), cols_(cols), data_(rows * cols, fill) {}

  // Row-major initializer; throws std::invalid_argument on ragged rows.
  Matrix(std::initializer_list<std::initializer_list<float>> init);

  std::size_t rows() const noexcept { return rows_; }
  std::size_t cols() const noexcept { return cols_; }
  std::size_t size() const noexcept { return data_.size(); }
  bool empty() const noexcept { return data_.empty(); }

  float& operator()(std::size_t r, std::size_t c) { return data_[r * cols_ + c]; }
  float operator()(std::size_t r, std::size_t c) const { return data_[r * cols_ + c]; }

  std::span<float> row(std::size_t r) { return {data_.data() + r * cols_, cols_}; }
  std::span<const float> row(std::size_t r) const { return {data_.data() + r * cols_, cols_}; }

  std::vector<float>& data() noexcept { return data_; }
  const std::vector<float>& data() const noexcept { return data_; }

  // Copy of rows [begin, end).
  Matrix slice_rows(std::size_t begin, std::size_t end) const;

  void fill(float v);

  bool same_shape(const Matrix& o) const noexcept { return rows_ == o.rows_ && cols_ == o.cols_; }

 private:
  std::size_t rows_{0};
  std::size_t cols_{0};
  std::vector<float> data_;
};

// out = a . b
Matrix matmul(const Matrix& a, const Matrix& b);

// out = a . b^T
Matrix matmul_transposed(const Matrix& a, const Matrix& b);

// out += scale * (a^T . b), in place
void add_scaled_transposed_product(Matrix& out, const Matrix& a, const Matrix& b, float scale);

// out[0][j] += scale * sum_i m[i][j]; out is 1 x m.cols()
void add_scaled_column_sums(Matrix& out, const Matrix& m, float scale);

// Broadcast-add the 1 x n bias row to every row of m.
void add_row_bias(Matrix& m, const Matrix& bias);

// Mean of (a - b)^2 over all entries.
double mean_squared_error(const Matrix& a, const Matrix& b);

}  // namespace chromanet::nn
