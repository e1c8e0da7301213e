/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include "RGEO/manifold/MatrixStack.h"
#include <glog/logging.h>
#include <sstream>
#include <stdexcept>

namespace RGEO {

namespace {
template <typename Scalar>
void checkSameShape(const MatrixStack<Scalar> &a, const MatrixStack<Scalar> &b) {
  if (!a.sameShape(b)) {
    std::stringstream ss;
    ss << "Matrix stack shape mismatch: (" << a.k() << " x " << a.rows() << " x " << a.cols()
       << ") vs (" << b.k() << " x " << b.rows() << " x " << b.cols() << ")";
    throw std::invalid_argument(ss.str());
  }
}
}  // namespace

template <typename Scalar>
MatrixStack<Scalar>::MatrixStack(unsigned int rows, unsigned int cols, unsigned int k) :
    rows_(rows), cols_(cols), k_(k) {
  X_ = BlockType::Zero(rows_, cols_ * k_);
}

template <typename Scalar>
MatrixStack<Scalar>::MatrixStack(const BlockType &M) :
    rows_(M.rows()), cols_(M.cols()), k_(1), X_(M) {}

template <typename Scalar>
MatrixStack<Scalar>::MatrixStack(const BlockType &X, unsigned int k) :
    rows_(X.rows()), cols_(0), k_(k), X_(X) {
  if (k_ == 0 || X.cols() % k_ != 0) {
    std::stringstream ss;
    ss << "Cannot split a matrix with " << X.cols() << " columns into " << k_ << " blocks";
    throw std::invalid_argument(ss.str());
  }
  cols_ = X.cols() / k_;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::Zero(unsigned int rows, unsigned int cols, unsigned int k) {
  return MatrixStack(rows, cols, k);
}

template <typename Scalar>
void MatrixStack<Scalar>::setData(const BlockType &X) {
  CHECK_EQ(X.rows(), rows_);
  CHECK_EQ(X.cols(), cols_ * k_);
  X_ = X;
}

template <typename Scalar>
Eigen::Ref<typename MatrixStack<Scalar>::BlockType> MatrixStack<Scalar>::block(unsigned int index) {
  CHECK_LT(index, k_);
  return X_.block(0, index * cols_, rows_, cols_);
}

template <typename Scalar>
typename MatrixStack<Scalar>::BlockType MatrixStack<Scalar>::block(unsigned int index) const {
  CHECK_LT(index, k_);
  return X_.block(0, index * cols_, rows_, cols_);
}

template <typename Scalar>
bool MatrixStack<Scalar>::sameShape(const MatrixStack &other) const {
  return rows_ == other.rows_ && cols_ == other.cols_ && k_ == other.k_;
}

template <typename Scalar>
MatrixStack<Scalar> &MatrixStack<Scalar>::operator+=(const MatrixStack &other) {
  checkSameShape(*this, other);
  X_ += other.X_;
  return *this;
}

template <typename Scalar>
MatrixStack<Scalar> &MatrixStack<Scalar>::operator-=(const MatrixStack &other) {
  checkSameShape(*this, other);
  X_ -= other.X_;
  return *this;
}

template <typename Scalar>
MatrixStack<Scalar> &MatrixStack<Scalar>::operator*=(double alpha) {
  X_ *= Scalar(alpha);
  return *this;
}

template <typename Scalar>
MatrixStack<Scalar> &MatrixStack<Scalar>::operator/=(double alpha) {
  X_ /= Scalar(alpha);
  return *this;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::operator+(const MatrixStack &other) const {
  MatrixStack result(*this);
  result += other;
  return result;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::operator-(const MatrixStack &other) const {
  MatrixStack result(*this);
  result -= other;
  return result;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::operator-() const {
  MatrixStack result(*this);
  result.X_ = -X_;
  return result;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::operator*(double alpha) const {
  MatrixStack result(*this);
  result *= alpha;
  return result;
}

template <typename Scalar>
MatrixStack<Scalar> MatrixStack<Scalar>::operator/(double alpha) const {
  MatrixStack result(*this);
  result /= alpha;
  return result;
}

template class MatrixStack<double>;
template class MatrixStack<Complex>;

}  // namespace RGEO
