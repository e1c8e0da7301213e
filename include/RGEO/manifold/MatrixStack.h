/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef RGEO_INCLUDE_RGEO_MANIFOLD_MATRIXSTACK_H_
#define RGEO_INCLUDE_RGEO_MANIFOLD_MATRIXSTACK_H_

#include "RGEO/RGEO_types.h"

namespace RGEO {
/**
 * @brief A class representing a stack of k equally sized matrices
 * Internally store as rows by (cols)k matrix X = [X1, ... Xk]
 * A single matrix is the special case k = 1.
 * Points and tangent vectors of the matrix manifolds are stored in this form.
 */
template <typename Scalar>
class MatrixStack {
 public:
  typedef Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> BlockType;
  typedef typename Eigen::NumTraits<Scalar>::Real RealScalar;

  /**
   * @brief Construct an empty stack
   */
  MatrixStack() : rows_(0), cols_(0), k_(0) {}
  /**
   * @brief Constructor. All blocks are initialized to zero.
   * @param rows
   * @param cols
   * @param k number of blocks
   */
  MatrixStack(unsigned int rows, unsigned int cols, unsigned int k = 1);
  /**
   * @brief Construct a stack holding a single matrix
   * @param M
   */
  explicit MatrixStack(const BlockType &M);
  /**
   * @brief Construct a stack from horizontally concatenated blocks
   * @param X rows by (cols)k matrix [X1 ... Xk]
   * @param k number of blocks
   */
  MatrixStack(const BlockType &X, unsigned int k);
  /**
   * @brief Return a stack of zero matrices
   */
  static MatrixStack Zero(unsigned int rows, unsigned int cols, unsigned int k = 1);
  /**
   * @brief Number of rows of each block
   */
  unsigned int rows() const { return rows_; }
  /**
   * @brief Number of columns of each block
   */
  unsigned int cols() const { return cols_; }
  /**
   * @brief Number of blocks
   */
  unsigned int k() const { return k_; }
  /**
   * @brief Return the underlying Eigen matrix [X1 ... Xk]
   * @return
   */
  const BlockType &getData() const { return X_; }
  /**
   * @brief Set the underlying Eigen matrix. The shape must match.
   * @param X
   */
  void setData(const BlockType &X);
  /**
   * @brief Obtain the writable block at the specified index
   * @param index
   * @return
   */
  Eigen::Ref<BlockType> block(unsigned int index);
  /**
   * @brief Obtain the read-only block at the specified index
   * @param index
   * @return
   */
  BlockType block(unsigned int index) const;
  /**
   * @brief Check that two stacks have identical block shape and block count
   */
  bool sameShape(const MatrixStack &other) const;
  /**
   * @brief Frobenius norm over all blocks
   */
  RealScalar norm() const { return X_.norm(); }
  RealScalar squaredNorm() const { return X_.squaredNorm(); }

  MatrixStack &operator+=(const MatrixStack &other);
  MatrixStack &operator-=(const MatrixStack &other);
  MatrixStack &operator*=(double alpha);
  MatrixStack &operator/=(double alpha);

  MatrixStack operator+(const MatrixStack &other) const;
  MatrixStack operator-(const MatrixStack &other) const;
  MatrixStack operator-() const;
  MatrixStack operator*(double alpha) const;
  MatrixStack operator/(double alpha) const;

  inline friend MatrixStack operator*(double alpha, const MatrixStack &S) {
    return S * alpha;
  }

 protected:
  // Dimension constants
  unsigned int rows_, cols_, k_;
  // Eigen matrix that stores the blocks
  BlockType X_;
};

typedef MatrixStack<double> RealStack;
typedef MatrixStack<Complex> ComplexStack;

}  // namespace RGEO
#endif  // RGEO_INCLUDE_RGEO_MANIFOLD_MATRIXSTACK_H_
