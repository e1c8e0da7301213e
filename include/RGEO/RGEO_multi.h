/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef RGEO_MULTI_H
#define RGEO_MULTI_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/MatrixStack.h>

/**
 * Block-wise linear algebra over matrix stacks.
 * Every function applies the corresponding matrix operation independently to each
 * of the k blocks; a single matrix is a stack with k = 1.
 * Instantiated for double and std::complex<double>.
 */
namespace RGEO {

/**
 * @brief Block-wise matrix product
 * @param A stack of k m-by-n matrices
 * @param B stack of k n-by-p matrices
 * @return stack of k m-by-p matrices with block i equal to A_i * B_i
 */
template <typename Scalar>
MatrixStack<Scalar> multiprod(const MatrixStack<Scalar> &A, const MatrixStack<Scalar> &B);

/**
 * @brief Block-wise transpose
 */
template <typename Scalar>
MatrixStack<Scalar> multitransp(const MatrixStack<Scalar> &A);

/**
 * @brief Block-wise conjugate transpose. Identical to multitransp for real stacks.
 */
template <typename Scalar>
MatrixStack<Scalar> multihconj(const MatrixStack<Scalar> &A);

/**
 * @brief Block-wise symmetrization 0.5 * (A + A^T)
 */
template <typename Scalar>
MatrixStack<Scalar> multisym(const MatrixStack<Scalar> &A);

/**
 * @brief Block-wise skew-symmetrization 0.5 * (A - A^T)
 */
template <typename Scalar>
MatrixStack<Scalar> multiskew(const MatrixStack<Scalar> &A);

/**
 * @brief Stack of k n-by-n identity matrices
 */
template <typename Scalar>
MatrixStack<Scalar> multieye(unsigned int k, unsigned int n);

/**
 * @brief Block-wise matrix logarithm
 * @param A stack of square matrices
 * @param positive_definite if true, every block is assumed to be Hermitian positive definite and the
 * logarithm is computed from its eigendecomposition V diag(log w) V^H. The assumption is not verified;
 * other inputs give meaningless results.
 * Otherwise the general matrix logarithm is used, which throws std::runtime_error for blocks with an
 * eigenvalue on the closed negative real axis.
 */
template <typename Scalar>
MatrixStack<Scalar> multilogm(const MatrixStack<Scalar> &A, bool positive_definite = false);

/**
 * @brief Block-wise matrix exponential
 * @param A stack of square matrices
 * @param symmetric if true, every block is assumed to be Hermitian and the exponential is computed
 * from its eigendecomposition. The assumption is not verified.
 * Otherwise the general (scaling and squaring) matrix exponential is used.
 */
template <typename Scalar>
MatrixStack<Scalar> multiexpm(const MatrixStack<Scalar> &A, bool symmetric = false);

}  // namespace RGEO

#endif
