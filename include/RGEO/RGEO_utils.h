/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef RGEOUTILS_H
#define RGEOUTILS_H

#include <RGEO/RGEO_types.h>

#include <Eigen/Dense>
#include <Eigen/SVD>

namespace RGEO {

/**
 * @brief Default pseudo-random engine of the calling thread.
 * Seeded from std::random_device unless seedDefaultRandomEngine has been called on this thread.
 * @return
 */
RandomEngine &defaultRandomEngine();

/**
 * @brief Reseed the default pseudo-random engine of the calling thread
 * @param seed
 */
void seedDefaultRandomEngine(unsigned int seed);

/**
 * @brief Sample a matrix with i.i.d. standard normal entries.
 * For complex scalars the real and imaginary parts are independent standard normals.
 * @param rows
 * @param cols
 * @param rng
 * @return
 */
template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> randomNormalMatrix(unsigned int rows,
                                                                         unsigned int cols,
                                                                         RandomEngine &rng);

/**
 * @brief Orthonormal basis of the column space of a tall matrix,
 * given by the thin Q factor of its Householder QR factorization
 * @param M n-by-p matrix with n >= p
 * @return n-by-p matrix Q with Q^H Q = I
 */
template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> orthonormalize(
    const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M);

/**
 * @brief project an input matrix M to the Stiefel manifold
 * @param M
 * @return orthogonal projection U V^H of M to Stiefel manifold, where M = U S V^H is the thin SVD
 */
template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> projectToStiefelManifold(
    const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &M);

/**
Generate a random element of the Stiefel element
The returned value is guaranteed to be the same for each d and r
*/
Matrix fixedStiefelVariable(unsigned d, unsigned r);

/**
 * @brief Deviation from orthonormality
 * @param Y
 * @return || Y^H Y - I ||_F
 */
template <typename Scalar>
double orthonormalityError(const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> &Y);

}  // namespace RGEO

#endif
