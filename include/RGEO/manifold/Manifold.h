/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef RGEO_MANIFOLD_H
#define RGEO_MANIFOLD_H

#include <RGEO/RGEO_types.h>
#include <RGEO/RGEO_utils.h>
#include <cmath>
#include <string>
#include <utility>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief Abstract Riemannian manifold.
 * A manifold is immutable once constructed; every operation is a pure function of its arguments,
 * so a single instance can be shared by concurrent callers.
 * Ambient (Euclidean) vectors, such as the gradient of a cost function, are represented with the
 * same type as tangent vectors.
 * @tparam Point representation of a point on the manifold
 * @tparam TangentVector representation of a tangent (or ambient) vector;
 * must support addition and multiplication by a double
 */
template <typename Point, typename TangentVector = Point>
class Manifold {
 public:
  typedef Point PointType;
  typedef TangentVector TangentVectorType;

  /**
   * @brief Constructor
   * @param name human readable name
   * @param dimension intrinsic (real) dimension
   */
  Manifold(std::string name, unsigned int dimension)
      : name_(std::move(name)), dimension_(dimension) {}

  virtual ~Manifold() = default;

  /**
   * @brief Human readable name of this manifold
   */
  const std::string &name() const { return name_; }

  /**
   * @brief Intrinsic dimension of this manifold
   */
  unsigned int dimension() const { return dimension_; }

  /**
   * @brief Typical distance between two points, used by solvers to scale trust regions
   */
  virtual double typicalDistance() const = 0;

  /**
   * @brief Riemannian inner product of two tangent vectors at a point. Always real.
   */
  virtual double innerProduct(const Point &x, const TangentVector &u, const TangentVector &v) const = 0;

  /**
   * @brief Riemannian norm of a tangent vector
   */
  virtual double norm(const Point &x, const TangentVector &v) const {
    return std::sqrt(innerProduct(x, v, v));
  }

  /**
   * @brief Geodesic distance between two points
   */
  virtual double distance(const Point &a, const Point &b) const = 0;

  /**
   * @brief Orthogonal projection of an ambient vector onto the tangent space at x
   */
  virtual TangentVector projection(const Point &x, const TangentVector &v) const = 0;

  /**
   * @brief First order approximation of the exponential map
   */
  virtual Point retraction(const Point &x, const TangentVector &v) const = 0;

  /**
   * @brief Endpoint of the geodesic leaving x with velocity v
   */
  virtual Point exponentialMap(const Point &x, const TangentVector &v) const = 0;

  /**
   * @brief Tangent vector at a whose geodesic reaches b. Inverse of exponentialMap near a.
   */
  virtual TangentVector logarithmMap(const Point &a, const Point &b) const = 0;

  /**
   * @brief Move a tangent vector at a into the tangent space at b.
   * The default implementation projects v onto the tangent space at b.
   */
  virtual TangentVector parallelTransport(const Point &a, const Point &b, const TangentVector &v) const {
    (void) a;
    return projection(b, v);
  }

  /**
   * @brief Sample a random point
   */
  virtual Point randomPoint(RandomEngine &rng) const = 0;
  Point randomPoint() const { return randomPoint(defaultRandomEngine()); }

  /**
   * @brief Sample a random unit-norm tangent vector at x
   */
  virtual TangentVector randomTangentVector(const Point &x, RandomEngine &rng) const = 0;
  TangentVector randomTangentVector(const Point &x) const {
    return randomTangentVector(x, defaultRandomEngine());
  }

  /**
   * @brief The zero tangent vector at x
   */
  virtual TangentVector zeroTangentVector(const Point &x) const = 0;

  /**
   * @brief Convert the gradient of a cost function in the ambient space to the Riemannian gradient.
   * The default implementation projects the ambient gradient onto the tangent space at x.
   */
  virtual TangentVector ambientToRiemannianGradient(const Point &x, const TangentVector &egrad) const {
    return projection(x, egrad);
  }

  /**
   * @brief Convert an ambient Hessian-vector product into the Riemannian Hessian applied to v
   * @param x base point
   * @param egrad ambient gradient at x
   * @param ehess ambient Hessian at x applied to v
   * @param v tangent vector at x
   */
  virtual TangentVector ambientToRiemannianHessian(const Point &x,
                                                   const TangentVector &egrad,
                                                   const TangentVector &ehess,
                                                   const TangentVector &v) const = 0;

  /**
   * @brief Midpoint of the geodesic between a and b
   */
  virtual Point pairMean(const Point &a, const Point &b) const {
    return exponentialMap(a, 0.5 * logarithmMap(a, b));
  }

 private:
  std::string name_;
  unsigned int dimension_;
};

}  // namespace RGEO

#endif
