/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef PRODUCTMANIFOLD_H
#define PRODUCTMANIFOLD_H

#include <RGEO/RGEO_types.h>
#include <RGEO/manifold/Manifold.h>
#include <RGEO/manifold/MatrixStack.h>
#include <RGEO/manifold/ProductElement.h>
#include <glog/logging.h>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief Cartesian product of manifolds sharing the same point representation.
 * A point (or tangent vector) is a ProductElement with one component per factor, and every
 * operation is delegated to the factors component by component. Distances combine as the
 * Euclidean norm of the factor distances and inner products add up.
 * A ProductManifold is itself a Manifold, so products can be nested.
 */
template <typename Element>
class ProductManifold : public Manifold<ProductElement<Element>> {
 public:
  typedef ProductElement<Element> Point;
  typedef ProductElement<Element> Vector;
  typedef Manifold<Element> Factor;
  typedef std::shared_ptr<const Factor> FactorPtr;

  using Manifold<Point>::randomPoint;
  using Manifold<Point>::randomTangentVector;

  /**
   * @brief Constructor. Throws std::invalid_argument if the list is empty or contains a null pointer.
   * @param manifolds factors of the product, in order
   */
  explicit ProductManifold(const std::vector<FactorPtr> &manifolds)
      : Manifold<Point>(productName(manifolds), productDimension(manifolds)),
        manifolds_(manifolds) {
    VLOG(1) << "Constructed " << this->name() << " of dimension " << this->dimension();
  }

  /**
   * @brief Number of factors
   */
  size_t numFactors() const { return manifolds_.size(); }

  /**
   * @brief Factor at the specified index
   */
  const Factor &factor(size_t index) const {
    CHECK_LT(index, manifolds_.size());
    return *manifolds_[index];
  }

  /**
   * @brief Euclidean norm of the typical distances of the factors
   */
  double typicalDistance() const override {
    double sumSq = 0;
    for (const auto &M : manifolds_) {
      const double d = M->typicalDistance();
      sumSq += d * d;
    }
    return std::sqrt(sumSq);
  }

  double innerProduct(const Point &x, const Vector &u, const Vector &v) const override {
    checkSize(x, "point");
    checkSize(u, "tangent vector");
    checkSize(v, "tangent vector");
    double result = 0;
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result += manifolds_[i]->innerProduct(x[i], u[i], v[i]);
    }
    return result;
  }

  double distance(const Point &a, const Point &b) const override {
    checkSize(a, "point");
    checkSize(b, "point");
    double sumSq = 0;
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      const double d = manifolds_[i]->distance(a[i], b[i]);
      sumSq += d * d;
    }
    return std::sqrt(sumSq);
  }

  Vector projection(const Point &x, const Vector &v) const override {
    checkSize(x, "point");
    checkSize(v, "ambient vector");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->projection(x[i], v[i]));
    }
    return Vector(std::move(result));
  }

  Point retraction(const Point &x, const Vector &v) const override {
    checkSize(x, "point");
    checkSize(v, "tangent vector");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->retraction(x[i], v[i]));
    }
    return Point(std::move(result));
  }

  Point exponentialMap(const Point &x, const Vector &v) const override {
    checkSize(x, "point");
    checkSize(v, "tangent vector");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->exponentialMap(x[i], v[i]));
    }
    return Point(std::move(result));
  }

  Vector logarithmMap(const Point &a, const Point &b) const override {
    checkSize(a, "point");
    checkSize(b, "point");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->logarithmMap(a[i], b[i]));
    }
    return Vector(std::move(result));
  }

  Vector parallelTransport(const Point &a, const Point &b, const Vector &v) const override {
    checkSize(a, "point");
    checkSize(b, "point");
    checkSize(v, "tangent vector");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->parallelTransport(a[i], b[i], v[i]));
    }
    return Vector(std::move(result));
  }

  Point randomPoint(RandomEngine &rng) const override {
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (const auto &M : manifolds_) {
      result.push_back(M->randomPoint(rng));
    }
    return Point(std::move(result));
  }

  /**
   * @brief Random tangent vector with a unit-norm component on every factor
   */
  Vector randomTangentVector(const Point &x, RandomEngine &rng) const override {
    checkSize(x, "point");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->randomTangentVector(x[i], rng));
    }
    return Vector(std::move(result));
  }

  Vector zeroTangentVector(const Point &x) const override {
    checkSize(x, "point");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->zeroTangentVector(x[i]));
    }
    return Vector(std::move(result));
  }

  Vector ambientToRiemannianGradient(const Point &x, const Vector &egrad) const override {
    checkSize(x, "point");
    checkSize(egrad, "ambient gradient");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->ambientToRiemannianGradient(x[i], egrad[i]));
    }
    return Vector(std::move(result));
  }

  Vector ambientToRiemannianHessian(const Point &x,
                                    const Vector &egrad,
                                    const Vector &ehess,
                                    const Vector &v) const override {
    checkSize(x, "point");
    checkSize(egrad, "ambient gradient");
    checkSize(ehess, "ambient Hessian-vector product");
    checkSize(v, "tangent vector");
    std::vector<Element> result;
    result.reserve(manifolds_.size());
    for (size_t i = 0; i < manifolds_.size(); ++i) {
      result.push_back(manifolds_[i]->ambientToRiemannianHessian(x[i], egrad[i], ehess[i], v[i]));
    }
    return Vector(std::move(result));
  }

 private:
  static void checkFactors(const std::vector<FactorPtr> &manifolds) {
    if (manifolds.empty()) {
      throw std::invalid_argument("Product manifold needs at least one factor");
    }
    for (size_t i = 0; i < manifolds.size(); ++i) {
      if (!manifolds[i]) {
        std::stringstream ss;
        ss << "Product manifold factor " << i << " is null";
        throw std::invalid_argument(ss.str());
      }
    }
  }

  static unsigned int productDimension(const std::vector<FactorPtr> &manifolds) {
    checkFactors(manifolds);
    unsigned int dim = 0;
    for (const auto &M : manifolds) dim += M->dimension();
    return dim;
  }

  static std::string productName(const std::vector<FactorPtr> &manifolds) {
    checkFactors(manifolds);
    std::stringstream ss;
    ss << "Product manifold: ";
    for (size_t i = 0; i < manifolds.size(); ++i) {
      if (i > 0) ss << " x ";
      ss << "[" << manifolds[i]->name() << "]";
    }
    return ss.str();
  }

  void checkSize(const ProductElement<Element> &E, const char *what) const {
    if (E.size() != manifolds_.size()) {
      std::stringstream ss;
      ss << this->name() << ": expected " << what << " with " << manifolds_.size()
         << " components, got " << E.size();
      throw std::invalid_argument(ss.str());
    }
  }

  std::vector<FactorPtr> manifolds_;
};

typedef ProductManifold<RealStack> RealProductManifold;
typedef ProductManifold<ComplexStack> ComplexProductManifold;

extern template class ProductManifold<RealStack>;
extern template class ProductManifold<ComplexStack>;

}  // namespace RGEO

#endif
