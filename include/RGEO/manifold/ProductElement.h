/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#ifndef PRODUCTELEMENT_H
#define PRODUCTELEMENT_H

#include <glog/logging.h>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

/*Define the namespace*/
namespace RGEO {

/**
 * @brief An ordered tuple of elements (points or tangent vectors), one per factor of a product manifold.
 * Addition and scaling act component-wise, so product tangent vectors form a vector space.
 */
template <typename Element>
class ProductElement {
 public:
  ProductElement() = default;
  explicit ProductElement(std::vector<Element> components) : components_(std::move(components)) {}
  ProductElement(std::initializer_list<Element> components) : components_(components) {}

  /**
   * @brief Number of components
   */
  size_t size() const { return components_.size(); }

  Element &operator[](size_t index) {
    CHECK_LT(index, components_.size());
    return components_[index];
  }
  const Element &operator[](size_t index) const {
    CHECK_LT(index, components_.size());
    return components_[index];
  }

  const std::vector<Element> &components() const { return components_; }

  ProductElement &operator+=(const ProductElement &other) {
    checkSameSize(other);
    for (size_t i = 0; i < components_.size(); ++i) components_[i] += other.components_[i];
    return *this;
  }
  ProductElement &operator-=(const ProductElement &other) {
    checkSameSize(other);
    for (size_t i = 0; i < components_.size(); ++i) components_[i] -= other.components_[i];
    return *this;
  }
  ProductElement &operator*=(double alpha) {
    for (auto &c : components_) c *= alpha;
    return *this;
  }
  ProductElement &operator/=(double alpha) {
    for (auto &c : components_) c /= alpha;
    return *this;
  }

  ProductElement operator+(const ProductElement &other) const {
    ProductElement result(*this);
    result += other;
    return result;
  }
  ProductElement operator-(const ProductElement &other) const {
    ProductElement result(*this);
    result -= other;
    return result;
  }
  ProductElement operator-() const {
    ProductElement result(*this);
    result *= -1.0;
    return result;
  }
  ProductElement operator*(double alpha) const {
    ProductElement result(*this);
    result *= alpha;
    return result;
  }
  ProductElement operator/(double alpha) const {
    ProductElement result(*this);
    result /= alpha;
    return result;
  }
  inline friend ProductElement operator*(double alpha, const ProductElement &E) {
    return E * alpha;
  }

 private:
  void checkSameSize(const ProductElement &other) const {
    if (other.size() != size()) {
      std::stringstream ss;
      ss << "Product element size mismatch: " << size() << " vs " << other.size();
      throw std::invalid_argument(ss.str());
    }
  }

  std::vector<Element> components_;
};

}  // namespace RGEO

#endif
