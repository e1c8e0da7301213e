/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/MixedManifold.h>

namespace RGEO {

template class MixedManifold<double>;
template class MixedManifold<Complex>;
template class ProductManifold<MixedStack>;

MixedProductManifold::FactorPtr makeMixedFactor(std::shared_ptr<const Manifold<RealStack>> manifold) {
  return std::make_shared<MixedManifold<double>>(std::move(manifold));
}

MixedProductManifold::FactorPtr makeMixedFactor(std::shared_ptr<const Manifold<ComplexStack>> manifold) {
  return std::make_shared<MixedManifold<Complex>>(std::move(manifold));
}

}  // namespace RGEO
