/* ----------------------------------------------------------------------------
 * Copyright 2020, Massachusetts Institute of Technology, * Cambridge, MA 02139
 * All Rights Reserved
 * Authors: Yulun Tian, et al. (see README for the full author list)
 * See LICENSE for the license information
 * -------------------------------------------------------------------------- */

#include <RGEO/manifold/ProductManifold.h>

namespace RGEO {

// Products of real and of complex matrix manifolds are compiled once here
template class ProductManifold<RealStack>;
template class ProductManifold<ComplexStack>;

}  // namespace RGEO
