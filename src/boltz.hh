#include <eigen3/Eigen/Core>
#include <eigen3/Eigen/Dense>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

#include "boltz_error.hh"
#include "utils/check.hh"
#include "utils/math.hh"
#include "utils/util.hh"

#ifndef BOLTZ_HH_
#define BOLTZ_HH_

namespace boltz {

using Scalar = float;
using Index = std::ptrdiff_t;

using Mat = typename Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                   Eigen::ColMajor>;
using Vec = typename Eigen::Matrix<Scalar, Eigen::Dynamic, 1>;
using RowVec = typename Eigen::Matrix<Scalar, 1, Eigen::Dynamic>;

// one explicit generator per training session; never global
using RNG = std::mt19937;

} // namespace boltz

#endif
