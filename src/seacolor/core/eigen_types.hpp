#pragma once

#include <eigen3/Eigen/Dense>

namespace seacolor {
namespace core {

// Put Eigen vector types in our namespace.
typedef Eigen::Matrix<float, 1, 1> Vector1f;

typedef Eigen::Vector3f Vector3f;
typedef Eigen::Vector3d Vector3d;

typedef Eigen::Matrix<float, 6, 1> Vector6f;

}
}
