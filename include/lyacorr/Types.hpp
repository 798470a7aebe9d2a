#pragma once
#include <Eigen/Dense>
#include <cstdint>

namespace lyacorr {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
	using Vec3   = Eigen::Vector3d;
	using CellId = std::int64_t;
} // namespace lyacorr
