/*
 * DistanceMatrixBuilder.cpp
 *
 */

#include <cmath>
#include <algorithm>
#include <sstream>

#include "DistanceMatrixBuilder.h"

using namespace std;

// relative tolerance for symmetry of distances returned by a user function
static const double SYMMETRY_TOL = 1e-10;

void EuclideanDistance::compute(const Matrix& samples, Matrix& dist) const {
	int n = samples.rows();
	int p = samples.cols();
	double d, diff;

	dist = Matrix(n, n);

	for (int k = 0; k < n; ++k) {
		for (int l = k + 1; l < n; ++l) {
			d = 0;
			for (int j = 0; j < p; ++j) {
				diff = samples(k, j) - samples(l, j);
				d += diff * diff;
			}

			dist(k, l) = dist(l, k) = sqrt(d);
		}
	}
}

DistanceMatrixBuilder::DistanceMatrixBuilder(const DistanceFunction* distance) {
	this->distance = distance;
}

Matrix DistanceMatrixBuilder::build(const Matrix& m) const {
	if (m.rows() == 0 || m.cols() == 0) {
		ostringstream oss;
		oss << "sample matrix has no data (" << m.rows() << " x " << m.cols() << ")";
		throw DimensionMismatchError(oss.str());
	}

	check_finite(m, "sample matrix");

	if (is_distance_matrix(m)) {
		if (!is_symmetric_nonnegative(m)) {
			throw InvalidInputError("square matrix with a zero diagonal is not a valid distance matrix (asymmetric or negative entries)");
		}
		return m;
	}

	int n = m.rows();
	Matrix d;
	if (distance == NULL) {
		euclidean.compute(m, d);
	} else {
		distance->compute(m, d);
	}

	if (d.rows() != n || d.cols() != n) {
		ostringstream oss;
		oss << "distance function returned a " << d.rows() << " x " << d.cols() << " matrix for " << n << " observations";
		throw DimensionMismatchError(oss.str());
	}

	check_finite(d, "distance matrix");

	for (int i = 0; i < n; ++i) {
		if (d(i, i) != 0) {
			throw DimensionMismatchError("distance function returned a nonzero self distance");
		}
	}

	if (!is_symmetric_nonnegative(d)) {
		throw DimensionMismatchError("distance function returned an asymmetric or negative distance matrix");
	}

	return d;
}

bool DistanceMatrixBuilder::is_distance_matrix(const Matrix& m) {
	if (m.rows() != m.cols()) {
		return false;
	}

	double diag_ss = 0;
	for (int i = 0; i < m.rows(); ++i) {
		diag_ss += m(i, i) * m(i, i);
	}

	return (diag_ss == 0);
}

void DistanceMatrixBuilder::check_finite(const Matrix& m, const char* what) {
	const double* v = m.data();
	size_t len = (size_t)m.rows() * m.cols();

	for (size_t i = 0; i < len; ++i) {
		if (!std::isfinite(v[i])) {
			ostringstream oss;
			oss << what << " contains a non-finite value at row " << (i % m.rows()) << ", column " << (i / m.rows());
			throw InvalidInputError(oss.str());
		}
	}
}

bool DistanceMatrixBuilder::is_symmetric_nonnegative(const Matrix& d) {
	int n = d.rows();

	for (int k = 0; k < n; ++k) {
		for (int l = k; l < n; ++l) {
			double a = d(k, l), b = d(l, k);
			if (a < 0 || b < 0) {
				return false;
			}
			if (fabs(a - b) > SYMMETRY_TOL * max(1.0, max(a, b))) {
				return false;
			}
		}
	}

	return true;
}
