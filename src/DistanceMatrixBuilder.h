/*
 * DistanceMatrixBuilder.h
 *
 * Turns a sample matrix (observations in rows) into a pairwise distance
 * matrix, or passes through a matrix that already is one.
 *
 */

#ifndef DISTANCEMATRIXBUILDER_H_
#define DISTANCEMATRIXBUILDER_H_

#include "HHGCorr.h"

// A pairwise distance between the rows of a sample matrix. Implementations
// fill dist with an n x n matrix; the builder validates it.
class DistanceFunction {
public:
	virtual ~DistanceFunction() {}
	virtual void compute(const Matrix& samples, Matrix& dist) const = 0;
};

class EuclideanDistance : public DistanceFunction {
public:
	virtual void compute(const Matrix& samples, Matrix& dist) const;
};

class DistanceMatrixBuilder {
public:
	explicit DistanceMatrixBuilder(const DistanceFunction* distance = NULL);

	Matrix build(const Matrix& m) const;

	// Square with an all-zero diagonal
	static bool is_distance_matrix(const Matrix& m);

protected:
	static void check_finite(const Matrix& m, const char* what);
	static bool is_symmetric_nonnegative(const Matrix& d);

	EuclideanDistance euclidean;
	const DistanceFunction* distance; // NULL => euclidean
};

#endif /* DISTANCEMATRIXBUILDER_H_ */
