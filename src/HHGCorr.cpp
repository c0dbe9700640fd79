//============================================================================
// Name        : HHGCorr.cpp
// Description : The HHG correlation statistic between two multivariate
//               samples, and its permutation p-value
//============================================================================

// BUILD NOTE:
// - The library and tests are built with CMake (see CMakeLists.txt)
// - The R module compiles these sources again with -DR_INTERFACE, together with HHGCorr_R.cpp

#include <unistd.h>

#include <sstream>

#include "HHGCorr.h"
#include "DistanceMatrixBuilder.h"
#include "StatsComputer.h"
#include "PermutationTest.h"

using namespace std;

static void check_samples(const Matrix& x, const Matrix& y) {
	if (x.rows() != y.rows()) {
		ostringstream oss;
		oss << "samples must have the same number of observations, got " << x.rows() << " and " << y.rows();
		throw DimensionMismatchError(oss.str());
	}

	if (x.rows() < 2) {
		ostringstream oss;
		oss << "at least 2 observations are needed, got " << x.rows();
		throw DimensionMismatchError(oss.str());
	}
}

StatisticResult compute_statistic(const Matrix& x, const Matrix& y, const DistanceFunction* distance, bool tables_wanted) {
	check_samples(x, y);

	DistanceMatrixBuilder builder(distance);
	Matrix dx = builder.build(x);
	Matrix dy = builder.build(y);

	StatsComputer sc(dx, dy);
	StatisticResult res;

	if (tables_wanted) {
		size_t nn = (size_t)dx.rows() * dx.rows();
		vector<int> tbls(4 * nn);
		vector<double>& contributions = res.metadata["contributions"];
		contributions.resize(nn);

		sc.compute_and_store_tbls(&tbls[0], &contributions[0]);

		res.metadata["t11"].assign(tbls.begin(),          tbls.begin() +     nn);
		res.metadata["t12"].assign(tbls.begin() +     nn, tbls.begin() + 2 * nn);
		res.metadata["t21"].assign(tbls.begin() + 2 * nn, tbls.begin() + 3 * nn);
		res.metadata["t22"].assign(tbls.begin() + 3 * nn, tbls.end());
	} else {
		sc.compute();
	}

	res.statistic = sc.get_sum_chi();
	return res;
}

PValueResult compute_p_value(const Matrix& x, const Matrix& y, int replication_factor, const DistanceFunction* distance, int rng_seed) {
	PermutationOptions options;
	options.nr_perm = replication_factor;
	options.distance = distance;
	options.base_seed = rng_seed;
	return compute_p_value(x, y, options);
}

PValueResult compute_p_value(const Matrix& x, const Matrix& y, const PermutationOptions& options) {
	check_samples(x, y);

	if (options.nr_perm < 1) {
		ostringstream oss;
		oss << "replication factor must be a positive integer, got " << options.nr_perm;
		throw InvalidInputError(oss.str());
	}

	DistanceMatrixBuilder builder(options.distance);
	Matrix dx = builder.build(x);
	Matrix dy = builder.build(y);

	PermutationTest pt(dx, dy, options);
	PValueResult res;
	res.p_value = pt.get_pvalue();
	pt.get_metadata(res.metadata);

	return res;
}

// Misc. utility functions
// ============================================================================

int get_available_nr_threads(void) {
#ifdef NO_THREADS
	return (1);
#else
	long nr = sysconf(_SC_NPROCESSORS_ONLN);
	return (nr > 0) ? (int)nr : 1;
#endif
}
