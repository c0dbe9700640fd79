#ifndef HHGCORR_H_
#define HHGCORR_H_

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>

// Compile-time switches (I sometimes define them in project files, makefiles, or build commands)
//#define R_INTERFACE // set for the R module only

//#define NO_THREADS
//#define DEBUG_CHECKS
//#define DEBUG_PRINTS // NOTE: very verbose, one line per local table
//#define ST_DEBUG_PRINTS

#ifdef R_INTERFACE
#undef ERROR
#define R_NO_REMAP
#define R_NO_REMAP_RMATH
#include <R.h>
#include <Rmath.h>
#include <Rinternals.h>
#define HHG_PRINTF Rprintf
#else
#include <cstdio>
#define HHG_PRINTF printf
#endif

// Column major n x p matrix of doubles (same layout as an R matrix)
class Matrix {
public:
	Matrix() : nr_rows(0), nr_cols(0) {}
	Matrix(int nr_rows, int nr_cols, double fill = 0) : nr_rows(nr_rows), nr_cols(nr_cols), v((size_t)nr_rows * nr_cols, fill) {}
	Matrix(int nr_rows, int nr_cols, const double* col_major) : nr_rows(nr_rows), nr_cols(nr_cols), v(col_major, col_major + (size_t)nr_rows * nr_cols) {}

	int rows(void) const { return nr_rows; }
	int cols(void) const { return nr_cols; }
	bool empty(void) const { return v.empty(); }

	double& operator()(int i, int j) { return v[(size_t)j * nr_rows + i]; }
	double operator()(int i, int j) const { return v[(size_t)j * nr_rows + i]; }

	double* data(void) { return v.empty() ? NULL : &v[0]; }
	const double* data(void) const { return v.empty() ? NULL : &v[0]; }

private:
	int nr_rows;
	int nr_cols;
	std::vector<double> v;
};

typedef std::map<std::string, std::vector<double> > Metadata;

// Sample counts or matrix shapes that do not agree
class DimensionMismatchError : public std::invalid_argument {
public:
	explicit DimensionMismatchError(const std::string& what) : std::invalid_argument(what) {}
};

// Non-finite values, bad parameters, or a square zero-diagonal matrix that is not a distance matrix
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

class DistanceFunction;

struct PermutationOptions {
	int nr_perm;
	int nr_threads; // 0 => one per online processor
	int base_seed;  // negative => seeded from the clock

	// Wald sequential test (early stopping)
	bool is_sequential;
	double alpha;
	double alpha0;
	double beta0;
	double eps;

	bool perm_stats_wanted;
	bool tables_wanted;
	bool verbose;

	const DistanceFunction* distance; // NULL => Euclidean

	PermutationOptions() {
		nr_perm = 1000;
		nr_threads = 1;
		base_seed = -1;
		is_sequential = false;
		alpha = 0.05;
		alpha0 = 0.05;
		beta0 = 0.0001;
		eps = 0.01;
		perm_stats_wanted = false;
		tables_wanted = false;
		verbose = false;
		distance = NULL;
	}
};

struct StatisticResult {
	double statistic;
	Metadata metadata;
};

struct PValueResult {
	double p_value;
	Metadata metadata;
};

// Entry points
// ============================================================================

// The HHG statistic of samples x and y (n x p and n x q, or n x n distance matrices).
StatisticResult compute_statistic(const Matrix& x, const Matrix& y, const DistanceFunction* distance = NULL, bool tables_wanted = false);

// Permutation p-value of the HHG statistic. Each call derives its own observed
// statistic, nothing is kept between calls.
PValueResult compute_p_value(const Matrix& x, const Matrix& y, int replication_factor = 1000,
		const DistanceFunction* distance = NULL, int rng_seed = -1);
PValueResult compute_p_value(const Matrix& x, const Matrix& y, const PermutationOptions& options);

int get_available_nr_threads(void);

#endif /* HHGCORR_H_ */
