/*
 * StatsComputer.h
 *
 * The HHG statistic on a pair of distance matrices, with the y side addressed
 * through a permutation of the sample indices (the identity for the observed
 * statistic). One object per thread; the distance matrices are shared and
 * never written.
 *
 */

#ifndef STATSCOMPUTER_H_
#define STATSCOMPUTER_H_

#include <cstdlib>
#include <vector>

#include "HHGCorr.h"

class StatsComputer {
public:
	StatsComputer(const Matrix& dx, const Matrix& dy);
	virtual ~StatsComputer();

	void seed(long base_seed);

	void compute(void);
	void compute_and_store_tbls(int* tbls, double* contributions);
	void permute_and_compute(void);

	void set_permutation(const int* perm);
	const std::vector<int>& get_permutation(void) const { return idx_perm; }

	double get_sum_chi(void) const { return sum_chi; }

protected:
	void permute_y(void);
	void hhg_local_tables(void);
	int my_rand(int lo, int hi);

	int xy_nrow;
	const Matrix& dx;
	const Matrix& dy;

	std::vector<int> idx_1_to_n, idx_perm;
	std::vector<double> dx_row, dy_row; // distances from the current center point, y permuted

	struct drand48_data rng_state;

	double sum_chi;

	int* tbls;
	double* contributions;
	bool store_tables;
};

#endif /* STATSCOMPUTER_H_ */
