/*
 * StatsComputer.cpp
 *
 */

#include <iostream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <cstring>

#include "StatsComputer.h"

using namespace std;

StatsComputer::StatsComputer(const Matrix& dx, const Matrix& dy) : dx(dx), dy(dy)
{
	if (dx.rows() != dx.cols() || dy.rows() != dy.cols() || dx.rows() != dy.rows()) {
		ostringstream oss;
		oss << "distance matrices must be square and of equal size, got "
			<< dx.rows() << " x " << dx.cols() << " and " << dy.rows() << " x " << dy.cols();
		throw DimensionMismatchError(oss.str());
	}

	xy_nrow = dx.rows();

	idx_1_to_n.resize(xy_nrow);
	for (int i = 0; i < xy_nrow; ++i) {
		idx_1_to_n[i] = i;
	}
	idx_perm = idx_1_to_n;

	dx_row.resize(xy_nrow);
	dy_row.resize(xy_nrow);

	memset(&rng_state, 0, sizeof(rng_state));
	srand48_r(0, &rng_state);

	tbls = NULL;
	contributions = NULL;
	store_tables = false;

	sum_chi = 0;
}

StatsComputer::~StatsComputer() {
}

void StatsComputer::seed(long base_seed) {
	srand48_r(base_seed, &rng_state);
}

void StatsComputer::compute(void) {
	hhg_local_tables();
}

void StatsComputer::compute_and_store_tbls(int* tbls, double* contributions) {
	store_tables = true;
	this->tbls = tbls;
	this->contributions = contributions;
	compute();
	store_tables = false;
	this->tbls = NULL;
	this->contributions = NULL;
}

void StatsComputer::permute_and_compute(void) {
	permute_y();
	compute();
}

void StatsComputer::set_permutation(const int* perm) {
	memcpy(&idx_perm[0], perm, sizeof(int) * xy_nrow);
}

// A fresh uniform permutation of the y sample indices (Fisher-Yates). It is
// drawn from the identity every time, so replication r only depends on the
// state of this object's generator.
void StatsComputer::permute_y(void) {
	idx_perm = idx_1_to_n;

	for (int i = xy_nrow - 1; i > 0; --i) {
		int j = my_rand(0, i);

		int temp = idx_perm[j];
		idx_perm[j] = idx_perm[i];
		idx_perm[i] = temp;
	}
}

int StatsComputer::my_rand(int lo, int hi) {
	double u;
	drand48_r(&rng_state, &u);
	return lo + (int)(u * (hi - lo + 1));
}

void StatsComputer::hhg_local_tables(void) {
	int n = xy_nrow;
	size_t nn = (size_t)n * n;
	int t11, t12, t21, t22;
	double dnm, current_chi, nm2 = (double)(n - 2);

	sum_chi = 0;

	for (int i = 0; i < n; ++i) {
		int pi = idx_perm[i];

		// Row i of dx, and row i of dy as seen after moving sample k to idx_perm[k]
		for (int k = 0; k < n; ++k) {
			dx_row[k] = dx(i, k);
			dy_row[k] = dy(pi, idx_perm[k]);
		}

		const double* rx = &dx_row[0];
		const double* ry = &dy_row[0];

		for (int j = 0; j < n; ++j) {
			if (j == i) {
				if (store_tables) {
					size_t cell = (size_t)j * n + i;
					tbls[         cell] = -1;
					tbls[    nn + cell] = -1;
					tbls[2 * nn + cell] = -1;
					tbls[3 * nn + cell] = -1;
					contributions[cell] = 0;
				}
				continue;
			}

			double rxj = rx[j], ryj = ry[j];
			int cnt_x = 0, cnt_y = 0, cnt_xy = 0;

			// Points no farther from i than j, in x and in y. Both i and j are
			// always counted in all three.
			for (int k = 0; k < n; ++k) {
				int a = (rx[k] <= rxj);
				int b = (ry[k] <= ryj);
				cnt_x += a;
				cnt_y += b;
				cnt_xy += a & b;
			}

			t11 = cnt_xy - 2;
			t12 = cnt_x - cnt_xy;
			t21 = cnt_y - cnt_xy;
			t22 = n - cnt_x - cnt_y + cnt_xy;

#ifdef DEBUG_PRINTS
			cout << "i = " << i << ", j = " << j << ": t11 = " << t11 << ", t12 = " << t12 << ", t21 = " << t21 << ", t22 = " << t22 << endl;
#endif

#ifdef DEBUG_CHECKS
			if (!((t11 >= 0) && (t12 >= 0) && (t21 >= 0) && (t22 >= 0) && (t11 + t12 + t21 + t22 == n - 2))) {
				cout << "THIS IS NOT A VALID CONTINGENCY TABLE !!!" << endl;
				exit(1);
			}
#endif

			// In double: the product of four counts overflows an int for large n
			dnm = (double)(t11 + t12) * (double)(t21 + t22) * (double)(t11 + t21) * (double)(t12 + t22);

			if (dnm > 0) {
				double cross = (double)t12 * t21 - (double)t11 * t22;
				current_chi = nm2 * cross * cross / dnm;
			} else {
				current_chi = 0;
			}

			sum_chi += current_chi;

			if (store_tables) {
				size_t cell = (size_t)j * n + i;
				tbls[         cell] = t11;
				tbls[    nn + cell] = t12;
				tbls[2 * nn + cell] = t21;
				tbls[3 * nn + cell] = t22;
				contributions[cell] = current_chi;
			}
		}
	}
}
