//============================================================================
// Name        : HHGCorrDebug.cpp
// Description : Standalone timing/debugging driver for the HHG correlation
//               test on simulated dependent data
//============================================================================

#include <sys/time.h>

#include <cstdlib>
#include <cmath>
#include <iostream>
#include <sstream>
#include <exception>

#include "HHGCorr.h"

using namespace std;

static const int SIM_N = 100;
static const double SIM_NOISE_SD = 0.1;
static const long long SEED_MODULUS = 0x40000000LL;

static long long get_time_ms(void) {
	struct timeval tv;

	gettimeofday(&tv, NULL);

	unsigned long long ret = tv.tv_usec;
	/* Convert from micro seconds (10^-6) to milliseconds (10^-3) */
	ret /= 1000;

	/* Adds the seconds (10^0) after converting them to milliseconds (10^-3) */
	ret += (tv.tv_sec * 1000);

	return ret;
}

// Box-Muller on a drand48_r stream
static double rnorm(struct drand48_data* rng) {
	double u1, u2;
	do {
		drand48_r(rng, &u1);
	} while (u1 <= 0);
	drand48_r(rng, &u2);
	return sqrt(-2 * log(u1)) * cos(2 * M_PI * u2);
}

static void simulate(struct drand48_data* rng, Matrix& x, Matrix& y) {
	x = Matrix(SIM_N, 1);
	y = Matrix(SIM_N, 1);

	for (int i = 0; i < SIM_N; ++i) {
		x(i, 0) = rnorm(rng);
		y(i, 0) = x(i, 0) + SIM_NOISE_SD * rnorm(rng);
	}
}

// Entry point
// ============================================================================

int main(int argc, char** argv) {
	if (argc < 3 || argc > 5) {
		cerr << "Usage: " << argv[0] << " nr_reps nr_perm [nr_threads] [seed]" << endl;
		return 1;
	}

	int nr_reps = atoi(argv[1]);
	int nr_perm = atoi(argv[2]);
	int nr_threads = (argc > 3) ? atoi(argv[3]) : 0;
	int seed = (argc > 4) ? atoi(argv[4]) : 0;

	if (nr_reps <= 0) {
		cerr << "nr_reps must be positive" << endl;
		return 1;
	}

	struct drand48_data rng;
	srand48_r(seed, &rng);

	PermutationOptions options;
	options.nr_perm = nr_perm;
	options.nr_threads = nr_threads;
	options.verbose = true;

	cout << "Computing HHG on Y = X + N(0, " << SIM_NOISE_SD << "^2) noise, n = " << SIM_N << endl;

	int nr_significant = 0;
	long long ts_start = get_time_ms();

	try {
		for (int i = 0; i < nr_reps; ++i) {
			cout << "  Iteration " << i << "..." << endl;

			Matrix x, y;
			simulate(&rng, x, y);

			// worker t of repetition i uses seed + i * 1024 + t, kept inside the int range
			options.base_seed = (seed < 0) ? -1 : (int)(((long long)seed + (long long)i * 1024) % SEED_MODULUS);
			PValueResult res = compute_p_value(x, y, options);
			nr_significant += (res.p_value < 0.05);
		}
	} catch (exception& e) {
		cerr << "HHG test failed: " << e.what() << endl;
		return 1;
	}

	cout << "Milliseconds elapsed during computation: " << get_time_ms() - ts_start << endl;
	cout << "Rejected at 0.05 in " << nr_significant << " of " << nr_reps << " repetitions" << endl;

	return 0;
}
