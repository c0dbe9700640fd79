#include <gtest/gtest.h>

#include <vector>

#include "DistanceMatrixBuilder.h"
#include "StatsComputer.h"
#include "TestData.h"

namespace {

class StatsComputerTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		dx = builder.build(example_x());
		dy = builder.build(example_y());
	}

	DistanceMatrixBuilder builder;
	Matrix dx, dy;
};

double statistic_of(const Matrix& dx, const Matrix& dy) {
	StatsComputer sc(dx, dy);
	sc.compute();
	return sc.get_sum_chi();
}

} // namespace

TEST_F(StatsComputerTest, ExampleRegressionValue) {
	EXPECT_NEAR(EXAMPLE_STATISTIC, statistic_of(dx, dy), 1e-9);
}

TEST_F(StatsComputerTest, IsDeterministic) {
	StatsComputer sc(dx, dy);
	sc.compute();
	double first = sc.get_sum_chi();
	sc.compute();
	EXPECT_EQ(first, sc.get_sum_chi());
}

// For a sample against itself with no ties in any row, the pair (i, j) with j
// at rank r in row i has t11 = r - 1, t22 = n - 1 - r and t12 = t21 = 0, so it
// contributes n - 2 whenever 2 <= r <= n - 2.
TEST_F(StatsComputerTest, IdenticalUntiedSamplesHaveClosedForm) {
	int n = dx.rows();
	EXPECT_DOUBLE_EQ((double)n * (n - 2) * (n - 3), statistic_of(dx, dx));
	EXPECT_DOUBLE_EQ(560.0, statistic_of(dx, dx));
}

TEST_F(StatsComputerTest, TwoAndThreeSamplesAreDegenerate) {
	EXPECT_EQ(0.0, statistic_of(builder.build(Matrix(2, 1, EXAMPLE_X)), builder.build(Matrix(2, 1, EXAMPLE_Y))));
	EXPECT_EQ(0.0, statistic_of(builder.build(Matrix(3, 1, EXAMPLE_X)), builder.build(Matrix(3, 1, EXAMPLE_Y))));
}

TEST_F(StatsComputerTest, ConstantSampleGivesZero) {
	Matrix dz(10, 10); // all samples at the same point
	EXPECT_EQ(0.0, statistic_of(dx, dz));
	EXPECT_EQ(0.0, statistic_of(dz, dy));
}

TEST_F(StatsComputerTest, IsNonnegative) {
	struct drand48_data rng;
	srand48_r(2024, &rng);

	for (int rep = 0; rep < 20; ++rep) {
		int n = 4 + rep;
		Matrix x = random_normal(&rng, n, 1 + rep % 3);
		Matrix y = random_normal(&rng, n, 2);
		EXPECT_GE(statistic_of(builder.build(x), builder.build(y)), 0.0);
	}
}

TEST_F(StatsComputerTest, RejectsMismatchedDistanceMatrices) {
	Matrix d9 = builder.build(Matrix(9, 1, EXAMPLE_X));
	Matrix raw(10, 1);
	EXPECT_THROW({ StatsComputer sc(dx, d9); }, DimensionMismatchError);
	EXPECT_THROW({ StatsComputer sc(raw, dy); }, DimensionMismatchError);
}

TEST_F(StatsComputerTest, StoredTablesAreConsistent) {
	int n = dx.rows();
	std::vector<int> tbls(4 * n * n);
	std::vector<double> contributions(n * n);

	StatsComputer sc(dx, dy);
	sc.compute_and_store_tbls(&tbls[0], &contributions[0]);

	double sum = 0;
	for (int j = 0; j < n; ++j) {
		for (int i = 0; i < n; ++i) {
			int cell = j * n + i;
			int t11 = tbls[cell], t12 = tbls[n*n + cell], t21 = tbls[2*n*n + cell], t22 = tbls[3*n*n + cell];

			if (i == j) {
				EXPECT_EQ(-1, t11);
				EXPECT_EQ(0.0, contributions[cell]);
				continue;
			}

			EXPECT_GE(t11, 0);
			EXPECT_GE(t12, 0);
			EXPECT_GE(t21, 0);
			EXPECT_GE(t22, 0);
			EXPECT_EQ(n - 2, t11 + t12 + t21 + t22);
			EXPECT_GE(contributions[cell], 0.0);
			sum += contributions[cell];
		}
	}

	EXPECT_NEAR(sc.get_sum_chi(), sum, 1e-9);

	// storing the tables does not change the statistic
	sc.compute();
	EXPECT_NEAR(sum, sc.get_sum_chi(), 1e-9);
}

// Permuting sample indices must be the same as reordering the raw y
// observations and rebuilding their distance matrix
TEST_F(StatsComputerTest, IndexPermutationMatchesRebuiltDistances) {
	const int perm[10] = {3, 7, 0, 9, 1, 4, 8, 2, 6, 5};

	Matrix dy_rebuilt = builder.build(permute_rows(example_y(), perm));

	StatsComputer sc(dx, dy);
	sc.set_permutation(perm);
	sc.compute();

	EXPECT_DOUBLE_EQ(statistic_of(dx, dy_rebuilt), sc.get_sum_chi());
}

TEST_F(StatsComputerTest, PermutationsAreValidAndSeedDriven) {
	StatsComputer a(dx, dy), b(dx, dy);
	a.seed(11);
	b.seed(11);

	for (int rep = 0; rep < 50; ++rep) {
		a.permute_and_compute();
		b.permute_and_compute();

		std::vector<int> p = a.get_permutation();
		EXPECT_EQ(p, b.get_permutation());
		EXPECT_EQ(a.get_sum_chi(), b.get_sum_chi());

		std::vector<int> seen(p.size(), 0);
		for (size_t i = 0; i < p.size(); ++i) {
			ASSERT_GE(p[i], 0);
			ASSERT_LT(p[i], (int)p.size());
			++seen[p[i]];
		}
		EXPECT_EQ(std::vector<int>(p.size(), 1), seen);
	}
}
