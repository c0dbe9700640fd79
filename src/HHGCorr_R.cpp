//============================================================================
// Name        : HHGCorr_R.cpp
// Description : .Call interface of the HHG correlation test for R
//============================================================================

// BUILD NOTE: only part of the R module, which defines R_INTERFACE for all sources

#include <cmath>
#include <cstring>
#include <exception>

#include "HHGCorr.h"

#ifndef R_INTERFACE
#error "HHGCorr_R.cpp must be built with R_INTERFACE defined"
#endif

#include <R_ext/Rdynload.h>

using namespace std;

// Takes an R numeric matrix, or a vector as an n x 1 matrix
static Matrix matrix_from_R(SEXP R_m) {
	SEXP R_dbl = PROTECT(Rf_coerceVector(R_m, REALSXP));
	int nrow, ncol;

	if (Rf_isMatrix(R_m)) {
		SEXP Rdim = Rf_getAttrib(R_m, R_DimSymbol);
		nrow = INTEGER(Rdim)[0];
		ncol = INTEGER(Rdim)[1];
	} else {
		nrow = Rf_length(R_m);
		ncol = 1;
	}

	Matrix m(nrow, ncol, REAL(R_dbl));
	UNPROTECT(1);
	return m;
}

static SEXP result_to_R(const char* value_name, double value, const Metadata& md) {
	int len = 1 + (int)md.size();

	SEXP R_res = PROTECT(Rf_allocVector(VECSXP, len));
	SEXP R_names = PROTECT(Rf_allocVector(STRSXP, len));

	SET_VECTOR_ELT(R_res, 0, Rf_ScalarReal(value));
	SET_STRING_ELT(R_names, 0, Rf_mkChar(value_name));

	int i = 1;
	for (Metadata::const_iterator it = md.begin(); it != md.end(); ++it, ++i) {
		SEXP R_v = PROTECT(Rf_allocVector(REALSXP, it->second.size()));
		if (!it->second.empty()) {
			memcpy(REAL(R_v), &(it->second[0]), sizeof(double) * it->second.size());
		}
		SET_VECTOR_ELT(R_res, i, R_v);
		SET_STRING_ELT(R_names, i, Rf_mkChar(it->first.c_str()));
		UNPROTECT(1);
	}

	Rf_setAttrib(R_res, R_NamesSymbol, R_names);
	UNPROTECT(2);
	return R_res;
}

extern "C" {

SEXP HHGCorr_statistic(SEXP R_x, SEXP R_y, SEXP R_tables_wanted)
{
	char msg[1024] = "";
	SEXP R_res = R_NilValue;

	// NOTE: R errors longjmp, so C++ objects must be gone before Rf_error() is called
	try {
		Matrix x = matrix_from_R(R_x);
		Matrix y = matrix_from_R(R_y);
		bool tables_wanted = (Rf_asLogical(R_tables_wanted) == TRUE);

		StatisticResult res = compute_statistic(x, y, NULL, tables_wanted);
		R_res = result_to_R("statistic", res.statistic, res.metadata);
	} catch (exception& e) {
		strncpy(msg, e.what(), sizeof(msg) - 1);
		msg[sizeof(msg) - 1] = '\0';
	}

	if (msg[0] != '\0') {
		Rf_error("%s", msg);
	}

	return (R_res);
}

SEXP HHGCorr_pvalue(SEXP R_x, SEXP R_y, SEXP R_nr_perm, SEXP R_nr_threads, SEXP R_seed,
		SEXP R_is_sequential, SEXP R_alpha, SEXP R_alpha0, SEXP R_beta0, SEXP R_eps,
		SEXP R_perm_stats_wanted)
{
	char msg[1024] = "";
	SEXP R_res = R_NilValue;

	PermutationOptions options;
	options.nr_perm = Rf_asInteger(R_nr_perm);
	options.nr_threads = Rf_asInteger(R_nr_threads);
	options.is_sequential = (Rf_asLogical(R_is_sequential) == TRUE);
	options.alpha = Rf_asReal(R_alpha);
	options.alpha0 = Rf_asReal(R_alpha0);
	options.beta0 = Rf_asReal(R_beta0);
	options.eps = Rf_asReal(R_eps);
	options.perm_stats_wanted = (Rf_asLogical(R_perm_stats_wanted) == TRUE);

	// An NA seed follows set.seed() in the R session
	int seed = Rf_asInteger(R_seed);
	if (seed == NA_INTEGER) {
		GetRNGstate();
		seed = (int)floor(unif_rand() * 1073741823.0);
		PutRNGstate();
	}
	options.base_seed = seed;

	if (options.nr_perm == NA_INTEGER || options.nr_threads == NA_INTEGER) {
		Rf_error("nr.perm and nr.threads must not be NA");
	}

	try {
		Matrix x = matrix_from_R(R_x);
		Matrix y = matrix_from_R(R_y);

		PValueResult res = compute_p_value(x, y, options);
		R_res = result_to_R("p.value", res.p_value, res.metadata);
	} catch (exception& e) {
		strncpy(msg, e.what(), sizeof(msg) - 1);
		msg[sizeof(msg) - 1] = '\0';
	}

	if (msg[0] != '\0') {
		Rf_error("%s", msg);
	}

	return (R_res);
}

static const R_CallMethodDef call_methods[] = {
	{"HHGCorr_statistic", (DL_FUNC) &HHGCorr_statistic,  3},
	{"HHGCorr_pvalue",    (DL_FUNC) &HHGCorr_pvalue,    11},
	{NULL, NULL, 0}
};

void R_init_hhgcorr(DllInfo* dll) {
	R_registerRoutines(dll, NULL, call_methods, NULL, NULL);
	R_useDynamicSymbols(dll, FALSE);
}

} // extern "C"
