#include <check.h>
#include <check_utils.h>
#include <stdlib.h>

#include "skycond/skytemp.h"

using namespace skycond;

SkyCoefficients *defaults = NULL;
SkyCoefficients *exponential = NULL;

void setup_skytemp (void)
{
	defaults = new SkyCoefficients ();
	exponential = new SkyCoefficients (33, 0, 100, 100, 100, 140, 40);
}

void teardown_skytemp (void)
{
	delete exponential;
	delete defaults;
}

START_TEST(defaults_values)
{
	ck_assert_dbl_eq (defaults->K1, 33, 1e-10);
	ck_assert_dbl_eq (defaults->K2, 0, 1e-10);
	ck_assert_dbl_eq (defaults->K3, 0, 1e-10);
	ck_assert_dbl_eq (defaults->K4, 0, 1e-10);
	ck_assert_dbl_eq (defaults->K5, 0, 1e-10);
	ck_assert_dbl_eq (defaults->K6, 140, 1e-10);
	ck_assert_dbl_eq (defaults->K7, 40, 1e-10);

	CloudLimits limits;
	ck_assert_dbl_eq (limits.clear, -17, 1e-10);
	ck_assert_dbl_eq (limits.cloudy, -8, 1e-10);
}
END_TEST

START_TEST(corrected)
{
	ck_assert_dbl_eq (skyDriftLinear (10, *defaults), 3.3, 1e-10);
	ck_assert_dbl_eq (skyDriftExponential (10, *defaults), 0, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (10, *defaults), 19.6, 1e-10);
	ck_assert_dbl_eq (skyDrift (10, *defaults), 22.9, 1e-10);

	double tsky = skyTemperatureCorrected (-30, 10, *defaults);
	ck_assert_dbl_eq (tsky, -52.9, 1e-10);
	ck_assert_int_eq (classifyCloudState (tsky), CLOUD_CLEAR);

	tsky = skyTemperatureCorrected (-5, 0, *defaults);
	ck_assert_dbl_eq (tsky, -5, 1e-10);
	ck_assert_int_eq (classifyCloudState (tsky), CLOUD_VERY_CLOUDY);

	// below K2/10, logarithmic part changes sign
	ck_assert_dbl_eq (skyDrift (-10, *defaults), -22.9, 1e-10);
	ck_assert_dbl_eq (skyTemperatureCorrected (-30, -10, *defaults), -7.1, 1e-10);

	SkyCoefficients shifted (33, 50, 0, 0, 0, 140, 40);
	ck_assert_dbl_eq (skyDriftLinear (5.5, shifted), 0.165, 1e-10);
	ck_assert_dbl_eq (skyDrift (5.5, shifted), 0.665, 1e-10);
	ck_assert_dbl_eq (skyDrift (15, shifted), 3.3 + 19.6, 1e-10);
}
END_TEST

START_TEST(exponential_term)
{
	double ta;
	SkyCoefficients no_k3 (33, 0, 0, 500, 300, 140, 40);
	SkyCoefficients no_k3_other (33, 0, 0, -800, 20, 140, 40);

	for (ta = -40; ta <= 40; ta += 0.5)
	{
		ck_assert (skyDriftExponential (ta, no_k3) == 0);
		ck_assert (skyDriftExponential (ta, no_k3_other) == 0);
		ck_assert_dbl_eq (skyDrift (ta, no_k3), skyDrift (ta, *defaults), 1e-12);
	}

	// (K3/100) * exp(K4/1000 * ta) ^ (K5/100)
	ck_assert_dbl_eq (skyDriftExponential (10, *exponential), M_E, 1e-10);
	ck_assert_dbl_eq (skyDriftExponential (0, *exponential), 1, 1e-10);

	SkyCoefficients half (33, 0, 50, 100, 200, 140, 40);
	ck_assert_dbl_eq (skyDriftExponential (5, half), 0.5 * M_E, 1e-10);
}
END_TEST

START_TEST(exponential_overflow)
{
	// exponential itself overflows
	SkyCoefficients huge (100, 0, 100, 1e6, 100, 140, 40);
	ck_assert (skyDriftExponential (1000, huge) == 0);
	ck_assert_dbl_eq (skyDrift (1000, huge), skyDriftLinear (1000, huge) + skyDriftLogarithmic (1000, huge), 1e-8);
	ck_assert (isfinite (skyTemperatureCorrected (-20, 1000, huge)));

	// exponential is finite, its power overflows
	SkyCoefficients power (33, 0, 100, 1000, 200, 140, 40);
	ck_assert (isfinite (exp (500.0)));
	ck_assert (skyDriftExponential (500, power) == 0);
}
END_TEST

START_TEST(logarithmic_near)
{
	ck_assert_dbl_eq (skyDriftLogarithmic (0.5, *defaults), 0.5, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (-0.5, *defaults), 0.5, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (0, *defaults), 0, 1e-10);

	SkyCoefficients negative (33, 0, 0, 0, 0, -140, 40);
	ck_assert_dbl_eq (skyDriftLogarithmic (0.5, negative), -0.5, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (-0.75, negative), -0.75, 1e-10);

	// zero K6 is treated as positive
	SkyCoefficients zero (33, 0, 0, 0, 0, 0, 40);
	ck_assert_dbl_eq (skyDriftLogarithmic (0.25, zero), 0.25, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (-0.25, zero), 0.25, 1e-10);

	// just outside near field the logarithm is used
	ck_assert_dbl_eq (skyDriftLogarithmic (1, *defaults), 14 * 0.4, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (-1, *defaults), -14 * 0.4, 1e-10);
	ck_assert_dbl_eq (skyDriftLogarithmic (100, *defaults), 14 * 2.4, 1e-10);
}
END_TEST

START_TEST(linear_in_ts)
{
	double ts, ta, d;
	for (ta = -30; ta <= 30; ta += 7.5)
	{
		for (ts = -50; ts <= 10; ts += 12.5)
		{
			for (d = -10; d <= 10; d += 2.5)
			{
				ck_assert_dbl_eq (skyTemperatureCorrected (ts + d, ta, *defaults), skyTemperatureCorrected (ts, ta, *defaults) + d, 1e-9);
				ck_assert_dbl_eq (skyTemperatureCorrected (ts + d, ta, *exponential), skyTemperatureCorrected (ts, ta, *exponential) + d, 1e-9);
			}
		}
	}
}
END_TEST

START_TEST(nan_propagates)
{
	ck_assert (isnan (skyTemperatureCorrected (NAN, 10, *defaults)));
	ck_assert (isnan (skyTemperatureCorrected (-20, NAN, *defaults)));
	ck_assert (isnan (skyDriftExponential (NAN, *exponential)));

	SkyCoefficients nan_k (NAN, 0, 0, 0, 0, 140, 40);
	ck_assert (isnan (skyDrift (10, nan_k)));
}
END_TEST

START_TEST(classify)
{
	ck_assert_int_eq (classifyCloudState (-52.9), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-17.001), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-17), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-12.5), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-8), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-7.999), CLOUD_VERY_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-5), CLOUD_VERY_CLOUDY);

	ck_assert_int_eq (classifyCloudState (-25, -25, -15), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-15, -25, -15), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-26, -25, -15), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-14, -25, -15), CLOUD_VERY_CLOUDY);

	CloudLimits limits (-25, -15);
	ck_assert_int_eq (classifyCloudState (-20, limits), CLOUD_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-30, limits), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-10, CloudLimits ()), CLOUD_CLOUDY);
}
END_TEST

START_TEST(classify_monotonic)
{
	double t;
	CloudState last = classifyCloudState (-100);
	ck_assert_int_eq (last, CLOUD_CLEAR);
	for (t = -100; t <= 50; t += 0.125)
	{
		CloudState st = classifyCloudState (t);
		ck_assert (st >= last);
		last = st;
	}
	ck_assert_int_eq (last, CLOUD_VERY_CLOUDY);
	ck_assert (CLOUD_CLEAR < CLOUD_CLOUDY && CLOUD_CLOUDY < CLOUD_VERY_CLOUDY);
}
END_TEST

START_TEST(classify_inverted)
{
	// no validation of the limits, comparison is still resolved
	ck_assert_int_eq (classifyCloudState (-10, -8, -17), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-20, -8, -17), CLOUD_CLEAR);
	ck_assert_int_eq (classifyCloudState (-8, -8, -17), CLOUD_VERY_CLOUDY);
	ck_assert_int_eq (classifyCloudState (-5, -8, -17), CLOUD_VERY_CLOUDY);
}
END_TEST

START_TEST(state_names)
{
	CloudState st;

	ck_assert_str_eq (cloudStateName (CLOUD_CLEAR), "CLEAR");
	ck_assert_str_eq (cloudStateName (CLOUD_CLOUDY), "CLOUDY");
	ck_assert_str_eq (cloudStateName (CLOUD_VERY_CLOUDY), "VERY_CLOUDY");

	ck_assert_int_eq (cloudStateFromName ("very_cloudy", st), 0);
	ck_assert_int_eq (st, CLOUD_VERY_CLOUDY);
	ck_assert_int_eq (cloudStateFromName ("CLEAR", st), 0);
	ck_assert_int_eq (st, CLOUD_CLEAR);
	ck_assert_int_eq (cloudStateFromName ("Cloudy", st), 0);
	ck_assert_int_eq (st, CLOUD_CLOUDY);
	ck_assert_int_eq (cloudStateFromName ("overcast", st), -1);
	ck_assert_int_eq (st, CLOUD_CLOUDY);
}
END_TEST

Suite * skytemp_suite (void)
{
	Suite *s;
	TCase *tc_corr;
	TCase *tc_class;

	s = suite_create ("SkyTemperature");
	tc_corr = tcase_create ("Drift correction");
	tcase_add_checked_fixture (tc_corr, setup_skytemp, teardown_skytemp);
	tcase_add_test (tc_corr, defaults_values);
	tcase_add_test (tc_corr, corrected);
	tcase_add_test (tc_corr, exponential_term);
	tcase_add_test (tc_corr, exponential_overflow);
	tcase_add_test (tc_corr, logarithmic_near);
	tcase_add_test (tc_corr, linear_in_ts);
	tcase_add_test (tc_corr, nan_propagates);
	suite_add_tcase (s, tc_corr);

	tc_class = tcase_create ("Cloud classification");
	tcase_add_test (tc_class, classify);
	tcase_add_test (tc_class, classify_monotonic);
	tcase_add_test (tc_class, classify_inverted);
	tcase_add_test (tc_class, state_names);
	suite_add_tcase (s, tc_class);

	return s;
}

int main (void)
{
	int number_failed;
	Suite *s;
	SRunner *sr;

	s = skytemp_suite ();
	sr = srunner_create (s);
	srunner_run_all (sr, CK_NORMAL);
	number_failed = srunner_ntests_failed (sr);
	srunner_free (sr);

	return (number_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
