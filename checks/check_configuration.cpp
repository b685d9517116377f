#include <check.h>
#include <check_utils.h>
#include <stdlib.h>

#include "skycond/configuration.h"

using namespace skycond;

Configuration *config = NULL;

void setup_configuration (void)
{
	unsetenv ("AAG_NUM_READINGS");
	unsetenv ("AAG_SKYTEMP__K1");
	unsetenv ("AAG_LOCATION__LATITUDE");
	unsetenv ("aag_units");
	config = new Configuration ();
}

void teardown_configuration (void)
{
	delete config;
	config = NULL;
}

START_TEST(defaults)
{
	ck_assert_int_eq (config->loadEnvironment (), 0);

	ck_assert_str_eq (config->getSerialPort ().c_str (), "/dev/ttyUSB0");
	ck_assert_dbl_eq (config->getSafetyDelay (), 15, 1e-10);
	ck_assert_dbl_eq (config->getCaptureDelay (), 30, 1e-10);
	ck_assert_int_eq (config->getNumReadings (), 10);
	ck_assert_dbl_eq (config->getSQReference (), 19.6, 1e-10);
	ck_assert_int_eq (config->getIgnoreUnsafe ().size (), 0);
	ck_assert (config->getVerboseLogging () == false);
	ck_assert_dbl_eq (config->getSerialPortOpenDelay (), 1, 1e-10);
	ck_assert_str_eq (config->getSoloDataFilePath ().c_str (), "./");
	ck_assert (config->getHaveHeater () == false);
	ck_assert_int_eq (config->getUnits (), UNITS_METRIC);

	const Thresholds &th = config->getThresholds ();
	ck_assert_dbl_eq (th.cloudy, -25, 1e-10);
	ck_assert_dbl_eq (th.veryCloudy, -15, 1e-10);
	ck_assert_dbl_eq (th.windy, 50, 1e-10);
	ck_assert_dbl_eq (th.veryWindy, 75, 1e-10);
	ck_assert_dbl_eq (th.gusty, 100, 1e-10);
	ck_assert_dbl_eq (th.veryGusty, 125, 1e-10);
	ck_assert_int_eq (th.wet, 2200);
	ck_assert_int_eq (th.rainy, 1800);

	const HeaterSettings &h = config->getHeater ();
	ck_assert_dbl_eq (h.rainThresholdFreq, 30, 1e-10);
	ck_assert_dbl_eq (h.pwmMax, 70, 1e-10);
	ck_assert_dbl_eq (h.pwmMid, 40, 1e-10);
	ck_assert_dbl_eq (h.pwmLow, 15, 1e-10);
	ck_assert_dbl_eq (h.hysteresis, 5, 1e-10);
	ck_assert_dbl_eq (h.lowTemp, 0, 1e-10);
	ck_assert_dbl_eq (h.lowDelta, 6, 1e-10);
	ck_assert_dbl_eq (h.highTemp, 20, 1e-10);
	ck_assert_dbl_eq (h.highDelta, 4, 1e-10);
	ck_assert_dbl_eq (h.impulseTemp, 10, 1e-10);
	ck_assert_dbl_eq (h.impulseDuration, 60, 1e-10);
	ck_assert_int_eq (h.impulseCycle, 600);
	ck_assert_dbl_eq (h.minPower, 15, 1e-10);

	ck_assert_str_eq (config->getLocationName ().c_str (), "AAG CloudWatcher");
	ck_assert_dbl_eq (config->getObservatoryAltitude (), 60, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lat, 49.054, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lng, -122.82, 1e-10);
	ck_assert_str_eq (config->getTimezone ().c_str (), "America/Vancouver");

	const SkyCoefficients &c = config->getSkyCoefficients ();
	ck_assert_dbl_eq (c.K1, 33, 1e-10);
	ck_assert_dbl_eq (c.K2, 0, 1e-10);
	ck_assert_dbl_eq (c.K3, 0, 1e-10);
	ck_assert_dbl_eq (c.K4, 0, 1e-10);
	ck_assert_dbl_eq (c.K5, 0, 1e-10);
	ck_assert_dbl_eq (c.K6, 140, 1e-10);
	ck_assert_dbl_eq (c.K7, 40, 1e-10);

	CloudLimits limits = config->getCloudLimits ();
	ck_assert_dbl_eq (limits.clear, -25, 1e-10);
	ck_assert_dbl_eq (limits.cloudy, -15, 1e-10);
}
END_TEST

START_TEST(file_values)
{
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/valid.ini"), 0);

	ck_assert_str_eq (config->getSerialPort ().c_str (), "/dev/ttyS1");
	ck_assert_int_eq (config->getNumReadings (), 5);
	ck_assert_dbl_eq (config->getSafetyDelay (), 15, 1e-10);
	ck_assert_int_eq (config->getUnits (), UNITS_IMPERIAL);
	ck_assert (config->getVerboseLogging () == false);

	ck_assert_int_eq (config->getIgnoreUnsafe ().size (), 2);
	ck_assert (config->ignoreUnsafeCondition ("wind"));
	ck_assert (config->ignoreUnsafeCondition ("gust"));
	ck_assert (config->ignoreUnsafeCondition ("rain") == false);

	CloudLimits limits = config->getCloudLimits ();
	ck_assert_dbl_eq (limits.clear, -20.5, 1e-10);
	ck_assert_dbl_eq (limits.cloudy, -10, 1e-10);

	ck_assert_dbl_eq (config->getHeater ().pwmMax, 80, 1e-10);
	ck_assert_dbl_eq (config->getHeater ().pwmMid, 40, 1e-10);
	ck_assert_int_eq (config->getHeater ().impulseCycle, 300);

	ck_assert_str_eq (config->getLocationName ().c_str (), "Test site");
	ck_assert_dbl_eq (config->getObservatoryAltitude (), 1250, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lat, -33.5, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lng, 19.5, 1e-10);
	ck_assert_str_eq (config->getTimezone ().c_str (), "Africa/Johannesburg");

	const SkyCoefficients &c = config->getSkyCoefficients ();
	ck_assert_dbl_eq (c.K1, 30, 1e-10);
	ck_assert_dbl_eq (c.K2, 5, 1e-10);
	ck_assert_dbl_eq (c.K6, 120, 1e-10);
	ck_assert_dbl_eq (c.K7, 35, 1e-10);

	// coefficients from file drive the correction
	ck_assert_dbl_eq (skyTemperatureCorrected (-30, 10.5, c), -30 - (0.3 * 10 + 12 * 1.35), 1e-10);
}
END_TEST

START_TEST(sexagesimal)
{
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/sexagesimal.ini"), 0);
	ck_assert_dbl_eq (config->getObserver ()->lat, -24.625, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lng, -(70 + 24 / 60.0 + 15.5 / 3600.0), 1e-10);
}
END_TEST

START_TEST(invalid_values)
{
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/conversion.ini"), -1);
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/units.ini"), -1);
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/missing.ini"), -1);

	setenv ("AAG_LOCATION__LATITUDE", "north", 1);
	ck_assert_int_eq (config->loadEnvironment (), -1);
	unsetenv ("AAG_LOCATION__LATITUDE");
	ck_assert_int_eq (config->loadEnvironment (), 0);
}
END_TEST

START_TEST(range_warnings)
{
	// out of range values are only reported, they are kept
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/range.ini"), 0);
	ck_assert_int_eq (config->getNumReadings (), 0);
	ck_assert_dbl_eq (config->getHeater ().pwmMax, 120, 1e-10);
	ck_assert_dbl_eq (config->getHeater ().hysteresis, 150, 1e-10);
	ck_assert_dbl_eq (config->getHeater ().minPower, -5, 1e-10);
	ck_assert_int_eq (config->getHeater ().impulseCycle, 0);
	ck_assert_dbl_eq (config->getSafetyDelay (), -1, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lat, 91, 1e-10);
	ck_assert_dbl_eq (config->getObserver ()->lng, 200, 1e-10);
}
END_TEST

START_TEST(inverted_limits)
{
	// only warning is issued
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/inverted.ini"), 0);
	CloudLimits limits = config->getCloudLimits ();
	ck_assert_dbl_eq (limits.clear, -5, 1e-10);
	ck_assert_dbl_eq (limits.cloudy, -20, 1e-10);
	ck_assert_int_eq (classifyCloudState (-10, limits), CLOUD_CLEAR);
}
END_TEST

START_TEST(environment)
{
	setenv ("AAG_SKYTEMP__K1", "31.5", 1);
	setenv ("AAG_NUM_READINGS", "8", 1);

	ck_assert_int_eq (config->loadEnvironment (), 0);
	ck_assert_dbl_eq (config->getSkyCoefficients ().K1, 31.5, 1e-10);
	ck_assert_int_eq (config->getNumReadings (), 8);

	// environment wins over file
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/valid.ini"), 0);
	ck_assert_dbl_eq (config->getSkyCoefficients ().K1, 31.5, 1e-10);
	ck_assert_int_eq (config->getNumReadings (), 8);
	ck_assert_dbl_eq (config->getSkyCoefficients ().K6, 120, 1e-10);

	unsetenv ("AAG_SKYTEMP__K1");
	unsetenv ("AAG_NUM_READINGS");

	// variable names are not case sensitive
	setenv ("aag_units", "imperial", 1);
	ck_assert_int_eq (config->loadEnvironment (), 0);
	ck_assert_int_eq (config->getUnits (), UNITS_IMPERIAL);
	unsetenv ("aag_units");
}
END_TEST

START_TEST(environment_file)
{
	ck_assert_int_eq (config->loadEnvironmentFile (CHECK_DATA_DIR "/config.env"), 0);
	ck_assert_int_eq (config->loadEnvironment (), 0);

	ck_assert_int_eq (config->getNumReadings (), 7);
	ck_assert_dbl_eq (config->getSkyCoefficients ().K1, 31.5, 1e-10);
	ck_assert_str_eq (config->getLocationName ().c_str (), "Env site");
	ck_assert_dbl_eq (config->getCloudLimits ().clear, -22, 1e-10);

	// file values are overriden by environment file
	ck_assert_int_eq (config->loadFile (CHECK_DATA_DIR "/valid.ini"), 0);
	ck_assert_int_eq (config->getNumReadings (), 7);
	ck_assert_str_eq (config->getSerialPort ().c_str (), "/dev/ttyS1");

	setenv ("AAG_NUM_READINGS", "11", 1);
	ck_assert_int_eq (config->loadEnvironment (), 0);
	ck_assert_int_eq (config->getNumReadings (), 11);
	unsetenv ("AAG_NUM_READINGS");
}
END_TEST

START_TEST(units_names)
{
	ck_assert_str_eq (Configuration::getUnitsName (UNITS_METRIC), "metric");
	ck_assert_str_eq (Configuration::getUnitsName (UNITS_IMPERIAL), "imperial");
	ck_assert_str_eq (Configuration::getUnitsName (UNITS_NONE), "none");

	ck_assert (Configuration::instance () != NULL);
	ck_assert (Configuration::instance () == Configuration::instance ());
}
END_TEST

Suite * configuration_suite (void)
{
	Suite *s;
	TCase *tc_config;

	s = suite_create ("Configuration");
	tc_config = tcase_create ("Configuration values");
	tcase_add_checked_fixture (tc_config, setup_configuration, teardown_configuration);
	tcase_add_test (tc_config, defaults);
	tcase_add_test (tc_config, file_values);
	tcase_add_test (tc_config, sexagesimal);
	tcase_add_test (tc_config, invalid_values);
	tcase_add_test (tc_config, range_warnings);
	tcase_add_test (tc_config, inverted_limits);
	tcase_add_test (tc_config, environment);
	tcase_add_test (tc_config, environment_file);
	tcase_add_test (tc_config, units_names);
	suite_add_tcase (s, tc_config);

	return s;
}

int main (void)
{
	int number_failed;
	Suite *s;
	SRunner *sr;

	s = configuration_suite ();
	sr = srunner_create (s);
	srunner_run_all (sr, CK_NORMAL);
	number_failed = srunner_ntests_failed (sr);
	srunner_free (sr);

	return (number_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
