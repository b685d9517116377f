#include <check.h>
#include <check_utils.h>
#include <stdarg.h>
#include <stdlib.h>

#include <sstream>
#include <string>
#include <vector>

#include "skycond/tskyapp.h"

using namespace skycond;

std::ostringstream *output = NULL;

void setup_tsky (void)
{
	unsetenv ("AAG_UNITS");
	output = new std::ostringstream ();
}

void teardown_tsky (void)
{
	delete output;
	output = NULL;
}

// run skycond-tsky with NULL terminated argument list
int run_tsky (const char *arg, ...)
{
	std::vector <char *> argv;
	argv.push_back ((char *) "skycond-tsky");

	va_list ap;
	va_start (ap, arg);
	for (const char *a = arg; a != NULL; a = va_arg (ap, const char *))
		argv.push_back ((char *) a);
	va_end (ap);

	int argc = argv.size ();
	argv.push_back (NULL);

	TSkyApp app (argc, &(argv[0]), *output);
	return app.run ();
}

START_TEST(clear_sky)
{
	ck_assert_int_eq (run_tsky ("-30", "10", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -52.90 °C => CLEAR\n");
}
END_TEST

START_TEST(limits_options)
{
	ck_assert_int_eq (run_tsky ("--clear", "-60", "-30", "10", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -52.90 °C => CLOUDY\n");

	output->str ("");
	ck_assert_int_eq (run_tsky ("--clear", "-60", "--cloud", "-55", "-30", "10", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -52.90 °C => VERY_CLOUDY\n");
}
END_TEST

START_TEST(number_forms)
{
	ck_assert_int_eq (run_tsky ("-1e1", "10", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -32.90 °C => CLEAR\n");

	output->str ("");
	ck_assert_int_eq (run_tsky ("-inf", "5", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -inf °C => CLEAR\n");

	// NaN falls between the limits
	output->str ("");
	ck_assert_int_eq (run_tsky ("-nan", "5", NULL), 0);
	ck_assert (output->str ().find ("=> CLOUDY\n") != std::string::npos);
}
END_TEST

START_TEST(argument_count)
{
	ck_assert_int_eq (run_tsky ("-30", NULL), -1);
	ck_assert_int_eq (run_tsky ("-30", "10", "5", NULL), -1);
	ck_assert_int_eq (run_tsky (NULL), -1);
	ck_assert_str_eq (output->str ().c_str (), "");
}
END_TEST

START_TEST(invalid_arguments)
{
	ck_assert_int_eq (run_tsky ("abc", "10", NULL), -1);
	ck_assert_int_eq (run_tsky ("-30", "10x", NULL), -1);
	ck_assert_int_eq (run_tsky ("--clear", "low", "-30", "10", NULL), -1);
	ck_assert_int_eq (run_tsky ("-x", "-30", "10", NULL), -1);
	ck_assert_str_eq (output->str ().c_str (), "");
}
END_TEST

START_TEST(configuration_file)
{
	ck_assert_int_eq (run_tsky ("--config", CHECK_DATA_DIR "/valid.ini", "-30", "10.5", NULL), 0);
	ck_assert_str_eq (output->str ().c_str (), "T_sky: -56.56 °F => CLEAR\n");
}
END_TEST

START_TEST(configuration_errors)
{
	ck_assert_int_eq (run_tsky ("--config", CHECK_DATA_DIR "/units.ini", "-30", "10", NULL), -1);
	ck_assert_int_eq (run_tsky ("--env-file", CHECK_DATA_DIR "/missing.env", "-30", "10", NULL), -1);
	ck_assert_str_eq (output->str ().c_str (), "");
}
END_TEST

Suite * tsky_suite (void)
{
	Suite *s;
	TCase *tc_tsky;

	s = suite_create ("TSky");
	tc_tsky = tcase_create ("Command line");
	tcase_add_checked_fixture (tc_tsky, setup_tsky, teardown_tsky);
	tcase_add_test (tc_tsky, clear_sky);
	tcase_add_test (tc_tsky, limits_options);
	tcase_add_test (tc_tsky, number_forms);
	tcase_add_test (tc_tsky, argument_count);
	tcase_add_test (tc_tsky, invalid_arguments);
	tcase_add_test (tc_tsky, configuration_file);
	tcase_add_test (tc_tsky, configuration_errors);
	suite_add_tcase (s, tc_tsky);

	return s;
}

int main (void)
{
	int number_failed;
	Suite *s;
	SRunner *sr;

	s = tsky_suite ();
	sr = srunner_create (s);
	srunner_run_all (sr, CK_NORMAL);
	number_failed = srunner_ntests_failed (sr);
	srunner_free (sr);

	return (number_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
