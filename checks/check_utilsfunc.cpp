#include <check.h>
#include <check_utils.h>
#include <stdlib.h>
#include <sstream>

#include "skycond/utilsfunc.h"
#include "skycond/libnova_cpp.h"
#include "skycond/error.h"

using namespace skycond;

START_TEST(split)
{
	std::vector <std::string> v = SplitStr ("rain cloud  wind ", " ");
	ck_assert_int_eq (v.size (), 3);
	ck_assert_str_eq (v[0].c_str (), "rain");
	ck_assert_str_eq (v[1].c_str (), "cloud");
	ck_assert_str_eq (v[2].c_str (), "wind");

	ck_assert_int_eq (SplitStr ("", " ").size (), 0);
	ck_assert_int_eq (SplitStr ("   ", " ").size (), 0);

	v = SplitStr ("a::b", "::");
	ck_assert_int_eq (v.size (), 2);
	ck_assert_str_eq (v[1].c_str (), "b");
}
END_TEST

START_TEST(booleans)
{
	bool b = false;
	ck_assert_int_eq (charToBool ("Yes", b), 0);
	ck_assert (b == true);
	ck_assert_int_eq (charToBool ("OFF", b), 0);
	ck_assert (b == false);
	ck_assert_int_eq (charToBool ("1", b), 0);
	ck_assert (b == true);
	ck_assert_int_eq (charToBool ("n", b), 0);
	ck_assert (b == false);
	ck_assert_int_eq (charToBool ("maybe", b), -1);
	ck_assert (b == false);

	ck_assert_str_eq (toUpper ("sky_temp").c_str (), "SKY_TEMP");

	ck_assert_dbl_eq (celsiusToFahrenheit (-40), -40, 1e-10);
	ck_assert_dbl_eq (celsiusToFahrenheit (100), 212, 1e-10);
	ck_assert_dbl_eq (celsiusToFahrenheit (-52.9), -63.22, 1e-10);
}
END_TEST

START_TEST(degrees)
{
	LibnovaDeg d;

	std::istringstream is1 ("-24:37:30");
	is1 >> d;
	ck_assert (!is1.fail ());
	ck_assert_dbl_eq (d.getDeg (), -24.625, 1e-10);

	std::istringstream is2 ("49.054");
	is2 >> d;
	ck_assert (!is2.fail ());
	ck_assert_dbl_eq (d.getDeg (), 49.054, 1e-10);

	std::istringstream is3 ("+19:30");
	is3 >> d;
	ck_assert (!is3.fail ());
	ck_assert_dbl_eq (d.getDeg (), 19.5, 1e-10);

	std::istringstream is4 ("12:61:00");
	is4 >> d;
	ck_assert (is4.fail ());
	ck_assert (isnan (d.getDeg ()));

	std::istringstream is5 ("north");
	is5 >> d;
	ck_assert (is5.fail ());

	std::istringstream is6 ("10:-5:00");
	is6 >> d;
	ck_assert (is6.fail ());

	// degrees part of sexagesimal value cannot exceed full circle
	std::istringstream is7 ("70000:30");
	is7 >> d;
	ck_assert (is7.fail ());
	ck_assert (isnan (d.getDeg ()));

	std::istringstream is8 ("1e9:0");
	is8 >> d;
	ck_assert (is8.fail ());

	std::istringstream is9 ("-359:30");
	is9 >> d;
	ck_assert (!is9.fail ());
	ck_assert_dbl_eq (d.getDeg (), -359.5, 1e-10);

	std::ostringstream os;
	os << LibnovaDeg (-24.625);
	ck_assert_str_eq (os.str ().c_str (), "-024:37:30.00");

	std::ostringstream pos;
	struct ln_lnlat_posn obs;
	obs.lng = -122.5;
	obs.lat = 49.25;
	pos << LibnovaPos (&obs);
	ck_assert_str_eq (pos.str ().c_str (), "+122:30:00.00 W, +049:15:00.00 N");
}
END_TEST

START_TEST(errors)
{
	ArgumentError er ("abc");
	ck_assert_str_eq (er.what (), "cannot parse number abc");

	std::ostringstream os;
	os << er;
	ck_assert_str_eq (os.str ().c_str (), "error: cannot parse number abc");
}
END_TEST

Suite * utilsfunc_suite (void)
{
	Suite *s;
	TCase *tc_utils;

	s = suite_create ("Utilities");
	tc_utils = tcase_create ("String and degree helpers");
	tcase_add_test (tc_utils, split);
	tcase_add_test (tc_utils, booleans);
	tcase_add_test (tc_utils, degrees);
	tcase_add_test (tc_utils, errors);
	suite_add_tcase (s, tc_utils);

	return s;
}

int main (void)
{
	int number_failed;
	Suite *s;
	SRunner *sr;

	s = utilsfunc_suite ();
	sr = srunner_create (s);
	srunner_run_all (sr, CK_NORMAL);
	number_failed = srunner_ntests_failed (sr);
	srunner_free (sr);

	return (number_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
