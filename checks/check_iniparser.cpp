#include <check.h>
#include <check_utils.h>
#include <stdlib.h>

#include "skycond/iniparser.h"

using namespace skycond;

IniParser *parser = NULL;

void setup_iniparser (void)
{
	parser = new IniParser ();
	parser->setEnvironment ("TEST_", "first");
	ck_assert_int_eq (parser->loadFile (CHECK_DATA_DIR "/parser.ini"), 0);
}

void teardown_iniparser (void)
{
	delete parser;
	unsetenv ("TEST_NAME");
	unsetenv ("TEST_NUMBER");
	unsetenv ("TEST_SECOND__NAME");
	unsetenv ("test_number");
}

START_TEST(strings)
{
	std::string buf;

	ck_assert_int_eq (parser->getString ("first", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "value");

	ck_assert_int_eq (parser->getString ("first", "quoted", buf), 0);
	ck_assert_str_eq (buf.c_str (), "value with spaces");

	ck_assert_int_eq (parser->getString ("first", "empty", buf), 0);
	ck_assert_str_eq (buf.c_str (), "");

	// unquoted value ends with first space
	ck_assert_int_eq (parser->getString ("first", "spaced", buf), 0);
	ck_assert_str_eq (buf.c_str (), "trailing");

	ck_assert_int_eq (parser->getString ("second", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "second");

	ck_assert_int_eq (parser->getString ("first", "missing", buf), -1);
	ck_assert_int_eq (parser->getString ("third", "name", buf), -1);

	ck_assert_int_eq (parser->getString ("third", "name", buf, "default"), -1);
	ck_assert_str_eq (buf.c_str (), "default");

	ck_assert_str_eq (parser->getStringDefault ("first", "name", "default").c_str (), "value");
	ck_assert_str_eq (parser->getStringDefault ("first", "none", "default").c_str (), "default");

	std::vector <std::string> list;
	ck_assert_int_eq (parser->getStringVector ("first", "list", list), 0);
	ck_assert_int_eq (list.size (), 3);
	ck_assert_str_eq (list[0].c_str (), "a");
	ck_assert_str_eq (list[1].c_str (), "b");
	ck_assert_str_eq (list[2].c_str (), "c");

	list.clear ();
	ck_assert_int_eq (parser->getStringVector ("first", "no_list", list, false), -1);
	ck_assert_int_eq (list.size (), 0);
}
END_TEST

START_TEST(numbers)
{
	int iv;
	float fv;
	double dv;

	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 12);

	ck_assert_int_eq (parser->getInteger ("first", "hex", iv), 0);
	ck_assert_int_eq (iv, 16);

	ck_assert_int_eq (parser->getFloat ("first", "number", fv), 0);
	ck_assert_dbl_eq (fv, 12, 1e-6);

	ck_assert_int_eq (parser->getDouble ("first", "negative", dv), 0);
	ck_assert_dbl_eq (dv, -3.5, 1e-10);

	ck_assert_int_eq (parser->getDouble ("first", "missing", dv, 7.25), -1);
	ck_assert_dbl_eq (dv, 7.25, 1e-10);

	ck_assert_int_eq (parser->getIntegerDefault ("second", "missing", 3), 3);
	ck_assert_dbl_eq (parser->getDoubleDefault ("first", "negative", 1), -3.5, 1e-10);
	ck_assert (isnan (parser->getDoubleDefault ("first", "missing")));

	ck_assert_int_eq (parser->getConversionErrors (), 0);
}
END_TEST

START_TEST(conversion_errors)
{
	int iv = 5;
	double dv = 1;

	ck_assert_int_eq (parser->getInteger ("first", "bad_number", iv), -1);
	ck_assert_int_eq (iv, 5);
	ck_assert_int_eq (parser->getConversionErrors (), 1);

	ck_assert_int_eq (parser->getDouble ("first", "name", dv, 2.5), -1);
	ck_assert_dbl_eq (dv, 2.5, 1e-10);
	ck_assert_int_eq (parser->getConversionErrors (), 2);

	ck_assert (parser->getBoolean ("first", "bad_flag", true) == true);
	ck_assert (parser->getBoolean ("first", "bad_flag", false) == false);
	ck_assert_int_eq (parser->getConversionErrors (), 4);

	// reload clears errors
	ck_assert_int_eq (parser->loadFile (CHECK_DATA_DIR "/parser.ini"), 0);
	ck_assert_int_eq (parser->getConversionErrors (), 0);
}
END_TEST

START_TEST(booleans)
{
	ck_assert (parser->getBoolean ("first", "flag", false) == true);
	ck_assert (parser->getBoolean ("first", "other_flag", true) == false);
	ck_assert (parser->getBoolean ("first", "missing_flag", true) == true);
	ck_assert (parser->getBoolean ("first", "missing_flag", false) == false);
}
END_TEST

START_TEST(suffix)
{
	std::string buf;

	// value with suffix is not found by name only
	ck_assert (parser->hasValue ("first", "value") == false);
	ck_assert (parser->hasValue ("first", "name") == true);
	ck_assert (parser->hasValue ("fourth", "name") == false);

	IniSection *sect = parser->getSection ("first");
	ck_assert (sect != NULL);
	bool found = false;
	for (IniSection::iterator iter = sect->begin (); iter != sect->end (); iter++)
	{
		if (iter->getValueName () == "value")
		{
			ck_assert_str_eq (iter->getSuffix ().c_str (), "suffix");
			ck_assert_str_eq (iter->getValue ().c_str (), "suffixed");
			found = true;
		}
	}
	ck_assert (found);

	sect = parser->getSection ("first");
	IniValue *val = sect->getValue ("quoted");
	ck_assert (val != NULL);
	ck_assert_str_eq (val->getComment (), "comment");

	ck_assert (parser->getSection ("none", false) == NULL);
}
END_TEST

START_TEST(environment)
{
	std::string buf;
	int iv;

	ck_assert_str_eq (parser->getEnvironmentName ("first", "name").c_str (), "TEST_NAME");
	ck_assert_str_eq (parser->getEnvironmentName ("second", "other_value").c_str (), "TEST_SECOND__OTHER_VALUE");

	setenv ("TEST_NAME", "from environment", 1);
	setenv ("TEST_SECOND__NAME", "second environment", 1);

	ck_assert_int_eq (parser->getString ("first", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "from environment");
	ck_assert_int_eq (parser->getString ("second", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "second environment");

	// environment provides values missing in file
	setenv ("TEST_NUMBER", "27", 1);
	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 27);
	ck_assert (parser->hasValue ("second", "name"));

	unsetenv ("TEST_NAME");
	ck_assert_int_eq (parser->getString ("first", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "value");
}
END_TEST

START_TEST(environment_case)
{
	std::string buf;
	int iv;

	setenv ("test_number", "31", 1);
	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 31);

	// exact name wins
	setenv ("TEST_NUMBER", "32", 1);
	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 32);

	ck_assert_int_eq (parser->loadEnvironmentFile (CHECK_DATA_DIR "/parser.env"), 0);
	ck_assert_int_eq (parser->getString ("second", "lower", buf), 0);
	ck_assert_str_eq (buf.c_str (), "lower case name");
}
END_TEST

START_TEST(environment_file)
{
	std::string buf;
	int iv;

	ck_assert_int_eq (parser->loadEnvironmentFile (CHECK_DATA_DIR "/missing.env", false), -1);
	ck_assert_int_eq (parser->loadEnvironmentFile (CHECK_DATA_DIR "/parser.env"), 0);

	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 42);

	ck_assert_int_eq (parser->getString ("second", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "from file");

	// full line is used in environment file
	ck_assert_int_eq (parser->getString ("second", "sentence", buf), 0);
	ck_assert_str_eq (buf.c_str (), "several words here");

	// process environment wins over the file
	setenv ("TEST_NUMBER", "43", 1);
	ck_assert_int_eq (parser->getInteger ("first", "number", iv), 0);
	ck_assert_int_eq (iv, 43);

	// values not in environment come from ini file
	ck_assert_int_eq (parser->getString ("first", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "value");
}
END_TEST

START_TEST(invalid_files)
{
	IniParser p;
	ck_assert_int_eq (p.loadFile (CHECK_DATA_DIR "/missing.ini"), -1);
	ck_assert_int_eq (p.loadFile (CHECK_DATA_DIR "/nosection.ini"), -1);
	ck_assert_int_eq (p.loadFile (CHECK_DATA_DIR "/unterminated.ini"), -1);

	IniParser def (true);
	std::string buf;
	ck_assert_int_eq (def.loadFile (CHECK_DATA_DIR "/nosection.ini"), 0);
	ck_assert_int_eq (def.getString ("", "name", buf), 0);
	ck_assert_str_eq (buf.c_str (), "value");
}
END_TEST

Suite * iniparser_suite (void)
{
	Suite *s;
	TCase *tc_ini;
	TCase *tc_files;

	s = suite_create ("IniParser");
	tc_ini = tcase_create ("Values");
	tcase_add_checked_fixture (tc_ini, setup_iniparser, teardown_iniparser);
	tcase_add_test (tc_ini, strings);
	tcase_add_test (tc_ini, numbers);
	tcase_add_test (tc_ini, conversion_errors);
	tcase_add_test (tc_ini, booleans);
	tcase_add_test (tc_ini, suffix);
	tcase_add_test (tc_ini, environment);
	tcase_add_test (tc_ini, environment_case);
	tcase_add_test (tc_ini, environment_file);
	suite_add_tcase (s, tc_ini);

	tc_files = tcase_create ("Files");
	tcase_add_test (tc_files, invalid_files);
	suite_add_tcase (s, tc_files);

	return s;
}

int main (void)
{
	int number_failed;
	Suite *s;
	SRunner *sr;

	s = iniparser_suite ();
	sr = srunner_create (s);
	srunner_run_all (sr, CK_NORMAL);
	number_failed = srunner_ntests_failed (sr);
	srunner_free (sr);

	return (number_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
