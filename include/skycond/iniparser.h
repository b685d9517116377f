/*
 * Configuration file read routines.
 * Copyright (C) 2003-2008 Petr Kubanek <petr@kubanek.net>
 * Copyright (C) 2011 Petr Kubanek, Institute of Physics <kubanek@fzu.cz>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */

#ifndef __SKYCOND_INIPARSER__
#define __SKYCOND_INIPARSER__

/**
 * @file
 * Access to ini style configuration files with environment overrides.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */

#include <istream>
#include <list>
#include <math.h>
#include <string>
#include <vector>

namespace skycond
{

/**
 * One "name[.suffix] = value" line of a section.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class IniValue
{
	public:
		IniValue (std::string in_valueName, std::string in_valueSuffix, std::string in_value, std::string in_comment)
		{
			valueName = in_valueName;
			valueSuffix = in_valueSuffix;
			value = in_value;
			comment = in_comment;
		}

		/**
		 * True if value has given name and no suffix.
		 */
		bool isValue (std::string name) { return (valueName == name && valueSuffix.length () == 0); }

		std::string getValueName () { return valueName; }

		std::string getSuffix () { return valueSuffix; }

		std::string getValue () { return value; }

		const char *getComment () { return comment.c_str (); }

	private:
		std::string valueName;
		std::string valueSuffix;
		std::string value;
		std::string comment;
};

/**
 * Named list of values.
 */
class IniSection:public std::list <IniValue>
{
	public:
		IniSection (const char *name) { sectName = std::string (name); }

		bool isSection (std::string name) { return sectName == name; }

		std::string getName () { return sectName; }

		/**
		 * Find value without suffix.
		 *
		 * @param verbose  warn, only once per name, when value is missing
		 *
		 * @return NULL if value is not present
		 */
		IniValue *getValue (const char *valueName, bool verbose = true);

	private:
		std::string sectName;
		std::vector <std::string> missingValues;
};

/**
 * Parsed configuration file.
 *
 * File consists of [section] headers and "name = value" lines. Values can
 * be quoted, ";" or "#" starts a comment. Unquoted value ends at first
 * blank, unless the file is parsed in full line mode.
 *
 * When environment prefix is set, value of key from section is first looked
 * up in PREFIX + SECTION + "__" + KEY environment variable, upper case. Keys
 * of the top section map to PREFIX + KEY. Environment file, with NAME=value
 * lines and no sections, provides the same variables. Process environment
 * wins over environment file, which wins over configuration file.
 *
 * Descendants read typed values in getSpecialValues, which is called after
 * each load.
 *
 * @author Petr Kubanek <petr@kubanek.net>
 */
class IniParser:public std::vector <IniSection *>
{
	public:
		/**
		 * @param defaultSection  put values without section to section with empty name
		 */
		IniParser (bool defaultSection = false);
		virtual ~ IniParser (void);

		/**
		 * Load configuration file, replacing any loaded values.
		 *
		 * @param filename       file to load, NULL for SKYCOND_CONFDIR/skycond/aag.ini
		 * @param parseFullLine  unquoted values extend to end of line
		 *
		 * @return -1 on error, 0 on success
		 */
		int loadFile (const char *filename = NULL, bool parseFullLine = false);

		/**
		 * @param prefix      environment variables prefix, e.g. AAG_
		 * @param topSection  section which keys map to PREFIX + KEY
		 */
		void setEnvironment (const char *prefix, const char *topSection);

		/**
		 * Load environment file.
		 *
		 * @param verbose  report missing file
		 *
		 * @return -1 on error, 0 on success
		 */
		int loadEnvironmentFile (const char *filename, bool verbose = true);

		/**
		 * Name of environment variable which overrides the value.
		 */
		std::string getEnvironmentName (const char *section, const char *valueName);

		/**
		 * @return NULL if section is not present
		 */
		IniSection *getSection (const char *section, bool verbose = true);

		/**
		 * @return -1 if value is missing, 0 on success
		 */
		int getString (const char *section, const char *valueName, std::string &buf);

		/**
		 * Copy defVal to buf if value is missing. No warning is logged.
		 *
		 * @return -1 if default was used, 0 on success
		 */
		int getString (const char *section, const char *valueName, std::string &buf, const char *defVal);

		std::string getStringDefault (const char *section, const char *valueName, const char *defVal);

		/**
		 * Split value on blanks. Vector is not touched if value is missing.
		 *
		 * @return -1 if value is missing, 0 on success
		 */
		int getStringVector (const char *section, const char *valueName, std::vector <std::string> &value, bool verbose = true);

		/**
		 * Integer value, decimal, octal with 0 or hexadecimal with 0x prefix.
		 *
		 * @return -1 if value is missing or cannot be converted, 0 on success
		 */
		int getInteger (const char *section, const char *valueName, int &value);

		/**
		 * Set value to defVal if value is missing or cannot be converted.
		 *
		 * @return -1 if default was used, 0 on success
		 */
		int getInteger (const char *section, const char *valueName, int &value, int defVal);

		int getIntegerDefault (const char *section, const char *valueName, int defVal);

		int getFloat (const char *section, const char *valueName, float &value);

		int getFloat (const char *section, const char *valueName, float &value, float defVal);

		int getDouble (const char *section, const char *valueName, double &value);

		int getDouble (const char *section, const char *valueName, double &value, double defVal);

		double getDoubleDefault (const char *section, const char *valueName, double defVal = NAN);

		/**
		 * @return def if value is missing or is not a boolean
		 */
		bool getBoolean (const char *section, const char *valueName, bool def);

		/**
		 * True if value is in configuration file or in environment.
		 */
		bool hasValue (const char *section, const char *valueName);

		/**
		 * Number of values which could not be converted since last load.
		 */
		int getConversionErrors () { return conversionErrors; }

	protected:
		virtual int getSpecialValues () { return 0; }

		void clearSections ();

	private:
		bool verboseEntry;
		bool addDefaultSection;

		std::string envPrefix;
		std::string envTopSection;
		IniParser *envFile;

		int conversionErrors;

		// sections reported as missing
		std::vector <std::string> missingSections;

		int parseStream (std::istream &is, const char *filename, bool parseFullLine);

		/**
		 * Parse "name[.suffix] = value [; comment]" line.
		 *
		 * @return -1 on error, 0 on success
		 */
		int parseValue (const std::string &line, size_t start, bool parseFullLine, IniSection *sect, int ln, const char *filename);

		IniValue *getValue (const char *section, const char *valueName);

		bool getEnvironmentValue (const char *section, const char *valueName, std::string &buf);

		/**
		 * Log conversion error and count it.
		 *
		 * @return -1
		 */
		int conversionFailed (const char *section, const char *valueName, const std::string &valbuf, const char *type);
};

}

#endif							 /* !__SKYCOND_INIPARSER__ */
