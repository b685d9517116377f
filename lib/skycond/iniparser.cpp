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

#include "skycond/iniparser.h"
#include "skycond/utilsfunc.h"
#include "skycond/app.h"

#include "skycond-config.h"

#include <algorithm>
#include <fstream>
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

extern char **environ;

using namespace skycond;

IniValue * IniSection::getValue (const char *valueName, bool verbose)
{
	std::string name (valueName);
	for (IniSection::iterator iter = begin (); iter != end (); iter++)
	{
		if (iter->isValue (name))
			return &(*iter);
	}
	if (verbose && std::find (missingValues.begin (), missingValues.end (), name) == missingValues.end ())
	{
		logStream (MESSAGE_WARNING) << "cannot find value '" << name << "' in section '" << sectName << "'" << sendLog;
		missingValues.push_back (name);
	}
	return NULL;
}

IniParser::IniParser (bool defaultSection)
{
	verboseEntry = true;
	addDefaultSection = defaultSection;
	envFile = NULL;
	conversionErrors = 0;
}

IniParser::~IniParser (void)
{
	clearSections ();
	delete envFile;
}

void IniParser::clearSections ()
{
	for (IniParser::iterator iter = begin (); iter != end (); iter++)
		delete *iter;
	clear ();
	missingSections.clear ();
	conversionErrors = 0;
}

static bool isComment (char c)
{
	return c == ';' || c == '#';
}

int IniParser::parseValue (const std::string &line, size_t start, bool parseFullLine, IniSection *sect, int ln, const char *filename)
{
	size_t eq = line.find ('=', start);
	if (eq == std::string::npos)
	{
		logStream (MESSAGE_ERROR) << "missing = on line " << ln << " of file " << filename << sendLog;
		return -1;
	}

	// name, with optional suffix after last dot
	size_t ne = eq;
	while (ne > start && isspace (line[ne - 1]))
		ne--;
	std::string name = line.substr (start, ne - start);
	std::string suffix;
	if (name.empty () || name.find_first_of (" \t") != std::string::npos)
	{
		logStream (MESSAGE_ERROR) << "invalid value name on line " << ln << " of file " << filename << sendLog;
		return -1;
	}
	size_t dot = name.rfind ('.');
	if (dot != std::string::npos)
	{
		suffix = name.substr (dot + 1);
		name = name.substr (0, dot);
	}

	size_t vb = eq + 1;
	while (vb < line.length () && isspace (line[vb]))
		vb++;

	std::string value;
	size_t rest;
	if (vb < line.length () && line[vb] == '"')
	{
		size_t qe = line.find ('"', vb + 1);
		if (qe == std::string::npos)
		{
			logStream (MESSAGE_ERROR) << "missing \" on line " << ln << " of file " << filename << sendLog;
			return -1;
		}
		value = line.substr (vb + 1, qe - vb - 1);
		rest = qe + 1;
	}
	else if (vb < line.length () && isComment (line[vb]))
	{
		rest = vb;
	}
	else if (parseFullLine)
	{
		size_t ve = line.length ();
		while (ve > vb && isspace (line[ve - 1]))
			ve--;
		value = line.substr (vb, ve - vb);
		rest = line.length ();
	}
	else
	{
		size_t ve = vb;
		while (ve < line.length () && !isspace (line[ve]))
			ve++;
		value = line.substr (vb, ve - vb);
		rest = ve;
	}

	// anything after value but comment is ignored
	std::string comment;
	size_t cb = line.find_first_of (";#", rest);
	if (cb != std::string::npos)
	{
		cb++;
		while (cb < line.length () && isspace (line[cb]))
			cb++;
		comment = line.substr (cb);
	}

	sect->push_back (IniValue (name, suffix, value, comment));
	return 0;
}

int IniParser::parseStream (std::istream &is, const char *filename, bool parseFullLine)
{
	int ln = 0;
	IniSection *sect = NULL;
	std::string line;

	while (getline (is, line))
	{
		ln++;
		size_t start = 0;
		while (start < line.length () && isspace (line[start]))
			start++;
		if (start == line.length () || isComment (line[start]))
			continue;

		if (line[start] == '[')
		{
			size_t se = line.find (']', start);
			if (se == std::string::npos)
			{
				logStream (MESSAGE_ERROR) << "cannot find end of section name on line " << ln << " of file " << filename << sendLog;
				return -1;
			}
			sect = new IniSection (line.substr (start + 1, se - start - 1).c_str ());
			push_back (sect);
			continue;
		}

		if (sect == NULL)
		{
			if (!addDefaultSection)
			{
				logStream (MESSAGE_ERROR) << "value without section on line " << ln << " of file " << filename << sendLog;
				return -1;
			}
			sect = new IniSection ("");
			push_back (sect);
		}

		if (parseValue (line, start, parseFullLine, sect, ln, filename))
			return -1;
	}
	return 0;
}

int IniParser::loadFile (const char *filename, bool parseFullLine)
{
	clearSections ();

	if (filename == NULL)
		filename = SKYCOND_CONFDIR "/skycond/aag.ini";

	std::ifstream is (filename);
	if (is.fail ())
	{
		logStream (MESSAGE_ERROR) << "cannot open configuration file " << filename << sendLog;
		return -1;
	}
	if (parseStream (is, filename, parseFullLine))
		return -1;

	return getSpecialValues ();
}

void IniParser::setEnvironment (const char *prefix, const char *topSection)
{
	envPrefix = std::string (prefix);
	envTopSection = std::string (topSection);
}

int IniParser::loadEnvironmentFile (const char *filename, bool verbose)
{
	delete envFile;
	envFile = NULL;

	std::ifstream is (filename);
	if (is.fail ())
	{
		if (verbose)
			logStream (MESSAGE_ERROR) << "cannot open environment file " << filename << sendLog;
		return -1;
	}

	envFile = new IniParser (true);
	if (envFile->parseStream (is, filename, true))
	{
		delete envFile;
		envFile = NULL;
		return -1;
	}
	return 0;
}

std::string IniParser::getEnvironmentName (const char *section, const char *valueName)
{
	if (envTopSection == section)
		return envPrefix + toUpper (valueName);
	return envPrefix + toUpper (section) + "__" + toUpper (valueName);
}

bool IniParser::getEnvironmentValue (const char *section, const char *valueName, std::string &buf)
{
	if (envPrefix.empty ())
		return false;

	std::string envName = getEnvironmentName (section, valueName);

	// exact name first, then any case
	const char *env = getenv (envName.c_str ());
	for (char **e = environ; env == NULL && e != NULL && *e != NULL; e++)
	{
		const char *eq = strchr (*e, '=');
		if (eq != NULL && (size_t) (eq - *e) == envName.length () && !strncasecmp (*e, envName.c_str (), envName.length ()))
			env = eq + 1;
	}
	if (env != NULL)
	{
		buf = std::string (env);
		return true;
	}

	if (envFile == NULL)
		return false;

	IniSection *sect = envFile->getSection ("", false);
	if (sect == NULL)
		return false;
	IniValue *val = sect->getValue (envName.c_str (), false);
	for (IniSection::iterator iter = sect->begin (); val == NULL && iter != sect->end (); iter++)
	{
		if (!strcasecmp (iter->getValueName ().c_str (), envName.c_str ()))
			val = &(*iter);
	}
	if (val == NULL)
		return false;
	buf = val->getValue ();
	return true;
}

IniSection * IniParser::getSection (const char *section, bool verbose)
{
	std::string name (section);
	for (IniParser::iterator iter = begin (); iter != end (); iter++)
	{
		if ((*iter)->isSection (name))
			return *iter;
	}
	if (verbose && std::find (missingSections.begin (), missingSections.end (), name) == missingSections.end ())
	{
		logStream (MESSAGE_ERROR) << "cannot find section '" << section << "'" << sendLog;
		missingSections.push_back (name);
	}
	return NULL;
}

IniValue * IniParser::getValue (const char *section, const char *valueName)
{
	IniSection *sect = getSection (section, verboseEntry);
	if (sect == NULL)
		return NULL;
	return sect->getValue (valueName, verboseEntry);
}

bool IniParser::hasValue (const char *section, const char *valueName)
{
	std::string buf;
	if (getEnvironmentValue (section, valueName, buf))
		return true;
	IniSection *sect = getSection (section, false);
	return sect != NULL && sect->getValue (valueName, false) != NULL;
}

int IniParser::conversionFailed (const char *section, const char *valueName, const std::string &valbuf, const char *type)
{
	logStream (MESSAGE_ERROR) << "cannot convert '" << valbuf << "' of [" << section << "] " << valueName
		<< " (environment " << getEnvironmentName (section, valueName) << ") to " << type << sendLog;
	conversionErrors++;
	return -1;
}

int IniParser::getString (const char *section, const char *valueName, std::string &buf)
{
	if (getEnvironmentValue (section, valueName, buf))
		return 0;
	IniValue *val = getValue (section, valueName);
	if (val == NULL)
		return -1;
	buf = val->getValue ();
	return 0;
}

int IniParser::getString (const char *section, const char *valueName, std::string &buf, const char *defVal)
{
	bool oldVerbose = verboseEntry;
	verboseEntry = false;
	int ret = getString (section, valueName, buf);
	verboseEntry = oldVerbose;
	if (ret)
		buf = std::string (defVal ? defVal : "");
	return ret;
}

std::string IniParser::getStringDefault (const char *section, const char *valueName, const char *defVal)
{
	std::string buf;
	getString (section, valueName, buf, defVal);
	return buf;
}

int IniParser::getStringVector (const char *section, const char *valueName, std::vector <std::string> &value, bool verbose)
{
	std::string buf;
	bool oldVerbose = verboseEntry;
	verboseEntry = verbose;
	int ret = getString (section, valueName, buf);
	verboseEntry = oldVerbose;
	if (ret)
		return ret;
	value = SplitStr (buf, std::string (" "));
	return 0;
}

int IniParser::getInteger (const char *section, const char *valueName, int &value)
{
	std::string buf;
	if (getString (section, valueName, buf))
		return -1;
	char *ep;
	errno = 0;
	long lv = strtol (buf.c_str (), &ep, 0);
	if (buf.empty () || *ep != '\0' || errno == ERANGE || lv != (int) lv)
		return conversionFailed (section, valueName, buf, "integer");
	value = lv;
	return 0;
}

int IniParser::getInteger (const char *section, const char *valueName, int &value, int defVal)
{
	bool oldVerbose = verboseEntry;
	verboseEntry = false;
	int ret = getInteger (section, valueName, value);
	verboseEntry = oldVerbose;
	if (ret)
		value = defVal;
	return ret;
}

int IniParser::getIntegerDefault (const char *section, const char *valueName, int defVal)
{
	int value;
	getInteger (section, valueName, value, defVal);
	return value;
}

int IniParser::getFloat (const char *section, const char *valueName, float &value)
{
	std::string buf;
	if (getString (section, valueName, buf))
		return -1;
	char *ep;
#ifdef SKYCOND_HAVE_STRTOF
	float fv = strtof (buf.c_str (), &ep);
#else
	float fv = strtod (buf.c_str (), &ep);
#endif
	if (buf.empty () || *ep != '\0')
		return conversionFailed (section, valueName, buf, "float number");
	value = fv;
	return 0;
}

int IniParser::getFloat (const char *section, const char *valueName, float &value, float defVal)
{
	bool oldVerbose = verboseEntry;
	verboseEntry = false;
	int ret = getFloat (section, valueName, value);
	verboseEntry = oldVerbose;
	if (ret)
		value = defVal;
	return ret;
}

int IniParser::getDouble (const char *section, const char *valueName, double &value)
{
	std::string buf;
	if (getString (section, valueName, buf))
		return -1;
	char *ep;
	double dv = strtod (buf.c_str (), &ep);
	if (buf.empty () || *ep != '\0')
		return conversionFailed (section, valueName, buf, "float number");
	value = dv;
	return 0;
}

int IniParser::getDouble (const char *section, const char *valueName, double &value, double defVal)
{
	bool oldVerbose = verboseEntry;
	verboseEntry = false;
	int ret = getDouble (section, valueName, value);
	verboseEntry = oldVerbose;
	if (ret)
		value = defVal;
	return ret;
}

double IniParser::getDoubleDefault (const char *section, const char *valueName, double defVal)
{
	double value;
	getDouble (section, valueName, value, defVal);
	return value;
}

bool IniParser::getBoolean (const char *section, const char *valueName, bool def)
{
	std::string buf;
	bool oldVerbose = verboseEntry;
	verboseEntry = false;
	int ret = getString (section, valueName, buf);
	verboseEntry = oldVerbose;
	if (ret)
		return def;
	bool bv;
	if (charToBool (buf.c_str (), bv))
	{
		conversionFailed (section, valueName, buf, "boolean");
		return def;
	}
	return bv;
}
