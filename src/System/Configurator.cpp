// Copyright 2016 The SwiftShader Authors. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "Configurator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>

namespace {

std::string trimSpaces(const std::string &str)
{
	auto notSpace = [](unsigned char c) { return !std::isspace(c); };

	auto begin = std::find_if(str.begin(), str.end(), notSpace);
	auto end = std::find_if(str.rbegin(), str.rend(), notSpace).base();

	return (begin < end) ? std::string(begin, end) : std::string();
}

}  // namespace

namespace caustic {

Configurator::Configurator(const std::string &filePath)
{
	std::ifstream file(filePath);
	if(file.fail())
	{
		return;
	}

	readConfiguration(file);
}

Configurator::Configurator(std::istream &str)
{
	readConfiguration(str);
}

void Configurator::readConfiguration(std::istream &str)
{
	std::string line;
	std::string sectionName;

	int lineNumber = 0;
	while(std::getline(str, line))
	{
		++lineNumber;

		if(!line.empty() && line.back() == '\r')
		{
			line.pop_back();
		}

		if(line.empty())
		{
			continue;
		}

		std::string::size_type pLeft = line.find_first_of(";#[=");
		if(pLeft == std::string::npos)
		{
			if(!trimSpaces(line).empty())
			{
				warn("Cannot parse line %d of configuration, skipping line\n", lineNumber);
			}
			continue;
		}

		switch(line[pLeft])
		{
		case '[':
			{
				std::string::size_type pRight = line.find_last_of(']');
				if(pRight == std::string::npos || pRight < pLeft)
				{
					warn("Unterminated section header at line %d of configuration\n", lineNumber);
					break;
				}

				sectionName = trimSpaces(line.substr(pLeft + 1, pRight - pLeft - 1));
				if(sectionName.empty())
				{
					warn("Found empty section name at line %d of configuration\n", lineNumber);
				}
			}
			break;
		case '=':
			{
				std::string key = trimSpaces(line.substr(0, pLeft));
				std::string value = trimSpaces(line.substr(pLeft + 1));

				// Trailing comments are not part of the value.
				std::string::size_type comment = value.find_first_of(";#");
				if(comment != std::string::npos)
				{
					value = trimSpaces(value.substr(0, comment));
				}

				if(key.empty() || value.empty())
				{
					warn("Cannot parse key-value pair at line %d of configuration (key or value is empty), skipping key-value pair\n", lineNumber);
				}
				else
				{
					sections[sectionName][key] = value;
				}
			}
			break;
		default:  // ';' or '#'
			break;
		}
	}
}

std::optional<std::string> Configurator::getValueIfExists(const std::string &sectionName, const std::string &keyName) const
{
	const auto section = sections.find(sectionName);
	if(section == sections.end())
	{
		return std::nullopt;
	}

	const auto keyValue = section->second.find(keyName);
	if(keyValue == section->second.end())
	{
		return std::nullopt;
	}

	return keyValue->second;
}

bool Configurator::hasValue(const std::string &sectionName, const std::string &keyName) const
{
	return getValueIfExists(sectionName, keyName).has_value();
}

std::string Configurator::getValue(const std::string &sectionName, const std::string &keyName, const std::string &defaultValue) const
{
	return getValueIfExists(sectionName, keyName).value_or(defaultValue);
}

void Configurator::addValue(const std::string &sectionName, const std::string &keyName, const std::string &value)
{
	sections[sectionName][keyName] = value;
}

bool Configurator::getBoolean(const std::string &sectionName, const std::string &keyName, bool defaultValue) const
{
	auto strValue = getValueIfExists(sectionName, keyName);
	if(!strValue)
	{
		return defaultValue;
	}

	std::stringstream ss{ *strValue };

	bool val = defaultValue;
	ss >> val;
	if(ss.fail())
	{
		// Accept "true" and "false" as well.
		ss.clear();
		ss.seekg(0);
		ss >> std::boolalpha >> val;
	}

	if(ss.fail())
	{
		warn("Option %s.%s has non-boolean value '%s', using default\n", sectionName.c_str(), keyName.c_str(), strValue->c_str());
		return defaultValue;
	}

	return val;
}

double Configurator::getFloat(const std::string &sectionName, const std::string &keyName, double defaultValue) const
{
	auto strValue = getValueIfExists(sectionName, keyName);
	if(!strValue)
	{
		return defaultValue;
	}

	std::stringstream ss{ *strValue };

	double val = 0.0;
	ss >> val;
	if(ss.fail())
	{
		warn("Option %s.%s has non-numeric value '%s', using default\n", sectionName.c_str(), keyName.c_str(), strValue->c_str());
		return defaultValue;
	}

	return val;
}

}  // namespace caustic
