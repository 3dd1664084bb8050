/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2021 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::replace(const std::string &variable_name, const std::string &value) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value);
    else
        existing_entry->value_ = value;
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        LOG_ERROR("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        LOG_ERROR("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


double IniFile::Section::getDouble(const std::string &variable_name, const double default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    double number;
    if (not StringUtil::ToDouble(existing_entry->value_, &number))
        LOG_ERROR("invalid double entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    const std::string value(StringUtil::ToLower(existing_entry->value_));
    if (value == "true" or value == "yes" or value == "on")
        return true;
    if (value == "false" or value == "no" or value == "off")
        return false;
    LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
              + existing_entry->value_ + "\")!");
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_lineno_(0) {
    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::IniFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno))
                                 + ")");
    processStream(ini_file);
}


IniFile::IniFile(std::istream &input, const std::string &pseudo_file_name): ini_file_name_(pseudo_file_name), current_lineno_(0) {
    processStream(input);
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == end()) {
        s->clear();
        return false;
    }

    return section->lookup(variable_name, s);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name,
                               const std::string &default_value) const
{
    const auto section(getSection(section_name));
    return (section == end()) ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const auto section(getSection(section_name));
    return (section == end()) ? default_value : section->getUnsigned(variable_name, default_value);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const {
    const auto section(getSection(section_name));
    return (section == end()) ? default_value : section->getDouble(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    return (section == end()) ? default_value : section->getBool(variable_name, default_value);
}


namespace {


// Removes everything starting at an unquoted and unescaped hash mark.
void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (size_t pos(0); pos < line->length(); ++pos) {
        const char ch((*line)[pos]);
        if (ch == '"')
            inside_string_literal = not inside_string_literal;
        else if (ch == '#' and not inside_string_literal and (pos == 0 or (*line)[pos - 1] != '\\')) {
            line->resize(pos);
            return;
        }
    }
}


bool IsValidVariableName(const std::string &variable_name) {
    if (variable_name.empty() or not std::isalpha(static_cast<unsigned char>(variable_name[0])))
        return false;

    for (const char ch : variable_name) {
        if (not std::isalnum(static_cast<unsigned char>(ch)) and ch != '_' and ch != '-' and ch != '.')
            return false;
    }

    return true;
}


} // unnamed namespace


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: unterminated section header on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    const std::string section_name(StringUtil::TrimWhite(line.substr(1, line.length() - 2)));
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");
    if (hasSection(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    sections_.emplace_back(section_name);
}


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos)
        throw std::runtime_error("in IniFile::processSectionEntry: missing equal sign on line " + std::to_string(current_lineno_)
                                 + " in file \"" + ini_file_name_ + "\"!");

    const std::string variable_name(StringUtil::Trim(" \t", line.substr(0, equal_sign)));
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");

    std::string value(StringUtil::Trim(" \t", line.substr(equal_sign + 1)));
    if (not value.empty() and value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line "
                                     + std::to_string(current_lineno_) + " in file \"" + ini_file_name_ + "\"!");
        value = value.substr(1, value.length() - 2);
    }
    StringUtil::ReplaceString("\\#", "#", &value);

    sections_.back().replace(variable_name, value);
}


void IniFile::processStream(std::istream &input) {
    sections_.emplace_back(""); // The global section.

    std::string line;
    while (std::getline(input, line)) {
        ++current_lineno_;
        StringUtil::TrimWhite(&line);
        if (line.empty() or line[0] == ';')
            continue;

        StripComment(&line);
        StringUtil::TrimWhite(&line);
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else
            processSectionEntry(line);
    }
}
