/** \file    IniFile.h
 *  \brief   Declaration of class IniFile, a reader for our .ini style configuration files.
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
#pragma once


#include <algorithm>
#include <istream>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  Files consist of "[section]" headers followed by "name = value" lines.  Everything after an unquoted hash mark or a
 *  semicolon at the start of a line is a comment.  Values may be enclosed in double quotes in order to preserve leading
 *  or trailing spaces or to embed hash marks.  Entries before the first section header belong to the section with the
 *  empty name.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;
    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;
    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \note A later definition of "variable_name" replaces an earlier one. */
        void replace(const std::string &variable_name, const std::string &value);

        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \brief   Retrieves a string value.
         *  \note    If the variable is not defined in the section, the program aborts.
         */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \brief   Retrieves an unsigned value.
         *  \note    A value that is not an unsigned number is fatal.
         */
        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        double getDouble(const std::string &variable_name, const double default_value) const;

        /** \return True if the value was "true", "yes" or "on" and false if the value was "false", "no" or "off".
         *  \note   Comparisons are case insensitive and any other value is fatal.
         */
        bool getBool(const std::string &variable_name, const bool default_value) const;
    };

    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    unsigned current_lineno_;

public:
    /** \brief  Creates an empty configuration, all lookups will yield their defaults. */
    IniFile(): current_lineno_(0) { }

    /** \throws std::runtime_error if "ini_file_name" can't be opened or contains a syntax error. */
    explicit IniFile(const std::string &ini_file_name);

    /** \brief  Parses the contents of "input" as if it had been read from a file named "pseudo_file_name". */
    IniFile(std::istream &input, const std::string &pseudo_file_name);

    inline const std::string &getFilename() const { return ini_file_name_; }

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    inline const_iterator getSection(const std::string &section_name) const {
        return std::find_if(sections_.cbegin(), sections_.cend(),
                            [&section_name](const Section &section) { return section.section_name_ == section_name; });
    }

    inline bool hasSection(const std::string &section_name) const { return getSection(section_name) != end(); }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    std::string getString(const std::string &section_name, const std::string &variable_name,
                          const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

private:
    void processStream(std::istream &input);
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
};
