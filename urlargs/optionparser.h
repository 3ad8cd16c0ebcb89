/*
 * (c) 2025, The urlargs developers
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
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301, USA.
 */
#ifndef OPTIONPARSER_H
#define OPTIONPARSER_H

#include <ostream>
#include <string>

#include "option.h"
#include "stringvector.h"

//{{{ OptionParser -------------------------------------------------------------

/**
 * Command line parser on top of getopt_long(3).
 *
 * Parsing stops at the first argument that is not an option, or after
 * "--". That argument and all following ones are returned unparsed by
 * getArgs(), so options meant for the executed program are never
 * interpreted here.
 */
class OptionParser {
    public:
        /**
         * Add an option to the parser. The parser does not take
         * ownership of the option.
         *
         * @param option the option to be added
         */
        void addOption(Option *option);

        /**
         * Print the list of options.
         *
         * @param[out] os the output stream
         * @param[in] indent prepended to every line
         */
        void printHelp(std::ostream &os, const std::string &indent = "") const;

        /**
         * Parse the command line.
         *
         * @param[in] argc argument count, as passed to main()
         * @param[in] argv argument vector, as passed to main()
         * @exception UUsageError on an unknown option or if an option
         *            argument is missing
         */
        void parse(int argc, char *argv[]);

        /**
         * Returns the arguments that follow the options.
         */
        const StringVector& getArgs() const
        { return m_args; }

    private:
        StringVector m_args;
        OptionList m_options;
};

//}}}

#endif /* OPTIONPARSER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
