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
#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <istream>
#include <ostream>
#include <string>

#include "global.h"
#include "invocation.h"
#include "stringvector.h"

//{{{ Dispatcher ---------------------------------------------------------------

/**
 * Decodes the arguments (and in filter mode standard input) of an
 * Invocation and then previews, prints or runs the result.
 */
class Dispatcher {

    public:

        /**
         * @param[in] invocation the parsed command line
         * @param[in] in encoded input for filter mode
         * @param[out] out where previews and decoded input are printed
         */
        Dispatcher(const Invocation &invocation,
                   std::istream &in, std::ostream &out);

        /**
         * Run the pipeline.
         *
         * Without --filter and --dry-run this replaces the current
         * process and only returns by throwing.
         *
         * @return exit status for the program
         * @exception UUsageError if no (or an empty) executable was given
         * @exception UExecError if the executable cannot be started
         * @exception USystemError on I/O errors
         */
        int run();

        /**
         * Returns the decoded arguments for the executable.
         */
        StringVector decodeArguments() const;

    protected:
        void preview(const StringVector &args);
        int runFiltered(const StringVector &args, const std::string &input);

    private:
        const Invocation &m_invocation;
        std::istream &m_in;
        std::ostream &m_out;
};

//}}}

#endif /* DISPATCHER_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
