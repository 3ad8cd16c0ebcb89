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
#ifndef URLARGS_H
#define URLARGS_H

#include <memory>
#include <ostream>
#include <string>

#include "global.h"
#include "invocation.h"

//{{{ UrlArgs ------------------------------------------------------------------

/**
 * Main class of the program.
 */
class UrlArgs {

    public:
        /**
         * Creates a new UrlArgs object. Mainly for initialisation.
         */
        UrlArgs();

        /**
         * Delete a UrlArgs object.
         */
        virtual ~UrlArgs();

    public:
        /**
         * Parses the command line. This method must be called before the
         * execute() method is called.
         *
         * @exception UUsageError on an unknown option
         */
        void parseCommandline(int argc, char *argv[]);

        /**
         * Returns the parsed command line. Only valid after
         * parseCommandline().
         */
        const Invocation &getInvocation() const;

        /**
         * Executes the main program.
         *
         * @return the exit status
         */
        int execute();

        /**
         * Print the one-line synopsis.
         *
         * @param[out] os the output stream
         */
        static void printUsage(std::ostream &os);

    protected:
        void printHelp(std::ostream &os);
        void printVersion(std::ostream &os);

    private:
        std::string m_optionHelp;
        std::unique_ptr<const Invocation> m_invocation;
};

//}}}

#endif /* URLARGS_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
