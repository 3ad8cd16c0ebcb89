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
#ifndef INVOCATION_H
#define INVOCATION_H

#include <string>

#include "stringvector.h"

//{{{ Invocation ---------------------------------------------------------------

/**
 * What the user asked for on the command line. Created once after the
 * options have been parsed and never modified afterwards.
 */
class Invocation {

    public:

        /**
         * @param[in] help @c true if --help was given
         * @param[in] version @c true if --version was given
         * @param[in] dryRun @c true if --dry-run or --preview was given
         * @param[in] filter @c true if --filter was given
         * @param[in] positional the non-option arguments; the first one
         *            is the executable, the rest are its (still encoded)
         *            arguments
         */
        Invocation(bool help, bool version, bool dryRun, bool filter,
                   const StringVector &positional)
            : m_help(help), m_version(version), m_dryRun(dryRun),
              m_filter(filter), m_positional(positional)
        { }

        bool helpRequested() const
        { return m_help; }

        bool versionRequested() const
        { return m_version; }

        bool dryRun() const
        { return m_dryRun; }

        bool filterMode() const
        { return m_filter; }

        bool hasExecutable() const
        { return !m_positional.empty(); }

        /**
         * Returns the executable name. Only valid if hasExecutable().
         */
        const std::string &executable() const
        { return m_positional.front(); }

        /**
         * Returns the encoded arguments for the executable.
         */
        StringVector encodedArgs() const
        {
            return m_positional.empty()
                ? StringVector()
                : StringVector(m_positional.begin() + 1, m_positional.end());
        }

    private:
        const bool m_help;
        const bool m_version;
        const bool m_dryRun;
        const bool m_filter;
        const StringVector m_positional;
};

//}}}

#endif /* INVOCATION_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
