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
#ifndef ARGV_H
#define ARGV_H

#include <string>
#include <vector>
#include <memory>

#include "stringvector.h"

//{{{ ArgV ---------------------------------------------------------------------

/**
 * Argument vector of a program to be executed. The program name is
 * element 0, so the result of data() can be passed to execvp(3) as is.
 */
class ArgV : public StringVector
{
        typedef std::unique_ptr<char []> unique_ptr;
        std::vector<unique_ptr> m_unique;
        std::vector<char *> m_array;

    public:
        /**
         * Build an argument vector from a program name and its arguments.
         * Arguments containing a NUL byte are reported at info level,
         * because the program sees them cut short.
         *
         * @param[in] name program name (becomes argv[0])
         * @param[in] args the arguments
         */
        ArgV(const std::string &name, const StringVector &args);

        /**
         * Returns a NULL-terminated C string array.
         *
         * @return pointer to the array, which stays valid until the next
         *         call to data() or until the object is destroyed
         */
        char **data();
};

//}}}

#endif /* ARGV_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
