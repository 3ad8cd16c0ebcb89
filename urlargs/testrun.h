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
#ifndef TESTRUN_H
#define TESTRUN_H

#include <cstdlib>
#include <iostream>

#include "global.h"

//{{{ TestRun -----------------------------------------------------------------

/**
 * Runs named checks and remembers whether any of them failed.
 */
class TestRun {
    int m_result;

public:
    TestRun()
        : m_result(EXIT_SUCCESS)
    { }

    int result(void)
    { return m_result; }

    template<typename check_fn>
    void check(const char *what, check_fn fn);
};

// -----------------------------------------------------------------------------
template<typename check_fn>
void TestRun::check(const char *what, check_fn fn)
{
    std::cout << what << ": ";
    try {
        if (fn()) {
            std::cout << "OK";
        } else {
            std::cout << "FAILED";
            m_result = EXIT_FAILURE;
        }
        std::cout << std::endl;
    } catch (const UError &e) {
        std::cout << "EXCEPTION" << std::endl;
        std::cerr << e.what() << std::endl;
        m_result = EXIT_FAILURE;
    }
}

//}}}

#endif /* TESTRUN_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
