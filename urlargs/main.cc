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
#include <iostream>
#include <cstdlib>
#include <stdexcept>

#include "global.h"
#include "urlargs.h"

using std::cerr;
using std::endl;

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    UrlArgs ua;

    try {
        ua.parseCommandline(argc, argv);
        return ua.execute();
    } catch (const UUsageError &ue) {
        cerr << "Error: " << ue.what() << endl;
        UrlArgs::printUsage(cerr);
        cerr << "Try '" PROGRAM_NAME " --help' for more information." << endl;
        return EXIT_USAGE;
    } catch (const UExecError &ee) {
        cerr << PROGRAM_NAME ": " << ee.what() << endl;
        return ee.getExitStatus();
    } catch (const UError &ke) {
        cerr << PROGRAM_NAME ": " << ke.what() << endl;
    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
    }

    return -1;
}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
