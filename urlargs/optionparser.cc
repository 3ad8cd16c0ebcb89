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
#include <cstring>
#include <vector>

#include <getopt.h>
#include <unistd.h>

#include "global.h"
#include "debug.h"
#include "optionparser.h"

using std::vector;
using std::string;
using std::endl;
using std::ostream;
using std::memset;

/* -------------------------------------------------------------------------- */
static string offendingOption(char *argv[], int index, int letter)
{
    // long options are reported as written, short ones by their letter
    // because they may be part of a group such as "-nx"
    string arg(argv[index - 1]);
    if (arg.compare(0, 2, "--") == 0 || !letter)
        return arg.substr(0, arg.find('='));
    return string("-") + static_cast<char>(letter);
}

/* -------------------------------------------------------------------------- */
void OptionParser::addOption(Option *option)
{
    m_options.push_back(option);
}

/* -------------------------------------------------------------------------- */
void OptionParser::parse(int argc, char *argv[])
{
    OptionList::const_iterator it;
    vector<struct option> opt(m_options.size() + 1);

    // '+' stops at the first non-option, ':' reports a missing argument
    string getopt_string = "+:";

    // get a struct option array from the list
    struct option *cur = opt.data();
    for (it = m_options.begin(); it != m_options.end(); ++it)
        getopt_string += (*it)->getoptArgs(cur++);
    memset(cur, 0, sizeof(struct option));

    // optind = 0 also resets the internal state of GNU getopt
    optind = 0;
    opterr = 0;
    for (;;) {
        int option_index = 0;

        int c = getopt_long(argc, argv, getopt_string.c_str(),
                opt.data(), &option_index);
        if (c == -1)
            break;

        if (c == '?')
            throw UUsageError("Unknown option: " +
                              offendingOption(argv, optind, optopt));
        else if (c == ':')
            throw UUsageError("Option " +
                              offendingOption(argv, optind, optopt) +
                              " requires an argument");

        for (it = m_options.begin(); it != m_options.end(); ++it) {
            if ((*it)->getLetter() == c) {
                Debug::debug()->trace("OptionParser::parse: --%s",
                    (*it)->getLongName().c_str());
                (*it)->setValue(optarg);
                break;
            }
        }
        if (it == m_options.end())
            throw UUsageError("Invalid command line option");
    }

    // save arguments
    m_args.clear();
    for (int i = optind; i < argc; ++i)
        m_args.push_back(argv[i]);
}

// -----------------------------------------------------------------------------
void OptionParser::printHelp(ostream &os, const string &indent) const
{
    for (OptionList::const_iterator it = m_options.begin();
            it != m_options.end(); ++it) {
        const Option *opt = *it;

        os << indent << "--" << opt->getLongName();
        const char *placeholder = opt->getPlaceholder();
        if (placeholder)
            os << "=" << placeholder;
        os << " | -" << opt->getLetter();
        if (placeholder)
            os << " " << placeholder;
        os << endl;
        os << indent << "     " << opt->getDescription() << endl;
    }
}

// vim: set sw=4 ts=4 et fdm=marker: :collapseFolds=1:
