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
#include <string>
#include <memory>
#include <cerrno>
#include <cstdlib>

#include <signal.h>
#include <unistd.h>

#include "global.h"
#include "debug.h"
#include "dispatcher.h"
#include "linedecoder.h"
#include "process.h"
#include "stringutil.h"

using std::string;
using std::istream;
using std::ostream;
using std::make_shared;

//{{{ Dispatcher ---------------------------------------------------------------

// -----------------------------------------------------------------------------
Dispatcher::Dispatcher(const Invocation &invocation,
                       istream &in, ostream &out)
    : m_invocation(invocation), m_in(in), m_out(out)
{}

// -----------------------------------------------------------------------------
int Dispatcher::run()
{
    Debug::debug()->trace("Dispatcher::run()");

    if (m_invocation.filterMode() && !m_invocation.hasExecutable()) {
        LineDecoder::filter(m_in, m_out);
        return EXIT_SUCCESS;
    }

    if (!m_invocation.hasExecutable())
        throw UUsageError("No executable specified.");
    if (m_invocation.executable().empty())
        throw UUsageError("Empty executable name.");

    StringVector args = decodeArguments();

    if (m_invocation.dryRun()) {
        preview(args);
        return EXIT_SUCCESS;
    }

    if (m_invocation.filterMode()) {
        // the child gets the complete input, never a partial stream
        string input = LineDecoder::decodeAll(m_in);
        return runFiltered(args, input);
    }

    SubProcess::exec(m_invocation.executable(), args);

    // not reached, exec() either succeeds or throws
    return EXIT_FAILURE;
}

// -----------------------------------------------------------------------------
StringVector Dispatcher::decodeArguments() const
{
    StringVector ret;
    StringVector encoded = m_invocation.encodedArgs();

    for (StringVector::const_iterator it = encoded.begin();
            it != encoded.end(); ++it) {
        ret.push_back(Stringutil::percentDecode(*it));
        Debug::debug()->trace("Argument %lu: '%s'",
                              (unsigned long)ret.size(), ret.back().c_str());
    }

    return ret;
}

// -----------------------------------------------------------------------------
void Dispatcher::preview(const StringVector &args)
{
    m_out << "Command: " << m_invocation.executable() << '\n';
    for (StringVector::size_type i = 0; i < args.size(); ++i)
        m_out << "Arg " << (i + 1) << ": '" << args[i] << "'\n";

    m_out.flush();
    if (!m_out)
        throw USystemError("Cannot write preview", errno);
}

// -----------------------------------------------------------------------------
int Dispatcher::runFiltered(const StringVector &args, const string &input)
{
    Debug::debug()->dbg("Feeding %lu bytes of decoded input to %s",
                        (unsigned long)input.size(),
                        m_invocation.executable().c_str());

    SubProcess p;
    auto pipe = make_shared<ParentToChildPipe>();
    p.setChildFD(STDIN_FILENO, pipe);
    p.spawn(m_invocation.executable(), args);

    // like system(3), leave interrupts to the child
    SignalGuard guard({ SIGINT, SIGQUIT, SIGPIPE });

    pipe->write(input.data(), input.size());
    pipe->close();

    ExitStatus status = p.wait();
    return status.propagate();
}

//}}}

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
