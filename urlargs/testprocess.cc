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
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <memory>
#include <string>
#include <typeinfo>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "global.h"
#include "process.h"
#include "argv.h"
#include "debug.h"
#include "stringvector.h"
#include "testrun.h"

using std::cout;
using std::cerr;
using std::endl;
using std::string;
using std::shared_ptr;
using std::make_shared;

// -----------------------------------------------------------------------------
static string readAll(int fd)
{
    string ret;
    char buf[256];
    ssize_t cnt;
    while ((cnt = read(fd, buf, sizeof buf)) > 0)
        ret.append(buf, cnt);
    return ret;
}

// -----------------------------------------------------------------------------
static bool isIgnored(int sig)
{
    struct sigaction act;
    sigaction(sig, NULL, &act);
    return act.sa_handler == SIG_IGN;
}

// -----------------------------------------------------------------------------
// Collects the log file output written while fn runs.
template <typename Fn>
static string logged(Fn fn)
{
    FILE *fp = tmpfile();
    if (!fp)
        throw USystemError("Cannot create temporary log file", errno);

    Debug::debug()->setFileHandle(fp);
    fn();
    Debug::debug()->setFileHandle(NULL);

    rewind(fp);
    string ret;
    int c;
    while ((c = fgetc(fp)) != EOF)
        ret.push_back(static_cast<char>(c));
    fclose(fp);
    return ret;
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        test.check("Uninitialized pipe is nullptr",
                   []() -> bool {
                       SubProcess p;
                       return !p.getChildFD(0);
                   });

        test.check("Child descriptor setup can be replaced",
                   []() -> bool {
                       SubProcess p;
                       p.setChildFD(0, make_shared<ParentToChildPipe>());
                       auto found = p.getChildFD(0);
                       if (typeid(*found) != typeid(ParentToChildPipe))
                           return false;
                       p.setChildFD(0, make_shared<ChildToParentPipe>());
                       found = p.getChildFD(0);
                       if (typeid(*found) != typeid(ChildToParentPipe))
                           return false;
                       p.setChildFD(0, nullptr);
                       return !p.getChildFD(0);
                   });

        test.check("Argument with a NUL byte is reported",
                   []() -> bool {
                       StringVector args;
                       args.push_back("plain");
                       args.push_back(string("a\0b", 3));
                       string log = logged([&args]() {
                           ArgV argv("printf", args);
                           char **data = argv.data();
                           if (std::strlen(data[2]) != 1 || data[3])
                               throw UError("unexpected argument vector");
                       });
                       string expected = "[" +
                           std::to_string((long)getpid()) +
                           "] INFO: Argument 2 contains a NUL byte";
                       if (log.find(expected) == string::npos) {
                           cerr << "log: " << log << endl;
                           return false;
                       }
                       return log.find("Argument 1 ") == string::npos;
                   });

        test.check("Exit status of 'true'",
                   []() -> bool {
                       SubProcess p;
                       p.spawn("true", StringVector());
                       ExitStatus status = p.wait();
                       return status.exited() && status.exitCode() == 0 &&
                           status.propagate() == 0;
                   });

        test.check("Exit status of 'false'",
                   []() -> bool {
                       SubProcess p;
                       p.spawn("false", StringVector());
                       ExitStatus status = p.wait();
                       return status.exited() && status.propagate() == 1;
                   });

        test.check("Arguments and input reach the child unchanged",
                   []() -> bool {
                       static const char input[] = "line one\nline two\n";
                       SubProcess p;
                       auto in = make_shared<ParentToChildPipe>();
                       auto out = make_shared<ChildToParentPipe>();
                       p.setChildFD(0, in);
                       p.setChildFD(1, out);
                       p.spawn("sh", StringVector({ "-c", "echo \"$1\"; cat",
                                                    "sh", "a 'b' ;c" }));
                       size_t n = in->write(input, sizeof(input) - 1);
                       in->close();
                       string got = readAll(out->parentFD());
                       ExitStatus status = p.wait();
                       return n == sizeof(input) - 1 &&
                           got == "a 'b' ;c\nline one\nline two\n" &&
                           status.exitCode() == 0;
                   });

        test.check("Missing program exits with 127",
                   []() -> bool {
                       SubProcess p;
                       p.spawn("/nonexistent/urlargs-test", StringVector());
                       ExitStatus status = p.wait();
                       return status.exited() && status.exitCode() == 127;
                   });

        test.check("exec() of a missing program throws",
                   []() -> bool {
                       try {
                           SubProcess::exec("/nonexistent/urlargs-test",
                                            StringVector({ "x" }));
                       } catch (const UExecError &e) {
                           return e.getExitStatus() == EXIT_NOT_FOUND &&
                               string(e.what()).find("urlargs-test")
                                   != string::npos;
                       }
                       return false;
                   });

        test.check("exec() of a directory gives 126",
                   []() -> bool {
                       try {
                           SubProcess::exec("/", StringVector());
                       } catch (const UExecError &e) {
                           return e.getExitStatus() == EXIT_CANNOT_EXECUTE;
                       }
                       return false;
                   });

        test.check("Writing to a child that does not read",
                   []() -> bool {
                       SignalGuard guard({ SIGPIPE });
                       SubProcess p;
                       auto in = make_shared<ParentToChildPipe>();
                       p.setChildFD(0, in);
                       p.spawn("true", StringVector());
                       string data(1024 * 1024, 'x');
                       size_t n = in->write(data.data(), data.size());
                       in->close();
                       ExitStatus status = p.wait();
                       return n < data.size() && status.exitCode() == 0;
                   });

        test.check("Killed child reports the signal",
                   []() -> bool {
                       SubProcess p;
                       p.spawn("sleep", StringVector({ "10" }));
                       p.kill(SIGTERM);
                       ExitStatus status = p.wait();
                       return status.signaled() &&
                           status.termSignal() == SIGTERM;
                   });

        test.check("Signal is propagated to the caller",
                   []() -> bool {
                       SubProcess p;
                       p.spawn("sleep", StringVector({ "10" }));
                       p.kill(SIGTERM);
                       ExitStatus status = p.wait();

                       // the child must not print our buffered output
                       cout.flush();
                       pid_t pid = fork();
                       if (pid == 0) {
                           status.propagate();
                           _exit(0);
                       }
                       int wstatus;
                       waitpid(pid, &wstatus, 0);
                       return WIFSIGNALED(wstatus) &&
                           WTERMSIG(wstatus) == SIGTERM;
                   });

        test.check("SignalGuard restores the old disposition",
                   []() -> bool {
                       bool before = isIgnored(SIGQUIT);
                       bool inside;
                       {
                           SignalGuard guard({ SIGINT, SIGQUIT });
                           inside = isIgnored(SIGQUIT) && isIgnored(SIGINT);
                       }
                       return inside && isIgnored(SIGQUIT) == before;
                   });

        test.check("Destructor reaps a running child",
                   []() -> bool {
                       pid_t pid;
                       {
                           SubProcess p;
                           p.spawn("sleep", StringVector({ "10" }));
                           pid = p.getChildPID();
                       }
                       return pid > 0 && ::kill(pid, 0) == -1;
                   });

        result = test.result();

    } catch(const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}
