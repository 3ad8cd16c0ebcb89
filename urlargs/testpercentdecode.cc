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

#include <cstdlib>
#include <iostream>
#include <string>

#include "global.h"
#include "debug.h"
#include "stringutil.h"
#include "testrun.h"

using std::cerr;
using std::endl;
using std::string;

// -----------------------------------------------------------------------------
static bool decodes(const string &input, const string &expected)
{
    return Stringutil::percentDecode(input) == expected;
}

// -----------------------------------------------------------------------------
int main(int argc, char *argv[])
{
    int result = EXIT_SUCCESS;

    Debug::debug()->setStderrLevel(Debug::DL_TRACE);
    try {
        TestRun test;

        // Stringutil::hex2int()
        test.check("Decimal digits",
                   []() {
                       return Stringutil::hex2int('0') == 0 &&
                           Stringutil::hex2int('9') == 9;
                   });

        test.check("Hex digits in both cases",
                   []() {
                       return Stringutil::hex2int('a') == 10 &&
                           Stringutil::hex2int('F') == 15;
                   });

        test.check("hex2int rejects a non-hex digit",
                   []() -> bool {
                       try {
                           Stringutil::hex2int('g');
                       } catch (const UError &) {
                           return true;
                       }
                       return false;
                   });

        test.check("isHexDigit rejects bytes above 0x7f",
                   []() {
                       return !Stringutil::isHexDigit('\xc3') &&
                           !Stringutil::isHexDigit('\xff');
                   });

        // Stringutil::percentDecode()
        test.check("Empty string",
                   []() { return decodes("", ""); });

        test.check("String without escapes is unchanged",
                   []() { return decodes("abc", "abc"); });

        test.check("Encoded space",
                   []() { return decodes("%20", " "); });

        test.check("Encoded space inside text",
                   []() { return decodes("hello%20world", "hello world"); });

        test.check("Lone percent sign",
                   []() { return decodes("%", "%"); });

        test.check("Percent sign with one hex digit",
                   []() { return decodes("%2", "%2"); });

        test.check("Percent sign with non-hex digits",
                   []() { return decodes("%ZZ", "%ZZ"); });

        test.check("Percent sign with one valid and one invalid digit",
                   []() { return decodes("%2G", "%2G"); });

        test.check("Failed escape does not swallow the next escape",
                   []() { return decodes("%%41", "%A"); });

        test.check("Trailing percent sign after an escape",
                   []() { return decodes("100%25%20complete%",
                                         "100% complete%"); });

        test.check("Encoded percent sign",
                   []() { return decodes("%25", "%"); });

        test.check("Only one decoding pass",
                   []() { return decodes("%2520", "%20"); });

        test.check("Plus sign is not a space",
                   []() { return decodes("a+b", "a+b"); });

        test.check("Encoded plus sign",
                   []() { return decodes("a%2Bb", "a+b"); });

        test.check("Hex digits are case insensitive",
                   []() { return decodes("%4a%4A", "JJ"); });

        test.check("Multi-byte UTF-8 sequence",
                   []() { return decodes("caf%C3%A9", "caf\xc3\xa9"); });

        test.check("Raw UTF-8 passes through",
                   []() { return decodes("caf\xc3\xa9%21", "caf\xc3\xa9!"); });

        test.check("Newline and carriage return",
                   []() { return decodes("a%0Ab%0Dc", "a\nb\rc"); });

        test.check("NUL byte",
                   []() { return decodes("a%00b", string("a\0b", 3)); });

        test.check("Byte 0xFF",
                   []() { return decodes("%ff", "\xff"); });

        test.check("Shell metacharacters",
                   []() {
                       return decodes("%5E%5Bwxy%5D%2B%5C.%2A%24",
                                      "^[wxy]+\\.*$");
                   });

        test.check("Semicolon terminator for find -exec",
                   []() { return decodes("%3B", ";"); });

        // UString::decodePercent()
        test.check("In-place decoding returns the same object",
                   []() -> bool {
                       UString s("a%20b");
                       UString &ret = s.decodePercent();
                       return &ret == &s && s == "a b";
                   });

        test.check("Every byte value decodes from its escape",
                   []() -> bool {
                       static const char hex[] = "0123456789ABCDEF";
                       string encoded, expected;
                       for (int i = 0; i < 256; ++i) {
                           encoded += '%';
                           encoded += hex[i >> 4];
                           encoded += hex[i & 0xf];
                           expected += static_cast<char>(i);
                       }
                       return decodes(encoded, expected);
                   });

        result = test.result();

    } catch (const std::exception &ex) {
        cerr << "Fatal exception: " << ex.what() << endl;
        result = EXIT_FAILURE;
    }

    return result;
}
