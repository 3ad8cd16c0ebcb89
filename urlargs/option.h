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
#ifndef OPTION_H
#define OPTION_H

#include <list>
#include <string>

struct option;

//{{{ Option -------------------------------------------------------------------

/**
 * A command line option. Subclasses know how to describe themselves to
 * getopt_long(3) and where to store the parsed value.
 */
class Option {
    public:
        Option(const std::string &name, char letter,
               const std::string &description);

        virtual ~Option()
        {}

        const std::string &getLongName() const
        { return m_longName; }

        char getLetter() const
        { return m_letter; }

        const std::string &getDescription() const
        { return m_description; }

        /**
         * Returns the name of the option argument for help output, or
         * NULL if the option takes no argument.
         */
        virtual const char *getPlaceholder() const
        { return NULL; }

        /**
         * Fill in the getopt_long(3) descriptor for this option.
         *
         * @param[out] opt the descriptor
         * @return the short option string (e.g. "L:")
         */
        virtual std::string getoptArgs(struct option *opt) = 0;

        /**
         * Store the value found on the command line.
         *
         * @param[in] arg the option argument, or NULL
         */
        virtual void setValue(const char *arg) = 0;

        /**
         * Checks whether the option appeared on the command line.
         */
        bool isSet() const
        { return m_isSet; }

    protected:
        std::string m_longName;
        std::string m_description;
        char m_letter;
        bool m_isSet;
};

typedef std::list<Option *> OptionList;

//}}}
//{{{ FlagOption ---------------------------------------------------------------

/**
 * Option without argument that sets a boolean to @c true.
 */
class FlagOption : public Option {
    public:
        FlagOption(const std::string &name, char letter, bool *value,
                   const std::string &description);

        std::string getoptArgs(struct option *opt);
        void setValue(const char *arg);

    private:
        bool *m_value;
};

//}}}
//{{{ StringOption -------------------------------------------------------------

/**
 * Option with a mandatory string argument.
 */
class StringOption : public Option {
    public:
        StringOption(const std::string &name, char letter,
                     std::string *value, const std::string &description,
                     const char *placeholder = "STRING");

        const char *getPlaceholder() const
        { return m_placeholder; }

        std::string getoptArgs(struct option *opt);
        void setValue(const char *arg);

    private:
        std::string *m_value;
        const char *m_placeholder;
};

//}}}

#endif /* OPTION_H */

// vim: set sw=4 ts=4 fdm=marker et: :collapseFolds=1:
