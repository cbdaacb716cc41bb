/******************************************************************************
 * Copyright (C) 2016 Kitsune Ral <kitsune-ral@users.sf.net>
 * Copyright (C) 2026 insogen contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace YamlFormatting
{
    /**
     * @brief A string stream that knows the current YAML nesting level
     *
     * Each level is two spaces wide; use the `offset` manipulator at
     * the beginning of a line and Offset/SequenceItem objects to change the level.
     */
    class oyamlstream : public std::ostringstream
    {
        public:
            using offset_type = std::string::difference_type;

            static constexpr offset_type IndentWidth = 2;

            using std::ostringstream::ostringstream;

            oyamlstream& operator<<(oyamlstream& (*f)(oyamlstream&))
            {
                f(*this);
                return *this;
            }

            oyamlstream& operator<<(std::ostream& (*f)(std::ostream&))
            {
                f(*this);
                return *this;
            }

            void promote(offset_type nStops = 1)
            {
                _offsetLevel += nStops;
            }

            void demote(offset_type nStops = 1)
            {
                _offsetLevel -= nStops;
            }

            offset_type offsetWidth() const
            {
                return _offsetLevel * IndentWidth;
            }

        private:
            offset_type _offsetLevel = 0;
    };

    oyamlstream& offset(oyamlstream& s);

    template <typename T>
    inline oyamlstream& operator<<(oyamlstream& s, const T& val)
    {
        static_cast<std::ostringstream&>(s) << val;
        return s;
    }

    class Offset
    {
        public:
            using off_type = oyamlstream::offset_type;
            using stream_type = oyamlstream;

            explicit Offset(stream_type& s, off_type depth = 1)
                    : _s(s)
            {
                shift(depth);
            }
            /// Writes \p leader (normally a `key:` line) and nests what follows
            Offset(stream_type& s, const std::string& leader)
                    : Offset(s << offset << leader << '\n')
            { }
            ~Offset()
            {
                shift(-_nStops);
            }
            Offset(const Offset&) = delete;
            Offset& operator=(const Offset&) = delete;

            void shift(off_type nStops = 1)
            {
                _s.promote(nStops); _nStops += nStops;
            }

        protected:
            stream_type& _s;
            off_type _nStops = 0;
    };

    /**
     * @brief Starts an element of a block sequence
     *
     * Writes `- ` at the current level; the caller continues the same line
     * with the first key, and further keys of the element line up with it.
     */
    class SequenceItem : public Offset
    {
        public:
            explicit SequenceItem(stream_type& s);
    };

    /// Writes `key: <indicator>` followed by \p text indented by \p contentDepth levels
    void writeBlockScalar(oyamlstream& s, std::string_view key, std::string_view indicator,
                          std::string_view text, Offset::off_type contentDepth = 1);

    /// Double-quotes \p s, escaping backslashes and double quotes
    std::string yamlQuote(std::string_view s);

    /**
     * @brief Makes a string safe to use as a plain YAML scalar
     *
     * Empty strings, strings with any of `:{}[]&*?|>!%@`#,` or a line break,
     * and strings starting with `- ` are quoted; anything else is returned as is.
     */
    std::string yamlEscape(std::string_view s);
}
