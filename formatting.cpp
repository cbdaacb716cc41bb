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

#include "formatting.h"

#include <algorithm>
#include <iterator>

using namespace std;
using namespace YamlFormatting;

oyamlstream& YamlFormatting::offset(oyamlstream& s)
{
    fill_n(ostreambuf_iterator<char>(s), s.offsetWidth(), ' ');
    return s;
}

SequenceItem::SequenceItem(stream_type& s)
    : Offset(s, 0)
{
    _s << offset << "- ";
    shift();
}

void YamlFormatting::writeBlockScalar(oyamlstream& s, string_view key, string_view indicator,
                                      string_view text, Offset::off_type contentDepth)
{
    s << offset << key << ": " << indicator << '\n';
    const Offset contentOffset(s, contentDepth);
    for (size_t lineStart = 0;;) {
        const auto lineEnd = text.find('\n', lineStart);
        s << offset << text.substr(lineStart, lineEnd - lineStart) << '\n';
        if (lineEnd == string_view::npos)
            break;
        lineStart = lineEnd + 1;
    }
}

string YamlFormatting::yamlQuote(string_view s)
{
    string result{'"'};
    for (const auto c : s)
        switch (c) {
        case '\\': result += "\\\\"; break;
        case '"': result += "\\\""; break;
        case '\n': result += "\\n"; break;
        case '\r': result += "\\r"; break;
        case '\t': result += "\\t"; break;
        default: result.push_back(c);
        }
    result.push_back('"');
    return result;
}

string YamlFormatting::yamlEscape(string_view s)
{
    static constexpr string_view SignificantChars = ":{}[]&*?|>!%@`#,\n";
    if (s.empty() || s.find_first_of(SignificantChars) != string_view::npos
        || s.starts_with("- "))
        return yamlQuote(s);
    return string(s);
}
