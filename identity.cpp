/******************************************************************************
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

#include "identity.h"

#include <QtCore/QByteArray>
#include <QtCore/QCryptographicHash>

std::string stableId(std::string_view prefix, std::string_view seed)
{
    const auto digest =
        QCryptographicHash::hash(QByteArray(seed.data(), qsizetype(seed.size())),
                                 QCryptographicHash::Md5)
            .toHex();
    return std::string(prefix).append(1, '_').append(digest.constData(), size_t(digest.size()));
}
