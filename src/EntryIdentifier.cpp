/************************************************************************\

    Passdeck - Password store browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "EntryIdentifier.h"

#include <QDir>

bool operator==(const EntryIdentifier &left, const EntryIdentifier &right)
{
    return left.profile == right.profile
        && left.category == right.category
        && left.name == right.name;
}

bool operator!=(const EntryIdentifier &left, const EntryIdentifier &right)
{
    return !(left == right);
}

/**
 * @brief Orders identifiers by profile, then category, then name.
 *
 * Comparison is a plain code-unit comparison so that the order matches the
 * order the store listing is sorted in.
 */
bool operator<(const EntryIdentifier &left, const EntryIdentifier &right)
{
    const int profileOrder = QString::compare(left.profile, right.profile, Qt::CaseSensitive);
    if (profileOrder != 0) {
        return profileOrder < 0;
    }
    const int categoryOrder = QString::compare(left.category, right.category, Qt::CaseSensitive);
    if (categoryOrder != 0) {
        return categoryOrder < 0;
    }
    return QString::compare(left.name, right.name, Qt::CaseSensitive) < 0;
}

bool operator>(const EntryIdentifier &left, const EntryIdentifier &right)
{
    return right < left;
}

namespace EntryPathUtils {

/**
 * @brief Converts a store-relative path into an identifier.
 *
 * The last segment is always the name and the first is the profile when
 * there is more than one segment. Everything in between is the category.
 *
 * @param path Relative path such as "profile/cat1/cat2/name".
 * @return Structured identifier for the path.
 */
EntryIdentifier parse(const QString &path)
{
    const QStringList segments = path.split(QLatin1Char(separator));
    EntryIdentifier id;
    switch (segments.size()) {
    case 1:
        id.name = segments.first();
        break;
    case 2:
        id.profile = segments.first();
        id.name = segments.last();
        break;
    default:
        id.profile = segments.first();
        id.category = segments.mid(1, segments.size() - 2).join(QLatin1Char(separator));
        id.name = segments.last();
        break;
    }
    return id;
}

/**
 * @brief Joins the identifier fields into a store-relative path.
 * @param id Identifier to format.
 * @return Path with empty fields omitted.
 */
QString format(const EntryIdentifier &id)
{
    QStringList fields;
    fields.reserve(3);
    for (const QString &field : {id.profile, id.category, id.name}) {
        if (!field.isEmpty()) {
            fields.append(field);
        }
    }
    return fields.join(QLatin1Char(separator));
}

/**
 * @brief Formats an identifier for display.
 *
 * Unlike format(), empty segments inside a field are dropped as well, so a
 * category such as "a//b" never shows a doubled separator.
 */
QString toDisplayString(const EntryIdentifier &id)
{
    QStringList segments;
    for (const QString &field : {id.profile, id.category, id.name}) {
        segments.append(field.split(QLatin1Char(separator), Qt::SkipEmptyParts));
    }
    return segments.join(QLatin1Char(separator));
}

QString joinSegments(const QStringList &segments)
{
    QStringList parts;
    parts.reserve(segments.size());
    for (const QString &segment : segments) {
        const QStringList pieces = segment.split(QLatin1Char(separator), Qt::SkipEmptyParts);
        parts.append(pieces);
    }
    return parts.join(QLatin1Char(separator));
}

/**
 * @brief Returns the absolute path of the encrypted file backing an entry.
 * @param storeRoot Absolute path of the store root.
 * @param id Entry identifier.
 * @return Absolute file path including the entry suffix.
 */
QString storeFilePath(const QString &storeRoot, const EntryIdentifier &id)
{
    return QDir(storeRoot).filePath(format(id) + QLatin1String(entrySuffix));
}

QStringList formatAll(const QVector<EntryIdentifier> &ids)
{
    QStringList paths;
    paths.reserve(ids.size());
    for (const EntryIdentifier &id : ids) {
        paths.append(format(id));
    }
    return paths;
}

} // namespace EntryPathUtils
