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

#include "InputValidators.h"

#include <QCoreApplication>

#include "EntryIdentifier.h"

namespace InputValidators {

namespace {
const QChar pathSeparator = QLatin1Char(EntryPathUtils::separator);
const QString parentSegment = QStringLiteral("..");

bool leavesStore(const QString &path)
{
    return path.split(pathSeparator).contains(parentSegment);
}
}

QString validateFilePath(const QString &path)
{
    if (path.trimmed().isEmpty()) {
        return QCoreApplication::translate("InputValidators", "Path cannot be empty");
    }
    if (path.startsWith(pathSeparator) || path.endsWith(pathSeparator)) {
        return QCoreApplication::translate("InputValidators", "Path cannot start or end with a /");
    }
    if (leavesStore(path)) {
        return QCoreApplication::translate("InputValidators", "Path cannot contain a .. segment");
    }
    return {};
}

QString validateDirPath(const QString &path)
{
    if (path.startsWith(pathSeparator)) {
        return QCoreApplication::translate("InputValidators", "Path cannot start with a /");
    }
    if (leavesStore(path)) {
        return QCoreApplication::translate("InputValidators", "Path cannot contain a .. segment");
    }
    return {};
}

QString validateEntryName(const QString &name)
{
    if (name.trimmed().isEmpty()) {
        return QCoreApplication::translate("InputValidators", "Name cannot be empty");
    }
    if (name.contains(pathSeparator)) {
        return QCoreApplication::translate("InputValidators", "Name cannot contain a /");
    }
    return {};
}

} // namespace InputValidators
