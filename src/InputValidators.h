#pragma once

#include <QString>

namespace InputValidators {

// Each validator returns an empty string when the value is valid,
// otherwise a user-facing reason.
QString validateFilePath(const QString &path);
QString validateDirPath(const QString &path);
QString validateEntryName(const QString &name);

} // namespace InputValidators
