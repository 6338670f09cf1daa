#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

struct EntryIdentifier {
    QString profile;
    QString category;
    QString name;
};

bool operator==(const EntryIdentifier &left, const EntryIdentifier &right);
bool operator!=(const EntryIdentifier &left, const EntryIdentifier &right);
bool operator<(const EntryIdentifier &left, const EntryIdentifier &right);
bool operator>(const EntryIdentifier &left, const EntryIdentifier &right);

Q_DECLARE_METATYPE(EntryIdentifier)

namespace EntryPathUtils {

constexpr char separator = '/';
constexpr char entrySuffix[] = ".gpg";

EntryIdentifier parse(const QString &path);
QString format(const EntryIdentifier &id);
QString toDisplayString(const EntryIdentifier &id);
QString joinSegments(const QStringList &segments);
QString storeFilePath(const QString &storeRoot, const EntryIdentifier &id);
QStringList formatAll(const QVector<EntryIdentifier> &ids);

} // namespace EntryPathUtils
