#pragma once

#include <QVector>

#include "EntryIdentifier.h"

struct EntryRow {
    EntryIdentifier identifier;
    bool selected = false;
    int ordinal = 0;
};

using EntryRowList = QVector<EntryRow>;
