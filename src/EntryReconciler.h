#pragma once

#include <QVector>

#include "EntryIdentifier.h"
#include "EntryRow.h"

namespace EntryReconciler {

struct ReconcileResult {
    EntryRowList rows;
    int cursor = 0;
};

ReconcileResult reconcile(const EntryRowList &oldRows, int cursor, const QVector<EntryIdentifier> &newIds);
void enumerate(EntryRowList &rows);
int clampCursor(int cursor, int rowCount);

} // namespace EntryReconciler
