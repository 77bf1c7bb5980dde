#pragma once

#include "TransferTypes.hpp"
#include <QtCore/QHash>
#include <QtCore/QStringList>
#include <set>

namespace Ferry {

/**
 * @brief Ready queue ordered by (priority tier, not-before, creation order).
 *
 * Entries are addressable by task id, so a reprioritization is an erase and
 * reinsert in O(log n) instead of a full sort. Tasks without a not-before time
 * sort ahead of scheduled ones within the same tier.
 */
class TaskQueue {
public:
    // Inserts the task or moves it to the position its current fields dictate
    void upsert(const TransferTask& task);
    bool remove(const QString& taskId);
    bool contains(const QString& taskId) const;
    void clear();

    int size() const { return static_cast<int>(entries_.size()); }
    bool isEmpty() const { return entries_.empty(); }

    // Highest priority first
    QStringList orderedIds() const;

private:
    struct Key {
        int tier;                // negated priority so higher sorts first
        qint64 notBeforeMs;
        qint64 createdMs;
        quint64 sequence;
        QString taskId;

        bool operator<(const Key& other) const;
    };

    static Key keyFor(const TransferTask& task);

    std::set<Key> entries_;
    QHash<QString, Key> index_;
};

} // namespace Ferry
