#include "TaskQueue.hpp"
#include <limits>
#include <tuple>

namespace Ferry {

bool TaskQueue::Key::operator<(const Key& other) const {
    return std::tie(tier, notBeforeMs, createdMs, sequence, taskId) <
           std::tie(other.tier, other.notBeforeMs, other.createdMs, other.sequence, other.taskId);
}

TaskQueue::Key TaskQueue::keyFor(const TransferTask& task) {
    Key key;
    key.tier = -static_cast<int>(task.priority);
    key.notBeforeMs = task.notBefore.isValid() ? task.notBefore.toMSecsSinceEpoch()
                                               : std::numeric_limits<qint64>::min();
    key.createdMs = task.createdAt.isValid() ? task.createdAt.toMSecsSinceEpoch() : 0;
    key.sequence = task.sequence;
    key.taskId = task.id;
    return key;
}

void TaskQueue::upsert(const TransferTask& task) {
    remove(task.id);
    Key key = keyFor(task);
    entries_.insert(key);
    index_.insert(task.id, key);
}

bool TaskQueue::remove(const QString& taskId) {
    auto it = index_.find(taskId);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it.value());
    index_.erase(it);
    return true;
}

bool TaskQueue::contains(const QString& taskId) const {
    return index_.contains(taskId);
}

void TaskQueue::clear() {
    entries_.clear();
    index_.clear();
}

QStringList TaskQueue::orderedIds() const {
    QStringList ids;
    ids.reserve(static_cast<int>(entries_.size()));
    for (const Key& key : entries_) {
        ids.append(key.taskId);
    }
    return ids;
}

} // namespace Ferry
