#include "TransferTypes.hpp"

namespace Ferry {

TransferError TransferError::network(const QString& message) {
    TransferError error;
    error.category = TransferErrorCategory::Network;
    error.message = message;
    return error;
}

TransferError TransferError::http(int status, const QString& message, int retryAfterSeconds) {
    TransferError error;
    error.category = TransferErrorCategory::HttpError;
    error.httpStatus = status;
    error.message = message;
    error.retryAfterSeconds = retryAfterSeconds;
    return error;
}

TransferError TransferError::localIO(const QString& message) {
    TransferError error;
    error.category = TransferErrorCategory::LocalIO;
    error.message = message;
    return error;
}

TransferError TransferError::rangeNotSatisfiable(const QString& message) {
    TransferError error;
    error.category = TransferErrorCategory::RangeNotSatisfiable;
    error.httpStatus = 416;
    error.message = message;
    return error;
}

TransferError TransferError::cancelled() {
    TransferError error;
    error.category = TransferErrorCategory::Cancelled;
    error.message = QStringLiteral("Cancelled by user");
    return error;
}

bool TransferError::isRetryable() const {
    switch (category) {
        case TransferErrorCategory::Network:
        case TransferErrorCategory::RangeNotSatisfiable:
            return true;
        case TransferErrorCategory::HttpError:
            return httpStatus == 429 || (httpStatus >= 500 && httpStatus <= 599);
        case TransferErrorCategory::None:
        case TransferErrorCategory::LocalIO:
        case TransferErrorCategory::Cancelled:
        case TransferErrorCategory::ExhaustedRetries:
            return false;
    }
    return false;
}

QString TransferError::describe() const {
    QString text = toString(category);
    if (httpStatus > 0) {
        text += QStringLiteral(" (HTTP %1)").arg(httpStatus);
    }
    if (!message.isEmpty()) {
        text += QStringLiteral(": ") + message;
    }
    return text;
}

bool TransferTask::isTerminal() const {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Cancelled ||
           status == TaskStatus::Failed;
}

TransferError TransferTask::lastError() const {
    TransferError error;
    error.category = lastErrorCategory;
    error.httpStatus = lastHttpStatus;
    error.message = lastErrorMessage;
    return error;
}

QString toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued: return QStringLiteral("queued");
        case TaskStatus::Active: return QStringLiteral("active");
        case TaskStatus::Paused: return QStringLiteral("paused");
        case TaskStatus::Completed: return QStringLiteral("completed");
        case TaskStatus::Failed: return QStringLiteral("failed");
        case TaskStatus::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QString toString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Low: return QStringLiteral("low");
        case TaskPriority::Normal: return QStringLiteral("normal");
        case TaskPriority::High: return QStringLiteral("high");
    }
    return QStringLiteral("normal");
}

QString toString(NetworkRequirement requirement) {
    switch (requirement) {
        case NetworkRequirement::Any: return QStringLiteral("any");
        case NetworkRequirement::UnmeteredOnly: return QStringLiteral("unmetered");
        case NetworkRequirement::LocalOnly: return QStringLiteral("local");
    }
    return QStringLiteral("any");
}

QString toString(NetworkClass networkClass) {
    switch (networkClass) {
        case NetworkClass::Unmetered: return QStringLiteral("unmetered");
        case NetworkClass::Metered: return QStringLiteral("metered");
        case NetworkClass::Offline: return QStringLiteral("offline");
    }
    return QStringLiteral("offline");
}

QString toString(TransferErrorCategory category) {
    switch (category) {
        case TransferErrorCategory::None: return QStringLiteral("none");
        case TransferErrorCategory::Network: return QStringLiteral("network");
        case TransferErrorCategory::HttpError: return QStringLiteral("httpError");
        case TransferErrorCategory::LocalIO: return QStringLiteral("localIO");
        case TransferErrorCategory::RangeNotSatisfiable: return QStringLiteral("rangeNotSatisfiable");
        case TransferErrorCategory::Cancelled: return QStringLiteral("cancelled");
        case TransferErrorCategory::ExhaustedRetries: return QStringLiteral("exhaustedRetries");
    }
    return QStringLiteral("none");
}

std::optional<TaskStatus> taskStatusFromString(const QString& value) {
    for (TaskStatus status : {TaskStatus::Queued, TaskStatus::Active, TaskStatus::Paused,
                              TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Cancelled}) {
        if (toString(status) == value) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<TaskPriority> taskPriorityFromString(const QString& value) {
    for (TaskPriority priority : {TaskPriority::Low, TaskPriority::Normal, TaskPriority::High}) {
        if (toString(priority) == value.toLower()) {
            return priority;
        }
    }
    return std::nullopt;
}

std::optional<NetworkRequirement> networkRequirementFromString(const QString& value) {
    for (NetworkRequirement requirement : {NetworkRequirement::Any, NetworkRequirement::UnmeteredOnly,
                                           NetworkRequirement::LocalOnly}) {
        if (toString(requirement) == value.toLower()) {
            return requirement;
        }
    }
    return std::nullopt;
}

std::optional<NetworkClass> networkClassFromString(const QString& value) {
    for (NetworkClass networkClass : {NetworkClass::Unmetered, NetworkClass::Metered, NetworkClass::Offline}) {
        if (toString(networkClass) == value.toLower()) {
            return networkClass;
        }
    }
    return std::nullopt;
}

std::optional<TransferErrorCategory> errorCategoryFromString(const QString& value) {
    for (TransferErrorCategory category : {TransferErrorCategory::None, TransferErrorCategory::Network,
                                           TransferErrorCategory::HttpError, TransferErrorCategory::LocalIO,
                                           TransferErrorCategory::RangeNotSatisfiable,
                                           TransferErrorCategory::Cancelled,
                                           TransferErrorCategory::ExhaustedRetries}) {
        if (toString(category) == value) {
            return category;
        }
    }
    return std::nullopt;
}

bool networkSatisfies(NetworkRequirement requirement, NetworkClass networkClass) {
    if (networkClass == NetworkClass::Offline) {
        return false;
    }

    switch (requirement) {
        case NetworkRequirement::Any:
            return true;
        // Local links (wifi, ethernet) are what the connectivity monitor
        // reports as unmetered, so both requirements gate on the same class.
        case NetworkRequirement::UnmeteredOnly:
        case NetworkRequirement::LocalOnly:
            return networkClass == NetworkClass::Unmetered;
    }
    return false;
}

} // namespace Ferry
