#pragma once

#include "CancellationToken.hpp"
#include "TransferTypes.hpp"

#include <functional>

namespace Ferry {

/**
 * @brief Moves the bytes of one task. Called on a worker thread and blocks
 * until the attempt ends.
 *
 * Implementations poll the token between chunks and report the attempt's
 * result through the returned outcome; they never change task status
 * themselves.
 */
class TransferExecutor {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    virtual ~TransferExecutor() = default;

    virtual TransferOutcome execute(const TransferTask& task,
                                    const CancellationToken& token,
                                    const ProgressCallback& onProgress) = 0;
};

} // namespace Ferry
