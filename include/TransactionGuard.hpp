#pragma once

#include "ExecutionEngine.hpp"

namespace sqladapter {

enum class BeginOutcome {
    Started,
    UnsupportedByBackend
};

// Issues BEGIN, tolerating storage engines that reject transactions
class TransactionGuard {
public:
    explicit TransactionGuard(ExecutionEngine& engine);

    /**
     * @brief Send BEGIN through the text protocol.
     * @return UnsupportedByBackend when the server rejected the statement.
     * @throws DatabaseError for connection errors, which are never tolerated.
     */
    BeginOutcome begin();

private:
    ExecutionEngine& m_engine;
};

}  // namespace sqladapter
