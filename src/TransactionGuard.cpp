#include "TransactionGuard.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqladapter {

TransactionGuard::TransactionGuard(ExecutionEngine& engine)
    : m_engine(engine) {
}

BeginOutcome TransactionGuard::begin() {
    try {
        m_engine.executeDirect("BEGIN", "TRANSACTION");
        return BeginOutcome::Started;
    } catch (const DatabaseError& e) {
        if (e.isConnectionError()) {
            throw;
        }
        if (ErrorHandler::isUnsupportedFeature(e.errorCode())) {
            spdlog::debug("Transactions not supported by the storage engine: {}", e.what());
        } else {
            spdlog::warn("BEGIN rejected ({}), continuing without a transaction: {}",
                         e.errorCode(), e.what());
        }
        return BeginOutcome::UnsupportedByBackend;
    }
}

}  // namespace sqladapter
