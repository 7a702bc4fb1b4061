#include "core/SessionSummarySink.hpp"
#include "core/Logger.hpp"

namespace core {

void LoggingSummarySink::record(const SessionSummary& summary) {
    Logger::info("Practice session ", summary.sessionId, " ended (", summary.endReason, "): ",
                 summary.sentencesReached, "/", summary.totalSentences, " sentences, ",
                 summary.attempts, " attempts, ",
                 summary.completed ? "completed" : "not completed", ", ",
                 static_cast<long long>(summary.durationMs / 1000.0), " s");
}

} // namespace core
