#pragma once

#include <string>

namespace core {

// What a finished practice session looked like
struct SessionSummary {
    std::string sessionId;
    int totalSentences = 0;
    int sentencesReached = 0; // highest index reached + 1
    int attempts = 0;
    bool completed = false;
    double durationMs = 0.0;
    std::string endReason;
};

/**
 * Destination for finished-session summaries. Storage is up to the
 * implementation; the session manager only hands summaries over.
 */
class SessionSummarySink {
public:
    virtual ~SessionSummarySink() = default;
    virtual void record(const SessionSummary& summary) = 0;
};

/**
 * Default sink: writes one log line per session.
 */
class LoggingSummarySink : public SessionSummarySink {
public:
    void record(const SessionSummary& summary) override;
};

} // namespace core
