#include "core/PracticeSessionManager.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace core {

PracticeSessionManager::PracticeSessionManager(std::shared_ptr<SessionSummarySink> sink)
    : sink_(std::move(sink)) {
}

PracticeSessionManager::~PracticeSessionManager() {
    end("connection_closed");
}

ControlResult PracticeSessionManager::start(const std::vector<std::string>& sentences,
                                            const std::string& sessionId) {
    if (sentences.empty()) {
        return failure(actions::START_SESSION, ErrorKind::SessionState, "no sentences provided");
    }

    if (session_) {
        end("replaced");
    }

    Session s;
    s.id = sessionId.empty() ? generateId() : sessionId;
    s.sentences = sentences;
    s.startedAt = Clock::now();
    session_ = std::move(s);
    ++startedSessions_;

    Logger::info("Practice session ", session_->id, " started with ", sentences.size(), " sentences");
    return describe(actions::START_SESSION);
}

ControlResult PracticeSessionManager::control(const std::string& action, const ControlPayload& payload) {
    if (action == actions::START_SESSION) {
        return start(payload.storySentences.value_or(std::vector<std::string>{}), payload.sessionId);
    }

    const bool known = action == actions::TRY_AGAIN || action == actions::NEXT_SENTENCE ||
                       action == actions::COMPLETE_STORY || action == actions::STOP_SESSION;
    if (!known) {
        Logger::warn("PracticeSessionManager: unknown action '", action, "'");
        return failure(action, ErrorKind::Protocol, "unknown action: " + action);
    }

    if (!session_) {
        return failure(action, ErrorKind::SessionState, "no active session");
    }

    Session& s = *session_;
    const int last = static_cast<int>(s.sentences.size()) - 1;

    if (action == actions::TRY_AGAIN) {
        s.mode = PracticeMode::Listening;
    } else if (action == actions::NEXT_SENTENCE) {
        if (s.index < last) {
            ++s.index;
            s.attemptsOnCurrent = 0;
            s.lastAttempt.reset();
            s.mode = PracticeMode::Listening;
            s.highestIndex = std::max(s.highestIndex, s.index);
        } else {
            s.mode = PracticeMode::Completed;
            s.reachedCompletion = true;
        }
    } else if (action == actions::COMPLETE_STORY) {
        s.mode = PracticeMode::Completed;
        s.reachedCompletion = true;
    } else {
        ControlResult result = describe(action);
        end("stopped");
        result.isActive = false;
        return result;
    }

    Logger::debug("Practice session ", s.id, ": ", action, " -> sentence ", s.index + 1, "/",
                  s.sentences.size(), " (", practiceModeName(s.mode), ")");
    return describe(action);
}

bool PracticeSessionManager::onGesture(const GestureEvent& event) {
    if (!session_ || session_->mode != PracticeMode::Listening) {
        return false;
    }

    Session& s = *session_;
    s.mode = PracticeMode::Feedback;
    ++s.attemptsOnCurrent;
    ++s.totalAttempts;
    s.lastAttempt = event.analysis;

    Logger::info("Practice session ", s.id, ": attempt ", s.attemptsOnCurrent, " on sentence ",
                 s.index + 1, " (", static_cast<int>(event.durationMs), " ms)");
    return true;
}

void PracticeSessionManager::end(const std::string& reason) {
    if (!session_) return;

    const Session& s = *session_;
    SessionSummary summary;
    summary.sessionId = s.id;
    summary.totalSentences = static_cast<int>(s.sentences.size());
    summary.sentencesReached = s.highestIndex + 1;
    summary.attempts = s.totalAttempts;
    summary.completed = s.reachedCompletion;
    summary.durationMs = elapsedMs(s.startedAt, Clock::now());
    summary.endReason = reason;

    session_.reset();

    if (sink_) {
        try {
            sink_->record(summary);
        } catch (const std::exception& e) {
            Logger::error("Session summary sink failed for ", summary.sessionId, ": ", e.what());
        }
    }
}

std::optional<PracticeMode> PracticeSessionManager::mode() const {
    if (!session_) return std::nullopt;
    return session_->mode;
}

std::optional<int> PracticeSessionManager::currentIndex() const {
    if (!session_) return std::nullopt;
    return session_->index;
}

std::optional<PracticeSnapshot> PracticeSessionManager::snapshot() const {
    if (!session_) return std::nullopt;

    const Session& s = *session_;
    PracticeSnapshot snap;
    snap.sessionId = s.id;
    snap.mode = s.mode;
    snap.currentSentenceIndex = s.index;
    snap.totalSentences = static_cast<int>(s.sentences.size());
    snap.currentSentence = s.sentences[static_cast<size_t>(s.index)];
    snap.attemptsOnCurrentSentence = s.attemptsOnCurrent;
    snap.totalAttempts = s.totalAttempts;
    snap.lastAttempt = s.lastAttempt;
    return snap;
}

ControlResult PracticeSessionManager::describe(const std::string& action) const {
    ControlResult r;
    r.success = true;
    r.action = action;
    if (!session_) return r;

    const Session& s = *session_;
    r.sessionId = s.id;
    r.currentSentenceIndex = s.index;
    r.totalSentences = static_cast<int>(s.sentences.size());
    r.currentSentence = s.sentences[static_cast<size_t>(s.index)];
    r.practiceMode = s.mode;
    r.isActive = true;
    return r;
}

ControlResult PracticeSessionManager::failure(const std::string& action, ErrorKind kind,
                                              std::string message) const {
    ControlResult r = describe(action);
    r.success = false;
    r.errorKind = kind;
    r.error = std::move(message);
    return r;
}

std::string PracticeSessionManager::generateId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "session-" + std::to_string(ms) + "-" + std::to_string(startedSessions_ + 1);
}

} // namespace core
