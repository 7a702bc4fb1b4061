#pragma once

#include "core/Errors.hpp"
#include "core/SessionSummarySink.hpp"
#include "core/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace core {

// Control actions understood by PracticeSessionManager::control
namespace actions {
constexpr const char* START_SESSION = "start_session";
constexpr const char* TRY_AGAIN = "try_again";
constexpr const char* NEXT_SENTENCE = "next_sentence";
constexpr const char* COMPLETE_STORY = "complete_story";
constexpr const char* STOP_SESSION = "stop_session";
}

struct ControlPayload {
    std::optional<std::vector<std::string>> storySentences;
    std::string sessionId;
};

/**
 * Outcome of a control call. A failed call leaves the session unchanged and
 * still reports its current state (empty sessionId when there is none).
 */
struct ControlResult {
    bool success = false;
    std::string action;
    std::string error;
    std::optional<ErrorKind> errorKind;

    std::string sessionId;
    std::string currentSentence;
    int currentSentenceIndex = 0;
    int totalSentences = 0;
    PracticeMode practiceMode = PracticeMode::Listening;
    bool isActive = false;
};

// Session state attached to processed frames
struct PracticeSnapshot {
    std::string sessionId;
    PracticeMode mode = PracticeMode::Listening;
    int currentSentenceIndex = 0;
    int totalSentences = 0;
    std::string currentSentence;
    int attemptsOnCurrentSentence = 0;
    int totalAttempts = 0;
    std::optional<AttemptAnalysis> lastAttempt;
};

/**
 * Practice session sequencing for one connection.
 *
 * Listening → Feedback happens on a finished gesture; every other change
 * (retry, advance, complete, stop) happens through control(). The sentence
 * index never decreases and only moves on next_sentence. Never throws.
 */
class PracticeSessionManager {
public:
    explicit PracticeSessionManager(std::shared_ptr<SessionSummarySink> sink = nullptr);
    ~PracticeSessionManager();

    PracticeSessionManager(const PracticeSessionManager&) = delete;
    PracticeSessionManager& operator=(const PracticeSessionManager&) = delete;

    ControlResult start(const std::vector<std::string>& sentences, const std::string& sessionId = "");

    /**
     * Single entry point for every session mutation.
     * Unknown actions and calls without an active session fail without
     * touching any state.
     */
    ControlResult control(const std::string& action, const ControlPayload& payload = {});

    /**
     * Feed a finished gesture. Only acts in Listening mode.
     * @return true if the mode changed to Feedback
     */
    bool onGesture(const GestureEvent& event);

    // End the session (if any) and hand its summary to the sink
    void end(const std::string& reason);

    [[nodiscard]] bool isActive() const { return session_.has_value(); }
    [[nodiscard]] std::optional<PracticeMode> mode() const;
    [[nodiscard]] std::optional<int> currentIndex() const;
    [[nodiscard]] std::optional<PracticeSnapshot> snapshot() const;

private:
    struct Session {
        std::string id;
        std::vector<std::string> sentences;
        int index = 0;
        PracticeMode mode = PracticeMode::Listening;
        int attemptsOnCurrent = 0;
        int totalAttempts = 0;
        int highestIndex = 0;
        bool reachedCompletion = false;
        TimePoint startedAt;
        std::optional<AttemptAnalysis> lastAttempt;
    };

    std::optional<Session> session_;
    std::shared_ptr<SessionSummarySink> sink_;
    uint64_t startedSessions_ = 0;

    [[nodiscard]] ControlResult describe(const std::string& action) const;
    [[nodiscard]] ControlResult failure(const std::string& action, ErrorKind kind, std::string message) const;
    [[nodiscard]] std::string generateId();
};

} // namespace core
