#ifndef LAUNCHERCORE_H
#define LAUNCHERCORE_H

#include <QMetaType>
#include <QString>

#define SLC_VERSION "2.0.0"

namespace slc {

// Install progress relayed from the mirroring tool's output streams.
// Idle is the transient reset that follows a success or a failure.
enum class SessionStatus {
    Idle,
    Installing,
    InstallSuccess,
    InstallFailure
};

// Error taxonomy. Only ToolNotFound and ToolCrash travel through
// MirrorSessionManager::sessionError(). Timeouts stay inside BridgeClient as
// ToolResult::Timeout and end up as missing data; a busy serial is reported
// through MirrorSessionManager::sessionBusy().
enum class ToolError {
    ToolNotFound,   // bridge or mirror executable absent / failed to start
    ToolTimeout,    // subprocess exceeded its timeout
    ToolCrash,      // crash exit or non-zero exit of a mirror session
    SessionBusy     // launch requested for a serial with a live session
};

// Outcome of a single synchronous tool invocation
enum class ToolResult {
    Success,
    NotFound,
    Timeout,
    Failed
};

inline const char* sessionStatusName(SessionStatus status)
{
    switch (status) {
    case SessionStatus::Idle: return "Idle";
    case SessionStatus::Installing: return "Installing";
    case SessionStatus::InstallSuccess: return "InstallSuccess";
    case SessionStatus::InstallFailure: return "InstallFailure";
    }
    return "Unknown";
}

inline const char* toolErrorName(ToolError error)
{
    switch (error) {
    case ToolError::ToolNotFound: return "ToolNotFound";
    case ToolError::ToolTimeout: return "ToolTimeout";
    case ToolError::ToolCrash: return "ToolCrash";
    case ToolError::SessionBusy: return "SessionBusy";
    }
    return "Unknown";
}

} // namespace slc

Q_DECLARE_METATYPE(slc::SessionStatus)
Q_DECLARE_METATYPE(slc::ToolError)

#endif // LAUNCHERCORE_H
