#pragma once

#include "errors.h"
#include <string>
#include <variant>

namespace voxlink {

// Control messages carried as JSON text frames
struct StartMsg {};                               ///< client -> server: {"start":true}
struct EndMsg {};                                 ///< client -> server: {"end":true}
struct UserTranscriptionMsg { std::string text; };///< server -> client
struct AssistantTextMsg { std::string text; };    ///< server -> client
struct EndOfTurnMsg {};                           ///< server -> client: {"end":true}

using ControlMessage = std::variant<StartMsg, EndMsg, UserTranscriptionMsg,
                                    AssistantTextMsg, EndOfTurnMsg>;

/**
 * @brief Who sent the text frame being parsed.
 *
 * {"end":true} means "stop recording" from the client and "turn complete"
 * from the server; only the direction tells them apart.
 */
enum class Direction {
    ClientToServer,
    ServerToClient
};

/**
 * @brief JSON codec for control messages.
 *
 * A valid message is a JSON object with exactly one recognized key whose
 * value has the expected type ("start"/"end" must be true).
 */
class ControlChannel {
public:
    static Result<ControlMessage> parse(const std::string& text, Direction direction);

    static std::string serialize(const ControlMessage& message);

    /// Short name for logs ("start", "end", "user_transcription", ...)
    static const char* kind_name(const ControlMessage& message);
};

} // namespace voxlink
