#pragma once

#include "common.h"
#include <map>
#include <optional>
#include <string>

namespace rtvoice {
namespace realtime {

/**
 * @brief Finalized conversation turn
 */
struct ConversationMessage {
    std::string id;
    Speaker role = Speaker::User;
    std::string content;
    std::string created_at;  ///< ISO-8601 UTC
};

/**
 * @brief Per-speaker accumulator for streamed transcript deltas
 *
 * Each speaker has at most one active utterance. A delta for a different item
 * supersedes the active one, whose partial text is discarded. When upstream
 * omits the item id, the active id is used, then a fixed per-speaker id.
 *
 * Not thread-safe; the owning session serializes access.
 */
class TranscriptBuffer {
public:
    static constexpr const char* kUserDefaultId = "user-default";
    static constexpr const char* kAssistantDefaultId = "assistant-default";

    /**
     * @brief Append a delta
     * @return The item id the delta was applied to
     */
    std::string append(Speaker speaker, const std::string& item_id, const std::string& delta);

    /**
     * @brief Close the utterance
     *
     * The text is transcript when non-empty, else the accumulated deltas.
     * @return The finalized message, or nullopt when the text is blank
     */
    std::optional<ConversationMessage> finalize(Speaker speaker,
                                                const std::string& item_id,
                                                const std::string& transcript);

    /**
     * @brief Drop the speaker's partial text (barge-in)
     */
    void reset(Speaker speaker);

    /// Both speakers
    void clear();

    /// Accumulated text of the speaker's active utterance
    std::string live_text(Speaker speaker) const;

    std::string active_item(Speaker speaker) const;

private:
    struct Track {
        std::string active_id;
        std::map<std::string, std::string> buffers;
    };

    Track& track(Speaker speaker);
    const Track& track(Speaker speaker) const;
    std::string resolve_id(Speaker speaker, const std::string& item_id) const;

    Track user_;
    Track assistant_;
};

} // namespace realtime
} // namespace rtvoice
