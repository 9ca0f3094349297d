#include "realtime/transcript_buffer.h"
#include "utils.h"

namespace rtvoice {
namespace realtime {

TranscriptBuffer::Track& TranscriptBuffer::track(Speaker speaker) {
    return speaker == Speaker::User ? user_ : assistant_;
}

const TranscriptBuffer::Track& TranscriptBuffer::track(Speaker speaker) const {
    return speaker == Speaker::User ? user_ : assistant_;
}

std::string TranscriptBuffer::resolve_id(Speaker speaker, const std::string& item_id) const {
    if (!item_id.empty()) {
        return item_id;
    }
    const Track& t = track(speaker);
    if (!t.active_id.empty()) {
        return t.active_id;
    }
    return speaker == Speaker::User ? kUserDefaultId : kAssistantDefaultId;
}

std::string TranscriptBuffer::append(Speaker speaker, const std::string& item_id, const std::string& delta) {
    std::string id = resolve_id(speaker, item_id);
    Track& t = track(speaker);
    if (t.active_id != id) {
        t.buffers.clear();
        t.active_id = id;
    }
    t.buffers[id] += delta;
    return id;
}

std::optional<ConversationMessage> TranscriptBuffer::finalize(Speaker speaker,
                                                              const std::string& item_id,
                                                              const std::string& transcript) {
    std::string id = resolve_id(speaker, item_id);
    Track& t = track(speaker);

    std::string text = transcript;
    if (text.empty()) {
        auto it = t.buffers.find(id);
        if (it != t.buffers.end()) {
            text = it->second;
        }
    }

    t.buffers.erase(id);
    if (t.active_id == id) {
        t.active_id.clear();
    }

    if (utils::is_empty_or_whitespace(text)) {
        return std::nullopt;
    }

    ConversationMessage message;
    message.id = utils::random_id();
    message.role = speaker;
    message.content = text;
    message.created_at = utils::iso_timestamp_now();
    return message;
}

void TranscriptBuffer::reset(Speaker speaker) {
    Track& t = track(speaker);
    t.buffers.clear();
    t.active_id.clear();
}

void TranscriptBuffer::clear() {
    reset(Speaker::User);
    reset(Speaker::Assistant);
}

std::string TranscriptBuffer::live_text(Speaker speaker) const {
    const Track& t = track(speaker);
    if (t.active_id.empty()) {
        return "";
    }
    auto it = t.buffers.find(t.active_id);
    return it != t.buffers.end() ? it->second : "";
}

std::string TranscriptBuffer::active_item(Speaker speaker) const {
    return track(speaker).active_id;
}

} // namespace realtime
} // namespace rtvoice
