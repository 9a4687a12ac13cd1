#include <stemdeck/playback_context.hh>
#include <stemdeck/fan_out.hh>
#include <failsafe/failsafe.hh>

namespace stemdeck {

    void release_channels(std::vector<channel_slot>& slots, const char* reason) {
        std::vector<channel_slot*> loaded;
        for (auto& slot : slots) {
            if (slot.usable && slot.handle) {
                loaded.push_back(&slot);
            }
        }
        if (loaded.empty()) {
            return;
        }
        auto results = fan_out(loaded, [](channel_slot* slot) {
            slot->handle->unload();
        });
        for (const auto& r : results) {
            if (!r.ok) {
                LOG_WARN("playback_context", "unload of", loaded[r.index]->source.id, "failed:", r.error);
            }
            loaded[r.index]->usable = false;
        }
        LOG_DEBUG("playback_context", "released", loaded.size(), "channels,", reason);
    }

    playback_context::playback_context(song s, std::vector<channel_slot> slots, std::uint64_t generation)
        : m_song(std::move(s)),
          m_slots(std::move(slots)),
          m_generation(generation) {
        for (const auto& slot : m_slots) {
            if (slot.usable) {
                m_state.loaded_track_ids.insert(slot.source.id);
            }
            m_state.active_track_ids.insert(slot.source.id);
        }
    }

    playback_context::~playback_context() {
        release_channels(m_slots, "song switched");
    }

    channel_slot* playback_context::find(const std::string& track_id) {
        for (auto& slot : m_slots) {
            if (slot.source.id == track_id) {
                return &slot;
            }
        }
        return nullptr;
    }

    const channel_slot* playback_context::find(const std::string& track_id) const {
        for (const auto& slot : m_slots) {
            if (slot.source.id == track_id) {
                return &slot;
            }
        }
        return nullptr;
    }

    std::vector<channel_slot*> playback_context::usable_slots() {
        std::vector<channel_slot*> out;
        for (auto& slot : m_slots) {
            if (slot.usable) {
                out.push_back(&slot);
            }
        }
        return out;
    }

    std::vector<channel_slot*> playback_context::active_slots() {
        std::vector<channel_slot*> out;
        for (auto& slot : m_slots) {
            if (slot.usable && m_state.active_track_ids.count(slot.source.id) > 0) {
                out.push_back(&slot);
            }
        }
        return out;
    }

} // namespace stemdeck
