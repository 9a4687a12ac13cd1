#ifndef STEMDECK_BACKENDS_SDL3_BACKEND_HH
#define STEMDECK_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Export macro for shared library builds
#ifdef STEMDECK_BACKEND_SDL3_SHARED
    #ifdef _WIN32
        #ifdef STEMDECK_BACKEND_SDL3_EXPORTS
            #define STEMDECK_BACKEND_SDL3_EXPORT __declspec(dllexport)
        #else
            #define STEMDECK_BACKEND_SDL3_EXPORT __declspec(dllimport)
        #endif
    #else
        #define STEMDECK_BACKEND_SDL3_EXPORT __attribute__((visibility("default")))
    #endif
#else
    #define STEMDECK_BACKEND_SDL3_EXPORT
#endif

// Public factory header for the SDL3 channel backend

namespace stemdeck {

class channel_factory;

/**
 * Create a channel factory playing WAV stems through SDL3.
 *
 * Every channel decodes its stem with SDL_LoadWAV and owns one audio
 * stream bound to the default playback device, so each stem has its own
 * gain, frequency ratio and pause state.
 *
 * @return New SDL3 channel factory; the SDL audio subsystem stays
 *         initialized while the factory lives
 * @throws channel_error if the SDL audio subsystem cannot be initialized
 *
 * Example usage:
 * @code
 * auto factory = stemdeck::create_sdl3_channel_factory();
 * auto ch = factory->create();
 * ch->load("stems/bass.wav");
 * ch->play();
 * @endcode
 */
STEMDECK_BACKEND_SDL3_EXPORT std::shared_ptr<channel_factory> create_sdl3_channel_factory();

} // namespace stemdeck

#endif // STEMDECK_BACKENDS_SDL3_BACKEND_HH
