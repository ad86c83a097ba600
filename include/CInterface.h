/**
 * @file CInterface.h
 * @brief C-compatible API layer over the playback engine.
 *
 * Lets hosts written in other languages (Swift, C#, Python via ctypes) drive
 * the engine. Every call blocks until the engine thread has replied. Failures
 * return a negative DeckErrorCode; deck_error_message() then describes the
 * most recent failure on the calling thread.
 */

#ifndef DECK_C_INTERFACE_H
#define DECK_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum DeckErrorCode {
    DECK_OK = 0,
    DECK_ERROR_NOT_FOUND = -1,
    DECK_ERROR_DEVICE = -2,
    DECK_ERROR_DECODE = -3,
    DECK_ERROR_INVALID_ARGUMENT = -4,
    DECK_ERROR_UNINITIALIZED_OUTPUT = -5,
    DECK_ERROR_DISCONNECTED = -6,
    DECK_ERROR_INTERNAL = -7
};

// Snapshot of one player. Strings are NUL-terminated and truncated to fit.
typedef struct DeckPlayerState {
    uint64_t player_id;
    char device_id[64];
    char file_name[256];
    int has_audio;
    int is_playing;
    int is_paused;
    int is_empty;
} DeckPlayerState;

// Opaque handle type
typedef void* DeckEngineHandle;

/**
 * @brief Start an engine thread.
 * @param config_json EngineConfig as JSON, or NULL for defaults.
 * @return NULL if the config is malformed or the audio host is unavailable.
 */
DeckEngineHandle deck_engine_create(const char* config_json);
void deck_engine_destroy(DeckEngineHandle handle);

/**
 * @brief Write the device list as a JSON array of {"id","name"} objects.
 * @param required_size Receives strlen(json) + 1; may be NULL.
 * @return DECK_ERROR_INVALID_ARGUMENT if `buffer` is too small (nothing written).
 */
int deck_list_output_devices_json(DeckEngineHandle handle, char* buffer, size_t buffer_size, size_t* required_size);

int deck_create_player(DeckEngineHandle handle, uint64_t* player_id);
int deck_destroy_player(DeckEngineHandle handle, uint64_t player_id);
int deck_set_player_device(DeckEngineHandle handle, uint64_t player_id, const char* device_id, DeckPlayerState* state);
int deck_load_asset(DeckEngineHandle handle, uint64_t player_id,
                    const uint8_t* bytes, size_t size, const char* name,
                    DeckPlayerState* state);
int deck_toggle_playback(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state);
int deck_stop(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state);
int deck_get_state(DeckEngineHandle handle, uint64_t player_id, DeckPlayerState* state);

/**
 * @brief Queue interleaved float PCM for immediate playback.
 * @param count Number of samples (frames * channels).
 */
int deck_play_raw_pcm(DeckEngineHandle handle, uint64_t player_id,
                      uint32_t sample_rate, uint16_t channels,
                      const float* samples, size_t count,
                      DeckPlayerState* state);

/**
 * @brief Message for the last failure on this thread; "" if none.
 */
const char* deck_error_message(void);

#ifdef __cplusplus
}
#endif

#endif // DECK_C_INTERFACE_H
