#ifndef SNOOKERIZER_FFI_H
#define SNOOKERIZER_FFI_H

#if defined(_WIN32)
#define EXPORT __declspec(dllexport)
#else
#define EXPORT __attribute__((visibility("default"))) __attribute__((used))
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Creates an analysis session and returns an opaque handle, or null on failure.
// config_path may be null or empty for defaults; model_path, when set, overrides the
// configured detection model.
EXPORT void* create_session(const char* config_path, const char* model_path);

// Runs one BGRA (channel_format 0) or RGBA (channel_format 1) frame through the session.
// Returns the frame analysis as JSON, or {"error": ...}. Every returned string belongs to the
// calling thread and stays valid until that thread next calls the same function. Calls on
// one handle must not overlap; separate handles may be driven from separate threads.
EXPORT const char* process_frame_bgra(void* session, const unsigned char* image_bytes, int width,
                                      int height, int stride, int frame_number, double timestamp,
                                      int channel_format);

EXPORT const char* get_latest_analysis(void* session);

EXPORT const char* get_calibration(void* session);

// Base64 PNG of the latest annotated frame (top_down != 0 for the table view).
// Requires debug_mode in the session configuration.
EXPORT const char* export_annotated_frame_bgra(void* session, int top_down);

EXPORT void release_session(void* session);

#ifdef __cplusplus
}
#endif

#endif  // SNOOKERIZER_FFI_H
