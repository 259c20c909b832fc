#ifndef _DEFS_H
#define _DEFS_H

// Streaming defaults. Most of these can be overridden through StreamParams.
#define NUM_ISO_TRANSFERS 4
#define PACKETS_PER_TRANSFER 32
#define EVENT_TIMEOUT_MS 100

// 4:2:2 raw formats (YUY2/UYVY).
#define RAW_BYTES_PER_PIXEL 2

// Largest width or height a capture's metadata may claim.
#define MAX_FRAME_DIMENSION 16384

// Big enough for any MJPEG frame we have seen from these cameras.
#define MAX_MJPEG_FRAME_SIZE (8 << 20)

// Frames the default allocator keeps around, and frames that can wait in the
// sink before new ones are dropped.
#define NUM_QUEUED_FRAMES 8
#define DEFAULT_SINK_CAPACITY 4

// How far into a finished MJPEG buffer we look for a start-of-image marker
// if it does not start with one.
#define MJPEG_SOI_SEARCH_LIMIT 100

// Rate limiting for hot-path diagnostics: log the first LOG_FIRST_N
// occurrences, then every LOG_EVERY_N-th.
#define LOG_FIRST_N 10
#define LOG_EVERY_N 100

// Number of frames at stream start whose boundary trigger we always log.
#define LOG_BOUNDARY_FRAMES 5

// Capture records longer than this are taken as file corruption.
#define MAX_CAPTURE_RECORD_SIZE (1 << 20)

#define VALIDATION_ENV_VAR "UVCSCOPE_FRAME_VALIDATION"

#define DEFAULT_OUTPUT_MUX_NAME "nut"

#endif  // !defined(_DEFS_H)
