#ifndef _STREAM_PARAMS_H
#define _STREAM_PARAMS_H 1

// Everything the core needs to know about a stream, as negotiated by whoever
// set up the device.

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "defs.h"
#include "frame_validator.h"
#include "video_frame.h"

enum StreamFormat {
	STREAM_FORMAT_AUTO,  // Decide from the first payload.
	STREAM_FORMAT_MJPEG,
	STREAM_FORMAT_YUY2,
	STREAM_FORMAT_UYVY,
};

// What to do about payload headers once a stream is known to be raw.
enum RawHeaderMode {
	// Take every byte as payload. Raw pixel data too easily looks like a
	// header to the relaxed check, and a wrongly stripped header shifts
	// every following row.
	RAW_HEADERS_SKIP,

	// Keep parsing (and stripping) a header at the start of every packet,
	// for cameras that follow the standard.
	RAW_HEADERS_STRIP,
};

struct StreamParams {
	uint8_t endpoint = 0x81;
	unsigned width = 640, height = 480;
	unsigned stride = 0;  // Bytes per row for raw formats; 0 = width * 2.
	StreamFormat format = STREAM_FORMAT_AUTO;
	unsigned max_packet_size = 0;  // 0 = ask the endpoint descriptor.
	unsigned packets_per_transfer = PACKETS_PER_TRANSFER;
	unsigned num_transfers = NUM_ISO_TRANSFERS;

	ValidationLevel validation_level = VALIDATION_STRICT;
	RawHeaderMode raw_header_mode = RAW_HEADERS_SKIP;

	size_t num_queued_frames = NUM_QUEUED_FRAMES;
	size_t max_mjpeg_frame_size = MAX_MJPEG_FRAME_SIZE;
};

// width * height * 2; the size at which a raw frame is complete.
size_t expected_raw_frame_size(const StreamParams &params);
unsigned raw_stride(const StreamParams &params);

// Size for each frame the default allocator hands out.
size_t allocator_frame_size(const StreamParams &params);

bool parse_stream_format(const std::string &name, StreamFormat *format);
const char *stream_format_name(StreamFormat format);

bool parse_raw_header_mode(const std::string &name, RawHeaderMode *mode);
const char *raw_header_mode_name(RawHeaderMode mode);

#endif  // !defined(_STREAM_PARAMS_H)
