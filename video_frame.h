#ifndef _VIDEO_FRAME_H
#define _VIDEO_FRAME_H 1

#include <stdint.h>

#include "ref_counted_frame.h"

enum FrameFormat {
	FRAME_FORMAT_MJPEG,
	FRAME_FORMAT_YUY2,
	FRAME_FORMAT_UYVY,
};

const char *frame_format_name(FrameFormat format);

inline bool is_raw_format(FrameFormat format)
{
	return format != FRAME_FORMAT_MJPEG;
}

// A finished frame on its way to the conversion/display stage.
// The bytes are frame->data[0 .. frame->len).
struct CompletedFrame {
	RefCountedFrame frame;
	FrameFormat format = FRAME_FORMAT_YUY2;
	unsigned width = 0, height = 0;
	uint64_t frame_number = 0;
	int64_t timestamp_us = 0;  // Steady clock, when the frame was completed.

	// Result of validation. Invalid frames are delivered all the same.
	bool valid = true;
};

#endif  // !defined(_VIDEO_FRAME_H)
