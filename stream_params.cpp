#include "stream_params.h"

#include <algorithm>

using namespace std;

size_t expected_raw_frame_size(const StreamParams &params)
{
	return size_t(params.width) * params.height * RAW_BYTES_PER_PIXEL;
}

unsigned raw_stride(const StreamParams &params)
{
	return params.stride != 0 ? params.stride : params.width * RAW_BYTES_PER_PIXEL;
}

size_t allocator_frame_size(const StreamParams &params)
{
	size_t raw_size = expected_raw_frame_size(params);
	switch (params.format) {
	case STREAM_FORMAT_YUY2:
	case STREAM_FORMAT_UYVY:
		return raw_size;
	case STREAM_FORMAT_MJPEG:
		return params.max_mjpeg_frame_size;
	case STREAM_FORMAT_AUTO:
		break;
	}
	return max(raw_size, params.max_mjpeg_frame_size);
}

bool parse_stream_format(const string &name, StreamFormat *format)
{
	if (name == "auto") {
		*format = STREAM_FORMAT_AUTO;
	} else if (name == "mjpeg" || name == "mjpg") {
		*format = STREAM_FORMAT_MJPEG;
	} else if (name == "yuy2" || name == "yuyv") {
		*format = STREAM_FORMAT_YUY2;
	} else if (name == "uyvy") {
		*format = STREAM_FORMAT_UYVY;
	} else {
		return false;
	}
	return true;
}

const char *stream_format_name(StreamFormat format)
{
	switch (format) {
	case STREAM_FORMAT_AUTO:
		return "auto";
	case STREAM_FORMAT_MJPEG:
		return "mjpeg";
	case STREAM_FORMAT_YUY2:
		return "yuy2";
	case STREAM_FORMAT_UYVY:
		return "uyvy";
	}
	return "unknown";
}

const char *frame_format_name(FrameFormat format)
{
	switch (format) {
	case FRAME_FORMAT_MJPEG:
		return "MJPEG";
	case FRAME_FORMAT_YUY2:
		return "YUY2";
	case FRAME_FORMAT_UYVY:
		return "UYVY";
	}
	return "unknown";
}

bool parse_raw_header_mode(const string &name, RawHeaderMode *mode)
{
	if (name == "skip") {
		*mode = RAW_HEADERS_SKIP;
	} else if (name == "strip") {
		*mode = RAW_HEADERS_STRIP;
	} else {
		return false;
	}
	return true;
}

const char *raw_header_mode_name(RawHeaderMode mode)
{
	return mode == RAW_HEADERS_SKIP ? "skip" : "strip";
}
