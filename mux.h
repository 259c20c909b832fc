#ifndef _MUX_H
#define _MUX_H 1

// Wrapper around an AVFormat mux, writing completed camera frames to a file
// as they are, without re-encoding: MJPEG frames become mjpeg packets, raw
// frames rawvideo packets.

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
}

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>

#include "video_frame.h"

class Mux {
public:
	// Opens <filename> for writing with the given muxer (e.g. "nut", "avi",
	// "matroska"), and writes the header. Returns nullptr (and logs why)
	// on failure.
	static std::unique_ptr<Mux> open(const std::string &filename, const std::string &mux_name,
	                                 unsigned width, unsigned height, FrameFormat format);

	~Mux();

	// <timestamp_us> is in microseconds; the first frame written becomes pts 0.
	// Returns false on a write error.
	bool add_frame(const uint8_t *data, size_t len, int64_t timestamp_us);

	uint64_t frames_written() const { return num_frames; }

private:
	// Takes ownership of avctx.
	Mux(AVFormatContext *avctx, AVStream *avstream_video);

	std::mutex ctx_mu;
	AVFormatContext *avctx;  // Protected by <ctx_mu>.
	AVStream *avstream_video;
	bool has_first_timestamp = false;
	int64_t first_timestamp_us = 0, last_pts = -1;
	uint64_t num_frames = 0;
};

#endif  // !defined(_MUX_H)
