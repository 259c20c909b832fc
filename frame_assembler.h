#ifndef _FRAME_ASSEMBLER_H
#define _FRAME_ASSEMBLER_H 1

// Grows frames out of in-order payloads and decides where one frame ends
// and the next begins.
//
// MJPEG: a frame ends at a packet with the EOF header bit set, provided the
// accumulated bytes start with a JPEG start-of-image marker and end with an
// end-of-image marker. The FID bit is tracked, but only as a second opinion;
// many devices toggle it one frame late.
//
// Raw (YUY2/UYVY): headers are not to be trusted on these cameras (FID in
// particular toggles mid-frame on some), so a frame ends when exactly
// width * height * 2 bytes have been collected. Bytes past that point are
// the start of the next frame and are carried over into it; throwing them
// away would shift every following frame.
//
// Not thread-safe; UVCStream serializes access.

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "frame_allocator.h"
#include "payload_extractor.h"
#include "stream_params.h"
#include "video_frame.h"

struct AssembledFrame {
	FrameAllocator::Frame frame;  // Owned by the receiver; give it back to frame.owner.
	FrameFormat format;
};

struct AssemblerStats {
	uint64_t frames_completed = 0;
	uint64_t frames_dropped = 0;  // Allocator overrun or overflow.
	uint64_t incomplete_frames = 0;  // MJPEG frames without proper markers.
	uint64_t error_resyncs = 0;  // MJPEG frames thrown away on a packet error.
	uint64_t fid_toggles = 0;
	uint64_t fid_unconfirmed = 0;  // EOF boundaries not followed by an FID toggle.
	uint64_t unsynced_bytes = 0;  // Skipped while waiting for a start of frame.
	uint64_t uvc_errors = 0;  // Packets dropped for the ERR header bit.
	uint64_t zero_filled_payloads = 0;
};

class FrameAssembler {
public:
	// Does not take ownership of <allocator>.
	FrameAssembler(const StreamParams &params, FrameAllocator *allocator);
	~FrameAssembler();

	// Applies one payload, which must be the next in sequence.
	// Completed frames are appended to <out>.
	//
	// Header-like bytes at the start of a packet are stripped, except once
	// the stream is known to be raw and params.raw_header_mode is
	// RAW_HEADERS_SKIP; then they are pixel data, and their flags mean
	// nothing. Until the format is known, they are stripped.
	void consume(const UrbPayload &payload, std::vector<AssembledFrame> *out);

	// Drops the frame in progress and starts over waiting for a frame start.
	// The detected format is kept unless <forget_format> is set (and the
	// format was not given up front).
	void reset(bool forget_format);

	bool format_known() const { return format_known_; }
	bool is_mjpeg() const { return format_known_ && format_ == FRAME_FORMAT_MJPEG; }
	bool is_raw() const { return format_known_ && format_ != FRAME_FORMAT_MJPEG; }
	FrameFormat format() const { return format_; }
	bool synced() const { return synced_; }
	bool keeps_headers() const { return is_raw() && params.raw_header_mode == RAW_HEADERS_SKIP; }
	int last_frame_id() const { return last_frame_id_; }  // -1 if none seen yet.

	size_t buffered_bytes() const { return current_frame.len; }
	size_t expected_frame_size() const { return expected_frame_size_; }

	const AssemblerStats &stats() const { return stats_; }

private:
	void detect_format(const uint8_t *start, size_t len);
	void consume_mjpeg_packet(const PacketMeta &meta, const uint8_t *start, std::vector<AssembledFrame> *out);
	void consume_raw_packet(const PacketMeta &meta, const uint8_t *start, std::vector<AssembledFrame> *out);
	void handle_packet_error();
	void track_frame_id(const PacketMeta &meta);
	void finish_mjpeg_frame(std::vector<AssembledFrame> *out);
	void complete_raw_frame(std::vector<AssembledFrame> *out);

	void add_to_frame(const uint8_t *start, size_t len);
	void emit_frame(const char *trigger, std::vector<AssembledFrame> *out);
	void drop_frame();
	void start_new_frame();

	StreamParams params;
	FrameAllocator *allocator;
	FrameAllocator::Frame current_frame;

	size_t expected_frame_size_;
	bool format_known_ = false;
	FrameFormat format_ = FRAME_FORMAT_YUY2;
	bool synced_ = false;
	int last_frame_id_ = -1;
	bool fid_check_pending = false;

	// The first two payload bytes of the stream, for format detection.
	uint8_t first_bytes[2];
	unsigned num_first_bytes = 0;

	AssemblerStats stats_;
};

#endif  // !defined(_FRAME_ASSEMBLER_H)
