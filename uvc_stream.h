#ifndef _UVC_STREAM_H
#define _UVC_STREAM_H 1

// The assembly context for one video stream: everything between a completed
// isochronous transfer and a frame in the sink. All transfer completions for
// the stream go through process_transfer(), which takes one lock for the
// whole of extraction, reordering, assembly and validation, so there is
// exactly one writer of the assembly state at any time.
//
// The stream never skips a missing sequence number by itself; a supervisor
// that decides the transfer is gone for good calls skip_sequence_gap()
// (or tears the stream down and calls reset()).

#include <stdint.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "frame_allocator.h"
#include "frame_assembler.h"
#include "frame_validator.h"
#include "ordering_queue.h"
#include "payload_extractor.h"
#include "stream_params.h"
#include "video_frame.h"

class FrameSink;
class PacketRecorder;

struct StreamStats {
	ExtractorStats extractor;
	AssemblerStats assembler;

	uint64_t empty_transfers = 0;
	uint64_t duplicate_payloads = 0;
	uint64_t stale_payloads = 0;
	uint64_t skipped_sequences = 0;
	uint64_t processing_errors = 0;

	uint64_t invalid_frames = 0;
	uint64_t frames_sent = 0;
	uint64_t sink_drops = 0;

	size_t pending_payloads = 0;
	uint64_t next_expected_sequence = 0;

	bool format_known = false;
	FrameFormat format = FRAME_FORMAT_YUY2;
};

class UVCStream {
public:
	// Frames go to <sink>, which can be nullptr (frames are then validated
	// and released right away). Does not take ownership of <sink>.
	//
	// The destructor closes the sink and releases whatever is still queued
	// there, since those frames point back to the stream's allocator.
	// Frames already received from the sink must be released before the
	// stream is destroyed.
	UVCStream(const StreamParams &params, FrameSink *sink);
	~UVCStream();

	// Replaces the default allocator. Must be called before the first
	// transfer. Does not take ownership.
	void set_frame_allocator(FrameAllocator *allocator);
	FrameAllocator *get_frame_allocator() { return frame_allocator; }

	// Every packet (headers included) is written to <recorder> before
	// processing, and every completed frame is counted there.
	// nullptr turns recording off.
	void set_packet_recorder(PacketRecorder *recorder);

	// Called once per completed transfer, from the USB thread. The sequence
	// number is taken from the stream's own counter, under the stream lock.
	void process_transfer(const IsoTransferView &xfr);

	// Same, with a sequence number from the caller (which must then supply
	// every sequence number from 0 up, in whatever order).
	void process_transfer(const IsoTransferView &xfr, uint64_t sequence);

	// True if no payload has been applied in the last <timeout>.
	bool is_stalled(std::chrono::milliseconds timeout) const;

	// Gives up on any missing sequence numbers below the lowest queued one,
	// and applies what then becomes ready. Returns the number skipped.
	uint64_t skip_sequence_gap();

	// Back to the state of a fresh stream: queues emptied, sequence counters
	// at zero, partial frame dropped, format (unless preset) undetected.
	// Counters in stats() are kept.
	void reset();

	StreamStats stats() const;
	const StreamParams &params() const { return params_; }

private:
	void process_transfer_locked(const IsoTransferView &xfr, uint64_t sequence);
	void apply_ready_payloads();
	void deliver_frame(const AssembledFrame &assembled);
	void record_packets(const IsoTransferView &xfr);

	const StreamParams params_;
	FrameSink *sink;

	std::unique_ptr<FrameAllocator> owned_frame_allocator;
	FrameAllocator *frame_allocator;

	mutable std::mutex stream_lock;
	PacketRecorder *recorder = nullptr;  // Under stream_lock.
	PayloadExtractor extractor;  // Under stream_lock.
	OrderingQueue ordering_queue;  // Under stream_lock.
	std::unique_ptr<FrameAssembler> assembler;  // Under stream_lock.
	ValidationLogger validation_logger;  // Under stream_lock.
	uint64_t next_sequence = 0, next_expected = 0;  // Under stream_lock.
	uint64_t frame_number = 0;  // Under stream_lock.
	std::chrono::steady_clock::time_point last_progress;  // Under stream_lock.
	StreamStats counters;  // Under stream_lock; the plain counters only.
};

#endif  // !defined(_UVC_STREAM_H)
