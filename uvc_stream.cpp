#include "uvc_stream.h"

#include <stdio.h>
#include <algorithm>
#include <exception>
#include <utility>

#include "frame_sink.h"
#include "packet_capture.h"

using namespace std;
using namespace std::chrono;

UVCStream::UVCStream(const StreamParams &params, FrameSink *sink)
	: params_(params),
	  sink(sink),
	  owned_frame_allocator(new MallocFrameAllocator(allocator_frame_size(params), params.num_queued_frames)),
	  frame_allocator(owned_frame_allocator.get()),
	  assembler(new FrameAssembler(params, frame_allocator)),
	  last_progress(steady_clock::now())
{
}

UVCStream::~UVCStream()
{
	// Frames still waiting in the sink, and the one the assembler holds,
	// belong to our allocator.
	if (sink != nullptr) {
		sink->close();
		size_t discarded = sink->discard_pending();
		if (discarded > 0) {
			printf("Discarded %zu frames never taken from the sink\n", discarded);
		}
	}
	assembler.reset();
}

void UVCStream::set_frame_allocator(FrameAllocator *allocator)
{
	lock_guard<mutex> lock(stream_lock);
	assembler.reset();
	frame_allocator = allocator;
	assembler.reset(new FrameAssembler(params_, frame_allocator));
}

void UVCStream::set_packet_recorder(PacketRecorder *recorder)
{
	lock_guard<mutex> lock(stream_lock);
	this->recorder = recorder;
}

void UVCStream::process_transfer(const IsoTransferView &xfr)
{
	lock_guard<mutex> lock(stream_lock);
	uint64_t sequence = next_sequence++;
	try {
		process_transfer_locked(xfr, sequence);
	} catch (const exception &e) {
		++counters.processing_errors;
		fprintf(stderr, "Error processing transfer %llu: %s\n", (unsigned long long)sequence, e.what());
	}
}

void UVCStream::process_transfer(const IsoTransferView &xfr, uint64_t sequence)
{
	lock_guard<mutex> lock(stream_lock);
	next_sequence = max(next_sequence, sequence + 1);
	try {
		process_transfer_locked(xfr, sequence);
	} catch (const exception &e) {
		++counters.processing_errors;
		fprintf(stderr, "Error processing transfer %llu: %s\n", (unsigned long long)sequence, e.what());
	}
}

void UVCStream::process_transfer_locked(const IsoTransferView &xfr, uint64_t sequence)
{
	if (recorder != nullptr) {
		record_packets(xfr);
	}

	UrbPayload payload;
	if (!extractor.extract(xfr, sequence, &payload)) {
		++counters.empty_transfers;
	}
	if (!ordering_queue.insert(move(payload))) {
		++counters.duplicate_payloads;
	}
	apply_ready_payloads();
}

void UVCStream::apply_ready_payloads()
{
	vector<UrbPayload> ready;
	if (ordering_queue.drain_ready(&next_expected, &ready) == 0) {
		return;
	}

	vector<AssembledFrame> frames;
	for (const UrbPayload &payload : ready) {
		if (!payload.data.empty()) {
			last_progress = steady_clock::now();
		}
		assembler->consume(payload, &frames);
	}
	for (const AssembledFrame &assembled : frames) {
		deliver_frame(assembled);
	}
}

void UVCStream::deliver_frame(const AssembledFrame &assembled)
{
	CompletedFrame frame;
	frame.frame = RefCountedFrame(assembled.frame);
	frame.format = assembled.format;
	frame.width = params_.width;
	frame.height = params_.height;
	frame.frame_number = ++frame_number;
	frame.timestamp_us = duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();

	const uint8_t *data = assembled.frame.data;
	size_t len = assembled.frame.len;
	ValidationResult result;
	if (is_raw_format(assembled.format)) {
		result = validate_raw_frame(data, len, params_.width, params_.height, raw_stride(params_),
			expected_raw_frame_size(params_), assembled.format, params_.validation_level);
	} else {
		result = validate_mjpeg_frame(data, len, params_.validation_level);
	}
	frame.valid = result.valid;
	if (recorder != nullptr) {
		recorder->count_frame(assembled.format);
	}
	if (!result.valid) {
		++counters.invalid_frames;
		validation_logger.report(result, frame.frame_number);
	}

	// Invalid frames are delivered all the same; the user should see what
	// the camera sent.
	if (sink == nullptr) {
		return;
	}
	if (sink->try_send(move(frame))) {
		++counters.frames_sent;
	} else {
		++counters.sink_drops;
	}
}

void UVCStream::record_packets(const IsoTransferView &xfr)
{
	size_t offset = 0;
	for (unsigned i = 0; i < xfr.num_packets; ++i) {
		const IsoPacketDesc &pack = xfr.packets[i];
		if (pack.status == PACKET_COMPLETED && pack.actual_length > 0) {
			recorder->record(xfr.buffer + offset, min(pack.actual_length, pack.length), xfr.endpoint);
		}
		offset += pack.length;
	}
}

bool UVCStream::is_stalled(milliseconds timeout) const
{
	lock_guard<mutex> lock(stream_lock);
	return steady_clock::now() - last_progress > timeout;
}

uint64_t UVCStream::skip_sequence_gap()
{
	lock_guard<mutex> lock(stream_lock);
	uint64_t old_next_expected = next_expected;
	uint64_t skipped = ordering_queue.skip_gap(&next_expected);
	if (skipped == 0) {
		return 0;
	}
	counters.skipped_sequences += skipped;
	fprintf(stderr, "Giving up on transfers %llu..%llu, continuing from %llu\n",
		(unsigned long long)old_next_expected, (unsigned long long)(next_expected - 1),
		(unsigned long long)next_expected);

	// Whatever frame was in progress is missing bytes now.
	assembler->reset(false);
	try {
		apply_ready_payloads();
	} catch (const exception &e) {
		++counters.processing_errors;
		fprintf(stderr, "Error processing transfers after gap: %s\n", e.what());
	}
	return skipped;
}

void UVCStream::reset()
{
	lock_guard<mutex> lock(stream_lock);
	ordering_queue.clear();
	next_sequence = next_expected = 0;
	assembler->reset(true);
	last_progress = steady_clock::now();
}

StreamStats UVCStream::stats() const
{
	lock_guard<mutex> lock(stream_lock);
	StreamStats stats = counters;
	stats.extractor = extractor.stats();
	stats.assembler = assembler->stats();
	stats.stale_payloads = ordering_queue.dropped_stale();
	stats.pending_payloads = ordering_queue.size();
	stats.next_expected_sequence = next_expected;
	stats.format_known = assembler->format_known();
	stats.format = assembler->format();
	return stats;
}
