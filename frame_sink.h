#ifndef _FRAME_SINK_H
#define _FRAME_SINK_H 1

// A bounded queue of completed frames between the USB thread and whoever
// consumes them (conversion, display, the muxer). Sending never blocks;
// if the consumer falls behind, new frames are dropped instead of stalling
// the transfer callbacks.

#include <stddef.h>
#include <stdint.h>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "video_frame.h"

class FrameSink {
public:
	explicit FrameSink(size_t capacity);

	// Returns false (and drops the frame, releasing it back to its allocator
	// once nobody else holds it) if the queue is full or closed.
	bool try_send(CompletedFrame frame);

	// Waits up to <timeout_ms> milliseconds for a frame (-1 = forever).
	// Returns false on timeout, or if the sink is closed and empty.
	bool receive(CompletedFrame *frame, int timeout_ms);

	// Wakes up all receivers; frames already queued can still be received.
	void close();

	// Releases every queued frame without delivering it. Returns how many.
	size_t discard_pending();

	size_t size() const;
	size_t capacity() const { return capacity_; }
	uint64_t sent_frames() const;
	uint64_t dropped_frames() const;

private:
	const size_t capacity_;

	mutable std::mutex queue_lock;
	std::condition_variable queue_not_empty;
	std::deque<CompletedFrame> pending_frames;  // Under queue_lock.
	bool closed_ = false;  // Under queue_lock.
	uint64_t num_sent = 0, num_dropped = 0;  // Under queue_lock.
};

#endif  // !defined(_FRAME_SINK_H)
