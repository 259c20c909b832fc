#include "frame_sink.h"

#include <stdio.h>
#include <chrono>
#include <utility>

#include "defs.h"

using namespace std;

FrameSink::FrameSink(size_t capacity)
	: capacity_(capacity)
{
}

bool FrameSink::try_send(CompletedFrame frame)
{
	{
		unique_lock<mutex> lock(queue_lock);
		if (closed_) {
			return false;
		}
		if (pending_frames.size() >= capacity_) {
			++num_dropped;
			if (num_dropped <= LOG_FIRST_N || num_dropped % LOG_EVERY_N == 0) {
				fprintf(stderr, "Frame sink full (%zu frames queued), dropping frame %llu (%llu dropped so far)\n",
					pending_frames.size(), (unsigned long long)frame.frame_number,
					(unsigned long long)num_dropped);
			}
			return false;
		}
		pending_frames.push_back(move(frame));
		++num_sent;
	}
	queue_not_empty.notify_one();  // might be spurious
	return true;
}

bool FrameSink::receive(CompletedFrame *frame, int timeout_ms)
{
	unique_lock<mutex> lock(queue_lock);
	auto ready = [this]{ return !pending_frames.empty() || closed_; };
	if (timeout_ms < 0) {
		queue_not_empty.wait(lock, ready);
	} else if (!queue_not_empty.wait_for(lock, chrono::milliseconds(timeout_ms), ready)) {
		return false;
	}
	if (pending_frames.empty()) {
		return false;  // Closed.
	}
	*frame = move(pending_frames.front());
	pending_frames.pop_front();
	return true;
}

void FrameSink::close()
{
	{
		unique_lock<mutex> lock(queue_lock);
		closed_ = true;
	}
	queue_not_empty.notify_all();
}

size_t FrameSink::discard_pending()
{
	deque<CompletedFrame> discarded;
	{
		unique_lock<mutex> lock(queue_lock);
		swap(discarded, pending_frames);
	}
	// The frames go back to their allocators here, outside the lock.
	return discarded.size();
}

size_t FrameSink::size() const
{
	unique_lock<mutex> lock(queue_lock);
	return pending_frames.size();
}

uint64_t FrameSink::sent_frames() const
{
	unique_lock<mutex> lock(queue_lock);
	return num_sent;
}

uint64_t FrameSink::dropped_frames() const
{
	unique_lock<mutex> lock(queue_lock);
	return num_dropped;
}
