// Tests for the bounded frame queue between the USB thread and the consumer.

#include <stdint.h>
#include <stdio.h>
#include <chrono>
#include <thread>

#include "frame_allocator.h"
#include "frame_sink.h"
#include "video_frame.h"

using namespace std;


static CompletedFrame
make_frame(FrameAllocator *allocator, uint64_t frame_number)
{
	CompletedFrame frame;
	FrameAllocator::Frame raw = allocator->alloc_frame();
	raw.len = raw.size;
	frame.frame = RefCountedFrame(raw);
	frame.format = FRAME_FORMAT_YUY2;
	frame.width = 4;
	frame.height = 2;
	frame.frame_number = frame_number;
	return frame;
}


static bool
test_fifo_order()
{
	printf("Test: Frames come out in the order they went in... ");

	MallocFrameAllocator allocator(16, 4);
	FrameSink sink(4);
	for (uint64_t i = 1; i <= 3; ++i) {
		if (!sink.try_send(make_frame(&allocator, i))) {
			printf("FAIL (send %llu refused)\n", (unsigned long long)i);
			return false;
		}
	}
	for (uint64_t i = 1; i <= 3; ++i) {
		CompletedFrame frame;
		if (!sink.receive(&frame, 0) || frame.frame_number != i) {
			printf("FAIL (expected frame %llu)\n", (unsigned long long)i);
			return false;
		}
	}
	CompletedFrame frame;
	if (sink.receive(&frame, 0)) {
		printf("FAIL (received from empty sink)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_full_sink_drops()
{
	printf("Test: A full sink drops new frames without blocking... ");

	MallocFrameAllocator allocator(16, 4);
	FrameSink sink(2);
	sink.try_send(make_frame(&allocator, 1));
	sink.try_send(make_frame(&allocator, 2));
	if (allocator.num_free_frames() != 2) {
		printf("FAIL (%zu free frames before drop)\n", allocator.num_free_frames());
		return false;
	}
	if (sink.try_send(make_frame(&allocator, 3))) {
		printf("FAIL (send to full sink accepted)\n");
		return false;
	}
	if (sink.dropped_frames() != 1 || sink.sent_frames() != 2 || sink.size() != 2) {
		printf("FAIL (%llu dropped, %llu sent)\n", (unsigned long long)sink.dropped_frames(),
			(unsigned long long)sink.sent_frames());
		return false;
	}

	// The dropped frame went back to its allocator.
	if (allocator.num_free_frames() != 2) {
		printf("FAIL (%zu free frames after drop)\n", allocator.num_free_frames());
		return false;
	}

	// The oldest frames are the ones kept.
	CompletedFrame frame;
	if (!sink.receive(&frame, 0) || frame.frame_number != 1) {
		printf("FAIL (wrong frame kept)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_receive_timeout()
{
	printf("Test: Receive times out on an empty sink... ");

	FrameSink sink(2);
	CompletedFrame frame;
	chrono::steady_clock::time_point start = chrono::steady_clock::now();
	if (sink.receive(&frame, 50)) {
		printf("FAIL (received something)\n");
		return false;
	}
	if (chrono::steady_clock::now() - start < chrono::milliseconds(40)) {
		printf("FAIL (returned too early)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_close_wakes_receiver()
{
	printf("Test: Closing wakes up a waiting receiver... ");

	MallocFrameAllocator allocator(16, 2);
	FrameSink sink(2);
	sink.try_send(make_frame(&allocator, 1));
	sink.close();

	if (sink.try_send(make_frame(&allocator, 2))) {
		printf("FAIL (send to closed sink accepted)\n");
		return false;
	}

	// Queued frames can still be had.
	CompletedFrame frame;
	if (!sink.receive(&frame, -1) || frame.frame_number != 1) {
		printf("FAIL (queued frame lost)\n");
		return false;
	}

	bool received = true;
	FrameSink waiting_sink(2);
	thread receiver([&waiting_sink, &received]{
		CompletedFrame frame;
		received = waiting_sink.receive(&frame, -1);
	});
	this_thread::sleep_for(chrono::milliseconds(20));
	waiting_sink.close();
	receiver.join();
	if (received) {
		printf("FAIL (receive on closed sink succeeded)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_discard_pending()
{
	printf("Test: Discarding returns queued frames to their allocator... ");

	MallocFrameAllocator allocator(16, 3);
	FrameSink sink(4);
	sink.try_send(make_frame(&allocator, 1));
	sink.try_send(make_frame(&allocator, 2));
	if (allocator.num_free_frames() != 1) {
		printf("FAIL (%zu free frames before discard)\n", allocator.num_free_frames());
		return false;
	}
	if (sink.discard_pending() != 2) {
		printf("FAIL (wrong count discarded)\n");
		return false;
	}
	if (allocator.num_free_frames() != 3 || sink.size() != 0) {
		printf("FAIL (%zu free frames, %zu queued)\n", allocator.num_free_frames(), sink.size());
		return false;
	}
	// Discarding does not close the sink.
	if (!sink.try_send(make_frame(&allocator, 3))) {
		printf("FAIL (send after discard refused)\n");
		return false;
	}
	if (sink.discard_pending() != 1 || sink.discard_pending() != 0) {
		printf("FAIL (second discard)\n");
		return false;
	}

	printf("OK\n");
	return true;
}


static bool
test_producer_consumer()
{
	printf("Test: Producer and consumer on separate threads... ");

	const int num_frames = 200;
	MallocFrameAllocator allocator(16, 8);
	FrameSink sink(4);

	int received = 0;
	uint64_t last_frame_number = 0;
	bool in_order = true;
	thread consumer([&]{
		CompletedFrame frame;
		while (sink.receive(&frame, -1)) {
			if (frame.frame_number <= last_frame_number) {
				in_order = false;
			}
			last_frame_number = frame.frame_number;
			frame = CompletedFrame();
			++received;
		}
	});

	for (int i = 1; i <= num_frames; ++i) {
		sink.try_send(make_frame(&allocator, i));
		if (i % 10 == 0) {
			this_thread::sleep_for(chrono::milliseconds(1));
		}
	}
	sink.close();
	consumer.join();

	if (uint64_t(received) != sink.sent_frames() || sink.sent_frames() + sink.dropped_frames() != num_frames) {
		printf("FAIL (%d received, %llu sent, %llu dropped)\n", received,
			(unsigned long long)sink.sent_frames(), (unsigned long long)sink.dropped_frames());
		return false;
	}
	if (!in_order) {
		printf("FAIL (out of order)\n");
		return false;
	}

	printf("OK (%d received, %llu dropped)\n", received, (unsigned long long)sink.dropped_frames());
	return true;
}


int
main(int argc, char **argv)
{
	printf("\n");
	printf("===========================================\n");
	printf("Frame Sink Tests\n");
	printf("===========================================\n\n");

	int passed = 0;
	int failed = 0;

	bool (*tests[])() = {
		test_fifo_order,
		test_full_sink_drops,
		test_receive_timeout,
		test_close_wakes_receiver,
		test_discard_pending,
		test_producer_consumer,
	};
	for (bool (*test)() : tests) {
		if (test())
			passed++;
		else
			failed++;
	}

	printf("\n");
	printf("===========================================\n");
	printf("Results: %d passed, %d failed\n", passed, failed);
	printf("===========================================\n\n");

	return (failed == 0) ? 0 : 1;
}
