#include "frame_allocator.h"
#include "ref_counted_frame.h"

#include <stdio.h>

using namespace std;

FrameAllocator::~FrameAllocator() {}

MallocFrameAllocator::MallocFrameAllocator(size_t frame_size, size_t num_queued_frames)
	: frame_size_(frame_size)
{
	for (size_t i = 0; i < num_queued_frames; ++i) {
		freelist.push(unique_ptr<uint8_t[]>(new uint8_t[frame_size]));
	}
}

FrameAllocator::Frame MallocFrameAllocator::alloc_frame()
{
	Frame vf;
	vf.owner = this;

	unique_lock<mutex> lock(freelist_mutex);  // Meh.
	if (freelist.empty()) {
		printf("Frame overrun (no more spare frames of size %zu), dropping frame!\n",
			frame_size_);
	} else {
		vf.data = freelist.top().release();
		vf.size = frame_size_;
		freelist.pop();  // Meh.
	}
	return vf;
}

void MallocFrameAllocator::release_frame(Frame frame)
{
	if (frame.data == nullptr) {
		return;
	}
	unique_lock<mutex> lock(freelist_mutex);
	freelist.push(unique_ptr<uint8_t[]>(frame.data));
}

size_t MallocFrameAllocator::num_free_frames()
{
	unique_lock<mutex> lock(freelist_mutex);
	return freelist.size();
}

void release_refcounted_frame(FrameAllocator::Frame *frame)
{
	if (frame->owner) {
		frame->owner->release_frame(*frame);
	}
	delete frame;
}
