#ifndef _REF_COUNTED_FRAME_H
#define _REF_COUNTED_FRAME_H 1

// A wrapper around FrameAllocator::Frame that is automatically refcounted;
// when the refcount goes to zero, the frame is given back to its allocator.
//
// Completed frames travel from the USB thread through the frame sink to
// whatever consumes them, so nobody in particular is the last owner.

#include <memory>

#include "frame_allocator.h"

void release_refcounted_frame(FrameAllocator::Frame *frame);

typedef std::shared_ptr<FrameAllocator::Frame> RefCountedFrameBase;

class RefCountedFrame : public RefCountedFrameBase {
public:
	RefCountedFrame() {}

	RefCountedFrame(const FrameAllocator::Frame &frame)
		: RefCountedFrameBase(new FrameAllocator::Frame(frame), release_refcounted_frame) {}
};

#endif  // !defined(_REF_COUNTED_FRAME_H)
