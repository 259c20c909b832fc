#ifndef _FRAME_ALLOCATOR_H
#define _FRAME_ALLOCATOR_H 1

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <mutex>
#include <stack>

// An interface for frame allocators; if you do not specify one
// (using UVCStream::set_frame_allocator), a default one that pre-allocates
// a freelist of frames using new[] will be used. Specifying your own can be
// useful if you want the frame to end up somewhere special (say, memory the
// conversion stage can read directly) and don't want to spend the extra copy
// to get it there.
class FrameAllocator {
 public:
	struct Frame {
		uint8_t *data = nullptr;
		size_t len = 0;  // Number of bytes we actually have.
		size_t size = 0;  // Number of bytes we have room for.
		size_t overflow = 0;  // Bytes that did not fit and were thrown away.
		void *userdata = nullptr;
		FrameAllocator *owner = nullptr;
	};

	virtual ~FrameAllocator();

	// Request a frame. Note that this is called from the USB thread, which
	// is very sensitive to delays. Thus, you should not do anything here
	// that might sleep, including calling malloc(). (Taking a mutex is
	// borderline.)
	//
	// The Frame object is handed to the frame sink, and whoever ends up
	// holding it is responsible for releasing it back once it is no longer
	// read from (RefCountedFrame does this automatically).
	//
	// Returning a Frame with data==nullptr is allowed;
	// if so, the frame in progress will be dropped.
	virtual Frame alloc_frame() = 0;

	virtual void release_frame(Frame frame) = 0;
};

class MallocFrameAllocator : public FrameAllocator {
public:
	MallocFrameAllocator(size_t frame_size, size_t num_queued_frames);
	Frame alloc_frame() override;
	void release_frame(Frame frame) override;

	size_t frame_size() const { return frame_size_; }
	size_t num_free_frames();

private:
	size_t frame_size_;

	std::mutex freelist_mutex;
	std::stack<std::unique_ptr<uint8_t[]>> freelist;  // All of size <frame_size_>.
};

#endif  // !defined(_FRAME_ALLOCATOR_H)
