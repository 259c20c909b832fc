#ifndef _ISO_TRANSFER_POOL_H
#define _ISO_TRANSFER_POOL_H 1

// Keeps a fixed number of isochronous transfers in flight against one
// streaming endpoint, and runs the libusb event loop on a thread of its own.
// Every completed transfer is handed to a UVCStream and then immediately
// resubmitted, from within the completion callback.
//
// The pool does not open, claim or configure the device; it wants a handle
// where the right alternate setting is already selected.

#include <libusb.h>
#include <stdint.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "payload_extractor.h"
#include "stream_params.h"

class UVCStream;

PacketStatus packet_status_from_libusb(libusb_transfer_status status);

// Copies the per-packet results of a finished transfer into <packets>
// (resized to fit), and returns a view over them and the transfer's buffer.
// The view is valid until the transfer or <packets> changes.
IsoTransferView iso_transfer_view(const libusb_transfer *xfr, std::vector<IsoPacketDesc> *packets);

// What to do with a transfer that libusb gave back.
enum CompletionAction {
	COMPLETION_RETIRE,  // Cancelled, or we are stopping.
	COMPLETION_DEVICE_GONE,  // Retire, and stop expecting the device to come back.
	COMPLETION_PROCESS,  // Hand to the stream, then resubmit.
	COMPLETION_RESUBMIT,  // Transfer-level error; count it and resubmit.
};
CompletionAction classify_completion(libusb_transfer_status status, bool quitting);

// Checks completion order against submission order.
class CompletionOrderTracker {
public:
	// Returns false if a transfer submitted later has already completed.
	bool note(uint64_t submission_sequence);
	void reset() { any_completed = false; last_completed = 0; }

private:
	bool any_completed = false;
	uint64_t last_completed = 0;
};

class IsoTransferPool {
public:
	IsoTransferPool() {}
	~IsoTransferPool();

	// Allocates and submits params.num_transfers transfers of
	// params.packets_per_transfer packets each, and starts the event thread.
	// If params.max_packet_size is 0, it is read from the endpoint descriptor.
	// Returns 0 on success, or a (negative) libusb error code; nothing is
	// left running on failure. <ctx> can be nullptr for the default context.
	// Does not take ownership of <devh> or <stream>, both of which must
	// outlive stop().
	int start(libusb_context *ctx, libusb_device_handle *devh, const StreamParams &params, UVCStream *stream);

	// Cancels all transfers, and blocks until libusb has given every one of
	// them back and the event thread has exited. Safe to call more than once.
	void stop();

	bool running() const { return usb_thread.joinable(); }

	// True if the device went away (all transfers came back with
	// LIBUSB_TRANSFER_NO_DEVICE or could not be resubmitted).
	bool device_lost() const { return device_gone; }
	int transfers_in_flight() const { return in_flight; }

	unsigned max_packet_size() const { return packet_size; }
	uint64_t completions() const { return num_completions; }
	uint64_t out_of_order_completions() const { return num_out_of_order; }
	uint64_t transfer_errors() const { return num_transfer_errors; }

private:
	struct Slot {
		IsoTransferPool *pool;
		libusb_transfer *xfr = nullptr;
		std::unique_ptr<uint8_t[]> buffer;
		uint64_t submission_sequence = 0;
		std::vector<IsoPacketDesc> packets;
	};

	static void LIBUSB_CALL cb_xfr(libusb_transfer *xfr);
	void handle_completion(Slot *slot);
	int submit(Slot *slot);
	void usb_thread_func();
	void free_transfers();

	libusb_context *ctx = nullptr;
	UVCStream *stream = nullptr;
	unsigned packet_size = 0;

	std::vector<std::unique_ptr<Slot>> slots;
	std::thread usb_thread;
	std::atomic<bool> should_quit{false};
	std::atomic<bool> device_gone{false};
	std::atomic<int> in_flight{0};

	// Only touched from the callbacks (and from start(), before the thread runs).
	uint64_t next_submission = 0;
	CompletionOrderTracker order;

	std::atomic<uint64_t> num_completions{0};
	std::atomic<uint64_t> num_out_of_order{0};
	std::atomic<uint64_t> num_transfer_errors{0};
};

#endif  // !defined(_ISO_TRANSFER_POOL_H)
