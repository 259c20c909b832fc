#include "iso_transfer_pool.h"

#include <errno.h>
#include <sched.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>

#include "defs.h"
#include "uvc_stream.h"

using namespace std;

PacketStatus packet_status_from_libusb(libusb_transfer_status status)
{
	switch (status) {
	case LIBUSB_TRANSFER_COMPLETED:
		return PACKET_COMPLETED;
	case LIBUSB_TRANSFER_TIMED_OUT:
		return PACKET_TIMED_OUT;
	case LIBUSB_TRANSFER_CANCELLED:
		return PACKET_CANCELLED;
	case LIBUSB_TRANSFER_STALL:
		return PACKET_STALL;
	case LIBUSB_TRANSFER_NO_DEVICE:
		return PACKET_NO_DEVICE;
	case LIBUSB_TRANSFER_OVERFLOW:
		return PACKET_OVERFLOW;
	case LIBUSB_TRANSFER_ERROR:
		break;
	}
	return PACKET_ERROR;
}

IsoTransferView iso_transfer_view(const libusb_transfer *xfr, vector<IsoPacketDesc> *packets)
{
	packets->resize(xfr->num_iso_packets);
	for (int i = 0; i < xfr->num_iso_packets; ++i) {
		const libusb_iso_packet_descriptor *pack = &xfr->iso_packet_desc[i];
		(*packets)[i].length = pack->length;
		(*packets)[i].actual_length = pack->actual_length;
		(*packets)[i].status = packet_status_from_libusb(pack->status);
	}

	IsoTransferView view;
	view.buffer = xfr->buffer;
	view.packets = packets->data();
	view.num_packets = xfr->num_iso_packets;
	view.endpoint = xfr->endpoint;
	return view;
}

CompletionAction classify_completion(libusb_transfer_status status, bool quitting)
{
	if (quitting) {
		return COMPLETION_RETIRE;
	}
	switch (status) {
	case LIBUSB_TRANSFER_COMPLETED:
		return COMPLETION_PROCESS;
	case LIBUSB_TRANSFER_CANCELLED:
		return COMPLETION_RETIRE;
	case LIBUSB_TRANSFER_NO_DEVICE:
		return COMPLETION_DEVICE_GONE;
	default:
		return COMPLETION_RESUBMIT;
	}
}

bool CompletionOrderTracker::note(uint64_t submission_sequence)
{
	if (any_completed && submission_sequence < last_completed) {
		return false;
	}
	last_completed = submission_sequence;
	any_completed = true;
	return true;
}

IsoTransferPool::~IsoTransferPool()
{
	stop();
}

int IsoTransferPool::start(libusb_context *ctx, libusb_device_handle *devh, const StreamParams &params, UVCStream *stream)
{
	if (running()) {
		fprintf(stderr, "Transfer pool already running\n");
		return LIBUSB_ERROR_BUSY;
	}
	this->ctx = ctx;
	this->stream = stream;
	should_quit = false;
	device_gone = false;
	in_flight = 0;
	next_submission = 0;
	order.reset();

	if (params.max_packet_size != 0) {
		packet_size = params.max_packet_size;
	} else {
		int rc = libusb_get_max_iso_packet_size(libusb_get_device(devh), params.endpoint);
		if (rc < 0) {
			fprintf(stderr, "Error getting max packet size for endpoint 0x%02x: %s\n",
				params.endpoint, libusb_error_name(rc));
			return rc;
		}
		if (rc == 0) {
			fprintf(stderr, "Endpoint 0x%02x has zero-sized packets (wrong alternate setting?)\n",
				params.endpoint);
			return LIBUSB_ERROR_INVALID_PARAM;
		}
		packet_size = rc;
	}

	int num_iso_pack = params.packets_per_transfer;
	int num_bytes = num_iso_pack * packet_size;
	printf("Picking %u transfers of %d packets of 0x%x bytes each, endpoint 0x%02x\n",
		params.num_transfers, num_iso_pack, packet_size, params.endpoint);

	for (unsigned i = 0; i < params.num_transfers; ++i) {
		unique_ptr<Slot> slot(new Slot);
		slot->pool = this;
		slot->buffer.reset(new uint8_t[num_bytes]);
		slot->packets.resize(num_iso_pack);
		slot->xfr = libusb_alloc_transfer(num_iso_pack);
		if (slot->xfr == nullptr) {
			fprintf(stderr, "Could not allocate transfer %u\n", i);
			free_transfers();
			return LIBUSB_ERROR_NO_MEM;
		}
		libusb_fill_iso_transfer(slot->xfr, devh, params.endpoint, slot->buffer.get(), num_bytes,
			num_iso_pack, cb_xfr, slot.get(), 0);
		libusb_set_iso_packet_lengths(slot->xfr, packet_size);
		slots.push_back(move(slot));
	}

	for (unique_ptr<Slot> &slot : slots) {
		int rc = submit(slot.get());
		if (rc < 0) {
			fprintf(stderr, "Error submitting iso to endpoint 0x%02x, number %llu: %s\n",
				params.endpoint, (unsigned long long)slot->submission_sequence, libusb_error_name(rc));
			if (in_flight == 0) {
				free_transfers();
			} else {
				// Let the event thread collect the ones that made it.
				usb_thread = thread(&IsoTransferPool::usb_thread_func, this);
				stop();
			}
			return rc;
		}
	}

	usb_thread = thread(&IsoTransferPool::usb_thread_func, this);
	return 0;
}

void IsoTransferPool::stop()
{
	if (!usb_thread.joinable()) {
		return;
	}
	should_quit = true;
	for (unique_ptr<Slot> &slot : slots) {
		// Fails harmlessly for transfers that are not in flight.
		int rc = libusb_cancel_transfer(slot->xfr);
		if (rc < 0 && rc != LIBUSB_ERROR_NOT_FOUND) {
			fprintf(stderr, "Error cancelling transfer: %s\n", libusb_error_name(rc));
		}
	}
	usb_thread.join();
	free_transfers();
}

int IsoTransferPool::submit(Slot *slot)
{
	slot->submission_sequence = next_submission++;
	++in_flight;
	int rc = libusb_submit_transfer(slot->xfr);
	if (rc < 0) {
		--in_flight;
	}
	return rc;
}

void IsoTransferPool::free_transfers()
{
	for (unique_ptr<Slot> &slot : slots) {
		if (slot->xfr != nullptr) {
			libusb_free_transfer(slot->xfr);
		}
	}
	slots.clear();
}

void LIBUSB_CALL IsoTransferPool::cb_xfr(libusb_transfer *xfr)
{
	Slot *slot = static_cast<Slot *>(xfr->user_data);
	slot->pool->handle_completion(slot);
}

void IsoTransferPool::handle_completion(Slot *slot)
{
	libusb_transfer *xfr = slot->xfr;

	// The quit flag is checked first; after stop() nothing gets processed or resubmitted.
	CompletionAction action = classify_completion(xfr->status, should_quit);
	if (action == COMPLETION_RETIRE || action == COMPLETION_DEVICE_GONE) {
		if (action == COMPLETION_DEVICE_GONE && !device_gone.exchange(true)) {
			fprintf(stderr, "Device disappeared from endpoint 0x%02x\n", xfr->endpoint);
		}
		--in_flight;
		return;
	}

	++num_completions;
	if (!order.note(slot->submission_sequence)) {
		++num_out_of_order;
	}

	if (action == COMPLETION_PROCESS) {
		stream->process_transfer(iso_transfer_view(xfr, &slot->packets));
	} else {
		++num_transfer_errors;
		if (num_transfer_errors <= LOG_FIRST_N || num_transfer_errors % LOG_EVERY_N == 0) {
			fprintf(stderr, "Transfer status %d on endpoint 0x%02x (%llu transfer errors so far)\n",
				xfr->status, xfr->endpoint, (unsigned long long)num_transfer_errors);
		}
	}

	int rc = submit(slot);
	if (rc < 0) {
		fprintf(stderr, "Error re-submitting URB: %s\n", libusb_error_name(rc));
		if (rc == LIBUSB_ERROR_NO_DEVICE) {
			device_gone = true;
		}
	}
}

void IsoTransferPool::usb_thread_func()
{
	sched_param param;
	memset(&param, 0, sizeof(param));
	param.sched_priority = 1;
	if (sched_setscheduler(0, SCHED_RR, &param) == -1) {
		printf("couldn't set realtime priority for USB thread: %s\n", strerror(errno));
	}
	while (in_flight > 0) {
		timeval tv;
		tv.tv_sec = 0;
		tv.tv_usec = EVENT_TIMEOUT_MS * 1000;
		int rc = libusb_handle_events_timeout_completed(ctx, &tv, nullptr);
		if (rc != LIBUSB_SUCCESS && rc != LIBUSB_ERROR_INTERRUPTED) {
			fprintf(stderr, "Error handling USB events: %s\n", libusb_error_name(rc));
		}
	}
	if (!should_quit) {
		fprintf(stderr, "No transfers left in flight, USB thread exiting\n");
	}
}
