#include <libusb.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "flags.h"
#include "frame_sink.h"
#include "iso_transfer_pool.h"
#include "mux.h"
#include "packet_capture.h"
#include "packet_replay.h"
#include "uvc_stream.h"

using namespace std;
using namespace std::chrono;

namespace {

atomic<bool> should_quit{false};

void quit_signal(int ignored)
{
	should_quit = true;
}

// The alternate setting of <interface_number> that has the largest
// packets on <endpoint_address>, or a (negative) libusb error code.
int find_altsetting(libusb_device_handle *devh, int interface_number, uint8_t endpoint_address)
{
	libusb_config_descriptor *config;
	int rc = libusb_get_active_config_descriptor(libusb_get_device(devh), &config);
	if (rc < 0) {
		fprintf(stderr, "Error getting configuration: %s\n", libusb_error_name(rc));
		return rc;
	}

	int best_altsetting = LIBUSB_ERROR_NOT_FOUND;
	unsigned best_size = 0;
	for (int i = 0; i < config->bNumInterfaces; ++i) {
		const libusb_interface *interface = &config->interface[i];
		for (int altsetting = 0; altsetting < interface->num_altsetting; ++altsetting) {
			const libusb_interface_descriptor *interface_desc = &interface->altsetting[altsetting];
			if (interface_desc->bInterfaceNumber != interface_number) {
				continue;
			}
			for (int e = 0; e < interface_desc->bNumEndpoints; ++e) {
				const libusb_endpoint_descriptor *endpoint = &interface_desc->endpoint[e];
				if (endpoint->bEndpointAddress != endpoint_address) {
					continue;
				}
				// Bits 11..12 are additional transactions per microframe.
				unsigned size = (endpoint->wMaxPacketSize & 0x7ff) * (((endpoint->wMaxPacketSize >> 11) & 3) + 1);
				printf("Interface %d, alternate setting %d: endpoint 0x%02x, %u bytes per packet\n",
					interface_number, interface_desc->bAlternateSetting, endpoint_address, size);
				if (size > best_size) {
					best_size = size;
					best_altsetting = interface_desc->bAlternateSetting;
				}
			}
		}
	}
	libusb_free_config_descriptor(config);

	if (best_altsetting < 0) {
		fprintf(stderr, "No alternate setting of interface %d has endpoint 0x%02x\n",
			interface_number, endpoint_address);
	}
	return best_altsetting;
}

// Opens the device given on the command line, claims the streaming interface
// and selects the alternate setting. Returns 0 or a libusb error code.
int open_device(libusb_context *ctx, libusb_device_handle **devh_ret)
{
	libusb_device_handle *devh = nullptr;
	int rc;
	if (global_flags.device_fd != -1) {
		rc = libusb_wrap_sys_device(ctx, global_flags.device_fd, &devh);
		if (rc < 0) {
			fprintf(stderr, "Error wrapping file descriptor %d: %s\n", global_flags.device_fd, libusb_error_name(rc));
			return rc;
		}
	} else {
		devh = libusb_open_device_with_vid_pid(ctx, global_flags.vendor_id, global_flags.product_id);
		if (devh == nullptr) {
			fprintf(stderr, "Error finding USB device %04x:%04x\n", global_flags.vendor_id, global_flags.product_id);
			return LIBUSB_ERROR_NO_DEVICE;
		}
	}

	// uvcvideo will usually have the interface; take it over.
	rc = libusb_set_auto_detach_kernel_driver(devh, 1);
	if (rc < 0 && rc != LIBUSB_ERROR_NOT_SUPPORTED) {
		fprintf(stderr, "Error enabling kernel driver auto-detach: %s\n", libusb_error_name(rc));
	}

	rc = libusb_claim_interface(devh, global_flags.interface_number);
	if (rc < 0) {
		fprintf(stderr, "Error claiming interface %d: %s\n", global_flags.interface_number, libusb_error_name(rc));
		libusb_close(devh);
		return rc;
	}

	int altsetting = global_flags.altsetting;
	if (altsetting == -1) {
		altsetting = find_altsetting(devh, global_flags.interface_number, global_flags.stream.endpoint);
		if (altsetting < 0) {
			libusb_release_interface(devh, global_flags.interface_number);
			libusb_close(devh);
			return altsetting;
		}
	}
	rc = libusb_set_interface_alt_setting(devh, global_flags.interface_number, altsetting);
	if (rc < 0) {
		fprintf(stderr, "Error setting alternate %d: %s\n", altsetting, libusb_error_name(rc));
		libusb_release_interface(devh, global_flags.interface_number);
		libusb_close(devh);
		return rc;
	}
	printf("Using interface %d, alternate setting %d\n", global_flags.interface_number, altsetting);

	*devh_ret = devh;
	return 0;
}

void close_device(libusb_device_handle *devh)
{
	// Back to zero bandwidth; fails if the device is gone, which is fine.
	libusb_set_interface_alt_setting(devh, global_flags.interface_number, 0);
	libusb_release_interface(devh, global_flags.interface_number);
	libusb_close(devh);
}

void print_stats(const UVCStream &stream, const FrameSink &sink, const IsoTransferPool *pool)
{
	StreamStats stats = stream.stats();
	printf("%s: %llu frames (%llu dropped, %llu incomplete, %llu invalid, %llu dropped at sink), "
	       "%llu transfers, %llu packets (%llu empty, %llu errors, %llu zero-filled, %llu UVC errors), "
	       "FID %llu toggles/%llu unconfirmed, next seq %llu, %zu pending",
		stats.format_known ? frame_format_name(stats.format) : "format unknown",
		(unsigned long long)stats.assembler.frames_completed,
		(unsigned long long)stats.assembler.frames_dropped,
		(unsigned long long)stats.assembler.incomplete_frames,
		(unsigned long long)stats.invalid_frames,
		(unsigned long long)sink.dropped_frames(),
		(unsigned long long)stats.extractor.transfers,
		(unsigned long long)stats.extractor.packets,
		(unsigned long long)stats.extractor.empty_packets,
		(unsigned long long)stats.extractor.packet_errors,
		(unsigned long long)stats.assembler.zero_filled_payloads,
		(unsigned long long)stats.assembler.uvc_errors,
		(unsigned long long)stats.assembler.fid_toggles,
		(unsigned long long)stats.assembler.fid_unconfirmed,
		(unsigned long long)stats.next_expected_sequence,
		stats.pending_payloads);
	if (pool != nullptr) {
		printf(", %llu completions (%llu out of order, %llu failed), %d transfers in flight",
			(unsigned long long)pool->completions(),
			(unsigned long long)pool->out_of_order_completions(),
			(unsigned long long)pool->transfer_errors(),
			pool->transfers_in_flight());
	}
	printf("\n");
}

class FrameWriter {
public:
	// Returns false if the frame could not be written; the output is closed then.
	bool write(const CompletedFrame &frame)
	{
		if (global_flags.output_filename.empty()) {
			return true;
		}
		if (mux == nullptr) {
			if (failed) {
				return false;
			}
			mux = Mux::open(global_flags.output_filename, global_flags.output_mux_name,
				frame.width, frame.height, frame.format);
			if (mux == nullptr) {
				failed = true;
				return false;
			}
			format = frame.format;
		}
		if (frame.format != format) {
			fprintf(stderr, "Frame format changed from %s to %s, not writing it\n",
				frame_format_name(format), frame_format_name(frame.format));
			return true;
		}
		if (!mux->add_frame(frame.frame->data, frame.frame->len, frame.timestamp_us)) {
			mux.reset();
			failed = true;
			return false;
		}
		return true;
	}

private:
	unique_ptr<Mux> mux;
	FrameFormat format = FRAME_FORMAT_YUY2;
	bool failed = false;
};

// Takes frames from the sink until told to quit, until enough frames have
// been received, or until <done> says so. <supervise> is called between
// frames and roughly every 100 ms; returning false stops everything.
template<class DoneFunc, class SuperviseFunc>
uint64_t consume_frames(const UVCStream &stream, FrameSink *sink, const IsoTransferPool *pool,
                        DoneFunc done, SuperviseFunc supervise)
{
	FrameWriter writer;
	uint64_t num_frames = 0;
	steady_clock::time_point last_stats = steady_clock::now();
	while (!should_quit) {
		CompletedFrame frame;
		if (sink->receive(&frame, 100)) {
			++num_frames;
			if (!writer.write(frame)) {
				fprintf(stderr, "Output failed, stopping\n");
				break;
			}
			if (global_flags.num_frames != 0 && num_frames >= global_flags.num_frames) {
				break;
			}
		} else if (done()) {
			break;
		}

		if (!supervise()) {
			break;
		}

		steady_clock::time_point now = steady_clock::now();
		if (global_flags.stats_interval_sec > 0 &&
		    now - last_stats >= seconds(global_flags.stats_interval_sec)) {
			print_stats(stream, *sink, pool);
			last_stats = now;
		}
	}
	print_stats(stream, *sink, pool);
	return num_frames;
}

CaptureMetadata metadata_for_stream(const StreamParams &params, const string &description)
{
	CaptureMetadata metadata;
	metadata.vendor_id = global_flags.vendor_id;
	metadata.product_id = global_flags.product_id;
	metadata.endpoint = params.endpoint;
	metadata.format = params.format;
	metadata.width = params.width;
	metadata.height = params.height;
	metadata.description = description;
	return metadata;
}

// The capture's metadata fills in the stream; flags given explicitly win.
StreamParams replay_stream_params(const CaptureMetadata &metadata)
{
	StreamParams params = global_flags.stream;
	apply_capture_metadata(metadata, &params);
	if (global_flags.width_given) {
		params.width = global_flags.stream.width;
	}
	if (global_flags.height_given) {
		params.height = global_flags.stream.height;
	}
	if (global_flags.format_given) {
		params.format = global_flags.stream.format;
	}
	if (global_flags.endpoint_given) {
		params.endpoint = global_flags.stream.endpoint;
	}
	return params;
}

int run_replay(PacketRecorder *recorder)
{
	vector<CapturedPacket> packets;
	CaptureMetadata metadata;
	if (!read_capture_file(global_flags.replay_filename, &packets, &metadata)) {
		return 1;
	}
	printf("Read %zu packets from %s\n", packets.size(), global_flags.replay_filename.c_str());
	if (!metadata.description.empty()) {
		printf("Capture: %s (%llu frames, %llu ms)\n", metadata.description.c_str(),
			(unsigned long long)metadata.total_frames, (unsigned long long)metadata.duration_ms);
	}

	StreamParams params = replay_stream_params(metadata);
	printf("Replaying as %ux%u, format %s, endpoint 0x%02x\n",
		params.width, params.height, stream_format_name(params.format), params.endpoint);

	FrameSink sink(global_flags.sink_capacity);
	UVCStream stream(params, &sink);
	if (recorder->is_open()) {
		CaptureMetadata rerecorded = metadata_for_stream(params, "replay of " + global_flags.replay_filename);
		rerecorded.vendor_id = metadata.vendor_id;
		rerecorded.product_id = metadata.product_id;
		recorder->set_metadata(rerecorded);
		stream.set_packet_recorder(recorder);
	}

	PacketReplay replay(move(packets), params, &stream);
	replay.set_speed(global_flags.replay_speed);
	replay.set_loop(global_flags.replay_loop);
	if (!replay.start()) {
		return 1;
	}

	uint64_t num_frames = consume_frames(stream, &sink, nullptr,
		[&replay, &sink]{ return !replay.running() && sink.size() == 0; },
		[]{ return true; });
	if (replay.running() && !replay.stop()) {
		fprintf(stderr, "Could not stop replay\n");
	}
	printf("Received %llu frames\n", (unsigned long long)num_frames);
	return 0;
}

int run_live(PacketRecorder *recorder)
{
	libusb_context *ctx = nullptr;
	if (global_flags.device_fd != -1) {
		// The descriptor is all we get; do not go looking for devices.
		int rc = libusb_set_option(nullptr, LIBUSB_OPTION_NO_DEVICE_DISCOVERY);
		if (rc < 0) {
			fprintf(stderr, "Error disabling device discovery: %s\n", libusb_error_name(rc));
		}
	}
	int rc = libusb_init(&ctx);
	if (rc < 0) {
		fprintf(stderr, "Error initializing libusb: %s\n", libusb_error_name(rc));
		return 1;
	}

	libusb_device_handle *devh = nullptr;
	rc = open_device(ctx, &devh);
	if (rc < 0) {
		libusb_exit(ctx);
		return 1;
	}

	FrameSink sink(global_flags.sink_capacity);
	UVCStream stream(global_flags.stream, &sink);
	if (recorder->is_open()) {
		char description[64];
		if (global_flags.device_fd != -1) {
			snprintf(description, sizeof(description), "device on fd %d", global_flags.device_fd);
		} else {
			snprintf(description, sizeof(description), "device %04x:%04x",
				global_flags.vendor_id, global_flags.product_id);
		}
		recorder->set_metadata(metadata_for_stream(global_flags.stream, description));
		stream.set_packet_recorder(recorder);
	}

	IsoTransferPool pool;
	rc = pool.start(ctx, devh, global_flags.stream, &stream);
	if (rc < 0) {
		close_device(devh);
		libusb_exit(ctx);
		return 1;
	}

	int num_restarts = 0;
	bool gave_up = false;
	auto supervise = [&]() -> bool {
		bool lost = pool.device_lost() || !pool.running();
		if (!lost && global_flags.stall_timeout_ms > 0 &&
		    stream.is_stalled(milliseconds(global_flags.stall_timeout_ms))) {
			// A transfer that never came back holds up everything behind it.
			if (stream.skip_sequence_gap() > 0) {
				return true;
			}
			fprintf(stderr, "No data for %d ms\n", global_flags.stall_timeout_ms);
			lost = true;
		}
		if (!lost) {
			return true;
		}

		fprintf(stderr, "Connection lost.\n");
		pool.stop();
		if (devh != nullptr) {
			close_device(devh);
			devh = nullptr;
		}
		if (num_restarts >= global_flags.max_restarts || global_flags.device_fd != -1) {
			fprintf(stderr, "Giving up after %d restarts\n", num_restarts);
			gave_up = true;
			return false;
		}
		++num_restarts;
		fprintf(stderr, "Restarting stream (attempt %d of %d)\n", num_restarts, global_flags.max_restarts);

		stream.reset();
		this_thread::sleep_for(seconds(1));  // Give the device time to come back.
		if (open_device(ctx, &devh) < 0) {
			// Try again next time around.
			devh = nullptr;
		} else if (pool.start(ctx, devh, global_flags.stream, &stream) < 0) {
			close_device(devh);
			devh = nullptr;
		}
		if (devh == nullptr && num_restarts >= global_flags.max_restarts) {
			gave_up = true;
			return false;
		}
		return true;
	};

	uint64_t num_frames = consume_frames(stream, &sink, &pool, []{ return false; }, supervise);
	printf("Received %llu frames\n", (unsigned long long)num_frames);

	pool.stop();
	if (devh != nullptr) {
		close_device(devh);
	}
	libusb_exit(ctx);
	return gave_up ? 1 : 0;
}

}  // namespace

int main(int argc, char *argv[])
{
	parse_flags(argc, argv);
	setlinebuf(stdout);

	signal(SIGINT, quit_signal);
	signal(SIGTERM, quit_signal);

	printf("Stream: %ux%u, format %s, endpoint 0x%02x, validation %s, raw headers %s\n",
		global_flags.stream.width, global_flags.stream.height,
		stream_format_name(global_flags.stream.format), global_flags.stream.endpoint,
		validation_level_name(global_flags.stream.validation_level),
		raw_header_mode_name(global_flags.stream.raw_header_mode));

	PacketRecorder recorder;
	if (!global_flags.record_filename.empty() && !recorder.open(global_flags.record_filename)) {
		exit(1);
	}

	int rc;
	if (!global_flags.replay_filename.empty()) {
		rc = run_replay(&recorder);
	} else {
		rc = run_live(&recorder);
	}
	recorder.close();
	return rc;
}
