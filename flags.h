#ifndef _FLAGS_H
#define _FLAGS_H

#include <string>

#include "defs.h"
#include "stream_params.h"

struct Flags {
	// Live capture. The device is found by vendor/product id, unless an
	// already opened file descriptor is given.
	int vendor_id = -1, product_id = -1;
	int device_fd = -1;
	int interface_number = 1;
	int altsetting = -1;  // -1 = the one with the largest packets on the endpoint.

	StreamParams stream;
	// Set when given on the command line; these win over a capture's metadata.
	bool width_given = false, height_given = false, format_given = false, endpoint_given = false;
	size_t sink_capacity = DEFAULT_SINK_CAPACITY;

	std::string output_filename;  // Blank = do not write frames anywhere.
	std::string output_mux_name = DEFAULT_OUTPUT_MUX_NAME;
	std::string record_filename;  // Blank = no packet capture.

	std::string replay_filename;  // Nonblank = replay instead of live capture.
	double replay_speed = 1.0;
	bool replay_loop = false;

	uint64_t num_frames = 0;  // Stop after this many frames; 0 = never.
	int stats_interval_sec = 5;
	int stall_timeout_ms = 2000;
	int max_restarts = 3;
};
extern Flags global_flags;

void usage();
void parse_flags(int argc, char * const argv[]);

#endif  // !defined(_FLAGS_H)
