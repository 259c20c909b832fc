#include "flags.h"

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include "frame_validator.h"

Flags global_flags;

namespace {

int parse_int(const char *arg, int base, const char *option_name)
{
	char *end;
	long val = strtol(arg, &end, base);
	if (*arg == '\0' || *end != '\0') {
		fprintf(stderr, "Invalid value '%s' for --%s\n", arg, option_name);
		exit(1);
	}
	return val;
}

void parse_device(const char *arg)
{
	unsigned vid, pid;
	if (sscanf(arg, "%x:%x", &vid, &pid) != 2 || vid > 0xffff || pid > 0xffff) {
		fprintf(stderr, "Invalid device '%s' (expected VID:PID in hex, e.g. 046d:0825)\n", arg);
		exit(1);
	}
	global_flags.vendor_id = vid;
	global_flags.product_id = pid;
}

}  // namespace

void usage()
{
	fprintf(stderr, "Usage: uvcscope [OPTION]...\n");
	fprintf(stderr, "\n");
	fprintf(stderr, "  -h, --help                      print usage information\n");
	fprintf(stderr, "  -d, --device=VID:PID            capture from the given USB device (hex ids)\n");
	fprintf(stderr, "      --fd=FD                     capture from an already opened USB device file descriptor\n");
	fprintf(stderr, "  -i, --interface=N               video streaming interface (default 1)\n");
	fprintf(stderr, "  -a, --altsetting=N              alternate setting (default: largest packets)\n");
	fprintf(stderr, "  -e, --endpoint=ADDR             isochronous endpoint address (default 0x81)\n");
	fprintf(stderr, "  -W, --width=PIXELS              negotiated width (default 640)\n");
	fprintf(stderr, "  -H, --height=PIXELS             negotiated height (default 480)\n");
	fprintf(stderr, "      --stride=BYTES              bytes per row for raw formats (default width * 2)\n");
	fprintf(stderr, "  -f, --format=FORMAT             auto, mjpeg, yuy2 or uyvy (default auto)\n");
	fprintf(stderr, "      --packet-size=BYTES         max isochronous packet size (default: from endpoint)\n");
	fprintf(stderr, "      --packets-per-transfer=N    (default %d)\n", PACKETS_PER_TRANSFER);
	fprintf(stderr, "      --transfers=N               transfers in flight (default %d)\n", NUM_ISO_TRANSFERS);
	fprintf(stderr, "  -V, --validation=LEVEL          strict, moderate, minimal or off (default strict,\n");
	fprintf(stderr, "                                    or $" VALIDATION_ENV_VAR ")\n");
	fprintf(stderr, "      --raw-headers=MODE          skip (default) or strip payload headers on raw streams\n");
	fprintf(stderr, "      --sink-capacity=N           frames waiting for output before dropping (default %d)\n",
		DEFAULT_SINK_CAPACITY);
	fprintf(stderr, "  -o, --output=FILE               write frames to FILE\n");
	fprintf(stderr, "      --mux=NAME                  mux to use for --output (default " DEFAULT_OUTPUT_MUX_NAME ")\n");
	fprintf(stderr, "      --record=FILE               record raw isochronous packets to FILE (and FILE.meta)\n");
	fprintf(stderr, "  -r, --replay=FILE               replay a packet recording instead of capturing;\n");
	fprintf(stderr, "                                    size, format and endpoint come from FILE.meta\n");
	fprintf(stderr, "                                    unless given\n");
	fprintf(stderr, "      --replay-speed=FACTOR       1.0 = real time, 0 = as fast as possible (default 1.0)\n");
	fprintf(stderr, "      --replay-loop               start the replay over when it ends\n");
	fprintf(stderr, "  -n, --num-frames=N              stop after N frames (default: run until interrupted)\n");
	fprintf(stderr, "      --stats-interval=SECONDS    print statistics this often (default 5, 0 = never)\n");
	fprintf(stderr, "      --stall-timeout=MS          restart the stream after this long without data\n");
	fprintf(stderr, "                                    (default 2000, 0 = never)\n");
	fprintf(stderr, "      --max-restarts=N            give up after N restarts (default 3)\n");
}

void parse_flags(int argc, char * const argv[])
{
	static const option long_options[] = {
		{ "help", no_argument, 0, 'h' },
		{ "device", required_argument, 0, 'd' },
		{ "fd", required_argument, 0, 1000 },
		{ "interface", required_argument, 0, 'i' },
		{ "altsetting", required_argument, 0, 'a' },
		{ "endpoint", required_argument, 0, 'e' },
		{ "width", required_argument, 0, 'W' },
		{ "height", required_argument, 0, 'H' },
		{ "stride", required_argument, 0, 1001 },
		{ "format", required_argument, 0, 'f' },
		{ "packet-size", required_argument, 0, 1002 },
		{ "packets-per-transfer", required_argument, 0, 1003 },
		{ "transfers", required_argument, 0, 1004 },
		{ "validation", required_argument, 0, 'V' },
		{ "raw-headers", required_argument, 0, 1005 },
		{ "sink-capacity", required_argument, 0, 1006 },
		{ "output", required_argument, 0, 'o' },
		{ "mux", required_argument, 0, 1007 },
		{ "record", required_argument, 0, 1008 },
		{ "replay", required_argument, 0, 'r' },
		{ "replay-speed", required_argument, 0, 1009 },
		{ "replay-loop", no_argument, 0, 1010 },
		{ "num-frames", required_argument, 0, 'n' },
		{ "stats-interval", required_argument, 0, 1011 },
		{ "stall-timeout", required_argument, 0, 1012 },
		{ "max-restarts", required_argument, 0, 1013 },
		{ 0, 0, 0, 0 }
	};

	// The environment gives the default; the command line overrides it.
	global_flags.stream.validation_level = validation_level_from_env(VALIDATION_STRICT);

	for ( ;; ) {
		int option_index = 0;
		int c = getopt_long(argc, argv, "hd:i:a:e:W:H:f:V:o:r:n:", long_options, &option_index);

		if (c == -1) {
			break;
		}
		switch (c) {
		case 'd':
			parse_device(optarg);
			break;
		case 1000:
			global_flags.device_fd = parse_int(optarg, 10, "fd");
			break;
		case 'i':
			global_flags.interface_number = parse_int(optarg, 10, "interface");
			break;
		case 'a':
			global_flags.altsetting = parse_int(optarg, 10, "altsetting");
			break;
		case 'e':
			global_flags.stream.endpoint = parse_int(optarg, 0, "endpoint");
			global_flags.endpoint_given = true;
			break;
		case 'W':
			global_flags.stream.width = parse_int(optarg, 10, "width");
			global_flags.width_given = true;
			break;
		case 'H':
			global_flags.stream.height = parse_int(optarg, 10, "height");
			global_flags.height_given = true;
			break;
		case 1001:
			global_flags.stream.stride = parse_int(optarg, 10, "stride");
			break;
		case 'f':
			if (!parse_stream_format(optarg, &global_flags.stream.format)) {
				fprintf(stderr, "Unknown format '%s' (expected auto, mjpeg, yuy2 or uyvy)\n", optarg);
				exit(1);
			}
			global_flags.format_given = true;
			break;
		case 1002:
			global_flags.stream.max_packet_size = parse_int(optarg, 10, "packet-size");
			break;
		case 1003:
			global_flags.stream.packets_per_transfer = parse_int(optarg, 10, "packets-per-transfer");
			break;
		case 1004:
			global_flags.stream.num_transfers = parse_int(optarg, 10, "transfers");
			break;
		case 'V':
			global_flags.stream.validation_level = parse_validation_level(optarg);
			break;
		case 1005:
			if (!parse_raw_header_mode(optarg, &global_flags.stream.raw_header_mode)) {
				fprintf(stderr, "Unknown raw header mode '%s' (expected skip or strip)\n", optarg);
				exit(1);
			}
			break;
		case 1006:
			global_flags.sink_capacity = parse_int(optarg, 10, "sink-capacity");
			break;
		case 'o':
			global_flags.output_filename = optarg;
			break;
		case 1007:
			global_flags.output_mux_name = optarg;
			break;
		case 1008:
			global_flags.record_filename = optarg;
			break;
		case 'r':
			global_flags.replay_filename = optarg;
			break;
		case 1009:
			global_flags.replay_speed = atof(optarg);
			break;
		case 1010:
			global_flags.replay_loop = true;
			break;
		case 'n':
			global_flags.num_frames = parse_int(optarg, 10, "num-frames");
			break;
		case 1011:
			global_flags.stats_interval_sec = parse_int(optarg, 10, "stats-interval");
			break;
		case 1012:
			global_flags.stall_timeout_ms = parse_int(optarg, 10, "stall-timeout");
			break;
		case 1013:
			global_flags.max_restarts = parse_int(optarg, 10, "max-restarts");
			break;
		case 'h':
			usage();
			exit(0);
		default:
			fprintf(stderr, "Unknown option '%s'\n", argv[option_index]);
			fprintf(stderr, "\n");
			usage();
			exit(1);
		}
	}

	if (global_flags.replay_filename.empty() &&
	    global_flags.vendor_id == -1 && global_flags.device_fd == -1) {
		fprintf(stderr, "ERROR: need one of --device, --fd or --replay\n");
		fprintf(stderr, "\n");
		usage();
		exit(1);
	}
	if (global_flags.vendor_id != -1 && global_flags.device_fd != -1) {
		fprintf(stderr, "ERROR: --device and --fd are mutually incompatible\n");
		exit(1);
	}
	if (global_flags.stream.width == 0 || global_flags.stream.height == 0) {
		fprintf(stderr, "ERROR: width and height must be nonzero\n");
		exit(1);
	}
	if (global_flags.stream.packets_per_transfer == 0 || global_flags.stream.num_transfers == 0) {
		fprintf(stderr, "ERROR: --packets-per-transfer and --transfers must be nonzero\n");
		exit(1);
	}
	if (global_flags.replay_speed < 0.0) {
		fprintf(stderr, "ERROR: --replay-speed cannot be negative\n");
		exit(1);
	}
	if (global_flags.sink_capacity == 0) {
		fprintf(stderr, "ERROR: --sink-capacity must be at least 1\n");
		exit(1);
	}
}
