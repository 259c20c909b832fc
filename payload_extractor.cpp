#include "payload_extractor.h"

#include <stdio.h>
#include <string.h>

#include "defs.h"
#include "uvc_header.h"

using namespace std;

namespace {

bool should_log(uint64_t count)
{
	return count <= LOG_FIRST_N || count % LOG_EVERY_N == 0;
}

}  // namespace

const char *packet_status_name(PacketStatus status)
{
	switch (status) {
	case PACKET_COMPLETED:
		return "completed";
	case PACKET_ERROR:
		return "error";
	case PACKET_TIMED_OUT:
		return "timed out";
	case PACKET_CANCELLED:
		return "cancelled";
	case PACKET_STALL:
		return "stall";
	case PACKET_NO_DEVICE:
		return "no device";
	case PACKET_OVERFLOW:
		return "overflow";
	}
	return "unknown";
}

bool is_zero_filled(const uint8_t *data, size_t len)
{
	if (len <= 8) {
		return false;
	}
	static const uint8_t zeros[8] = { 0 };
	return memcmp(data, zeros, sizeof(zeros)) == 0;
}

bool PayloadExtractor::extract(const IsoTransferView &xfr, uint64_t sequence, UrbPayload *out)
{
	out->sequence = sequence;
	out->data.clear();
	out->packets.clear();
	++stats_.transfers;

	size_t offset = 0;
	for (unsigned i = 0; i < xfr.num_packets; ++i) {
		const IsoPacketDesc *pack = &xfr.packets[i];
		const uint8_t *start = xfr.buffer + offset;
		offset += pack->length;
		++stats_.packets;

		if (pack->status != PACKET_COMPLETED) {
			++stats_.packet_errors;
			if (should_log(stats_.packet_errors)) {
				fprintf(stderr, "Error: pack %u/%u status %s (%llu packet errors so far)\n",
					i, xfr.num_packets, packet_status_name(pack->status),
					(unsigned long long)stats_.packet_errors);
			}
			PacketMeta meta;
			meta.error = true;
			meta.offset = out->data.size();
			out->packets.push_back(meta);
			continue;
		}
		if (pack->actual_length == 0) {
			++stats_.empty_packets;
			continue;
		}

		size_t len = pack->actual_length;
		if (len > pack->length) {
			fprintf(stderr, "pack %u/%u claims %u bytes in a %u-byte slot, truncating\n",
				i, xfr.num_packets, pack->actual_length, pack->length);
			len = pack->length;
		}
		extract_packet(start, len, out);
	}

	return !out->packets.empty();
}

void PayloadExtractor::extract_packet(const uint8_t *start, size_t len, UrbPayload *out)
{
	PacketMeta meta;
	meta.offset = out->data.size();

	UVCHeader header;
	unsigned header_len = parse_uvc_header(start, len, &header);
	if (header_len > 0) {
		meta.has_header = true;
		meta.header_length = header_len;
		meta.frame_id = header.frame_id();
		meta.end_of_frame = header.end_of_frame();
		meta.header_error = header.error();

		unsigned flags_len = uvc_header_length_from_flags(header.flags);
		if (header_len != flags_len) {
			++stats_.header_length_mismatches;
			if (should_log(stats_.header_length_mismatches)) {
				fprintf(stderr, "Payload header declares %u bytes, flags 0x%02x imply %u (%llu so far)\n",
					header_len, header.flags, flags_len,
					(unsigned long long)stats_.header_length_mismatches);
			}
		}
	} else {
		++stats_.headerless_packets;
	}

	out->data.insert(out->data.end(), start, start + len);
	meta.length = len - header_len;
	stats_.payload_bytes += meta.length;
	out->packets.push_back(meta);
}
