#ifndef _PAYLOAD_EXTRACTOR_H
#define _PAYLOAD_EXTRACTOR_H 1

// Turns one completed isochronous transfer into a contiguous blob of packet
// bytes plus a record per packet of what looked like a UVC header at its
// start, and what that header said. The header bytes stay in the blob;
// whether they really are a header (or pixel data that happens to look like
// one) is only known once the payload is applied in order, so FrameAssembler
// decides. The transfer itself is described without reference to the USB
// library, so that replayed or synthetic transfers go through the exact
// same code as live ones.

#include <stddef.h>
#include <stdint.h>
#include <vector>

enum PacketStatus {
	PACKET_COMPLETED = 0,
	PACKET_ERROR,
	PACKET_TIMED_OUT,
	PACKET_CANCELLED,
	PACKET_STALL,
	PACKET_NO_DEVICE,
	PACKET_OVERFLOW,
};

const char *packet_status_name(PacketStatus status);

struct IsoPacketDesc {
	unsigned length = 0;  // Room reserved in the transfer buffer.
	unsigned actual_length = 0;  // What the device actually sent.
	PacketStatus status = PACKET_COMPLETED;
};

// Packet i starts at <buffer> + the sum of length for packets 0..i-1,
// just like libusb lays out iso transfers.
struct IsoTransferView {
	const uint8_t *buffer = nullptr;
	const IsoPacketDesc *packets = nullptr;
	unsigned num_packets = 0;
	uint8_t endpoint = 0;
};

struct PacketMeta {
	bool frame_id = false;
	bool end_of_frame = false;
	bool error = false;  // Packet status error; no bytes.
	bool header_error = false;  // ERR bit in the header.
	bool has_header = false;
	unsigned header_length = 0;  // Header bytes at <offset>.
	size_t offset = 0;  // Into UrbPayload::data, where the packet starts.
	size_t length = 0;  // Payload bytes after the header.
};

struct UrbPayload {
	uint64_t sequence = 0;
	std::vector<uint8_t> data;
	std::vector<PacketMeta> packets;
};

struct ExtractorStats {
	uint64_t transfers = 0;
	uint64_t packets = 0;
	uint64_t empty_packets = 0;
	uint64_t packet_errors = 0;
	uint64_t headerless_packets = 0;
	uint64_t header_length_mismatches = 0;  // Declared length disagrees with the PTS/SCR flags.
	uint64_t payload_bytes = 0;
};

class PayloadExtractor {
public:
	// Extracts all packets of <xfr> into <out>, tagging it with <sequence>.
	// Returns false if the transfer produced nothing worth queueing
	// (no packet with bytes or an error).
	bool extract(const IsoTransferView &xfr, uint64_t sequence, UrbPayload *out);

	const ExtractorStats &stats() const { return stats_; }
	void reset_stats() { stats_ = ExtractorStats(); }

private:
	void extract_packet(const uint8_t *start, size_t len, UrbPayload *out);

	ExtractorStats stats_;
};

// Payloads whose first eight bytes are all zero are taken to be stray
// zero-filled packets. (This can drop genuine near-black video data.)
bool is_zero_filled(const uint8_t *data, size_t len);

#endif  // !defined(_PAYLOAD_EXTRACTOR_H)
