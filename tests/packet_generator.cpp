#include "packet_generator.h"

#include <algorithm>

#include "uvc_header.h"

using namespace std;

vector<uint8_t> make_raw_frame(unsigned width, unsigned height, TestPattern pattern, bool uyvy)
{
	vector<uint8_t> frame;
	frame.reserve(size_t(width) * height * 2);
	for (unsigned y = 0; y < height; ++y) {
		for (unsigned x = 0; x < width; ++x) {
			uint8_t luma;
			switch (pattern) {
			case PATTERN_SOLID:
				luma = 128;
				break;
			case PATTERN_GRADIENT:
				luma = 16 + (x / 4 + y) % 200;
				break;
			case PATTERN_BANDED:
			default:
				luma = (y % 2 == 0) ? 16 : 235;
				break;
			}
			uint8_t chroma = (x % 2 == 0) ? 128 : 120;
			if (uyvy) {
				frame.push_back(chroma);
				frame.push_back(luma);
			} else {
				frame.push_back(luma);
				frame.push_back(chroma);
			}
		}
	}
	return frame;
}

vector<uint8_t> make_jpeg(size_t len, uint8_t seed)
{
	vector<uint8_t> jpeg;
	jpeg.push_back(0xff);
	jpeg.push_back(0xd8);
	for (size_t i = 4; i < len; ++i) {
		jpeg.push_back(1 + (seed + i * 7) % 250);
	}
	jpeg.push_back(0xff);
	jpeg.push_back(0xd9);
	return jpeg;
}

vector<uint8_t> make_uvc_header(uint8_t flags)
{
	vector<uint8_t> header;
	header.push_back(2);
	header.push_back(UVC_STREAM_EOH | flags);
	return header;
}

vector<vector<uint8_t>> split_payload(const vector<uint8_t> &payload, size_t chunk_size)
{
	vector<vector<uint8_t>> chunks;
	for (size_t offset = 0; offset < payload.size(); offset += chunk_size) {
		size_t end = min(offset + chunk_size, payload.size());
		chunks.push_back(vector<uint8_t>(payload.begin() + offset, payload.begin() + end));
	}
	return chunks;
}

vector<vector<uint8_t>> add_headers(const vector<vector<uint8_t>> &chunks, bool fid, bool eof_on_last)
{
	vector<vector<uint8_t>> packets;
	for (size_t i = 0; i < chunks.size(); ++i) {
		uint8_t flags = fid ? UVC_STREAM_FID : 0;
		if (eof_on_last && i == chunks.size() - 1) {
			flags |= UVC_STREAM_EOF;
		}
		vector<uint8_t> packet = make_uvc_header(flags);
		packet.insert(packet.end(), chunks[i].begin(), chunks[i].end());
		packets.push_back(packet);
	}
	return packets;
}

IsoTransferView SyntheticTransfer::view() const
{
	IsoTransferView view;
	view.buffer = buffer.data();
	view.packets = packets.data();
	view.num_packets = packets.size();
	view.endpoint = endpoint;
	return view;
}

SyntheticTransfer make_transfer(const vector<vector<uint8_t>> &packets, size_t first, size_t count,
                                unsigned slot_size)
{
	SyntheticTransfer xfr;
	for (size_t i = first; i < first + count && i < packets.size(); ++i) {
		const vector<uint8_t> &packet = packets[i];
		unsigned length = (slot_size == 0) ? packet.size() : slot_size;
		unsigned actual_length = min<size_t>(packet.size(), length);

		xfr.buffer.insert(xfr.buffer.end(), packet.begin(), packet.begin() + actual_length);
		xfr.buffer.insert(xfr.buffer.end(), length - actual_length, 0xaa);

		IsoPacketDesc desc;
		desc.length = length;
		desc.actual_length = actual_length;
		desc.status = PACKET_COMPLETED;
		xfr.packets.push_back(desc);
	}
	return xfr;
}

vector<SyntheticTransfer> make_transfers(const vector<vector<uint8_t>> &packets, size_t per_transfer, unsigned slot_size)
{
	vector<SyntheticTransfer> transfers;
	for (size_t first = 0; first < packets.size(); first += per_transfer) {
		transfers.push_back(make_transfer(packets, first, per_transfer, slot_size));
	}
	return transfers;
}

UrbPayload make_payload(uint64_t sequence, const vector<vector<uint8_t>> &chunks,
                        bool with_header, bool fid, bool eof_on_last)
{
	UrbPayload payload;
	payload.sequence = sequence;
	for (size_t i = 0; i < chunks.size(); ++i) {
		PacketMeta meta;
		meta.offset = payload.data.size();
		meta.length = chunks[i].size();
		if (with_header) {
			meta.has_header = true;
			meta.header_length = 2;
			meta.frame_id = fid;
			meta.end_of_frame = eof_on_last && i == chunks.size() - 1;

			uint8_t flags = (meta.frame_id ? UVC_STREAM_FID : 0) | (meta.end_of_frame ? UVC_STREAM_EOF : 0);
			vector<uint8_t> header = make_uvc_header(flags);
			payload.data.insert(payload.data.end(), header.begin(), header.end());
		}
		payload.data.insert(payload.data.end(), chunks[i].begin(), chunks[i].end());
		payload.packets.push_back(meta);
	}
	return payload;
}

vector<uint8_t> concat(const vector<vector<uint8_t>> &chunks)
{
	vector<uint8_t> out;
	for (const vector<uint8_t> &chunk : chunks) {
		out.insert(out.end(), chunk.begin(), chunk.end());
	}
	return out;
}
