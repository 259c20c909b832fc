#include "packet_capture.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "defs.h"

using namespace std;
using namespace std::chrono;

namespace {

void put_le(uint8_t *dst, uint64_t val, unsigned bytes)
{
	for (unsigned i = 0; i < bytes; ++i) {
		dst[i] = val & 0xff;
		val >>= 8;
	}
}

uint64_t get_le(const uint8_t *src, unsigned bytes)
{
	uint64_t val = 0;
	for (unsigned i = bytes; i-- > 0; ) {
		val = (val << 8) | src[i];
	}
	return val;
}

StreamFormat stream_format_for(FrameFormat format)
{
	switch (format) {
	case FRAME_FORMAT_MJPEG:
		return STREAM_FORMAT_MJPEG;
	case FRAME_FORMAT_YUY2:
		return STREAM_FORMAT_YUY2;
	case FRAME_FORMAT_UYVY:
		return STREAM_FORMAT_UYVY;
	}
	return STREAM_FORMAT_AUTO;
}

bool parse_metadata_number(const string &value, uint64_t max_value, uint64_t *out)
{
	if (value.empty() || value[0] == '-') {
		return false;
	}
	char *end;
	errno = 0;
	unsigned long long ret = strtoull(value.c_str(), &end, 0);
	if (errno != 0 || *end != '\0' || ret > max_value) {
		return false;
	}
	*out = ret;
	return true;
}

}  // namespace

string capture_metadata_filename(const string &capture_filename)
{
	return capture_filename + ".meta";
}

bool write_capture_metadata(const string &filename, const CaptureMetadata &metadata)
{
	FILE *fp = fopen(filename.c_str(), "w");
	if (fp == nullptr) {
		perror(filename.c_str());
		return false;
	}
	fprintf(fp, "# uvcscope capture metadata\n");
	if (metadata.vendor_id >= 0) {
		fprintf(fp, "vendor_id 0x%04x\n", metadata.vendor_id);
	}
	if (metadata.product_id >= 0) {
		fprintf(fp, "product_id 0x%04x\n", metadata.product_id);
	}
	fprintf(fp, "endpoint 0x%02x\n", metadata.endpoint);
	fprintf(fp, "format %s\n", stream_format_name(metadata.format));
	fprintf(fp, "width %u\n", metadata.width);
	fprintf(fp, "height %u\n", metadata.height);
	fprintf(fp, "total_packets %llu\n", (unsigned long long)metadata.total_packets);
	fprintf(fp, "total_bytes %llu\n", (unsigned long long)metadata.total_bytes);
	fprintf(fp, "total_frames %llu\n", (unsigned long long)metadata.total_frames);
	fprintf(fp, "duration_ms %llu\n", (unsigned long long)metadata.duration_ms);
	if (!metadata.description.empty()) {
		fprintf(fp, "description %s\n", metadata.description.c_str());
	}
	if (ferror(fp)) {
		fprintf(stderr, "%s: write error (%s)\n", filename.c_str(), strerror(errno));
		fclose(fp);
		return false;
	}
	if (fclose(fp) != 0) {
		perror(filename.c_str());
		return false;
	}
	return true;
}

bool read_capture_metadata(const string &filename, CaptureMetadata *metadata)
{
	FILE *fp = fopen(filename.c_str(), "r");
	if (fp == nullptr) {
		perror(filename.c_str());
		return false;
	}

	CaptureMetadata ret;
	char buf[4096];
	unsigned lineno = 0;
	bool ok = true;
	while (ok && fgets(buf, sizeof(buf), fp) != nullptr) {
		++lineno;
		string line(buf);
		while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
			line.pop_back();
		}
		if (line.empty() || line[0] == '#') {
			continue;
		}
		size_t space = line.find(' ');
		if (space == string::npos || space + 1 == line.size()) {
			fprintf(stderr, "%s:%u: no value for '%s'\n", filename.c_str(), lineno, line.c_str());
			ok = false;
			break;
		}
		string key = line.substr(0, space);
		string value = line.substr(space + 1);

		uint64_t num = 0;
		if (key == "description") {
			ret.description = value;
		} else if (key == "format") {
			ok = parse_stream_format(value, &ret.format);
		} else if (key == "vendor_id") {
			ok = parse_metadata_number(value, 0xffff, &num);
			ret.vendor_id = num;
		} else if (key == "product_id") {
			ok = parse_metadata_number(value, 0xffff, &num);
			ret.product_id = num;
		} else if (key == "endpoint") {
			ok = parse_metadata_number(value, 0xff, &num);
			ret.endpoint = num;
		} else if (key == "width") {
			ok = parse_metadata_number(value, MAX_FRAME_DIMENSION, &num);
			ret.width = num;
		} else if (key == "height") {
			ok = parse_metadata_number(value, MAX_FRAME_DIMENSION, &num);
			ret.height = num;
		} else if (key == "total_packets") {
			ok = parse_metadata_number(value, UINT64_MAX, &ret.total_packets);
		} else if (key == "total_bytes") {
			ok = parse_metadata_number(value, UINT64_MAX, &ret.total_bytes);
		} else if (key == "total_frames") {
			ok = parse_metadata_number(value, UINT64_MAX, &ret.total_frames);
		} else if (key == "duration_ms") {
			ok = parse_metadata_number(value, UINT64_MAX, &ret.duration_ms);
		} else {
			fprintf(stderr, "%s:%u: WARNING: unknown key '%s', ignoring\n",
				filename.c_str(), lineno, key.c_str());
		}
		if (!ok) {
			fprintf(stderr, "%s:%u: bad value '%s' for %s\n",
				filename.c_str(), lineno, value.c_str(), key.c_str());
		}
	}
	if (ok && ferror(fp)) {
		fprintf(stderr, "%s: read error (%s)\n", filename.c_str(), strerror(errno));
		ok = false;
	}
	fclose(fp);

	if (ok) {
		*metadata = ret;
	}
	return ok;
}

void apply_capture_metadata(const CaptureMetadata &metadata, StreamParams *params)
{
	if (metadata.width != 0) {
		params->width = metadata.width;
	}
	if (metadata.height != 0) {
		params->height = metadata.height;
	}
	if (metadata.format != STREAM_FORMAT_AUTO) {
		params->format = metadata.format;
	}
	params->endpoint = metadata.endpoint;
}

PacketRecorder::~PacketRecorder()
{
	close();
}

bool PacketRecorder::open(const string &filename)
{
	unique_lock<mutex> lock(mu);
	if (fp != nullptr) {
		fprintf(stderr, "%s: packet capture already open to %s\n", filename.c_str(), this->filename.c_str());
		return false;
	}
	fp = fopen(filename.c_str(), "wb");
	if (fp == nullptr) {
		perror(filename.c_str());
		return false;
	}
	this->filename = filename;
	start = steady_clock::now();
	packets_written = bytes_written = frames_seen = 0;
	printf("Recording packets to %s\n", filename.c_str());
	return true;
}

void PacketRecorder::close()
{
	unique_lock<mutex> lock(mu);
	if (fp == nullptr) {
		return;
	}
	if (fclose(fp) != 0) {
		perror(filename.c_str());
	} else {
		printf("Packet capture %s closed: %llu packets, %llu bytes, %llu frames\n", filename.c_str(),
			(unsigned long long)packets_written, (unsigned long long)bytes_written,
			(unsigned long long)frames_seen);
	}
	fp = nullptr;

	meta.total_packets = packets_written;
	meta.total_bytes = bytes_written;
	meta.total_frames = frames_seen;
	meta.duration_ms = duration_cast<milliseconds>(steady_clock::now() - start).count();
	string meta_filename = capture_metadata_filename(filename);
	if (!write_capture_metadata(meta_filename, meta)) {
		fprintf(stderr, "%s: could not write capture metadata; replay will need explicit stream flags\n",
			meta_filename.c_str());
	}
}

bool PacketRecorder::is_open() const
{
	unique_lock<mutex> lock(mu);
	return fp != nullptr;
}

void PacketRecorder::record(const uint8_t *data, size_t len, uint8_t endpoint)
{
	uint64_t timestamp_us = duration_cast<microseconds>(steady_clock::now() - start).count();
	record_at(timestamp_us, data, len, endpoint);
}

void PacketRecorder::record_at(uint64_t timestamp_us, const uint8_t *data, size_t len, uint8_t endpoint)
{
	uint8_t hdr[CAPTURE_RECORD_HEADER_SIZE];
	put_le(hdr, timestamp_us, 8);
	put_le(hdr + 8, len, 4);
	hdr[12] = endpoint;

	unique_lock<mutex> lock(mu);
	if (fp == nullptr) {
		return;
	}
	if (fwrite(hdr, sizeof(hdr), 1, fp) != 1 ||
	    (len > 0 && fwrite(data, len, 1, fp) != 1)) {
		fprintf(stderr, "%s: write error (%s), stopping packet capture\n",
			filename.c_str(), strerror(errno));
		fclose(fp);
		fp = nullptr;
		return;
	}
	++packets_written;
	bytes_written += len;
}

void PacketRecorder::set_metadata(const CaptureMetadata &metadata)
{
	unique_lock<mutex> lock(mu);
	meta = metadata;
}

void PacketRecorder::count_frame(FrameFormat format)
{
	unique_lock<mutex> lock(mu);
	if (fp == nullptr) {
		return;
	}
	++frames_seen;
	if (meta.format == STREAM_FORMAT_AUTO) {
		meta.format = stream_format_for(format);
	}
}

uint64_t PacketRecorder::num_packets() const
{
	unique_lock<mutex> lock(mu);
	return packets_written;
}

uint64_t PacketRecorder::num_bytes() const
{
	unique_lock<mutex> lock(mu);
	return bytes_written;
}

uint64_t PacketRecorder::num_frames() const
{
	unique_lock<mutex> lock(mu);
	return frames_seen;
}

bool parse_capture_data(const uint8_t *data, size_t len, vector<CapturedPacket> *packets)
{
	size_t offset = 0;
	while (offset < len) {
		if (len - offset < CAPTURE_RECORD_HEADER_SIZE) {
			fprintf(stderr, "Truncated record header at offset %zu (%zu bytes left)\n",
				offset, len - offset);
			return false;
		}
		const uint8_t *hdr = data + offset;
		size_t packet_len = get_le(hdr + 8, 4);
		if (packet_len > MAX_CAPTURE_RECORD_SIZE) {
			fprintf(stderr, "Record at offset %zu claims %zu bytes (max %d), file is probably corrupt\n",
				offset, packet_len, MAX_CAPTURE_RECORD_SIZE);
			return false;
		}
		if (len - offset - CAPTURE_RECORD_HEADER_SIZE < packet_len) {
			fprintf(stderr, "Truncated record at offset %zu (%zu bytes, %zu left)\n",
				offset, packet_len, len - offset - CAPTURE_RECORD_HEADER_SIZE);
			return false;
		}

		CapturedPacket packet;
		packet.timestamp_us = get_le(hdr, 8);
		packet.endpoint = hdr[12];
		packet.data.assign(hdr + CAPTURE_RECORD_HEADER_SIZE, hdr + CAPTURE_RECORD_HEADER_SIZE + packet_len);
		packets->push_back(move(packet));

		offset += CAPTURE_RECORD_HEADER_SIZE + packet_len;
	}
	return true;
}

bool read_capture_file(const string &filename, vector<CapturedPacket> *packets,
                       CaptureMetadata *metadata)
{
	FILE *fp = fopen(filename.c_str(), "rb");
	if (fp == nullptr) {
		perror(filename.c_str());
		return false;
	}

	vector<uint8_t> contents;
	uint8_t buf[65536];
	for ( ;; ) {
		size_t ret = fread(buf, 1, sizeof(buf), fp);
		contents.insert(contents.end(), buf, buf + ret);
		if (ret < sizeof(buf)) {
			break;
		}
	}
	if (ferror(fp)) {
		fprintf(stderr, "%s: read error (%s)\n", filename.c_str(), strerror(errno));
		fclose(fp);
		return false;
	}
	fclose(fp);

	if (!parse_capture_data(contents.data(), contents.size(), packets)) {
		fprintf(stderr, "%s: could not parse packet capture\n", filename.c_str());
		return false;
	}

	if (metadata != nullptr) {
		string meta_filename = capture_metadata_filename(filename);
		if (access(meta_filename.c_str(), F_OK) != 0) {
			printf("%s: no capture metadata, using the stream flags as given\n", filename.c_str());
			*metadata = CaptureMetadata();
		} else if (!read_capture_metadata(meta_filename, metadata)) {
			return false;
		}
	}
	return true;
}
