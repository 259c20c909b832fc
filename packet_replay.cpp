#include "packet_replay.h"

#include <stdio.h>
#include <algorithm>
#include <chrono>
#include <utility>

#include "frame_sink.h"
#include "payload_extractor.h"
#include "uvc_stream.h"

using namespace std;
using namespace std::chrono;

namespace {

// Builds one synthetic transfer out of packets[first, last). Every packet
// gets a slot exactly its own size.
void build_transfer(const vector<CapturedPacket> &packets, size_t first, size_t last, uint8_t endpoint,
                    vector<uint8_t> *buffer, vector<IsoPacketDesc> *descs, IsoTransferView *view)
{
	buffer->clear();
	descs->clear();
	for (size_t i = first; i < last; ++i) {
		const vector<uint8_t> &data = packets[i].data;
		buffer->insert(buffer->end(), data.begin(), data.end());

		IsoPacketDesc desc;
		desc.length = data.size();
		desc.actual_length = data.size();
		desc.status = PACKET_COMPLETED;
		descs->push_back(desc);
	}
	view->buffer = buffer->data();
	view->packets = descs->data();
	view->num_packets = descs->size();
	view->endpoint = endpoint;
}

}  // namespace

PacketReplay::PacketReplay(vector<CapturedPacket> packets, const StreamParams &params, UVCStream *stream)
	: packets(move(packets)), params(params), stream(stream)
{
}

PacketReplay::~PacketReplay()
{
	{
		unique_lock<mutex> lock(quit_mu);
		should_quit = true;
	}
	quit_cond.notify_all();
	join_thread();
}

bool PacketReplay::start()
{
	if (running()) {
		fprintf(stderr, "Replay already running\n");
		return false;
	}
	join_thread();  // Reap a replay that ran to the end.

	{
		unique_lock<mutex> lock(quit_mu);
		should_quit = false;
	}
	finished = false;
	replay_thread = thread(&PacketReplay::replay_thread_func, this);
	return true;
}

bool PacketReplay::stop()
{
	if (!running()) {
		fprintf(stderr, "Replay not running\n");
		join_thread();
		return false;
	}
	{
		unique_lock<mutex> lock(quit_mu);
		should_quit = true;
	}
	quit_cond.notify_all();
	join_thread();
	return true;
}

void PacketReplay::wait()
{
	join_thread();
}

void PacketReplay::join_thread()
{
	if (replay_thread.joinable()) {
		replay_thread.join();
	}
}

void PacketReplay::replay_thread_func()
{
	printf("Replaying %zu packets (speed %.2f%s)\n", packets.size(), speed, loop ? ", looping" : "");
	for ( ;; ) {
		if (!replay_once()) {
			break;
		}
		++num_loops;
		if (!loop || packets.empty()) {
			break;
		}
		stream->reset();
	}
	printf("Replay done after %llu transfers\n", (unsigned long long)num_transfers);
	finished = true;
}

bool PacketReplay::replay_once()
{
	const unsigned per_transfer = max(params.packets_per_transfer, 1u);
	const steady_clock::time_point start_time = steady_clock::now();
	const uint64_t first_timestamp = packets.empty() ? 0 : packets[0].timestamp_us;

	vector<uint8_t> buffer;
	vector<IsoPacketDesc> descs;
	for (size_t first = 0; first < packets.size(); first += per_transfer) {
		size_t last = min(first + per_transfer, packets.size());

		unique_lock<mutex> lock(quit_mu);
		if (speed > 0.0) {
			uint64_t offset_us = packets[first].timestamp_us - min(packets[first].timestamp_us, first_timestamp);
			steady_clock::time_point due = start_time + microseconds(uint64_t(offset_us / speed));
			quit_cond.wait_until(lock, due, [this]{ return should_quit; });
		}
		if (should_quit) {
			return false;
		}
		lock.unlock();

		IsoTransferView view;
		build_transfer(packets, first, last, params.endpoint, &buffer, &descs, &view);
		stream->process_transfer(view);
		++num_transfers;
	}
	return true;
}

vector<ReplayedFrame> replay_all_frames(const vector<CapturedPacket> &packets, const StreamParams &params)
{
	const unsigned per_transfer = max(params.packets_per_transfer, 1u);

	// At most one frame per packet can complete within a transfer.
	StreamParams replay_params = params;
	replay_params.num_queued_frames = max<size_t>(params.num_queued_frames, per_transfer + 2);

	vector<ReplayedFrame> frames;
	FrameSink sink(replay_params.num_queued_frames);
	UVCStream stream(replay_params, &sink);

	vector<uint8_t> buffer;
	vector<IsoPacketDesc> descs;
	for (size_t first = 0; first < packets.size(); first += per_transfer) {
		size_t last = min(first + per_transfer, packets.size());
		IsoTransferView view;
		build_transfer(packets, first, last, params.endpoint, &buffer, &descs, &view);
		stream.process_transfer(view);

		// Copy out and release right away, so the allocator never runs dry.
		CompletedFrame frame;
		while (sink.receive(&frame, 0)) {
			ReplayedFrame replayed;
			replayed.format = frame.format;
			replayed.valid = frame.valid;
			replayed.data.assign(frame.frame->data, frame.frame->data + frame.frame->len);
			frames.push_back(move(replayed));
			frame = CompletedFrame();
		}
	}
	return frames;
}
