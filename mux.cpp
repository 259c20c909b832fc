#include "mux.h"

#include <stdio.h>
#include <string.h>

#include "timebase.h"

using namespace std;

namespace {

string av_error_string(int err)
{
	char buf[AV_ERROR_MAX_STRING_SIZE];
	av_strerror(err, buf, sizeof(buf));
	return buf;
}

}  // namespace

unique_ptr<Mux> Mux::open(const string &filename, const string &mux_name,
                          unsigned width, unsigned height, FrameFormat format)
{
	AVFormatContext *avctx = nullptr;
	int err = avformat_alloc_output_context2(&avctx, nullptr, mux_name.c_str(), filename.c_str());
	if (err < 0 || avctx == nullptr) {
		fprintf(stderr, "%s: could not set up mux '%s': %s\n", filename.c_str(), mux_name.c_str(),
			av_error_string(err).c_str());
		return nullptr;
	}

	AVStream *avstream_video = avformat_new_stream(avctx, nullptr);
	if (avstream_video == nullptr) {
		fprintf(stderr, "avformat_new_stream() failed\n");
		avformat_free_context(avctx);
		return nullptr;
	}
	avstream_video->time_base = AVRational{1, TIMEBASE};

	AVCodecParameters *par = avstream_video->codecpar;
	par->codec_type = AVMEDIA_TYPE_VIDEO;
	if (format == FRAME_FORMAT_MJPEG) {
		par->codec_id = AV_CODEC_ID_MJPEG;
		par->format = AV_PIX_FMT_YUVJ422P;
		par->color_range = AVCOL_RANGE_JPEG;
	} else {
		AVPixelFormat pix_fmt = (format == FRAME_FORMAT_UYVY) ? AV_PIX_FMT_UYVY422 : AV_PIX_FMT_YUYV422;
		par->codec_id = AV_CODEC_ID_RAWVIDEO;
		par->format = pix_fmt;
		par->codec_tag = avcodec_pix_fmt_to_codec_tag(pix_fmt);
		par->color_range = AVCOL_RANGE_MPEG;
	}
	par->width = width;
	par->height = height;
	par->field_order = AV_FIELD_PROGRESSIVE;

	if (!(avctx->oformat->flags & AVFMT_NOFILE)) {
		err = avio_open2(&avctx->pb, filename.c_str(), AVIO_FLAG_WRITE, nullptr, nullptr);
		if (err < 0) {
			fprintf(stderr, "%s: %s\n", filename.c_str(), av_error_string(err).c_str());
			avformat_free_context(avctx);
			return nullptr;
		}
	}

	err = avformat_write_header(avctx, nullptr);
	if (err < 0) {
		fprintf(stderr, "avformat_write_header() failed: %s\n", av_error_string(err).c_str());
		avio_closep(&avctx->pb);
		avformat_free_context(avctx);
		return nullptr;
	}

	// Make sure the header is written before we return.
	avio_flush(avctx->pb);
	printf("Writing %s %ux%u video to %s (mux %s)\n", frame_format_name(format), width, height,
		filename.c_str(), mux_name.c_str());
	return unique_ptr<Mux>(new Mux(avctx, avstream_video));
}

Mux::Mux(AVFormatContext *avctx, AVStream *avstream_video)
	: avctx(avctx), avstream_video(avstream_video)
{
}

Mux::~Mux()
{
	int err = av_write_trailer(avctx);
	if (err < 0) {
		fprintf(stderr, "av_write_trailer() failed: %s\n", av_error_string(err).c_str());
	}
	if (!(avctx->oformat->flags & AVFMT_NOFILE)) {
		avio_closep(&avctx->pb);
	}
	avformat_free_context(avctx);
}

bool Mux::add_frame(const uint8_t *data, size_t len, int64_t timestamp_us)
{
	unique_lock<mutex> lock(ctx_mu);
	if (!has_first_timestamp) {
		first_timestamp_us = timestamp_us;
		has_first_timestamp = true;
	}
	int64_t pts = av_rescale_q(timestamp_us - first_timestamp_us,
		AVRational{1, TIMESTAMP_TIMEBASE}, avstream_video->time_base);
	if (pts <= last_pts) {
		// Muxers want strictly increasing timestamps.
		pts = last_pts + 1;
	}
	last_pts = pts;

	AVPacket *pkt = av_packet_alloc();
	if (pkt == nullptr) {
		fprintf(stderr, "av_packet_alloc() failed\n");
		return false;
	}
	int err = av_new_packet(pkt, len);
	if (err < 0) {
		fprintf(stderr, "av_new_packet() failed: %s\n", av_error_string(err).c_str());
		av_packet_free(&pkt);
		return false;
	}
	memcpy(pkt->data, data, len);
	pkt->stream_index = avstream_video->index;
	pkt->pts = pkt->dts = pts;
	pkt->flags = AV_PKT_FLAG_KEY;

	err = av_interleaved_write_frame(avctx, pkt);
	av_packet_free(&pkt);
	if (err < 0) {
		fprintf(stderr, "av_interleaved_write_frame() failed: %s\n", av_error_string(err).c_str());
		return false;
	}
	++num_frames;
	return true;
}
