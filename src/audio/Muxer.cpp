// Repository: Dossier-render
// Component: Muxer
// Purpose: Combines the silent video with the soundtrack into the final MP4.
// Copyright (c) 2025 Dossier

#include "dossier/audio/Muxer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"

#ifdef DOSSIER_FFMPEG_AVAILABLE
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}
#endif

namespace dossier::audio {

LibavMuxer::LibavMuxer(const std::atomic<bool>* interrupt, int audio_bitrate)
    : interrupt_(interrupt), audio_bitrate_(audio_bitrate) {}

#ifndef DOSSIER_FFMPEG_AVAILABLE

bool LibavMuxer::Available() { return false; }

RenderResult LibavMuxer::Mux(const MuxRequest& request) {
  return RenderResult::Failure(RenderError::kAudioFailure,
                               "built without FFmpeg; cannot mux " + request.audio_path);
}

#else

namespace {

using Clock = std::chrono::steady_clock;

struct InterruptState {
  Clock::time_point deadline;
  const std::atomic<bool>* interrupt = nullptr;
  bool timed_out = false;
};

// FFmpeg interrupt callback: return non-zero to abort I/O.
int InterruptCallback(void* opaque) {
  auto* state = static_cast<InterruptState*>(opaque);
  if (state->interrupt && state->interrupt->load(std::memory_order_acquire)) return 1;
  if (Clock::now() >= state->deadline) {
    state->timed_out = true;
    return 1;
  }
  return 0;
}

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

// Length of a stream in seconds, falling back to the container duration.
// Negative when neither is known.
double StreamSeconds(const AVFormatContext* ctx, int index) {
  const AVStream* st = ctx->streams[index];
  if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
    return static_cast<double>(st->duration) * av_q2d(st->time_base);
  }
  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    return static_cast<double>(ctx->duration) / AV_TIME_BASE;
  }
  return -1.0;
}

// =============================================================================
// MuxJob: one remux from open to trailer. All libav state is released by the
// destructor, in reverse order of acquisition.
// =============================================================================
class MuxJob {
 public:
  MuxJob(const MuxRequest& request, std::string temp_path, InterruptState* irq, int bitrate)
      : request_(request), temp_path_(std::move(temp_path)), irq_(irq), bitrate_(bitrate) {}

  ~MuxJob() {
    av_frame_free(&chunk_);
    av_frame_free(&decoded_);
    av_packet_free(&packet_);
    if (fifo_) av_audio_fifo_free(fifo_);
    swr_free(&swr_);
    avcodec_free_context(&encoder_);
    avcodec_free_context(&decoder_);
    if (out_) {
      if (out_->pb) avio_closep(&out_->pb);
      avformat_free_context(out_);
    }
    avformat_close_input(&audio_in_);
    avformat_close_input(&video_in_);
  }

  MuxJob(const MuxJob&) = delete;
  MuxJob& operator=(const MuxJob&) = delete;

  bool Run(std::string* error);

 private:
  bool OpenInput(const std::string& path, AVFormatContext** ctx);
  bool OpenInputs();
  bool OpenDecoder();
  bool OpenOutput();
  bool CopyVideoPacket(bool* done, double* position);
  bool PumpAudio(bool* done);
  bool ReceiveDecoded();
  bool Resample(const uint8_t** input, int samples);
  bool EncodeFromFifo(bool flush);
  bool SendToEncoder(AVFrame* frame);

  bool Fail(const std::string& message) {
    error_ = message;
    return false;
  }

  const MuxRequest& request_;
  std::string temp_path_;
  InterruptState* irq_;
  int bitrate_;
  std::string error_;

  AVFormatContext* video_in_ = nullptr;
  AVFormatContext* audio_in_ = nullptr;
  AVFormatContext* out_ = nullptr;
  AVCodecContext* decoder_ = nullptr;
  AVCodecContext* encoder_ = nullptr;
  SwrContext* swr_ = nullptr;
  AVAudioFifo* fifo_ = nullptr;
  AVPacket* packet_ = nullptr;
  AVFrame* decoded_ = nullptr;
  AVFrame* chunk_ = nullptr;

  int video_index_ = -1;
  int audio_index_ = -1;
  AVStream* video_out_ = nullptr;
  AVStream* audio_out_ = nullptr;

  // Shortest-stream cut.
  double limit_sec_ = std::numeric_limits<double>::infinity();
  int64_t sample_limit_ = std::numeric_limits<int64_t>::max();
  // Encoded audio samples; also the pts of the next audio frame.
  int64_t samples_encoded_ = 0;
};

bool MuxJob::Run(std::string* error) {
  packet_ = av_packet_alloc();
  decoded_ = av_frame_alloc();
  chunk_ = av_frame_alloc();
  if (!packet_ || !decoded_ || !chunk_) {
    *error = "cannot allocate packet/frame";
    return false;
  }

  if (!OpenInputs() || !OpenDecoder() || !OpenOutput()) {
    *error = error_;
    return false;
  }

  bool video_done = false;
  bool audio_done = false;
  double video_sec = 0.0;
  const double sample_rate = static_cast<double>(encoder_->sample_rate);

  // Advance whichever stream is behind so the interleaver never has to hold
  // more than a few packets.
  while (!video_done || !audio_done) {
    if (InterruptCallback(irq_)) {
      *error = "aborted";
      return false;
    }
    const double audio_sec = static_cast<double>(samples_encoded_) / sample_rate;
    bool ok;
    if (!video_done && (audio_done || video_sec <= audio_sec)) {
      ok = CopyVideoPacket(&video_done, &video_sec);
    } else {
      ok = PumpAudio(&audio_done);
    }
    if (!ok) {
      *error = error_;
      return false;
    }
  }

  if (!EncodeFromFifo(true) || !SendToEncoder(nullptr)) {
    *error = error_;
    return false;
  }

  int ret = av_write_trailer(out_);
  if (ret < 0) {
    *error = "write trailer: " + AvError(ret);
    return false;
  }
  ret = avio_closep(&out_->pb);
  if (ret < 0) {
    *error = "close " + temp_path_ + ": " + AvError(ret);
    return false;
  }
  return true;
}

bool MuxJob::OpenInput(const std::string& path, AVFormatContext** ctx) {
  *ctx = avformat_alloc_context();
  if (!*ctx) return Fail("cannot allocate input context");
  (*ctx)->interrupt_callback.callback = InterruptCallback;
  (*ctx)->interrupt_callback.opaque = irq_;

  // On failure avformat_open_input frees the context and nulls the pointer.
  int ret = avformat_open_input(ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) return Fail("open " + path + ": " + AvError(ret));
  ret = avformat_find_stream_info(*ctx, nullptr);
  if (ret < 0) return Fail("stream info " + path + ": " + AvError(ret));
  return true;
}

bool MuxJob::OpenInputs() {
  if (!OpenInput(request_.video_path, &video_in_)) return false;
  video_index_ = av_find_best_stream(video_in_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_index_ < 0) return Fail("no video stream in " + request_.video_path);

  if (!OpenInput(request_.audio_path, &audio_in_)) return false;
  audio_index_ = av_find_best_stream(audio_in_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_index_ < 0) return Fail("no audio stream in " + request_.audio_path);

  const double video_sec = StreamSeconds(video_in_, video_index_);
  const double audio_sec = StreamSeconds(audio_in_, audio_index_);
  if (video_sec > 0.0) limit_sec_ = video_sec;
  if (audio_sec > 0.0) limit_sec_ = std::min(limit_sec_, audio_sec);
  return true;
}

bool MuxJob::OpenDecoder() {
  const AVStream* in = audio_in_->streams[audio_index_];
  const AVCodec* codec = avcodec_find_decoder(in->codecpar->codec_id);
  if (!codec) return Fail("no decoder for " + request_.audio_path);

  decoder_ = avcodec_alloc_context3(codec);
  if (!decoder_) return Fail("cannot allocate decoder");
  int ret = avcodec_parameters_to_context(decoder_, in->codecpar);
  if (ret < 0) return Fail("decoder parameters: " + AvError(ret));
  decoder_->pkt_timebase = in->time_base;
  ret = avcodec_open2(decoder_, codec, nullptr);
  if (ret < 0) return Fail("open decoder: " + AvError(ret));

  if (decoder_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
    const int channels = decoder_->ch_layout.nb_channels > 0 ? decoder_->ch_layout.nb_channels : 1;
    av_channel_layout_uninit(&decoder_->ch_layout);
    av_channel_layout_default(&decoder_->ch_layout, channels);
  }
  return true;
}

bool MuxJob::OpenOutput() {
  int ret = avformat_alloc_output_context2(&out_, nullptr, "mp4", temp_path_.c_str());
  if (ret < 0 || !out_) return Fail("allocate output: " + AvError(ret));
  out_->interrupt_callback.callback = InterruptCallback;
  out_->interrupt_callback.opaque = irq_;

  // Video: stream copy.
  const AVStream* video_in = video_in_->streams[video_index_];
  video_out_ = avformat_new_stream(out_, nullptr);
  if (!video_out_) return Fail("cannot add video stream");
  ret = avcodec_parameters_copy(video_out_->codecpar, video_in->codecpar);
  if (ret < 0) return Fail("copy video parameters: " + AvError(ret));
  video_out_->codecpar->codec_tag = 0;
  video_out_->time_base = video_in->time_base;

  // Audio: AAC.
  const AVCodec* aac = avcodec_find_encoder(AV_CODEC_ID_AAC);
  if (!aac) return Fail("no AAC encoder");
  encoder_ = avcodec_alloc_context3(aac);
  if (!encoder_) return Fail("cannot allocate AAC encoder");
  encoder_->sample_fmt = AV_SAMPLE_FMT_FLTP;
  encoder_->sample_rate = decoder_->sample_rate;
  ret = av_channel_layout_copy(&encoder_->ch_layout, &decoder_->ch_layout);
  if (ret < 0) return Fail("channel layout: " + AvError(ret));
  encoder_->bit_rate = bitrate_;
  encoder_->time_base = AVRational{1, encoder_->sample_rate};
  if (out_->oformat->flags & AVFMT_GLOBALHEADER) {
    encoder_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }
  ret = avcodec_open2(encoder_, aac, nullptr);
  if (ret < 0) return Fail("open AAC encoder: " + AvError(ret));

  audio_out_ = avformat_new_stream(out_, nullptr);
  if (!audio_out_) return Fail("cannot add audio stream");
  ret = avcodec_parameters_from_context(audio_out_->codecpar, encoder_);
  if (ret < 0) return Fail("audio parameters: " + AvError(ret));
  audio_out_->time_base = encoder_->time_base;

  if (std::isfinite(limit_sec_)) {
    sample_limit_ = static_cast<int64_t>(std::llround(limit_sec_ * encoder_->sample_rate));
  }

  ret = swr_alloc_set_opts2(&swr_, &encoder_->ch_layout, encoder_->sample_fmt,
                            encoder_->sample_rate, &decoder_->ch_layout, decoder_->sample_fmt,
                            decoder_->sample_rate, 0, nullptr);
  if (ret < 0 || !swr_) return Fail("allocate resampler: " + AvError(ret));
  ret = swr_init(swr_);
  if (ret < 0) return Fail("init resampler: " + AvError(ret));

  const int frame_size = encoder_->frame_size > 0 ? encoder_->frame_size : 1024;
  fifo_ = av_audio_fifo_alloc(encoder_->sample_fmt, encoder_->ch_layout.nb_channels, frame_size);
  if (!fifo_) return Fail("cannot allocate sample fifo");

  AVIOInterruptCB io_cb{InterruptCallback, irq_};
  ret = avio_open2(&out_->pb, temp_path_.c_str(), AVIO_FLAG_WRITE, &io_cb, nullptr);
  if (ret < 0) return Fail("open " + temp_path_ + ": " + AvError(ret));

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "movflags", "+faststart", 0);
  ret = avformat_write_header(out_, &opts);
  av_dict_free(&opts);
  if (ret < 0) return Fail("write header: " + AvError(ret));
  return true;
}

bool MuxJob::CopyVideoPacket(bool* done, double* position) {
  int ret = av_read_frame(video_in_, packet_);
  if (ret == AVERROR_EOF) {
    *done = true;
    return true;
  }
  if (ret < 0) return Fail("read video: " + AvError(ret));
  if (packet_->stream_index != video_index_) {
    av_packet_unref(packet_);
    return true;
  }

  const AVStream* in = video_in_->streams[video_index_];
  const int64_t ts = packet_->pts != AV_NOPTS_VALUE ? packet_->pts : packet_->dts;
  if (ts != AV_NOPTS_VALUE) {
    const int64_t origin = in->start_time != AV_NOPTS_VALUE ? in->start_time : 0;
    const double sec = static_cast<double>(ts - origin) * av_q2d(in->time_base);
    if (sec >= limit_sec_) {
      av_packet_unref(packet_);
      *done = true;
      return true;
    }
    *position = std::max(*position, sec);
  }

  av_packet_rescale_ts(packet_, in->time_base, video_out_->time_base);
  packet_->stream_index = video_out_->index;
  packet_->pos = -1;
  ret = av_interleaved_write_frame(out_, packet_);
  if (ret < 0) return Fail("write video packet: " + AvError(ret));
  return true;
}

bool MuxJob::PumpAudio(bool* done) {
  if (samples_encoded_ >= sample_limit_) {
    *done = true;
    return true;
  }

  int ret = av_read_frame(audio_in_, packet_);
  if (ret == AVERROR_EOF) {
    // Drain the decoder, then the resampler's delay line.
    ret = avcodec_send_packet(decoder_, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) return Fail("flush decoder: " + AvError(ret));
    if (!ReceiveDecoded() || !Resample(nullptr, 0)) return false;
    *done = true;
    return true;
  }
  if (ret < 0) return Fail("read audio: " + AvError(ret));
  if (packet_->stream_index != audio_index_) {
    av_packet_unref(packet_);
    return true;
  }

  ret = avcodec_send_packet(decoder_, packet_);
  av_packet_unref(packet_);
  if (ret < 0) return Fail("decode audio: " + AvError(ret));
  return ReceiveDecoded() && EncodeFromFifo(false);
}

bool MuxJob::ReceiveDecoded() {
  while (true) {
    const int ret = avcodec_receive_frame(decoder_, decoded_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail("decode audio: " + AvError(ret));
    // swr_convert expects const uint8_t ** for input
    const bool ok =
        Resample(const_cast<const uint8_t**>(decoded_->extended_data), decoded_->nb_samples);
    av_frame_unref(decoded_);
    if (!ok) return false;
  }
}

bool MuxJob::Resample(const uint8_t** input, int samples) {
  const int capacity = swr_get_out_samples(swr_, samples);
  if (capacity <= 0) return true;

  uint8_t** buffer = nullptr;
  int ret = av_samples_alloc_array_and_samples(&buffer, nullptr, encoder_->ch_layout.nb_channels,
                                               capacity, encoder_->sample_fmt, 0);
  if (ret < 0) return Fail("allocate samples: " + AvError(ret));

  const int converted = swr_convert(swr_, buffer, capacity, input, samples);
  int written = 0;
  if (converted > 0) {
    written = av_audio_fifo_write(fifo_, reinterpret_cast<void**>(buffer), converted);
  }
  av_freep(&buffer[0]);
  av_freep(&buffer);

  if (converted < 0) return Fail("resample: " + AvError(converted));
  if (written < converted) return Fail("sample fifo write failed");
  return true;
}

bool MuxJob::EncodeFromFifo(bool flush) {
  const int frame_size = encoder_->frame_size > 0 ? encoder_->frame_size : 1024;
  while (true) {
    const int64_t remaining = sample_limit_ - samples_encoded_;
    const int available = av_audio_fifo_size(fifo_);
    if (remaining <= 0 || available <= 0) return true;
    if (available < frame_size && !flush) return true;

    const int n = static_cast<int>(
        std::min<int64_t>(remaining, static_cast<int64_t>(std::min(available, frame_size))));

    av_frame_unref(chunk_);
    chunk_->nb_samples = n;
    chunk_->format = encoder_->sample_fmt;
    chunk_->sample_rate = encoder_->sample_rate;
    int ret = av_channel_layout_copy(&chunk_->ch_layout, &encoder_->ch_layout);
    if (ret < 0) return Fail("channel layout: " + AvError(ret));
    ret = av_frame_get_buffer(chunk_, 0);
    if (ret < 0) return Fail("allocate audio frame: " + AvError(ret));
    if (av_audio_fifo_read(fifo_, reinterpret_cast<void**>(chunk_->data), n) < n) {
      return Fail("sample fifo read failed");
    }
    chunk_->pts = samples_encoded_;
    samples_encoded_ += n;
    if (!SendToEncoder(chunk_)) return false;
  }
}

bool MuxJob::SendToEncoder(AVFrame* frame) {
  int ret = avcodec_send_frame(encoder_, frame);
  if (ret < 0) return Fail("encode audio: " + AvError(ret));
  while (true) {
    ret = avcodec_receive_packet(encoder_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return Fail("encode audio: " + AvError(ret));
    av_packet_rescale_ts(packet_, encoder_->time_base, audio_out_->time_base);
    packet_->stream_index = audio_out_->index;
    ret = av_interleaved_write_frame(out_, packet_);
    if (ret < 0) return Fail("write audio packet: " + AvError(ret));
  }
}

}  // namespace

bool LibavMuxer::Available() { return true; }

RenderResult LibavMuxer::Mux(const MuxRequest& request) {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  InterruptState irq;
  irq.deadline = Clock::now() + request.timeout;
  irq.interrupt = interrupt_;

  const std::string temp_path = util::TempPathFor(request.output_path);
  util::ScopedFileRemover remover(temp_path);

  std::string error;
  bool ok;
  {
    MuxJob job(request, temp_path, &irq, audio_bitrate_);
    ok = job.Run(&error);
  }
  if (!ok) {
    if (irq.timed_out) {
      error = "timed out after " + std::to_string(request.timeout.count()) + " ms (" + error + ")";
    } else if (interrupt_ && interrupt_->load(std::memory_order_acquire)) {
      return RenderResult::Failure(RenderError::kInterrupted, "mux: interrupted");
    }
    return RenderResult::Failure(RenderError::kAudioFailure, "mux: " + error);
  }

  if (interrupt_ && interrupt_->load(std::memory_order_acquire)) {
    return RenderResult::Failure(RenderError::kInterrupted, "mux: interrupted before publish");
  }
  if (!util::CommitFile(temp_path, request.output_path, &error)) {
    return RenderResult::Failure(RenderError::kAudioFailure, "mux: " + error);
  }
  remover.Release();
  util::Logger::Info("[Muxer] " + request.video_path + " + " + request.audio_path + " -> " +
                     request.output_path);
  return RenderResult::Success();
}

#endif  // DOSSIER_FFMPEG_AVAILABLE

}  // namespace dossier::audio
