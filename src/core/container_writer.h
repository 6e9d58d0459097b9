// Copyright 2026 The screenrec Authors

#ifndef SCREENREC_CORE_CONTAINER_WRITER_H_
#define SCREENREC_CORE_CONTAINER_WRITER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "core/error.h"
#include "core/media_sample.h"
#include "core/output_path.h"
#include "core/session_config.h"

namespace screenrec {
namespace internal {

/// Encodes and muxes samples into a container file.
///
/// Held through shared_ptr: Finalize() completes asynchronously and an
/// implementation may keep itself alive until the completion fires, even
/// after the session that created it has given up waiting.
class ContainerWriter {
 public:
  /// Invoked exactly once, from an unspecified thread.
  using FinalizeCallback = std::function<void(bool ok, const Error& err)>;

  virtual ~ContainerWriter() = default;

  // Non-copyable.
  ContainerWriter(const ContainerWriter&) = delete;
  ContainerWriter& operator=(const ContainerWriter&) = delete;

  virtual bool AddVideoTrack(const VideoEncodingSettings& settings,
                             Error* err) = 0;
  virtual bool AddAudioTrack(const AudioEncodingSettings& settings,
                             Error* err) = 0;

  virtual bool BeginWriting(Error* err) = 0;

  /// Sets the timeline origin.  Called once, before the first Append().
  virtual void AnchorTimeline(int64_t timestamp_ns) = 0;

  /// Whether the input for `kind` can take another sample now.
  virtual bool IsReadyForMoreData(MediaKind kind) const = 0;

  /// False if the sample was rejected.
  virtual bool Append(const MediaSample& sample) = 0;

  virtual void MarkInputFinished(MediaKind kind) = 0;

  virtual void Finalize(FinalizeCallback completion) = 0;

  /// Tear down without finalizing and remove the output file.  Used when
  /// capture never started.
  virtual void Cancel() = 0;

  /// Bytes currently on disk.
  virtual int64_t BytesWritten() const = 0;

 protected:
  ContainerWriter() = default;
};

/// Creates writers for an output path.
class ContainerWriterFactory {
 public:
  virtual ~ContainerWriterFactory() = default;

  ContainerWriterFactory(const ContainerWriterFactory&) = delete;
  ContainerWriterFactory& operator=(const ContainerWriterFactory&) = delete;

  virtual std::shared_ptr<ContainerWriter> Create(const std::string& path,
                                                  ContainerFormat format,
                                                  Error* err) = 0;

 protected:
  ContainerWriterFactory() = default;
};

/// Defined in platform/<os>/xxx_container_writer.cpp.
std::unique_ptr<ContainerWriterFactory> CreatePlatformWriterFactory();

}  // namespace internal
}  // namespace screenrec

#endif  // SCREENREC_CORE_CONTAINER_WRITER_H_
