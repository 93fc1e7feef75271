#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "karics/http-request.hpp"
#include "karics/http-server-config.hpp"
#include "karics/http-status-code.hpp"
#include "karics/raw-chars.hpp"

namespace karics {

// Outcome of a RequestParser::tryParseOne call.
struct ParseOutcome {
  enum class Kind : uint8_t { Complete, Incomplete, Malformed };

  static constexpr ParseOutcome Complete(std::size_t frameBytes) noexcept {
    return {Kind::Complete, http::StatusCodeOK, {}, frameBytes};
  }

  static constexpr ParseOutcome Incomplete() noexcept { return {Kind::Incomplete, 0, {}, 0}; }

  static constexpr ParseOutcome Malformed(http::StatusCode status, std::string_view reason) noexcept {
    return {Kind::Malformed, status, reason, 0};
  }

  [[nodiscard]] constexpr bool isComplete() const noexcept { return kind == Kind::Complete; }
  [[nodiscard]] constexpr bool isIncomplete() const noexcept { return kind == Kind::Incomplete; }
  [[nodiscard]] constexpr bool isMalformed() const noexcept { return kind == Kind::Malformed; }

  Kind kind;
  // Status to answer with when Malformed (400 for syntax and size limits, 413 for bodies too large,
  // 501 for unknown methods, 505 for unsupported versions).
  http::StatusCode errorStatus;
  // Static description of the error when Malformed.
  std::string_view reason;
  // Number of raw bytes of the frame when Complete.
  std::size_t frameBytes;
};

// Incremental HTTP/1.x request parser over a growing byte buffer.
//
// Bytes are appended with feed() (or read straight into writableSpan() and committed), and tryParseOne()
// extracts at most one complete request frame per call. Parsing is resumable: already scanned bytes of a
// partial frame are never scanned again, so the total work is linear in the number of received bytes.
//
// Lifetime: the HttpRequest returned by request() after a Complete outcome references the internal buffer.
// It stays valid until the next feed() / writableSpan() call, which compacts the consumed frames away.
// Pipelined requests already buffered can be parsed with further tryParseOne() calls.
class RequestParser {
 public:
  struct Limits {
    std::size_t maxRequestLineBytes{8192};
    std::size_t maxHeaderBytes{8192};
    std::size_t maxHeaderCount{100};
    std::size_t maxBodyBytes{std::size_t{64} << 20};

    static Limits From(const HttpServerConfig& config) noexcept {
      return {config.maxRequestLineBytes, config.maxHeaderBytes, config.maxHeaderCount, config.maxBodyBytes};
    }
  };

  RequestParser() noexcept = default;

  explicit RequestParser(Limits limits) noexcept : _limits(limits) {}

  // Appends bytes to the buffer. Does not parse.
  void feed(std::string_view bytes);

  // Returns a writable span of at least minCapacity bytes after the buffered data, to be followed by commit(n)
  // with the number of bytes actually written.
  std::span<char> writableSpan(std::size_t minCapacity);

  void commit(std::size_t nbBytes) { _buf.addSize(nbBytes); }

  // Attempts to extract exactly one complete request from the unconsumed bytes.
  ParseOutcome tryParseOne();

  // Last successfully parsed request. Only meaningful after a Complete outcome.
  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }

  // Number of buffered bytes not belonging to an already returned frame.
  [[nodiscard]] std::size_t pendingBytes() const noexcept { return _buf.size() - _frameStart; }

  // True if some bytes of the next frame have been received.
  [[nodiscard]] bool hasPartialFrame() const noexcept { return pendingBytes() != 0; }

  // True while the head (request line and headers) of the current frame is not fully received.
  [[nodiscard]] bool isReadingHead() const noexcept { return _stage == Stage::Head; }

  // Drops all buffered bytes and parsing progress.
  void reset() noexcept;

  // Releases buffer memory above given capacity if nothing is buffered.
  void shrinkIfIdle(std::size_t maxCapacity) noexcept;

 private:
  enum class Stage : uint8_t { Head, FixedBody, ChunkSize, ChunkData, ChunkTrailers };

  struct Slice {
    uint32_t pos{};
    uint32_t len{};
  };

  struct PendingHeader {
    Slice name;
    Slice value;
  };

  // All positions are relative to _frameStart so that compaction does not invalidate them.
  [[nodiscard]] const char* frameData() const noexcept { return _buf.data() + _frameStart; }
  [[nodiscard]] std::size_t frameAvail() const noexcept { return _buf.size() - _frameStart; }
  [[nodiscard]] std::string_view sliceView(Slice slice) const noexcept {
    return {frameData() + slice.pos, slice.len};
  }

  void compact();

  void resetFrameState() noexcept;

  // Returns the position of the LF ending the line starting at _lineStart, or npos if not received yet.
  // Bytes scanned without success are remembered in _scanPos.
  std::size_t findLineEnd() noexcept;

  ParseOutcome parseHead();
  ParseOutcome parseRequestLine(std::size_t lineFirst, std::size_t lineLast);
  ParseOutcome parseHeaderLine(std::size_t lineFirst, std::size_t lineLast);
  ParseOutcome setupBodyFraming();
  ParseOutcome parseChunked();
  ParseOutcome completeFrame(std::size_t frameBytes);

  Limits _limits;
  RawChars _buf;
  RawChars _decodedBody;
  std::size_t _frameStart{0};
  std::size_t _lineStart{0};
  std::size_t _scanPos{0};
  std::size_t _bodyStart{0};
  std::size_t _bodyLen{0};
  std::size_t _chunkRemaining{0};
  std::size_t _trailerBytes{0};
  Stage _stage{Stage::Head};
  bool _requestLineDone{false};
  bool _chunked{false};
  http::Method _method{http::Method::GET};
  http::Version _version{http::HTTP_1_1};
  Slice _target;
  std::vector<PendingHeader> _pendingHeaders;
  HttpRequest _request;
};

}  // namespace karics
