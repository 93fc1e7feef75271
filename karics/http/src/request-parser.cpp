#include "karics/request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string_view>
#include <system_error>

#include "karics/char-hexadecimal-converter.hpp"
#include "karics/header-line-parse.hpp"
#include "karics/http-constants.hpp"
#include "karics/http-header.hpp"
#include "karics/http-method.hpp"
#include "karics/http-status-code.hpp"
#include "karics/http-version.hpp"
#include "karics/string-equal-ignore-case.hpp"

namespace karics {

namespace {

// Chunk size lines are short ("1a2b;ext=val\r\n"), anything longer is an attack or garbage.
constexpr std::size_t kMaxChunkSizeLineBytes = 1024;

constexpr ParseOutcome BadRequest(std::string_view reason) noexcept {
  return ParseOutcome::Malformed(http::StatusCodeBadRequest, reason);
}

constexpr std::string_view LastListElement(std::string_view values) noexcept {
  const auto commaPos = values.rfind(',');
  if (commaPos != std::string_view::npos) {
    values.remove_prefix(commaPos + 1);
  }
  while (!values.empty() && http::IsHeaderWhitespace(values.front())) {
    values.remove_prefix(1);
  }
  while (!values.empty() && http::IsHeaderWhitespace(values.back())) {
    values.remove_suffix(1);
  }
  return values;
}

}  // namespace

void RequestParser::feed(std::string_view bytes) {
  compact();
  _buf.append(bytes);
}

std::span<char> RequestParser::writableSpan(std::size_t minCapacity) {
  compact();
  _buf.ensureAvailableCapacityExponential(minCapacity);
  return {_buf.end(), static_cast<std::size_t>(_buf.availableCapacity())};
}

void RequestParser::compact() {
  if (_frameStart != 0) {
    _buf.erase_front(_frameStart);
    _frameStart = 0;
  }
}

void RequestParser::reset() noexcept {
  _buf.clear();
  _decodedBody.clear();
  _frameStart = 0;
  _request.clear();
  resetFrameState();
}

void RequestParser::shrinkIfIdle(std::size_t maxCapacity) noexcept {
  if (pendingBytes() == 0) {
    _buf.clear();
    _frameStart = 0;
    _buf.shrinkIfEmpty(maxCapacity);
  }
}

void RequestParser::resetFrameState() noexcept {
  _lineStart = 0;
  _scanPos = 0;
  _bodyStart = 0;
  _bodyLen = 0;
  _chunkRemaining = 0;
  _trailerBytes = 0;
  _stage = Stage::Head;
  _requestLineDone = false;
  _chunked = false;
  _target = {};
  _pendingHeaders.clear();
}

std::size_t RequestParser::findLineEnd() noexcept {
  const std::size_t avail = frameAvail();
  if (_scanPos >= avail) {
    return std::string_view::npos;
  }
  const char* first = frameData() + _scanPos;
  const auto* lfPtr = static_cast<const char*>(std::memchr(first, '\n', avail - _scanPos));
  if (lfPtr == nullptr) {
    _scanPos = avail;
    return std::string_view::npos;
  }
  return static_cast<std::size_t>(lfPtr - frameData());
}

ParseOutcome RequestParser::tryParseOne() {
  if (_stage == Stage::Head) {
    const ParseOutcome headOutcome = parseHead();
    if (!headOutcome.isComplete()) {
      return headOutcome;
    }
    const ParseOutcome framingOutcome = setupBodyFraming();
    if (framingOutcome.isMalformed()) {
      return framingOutcome;
    }
  }

  if (_stage == Stage::FixedBody) {
    if (frameAvail() < _bodyStart + _bodyLen) {
      return ParseOutcome::Incomplete();
    }
    return completeFrame(_bodyStart + _bodyLen);
  }
  return parseChunked();
}

ParseOutcome RequestParser::parseHead() {
  while (true) {
    const std::size_t lf = findLineEnd();
    if (lf == std::string_view::npos) {
      if (!_requestLineDone && frameAvail() - _lineStart > _limits.maxRequestLineBytes) {
        return BadRequest("request line too long");
      }
      if (frameAvail() > _limits.maxHeaderBytes) {
        return BadRequest("request head too large");
      }
      return ParseOutcome::Incomplete();
    }
    const std::size_t lineFirst = _lineStart;
    _lineStart = lf + 1;
    _scanPos = _lineStart;
    if (_lineStart > _limits.maxHeaderBytes) {
      return BadRequest("request head too large");
    }
    if (lf == lineFirst || frameData()[lf - 1] != '\r') {
      return BadRequest("line not terminated by CRLF");
    }
    const std::size_t lineLast = lf - 1;

    if (!_requestLineDone) {
      if (lineFirst == lineLast) {
        // Empty lines received before the request line are ignored (RFC 9112 2.2).
        _frameStart += _lineStart;
        _lineStart = 0;
        _scanPos = 0;
        continue;
      }
      if (_lineStart - lineFirst > _limits.maxRequestLineBytes) {
        return BadRequest("request line too long");
      }
      const ParseOutcome outcome = parseRequestLine(lineFirst, lineLast);
      if (outcome.isMalformed()) {
        return outcome;
      }
    } else if (lineFirst == lineLast) {
      return ParseOutcome::Complete(_lineStart);
    } else {
      const ParseOutcome outcome = parseHeaderLine(lineFirst, lineLast);
      if (outcome.isMalformed()) {
        return outcome;
      }
    }
  }
}

ParseOutcome RequestParser::parseRequestLine(std::size_t lineFirst, std::size_t lineLast) {
  const std::string_view line(frameData() + lineFirst, lineLast - lineFirst);

  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos || firstSp == 0) {
    return BadRequest("invalid request line");
  }
  const auto secondSp = line.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || secondSp == firstSp + 1 ||
      line.find(' ', secondSp + 1) != std::string_view::npos) {
    return BadRequest("invalid request line");
  }

  const std::string_view methodStr = line.substr(0, firstSp);
  const std::string_view target = line.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view versionStr = line.substr(secondSp + 1);

  if (!http::IsValidHeaderName(methodStr)) {
    return BadRequest("invalid method token");
  }
  for (char ch : target) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch <= 0x20 || uch == 0x7F) {
      return BadRequest("invalid request target");
    }
  }
  if (target.front() != '/' && target != "*") {
    return BadRequest("invalid request target");
  }

  const auto version = http::ParseVersion(versionStr);
  if (!version) {
    if (versionStr.starts_with("HTTP/")) {
      return ParseOutcome::Malformed(http::StatusCodeHTTPVersionNotSupported, "unsupported HTTP version");
    }
    return BadRequest("invalid HTTP version");
  }
  const auto method = http::MethodStrToOptEnum(methodStr);
  if (!method) {
    return ParseOutcome::Malformed(http::StatusCodeNotImplemented, "unknown method");
  }

  _method = *method;
  _version = *version;
  _target = Slice{static_cast<uint32_t>(lineFirst + firstSp + 1), static_cast<uint32_t>(target.size())};
  _requestLineDone = true;
  return ParseOutcome::Incomplete();
}

ParseOutcome RequestParser::parseHeaderLine(std::size_t lineFirst, std::size_t lineLast) {
  if (_pendingHeaders.size() >= _limits.maxHeaderCount) {
    return BadRequest("too many headers");
  }
  const char* first = frameData() + lineFirst;
  if (http::IsHeaderWhitespace(*first)) {
    return BadRequest("obsolete header line folding");
  }
  const http::HeaderView header = http::ParseHeaderLine(first, frameData() + lineLast);
  if (!http::IsValidHeaderName(header.name)) {
    return BadRequest("invalid header name");
  }
  if (!http::IsValidHeaderValue(header.value)) {
    return BadRequest("invalid header value");
  }
  const auto toPos = [this](std::string_view part) { return static_cast<uint32_t>(part.data() - frameData()); };
  _pendingHeaders.push_back(
      {Slice{toPos(header.name), static_cast<uint32_t>(header.name.size())},
       Slice{toPos(header.value), static_cast<uint32_t>(header.value.size())}});
  return ParseOutcome::Incomplete();
}

ParseOutcome RequestParser::setupBodyFraming() {
  _bodyStart = _lineStart;

  bool hasContentLength = false;
  bool hasTransferEncoding = false;
  std::size_t contentLength = 0;
  std::string_view transferEncoding;
  for (const PendingHeader& header : _pendingHeaders) {
    const std::string_view name = sliceView(header.name);
    const std::string_view value = sliceView(header.value);
    if (CaseInsensitiveEqual(name, http::TransferEncoding)) {
      hasTransferEncoding = true;
      transferEncoding = value;
    } else if (CaseInsensitiveEqual(name, http::ContentLength)) {
      std::size_t parsed = 0;
      const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (value.empty() || errc != std::errc{} || ptr != value.data() + value.size()) {
        return BadRequest("invalid Content-Length");
      }
      if (hasContentLength && parsed != contentLength) {
        return BadRequest("conflicting Content-Length values");
      }
      hasContentLength = true;
      contentLength = parsed;
    }
  }

  if (hasTransferEncoding) {
    if (hasContentLength) {
      return BadRequest("both Content-Length and Transfer-Encoding");
    }
    if (_version == http::HTTP_1_0) {
      return BadRequest("Transfer-Encoding not allowed in HTTP/1.0");
    }
    if (!CaseInsensitiveEqual(LastListElement(transferEncoding), http::chunked)) {
      return BadRequest("unsupported Transfer-Encoding");
    }
    _chunked = true;
    _decodedBody.clear();
    _lineStart = _bodyStart;
    _scanPos = _bodyStart;
    _stage = Stage::ChunkSize;
    return ParseOutcome::Incomplete();
  }

  if (contentLength > _limits.maxBodyBytes) {
    return ParseOutcome::Malformed(http::StatusCodePayloadTooLarge, "payload too large");
  }
  _bodyLen = contentLength;
  _stage = Stage::FixedBody;
  return ParseOutcome::Incomplete();
}

ParseOutcome RequestParser::parseChunked() {
  while (true) {
    switch (_stage) {
      case Stage::ChunkSize: {
        const std::size_t lf = findLineEnd();
        if (lf == std::string_view::npos) {
          if (frameAvail() - _lineStart > kMaxChunkSizeLineBytes) {
            return BadRequest("chunk size line too long");
          }
          return ParseOutcome::Incomplete();
        }
        const std::size_t lineFirst = _lineStart;
        _lineStart = lf + 1;
        _scanPos = _lineStart;
        if (lf == lineFirst || frameData()[lf - 1] != '\r') {
          return BadRequest("chunk size line not terminated by CRLF");
        }
        const char* ptr = frameData() + lineFirst;
        const char* last = frameData() + lf - 1;
        std::size_t chunkSize = 0;
        std::size_t nbDigits = 0;
        for (; ptr < last; ++ptr) {
          const int digit = from_hex_digit(*ptr);
          if (digit < 0) {
            break;
          }
          if (chunkSize > (std::numeric_limits<std::size_t>::max() >> 4)) {
            return BadRequest("chunk size overflow");
          }
          chunkSize = (chunkSize << 4) | static_cast<std::size_t>(digit);
          ++nbDigits;
        }
        while (ptr < last && http::IsHeaderWhitespace(*ptr)) {
          ++ptr;
        }
        // Chunk extensions after ';' are ignored.
        if (nbDigits == 0 || (ptr != last && *ptr != ';')) {
          return BadRequest("invalid chunk size");
        }
        if (chunkSize == 0) {
          _trailerBytes = 0;
          _stage = Stage::ChunkTrailers;
        } else if (chunkSize > _limits.maxBodyBytes - _decodedBody.size()) {
          return ParseOutcome::Malformed(http::StatusCodePayloadTooLarge, "payload too large");
        } else {
          _chunkRemaining = chunkSize;
          _stage = Stage::ChunkData;
        }
        break;
      }
      case Stage::ChunkData: {
        const std::size_t chunkEnd = _lineStart + _chunkRemaining;
        if (frameAvail() < chunkEnd + http::CRLF.size()) {
          return ParseOutcome::Incomplete();
        }
        const char* data = frameData() + _lineStart;
        if (data[_chunkRemaining] != '\r' || data[_chunkRemaining + 1] != '\n') {
          return BadRequest("missing CRLF after chunk data");
        }
        _decodedBody.append(data, _chunkRemaining);
        _lineStart = chunkEnd + http::CRLF.size();
        _scanPos = _lineStart;
        _chunkRemaining = 0;
        _stage = Stage::ChunkSize;
        break;
      }
      case Stage::ChunkTrailers: {
        const std::size_t lf = findLineEnd();
        if (lf == std::string_view::npos) {
          if (_trailerBytes + (frameAvail() - _lineStart) > _limits.maxHeaderBytes) {
            return BadRequest("trailers too large");
          }
          return ParseOutcome::Incomplete();
        }
        const std::size_t lineFirst = _lineStart;
        _lineStart = lf + 1;
        _scanPos = _lineStart;
        _trailerBytes += _lineStart - lineFirst;
        if (lf == lineFirst || frameData()[lf - 1] != '\r') {
          return BadRequest("trailer line not terminated by CRLF");
        }
        if (_trailerBytes > _limits.maxHeaderBytes) {
          return BadRequest("trailers too large");
        }
        if (lineFirst == lf - 1) {
          return completeFrame(_lineStart);
        }
        // Trailer fields are validated but not exposed.
        const http::HeaderView trailer = http::ParseHeaderLine(frameData() + lineFirst, frameData() + lf - 1);
        if (!http::IsValidHeaderName(trailer.name) || !http::IsValidHeaderValue(trailer.value)) {
          return BadRequest("invalid trailer line");
        }
        break;
      }
      default:
        return ParseOutcome::Incomplete();
    }
  }
}

ParseOutcome RequestParser::completeFrame(std::size_t frameBytes) {
  _request.clear();
  _request._method = _method;
  _request._version = _version;
  _request._target = sliceView(_target);
  const auto queryPos = _request._target.find('?');
  _request._path = _request._target.substr(0, queryPos);
  if (queryPos != std::string_view::npos) {
    _request._query = _request._target.substr(queryPos + 1);
  }
  _request._headers.reserve(_pendingHeaders.size());
  for (const PendingHeader& header : _pendingHeaders) {
    _request._headers.push_back({sliceView(header.name), sliceView(header.value)});
  }
  if (_chunked) {
    _request._body = _decodedBody;
  } else {
    _request._body = std::string_view(frameData() + _bodyStart, _bodyLen);
  }

  _frameStart += frameBytes;
  resetFrameState();
  return ParseOutcome::Complete(frameBytes);
}

}  // namespace karics
