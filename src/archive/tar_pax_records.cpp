/***
 * Name: floability::archive::detail::ApplyPaxRecords
 * Purpose: Extract the pax keywords the extractor cares about.
 * Inputs: records (payload of an 'x' header)
 * Outputs: path, linkpath, size/has_size updated when present
 * Theory of Operation: Each record is "<decimal length> <key>=<value>\n" where the
 *   length covers the whole record. Malformed records, and decimals that would
 *   overflow or run past the header payload, abort with ExtractionError.
 */
#include "floability/archive/tar_reader.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "floability/exceptions/extraction_error.h"

namespace floability::archive::detail {

// Digits only, at least one, and never more than limit.
static std::uint64_t ParsePaxDecimal(const std::string& text, std::size_t begin, std::size_t end, std::uint64_t limit,
                                     const char* what) {
  if (begin == end) {
    throw exceptions::ExtractionError(std::string("empty pax ") + what);
  }
  std::uint64_t value = 0;
  for (std::size_t i = begin; i < end; ++i) {
    const char ch = text[i];
    if (ch < '0' || ch > '9') {
      throw exceptions::ExtractionError(std::string("malformed pax ") + what);
    }
    const auto digit = static_cast<std::uint64_t>(ch - '0');
    if (value > limit / 10 || value * 10 + digit > limit) {
      throw exceptions::ExtractionError(std::string("pax ") + what + " out of range");
    }
    value = value * 10 + digit;
  }
  return value;
}

auto ApplyPaxRecords(const std::string& records, std::string& path, std::string& linkpath, std::uint64_t& size,
                     bool& has_size) -> void {
  std::size_t pos = 0;
  while (pos < records.size()) {
    if (records[pos] == '\0') {
      break;
    }
    const std::size_t space = records.find(' ', pos);
    if (space == std::string::npos) {
      throw exceptions::ExtractionError("malformed pax header record");
    }
    const auto length =
        static_cast<std::size_t>(ParsePaxDecimal(records, pos, space, records.size() - pos, "record length"));
    if (length <= space - pos + 1 || records[pos + length - 1] != '\n') {
      throw exceptions::ExtractionError("malformed pax header record");
    }
    const std::string record = records.substr(space + 1, pos + length - space - 2);
    const std::size_t equals = record.find('=');
    if (equals != std::string::npos) {
      const std::string key = record.substr(0, equals);
      const std::string value = record.substr(equals + 1);
      if (key == "path") {
        path = value;
      } else if (key == "linkpath") {
        linkpath = value;
      } else if (key == "size") {
        size = ParsePaxDecimal(value, 0, value.size(), std::numeric_limits<std::int64_t>::max(), "size value");
        has_size = true;
      }
    }
    pos += length;
  }
}

}  // namespace floability::archive::detail
