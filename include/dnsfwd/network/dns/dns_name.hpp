// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsfwd, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include "dns_wire.hpp"
#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace dnsfwd
{
namespace network
{
namespace dns
{

/// \brief One element of a domain name: either literal label text or a
/// compression pointer holding a message-absolute byte offset.
class DnsLabel
{
public:
  enum class Kind
  {
    Value,
    Pointer
  };

  static DnsLabel value(std::string text) { return DnsLabel(Kind::Value, std::move(text), 0); }

  static DnsLabel pointer(std::uint16_t offset) { return DnsLabel(Kind::Pointer, "", offset); }

  Kind kind() const { return _kind; }
  bool isPointer() const { return _kind == Kind::Pointer; }

  /// \brief Label text; empty for pointers.
  const std::string &text() const { return _text; }

  /// \brief Target offset; zero for value labels.
  std::uint16_t offset() const { return _offset; }

  /// \brief Bytes this label occupies on the wire (length prefix included).
  std::size_t wireLength() const
  {
    return isPointer() ? constants::DNS_POINTER_SIZE : _text.size() + 1;
  }

  bool operator==(const DnsLabel &other) const
  {
    return _kind == other._kind && _text == other._text && _offset == other._offset;
  }

  bool operator!=(const DnsLabel &other) const { return !(*this == other); }

private:
  DnsLabel(Kind kind, std::string text, std::uint16_t offset)
    : _kind(kind), _text(std::move(text)), _offset(offset)
  {
  }

  Kind _kind;
  std::string _text;
  std::uint16_t _offset;
};

/// \brief A domain name as an ordered list of labels.
///
/// A pointer label, when present, is always the last one: on the wire a
/// compression pointer ends the name. Resolving it needs the message the name
/// was read from, see DnsMessage::decompress().
class DnsName
{
public:
  DnsName() = default;

  explicit DnsName(std::vector<DnsLabel> labels) : _labels(std::move(labels))
  {
    for (std::size_t i = 0; i + 1 < _labels.size(); ++i)
    {
      if (_labels[i].isPointer())
      {
        throw DnsEncodeException("Compression pointer must be the last label of a name");
      }
    }
  }

  /// \brief Build an uncompressed name from dotted text ("codecrafters.io").
  /// Empty labels are skipped, so "" and "." give the root name.
  /// \throws DnsEncodeException for labels over 63 bytes or names over 255
  static DnsName fromString(const std::string &name)
  {
    std::vector<DnsLabel> labels;
    std::istringstream iss(name);
    std::string label;
    while (std::getline(iss, label, '.'))
    {
      if (label.empty())
        continue;

      if (label.length() > constants::DNS_MAX_LABEL_SIZE)
      {
        throw DnsEncodeException("Label too long: " + label + " (max " +
                                 std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
      }
      labels.push_back(DnsLabel::value(label));
    }

    DnsName result(std::move(labels));
    if (result.length() > constants::DNS_MAX_NAME_SIZE)
    {
      throw DnsEncodeException("Domain name too long: " + name);
    }
    return result;
  }

  /// \brief Decode a name starting at \p offset of the whole message.
  ///
  /// Pointers are not followed here; a pointer is stored as the final label.
  /// \param data Start of the complete DNS message
  /// \param offset Message-absolute offset of the first length byte
  /// \param size Size of the complete message
  /// \param name Output parameter for the decoded name
  /// \return Offset of the first byte after the name
  /// \throws DnsParseException on truncation, labels over 63 bytes, labels
  ///         that are not UTF-8, reserved label types, names over 255 bytes,
  ///         or pointers that do not point backwards past the header
  static std::size_t decode(const std::uint8_t *data, std::size_t offset, std::size_t size,
                            DnsName &name)
  {
    std::vector<DnsLabel> labels;
    std::size_t totalLength = 0;

    while (true)
    {
      wire::checkBounds(offset, 1, size);
      std::uint8_t length = data[offset];

      if (length == 0)
      {
        ++offset;
        break;
      }

      if ((length & constants::DNS_COMPRESSION_MASK) == constants::DNS_COMPRESSION_MASK)
      {
        wire::checkBounds(offset, constants::DNS_POINTER_SIZE, size);
        std::uint16_t pointer =
          wire::readUint16(data, offset) & constants::DNS_COMPRESSION_POINTER_MASK;

        if (pointer < constants::DNS_HEADER_SIZE)
        {
          throw DnsParseException("Compression pointer " + std::to_string(pointer) +
                                  " points into the header");
        }
        if (pointer >= offset)
        {
          throw DnsParseException("Compression pointer " + std::to_string(pointer) + " at offset " +
                                  std::to_string(offset) + " does not point backwards");
        }

        labels.push_back(DnsLabel::pointer(pointer));
        offset += constants::DNS_POINTER_SIZE;
        break;
      }

      // Covers the reserved 0x40 and 0x80 label types as well
      if (length > constants::DNS_MAX_LABEL_SIZE)
      {
        throw DnsParseException("Label too long: " + std::to_string(length) + " (max " +
                                std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
      }

      wire::checkBounds(offset + 1, length, size);
      if (!wire::isValidUtf8(data + offset + 1, length))
      {
        throw DnsParseException("Label at offset " + std::to_string(offset) +
                                " is not valid UTF-8");
      }
      labels.push_back(
        DnsLabel::value(std::string(reinterpret_cast<const char *>(data + offset + 1), length)));
      offset += length + 1;

      totalLength += length + 1;
      if (totalLength + 1 > constants::DNS_MAX_NAME_SIZE)
      {
        throw DnsParseException("Domain name too long: " + std::to_string(totalLength + 1) +
                                " (max " + std::to_string(constants::DNS_MAX_NAME_SIZE) + ")");
      }
    }

    name = DnsName(std::move(labels));
    return offset;
  }

  /// \brief Append the wire form of an uncompressed name.
  /// \throws DnsUnsupportedException if the name ends in a pointer
  /// \throws DnsEncodeException for labels over 63 bytes
  void encode(std::vector<std::uint8_t> &buffer) const
  {
    for (const auto &label : _labels)
    {
      if (label.isPointer())
      {
        throw DnsUnsupportedException("Encoding compressed names is not implemented (pointer to " +
                                      std::to_string(label.offset()) + ")");
      }
      if (label.text().size() > constants::DNS_MAX_LABEL_SIZE)
      {
        throw DnsEncodeException("Label too long: " + label.text());
      }
      wire::writeUint8(buffer, static_cast<std::uint8_t>(label.text().size()));
      buffer.insert(buffer.end(), label.text().begin(), label.text().end());
    }
    wire::writeUint8(buffer, 0);
  }

  /// \brief On-wire size: value labels with their length prefixes, then
  /// either a 2-byte pointer or the 1-byte terminator.
  std::uint16_t length() const
  {
    std::size_t total = 0;
    for (const auto &label : _labels)
    {
      total += label.wireLength();
    }
    if (!isCompressed())
    {
      ++total;
    }
    return static_cast<std::uint16_t>(total);
  }

  bool isCompressed() const { return !_labels.empty() && _labels.back().isPointer(); }

  bool isRoot() const { return _labels.empty(); }

  const std::vector<DnsLabel> &labels() const { return _labels; }

  /// \brief The compression pointer target. Only valid if isCompressed().
  std::uint16_t pointerOffset() const { return _labels.back().offset(); }

  /// \brief The labels starting at \p relativeOffset bytes into this name's
  /// wire form. An offset equal to the terminator yields the root name.
  /// \throws DnsParseException if the offset is not on a label boundary
  DnsName suffixAt(std::size_t relativeOffset) const
  {
    std::size_t position = 0;
    for (std::size_t i = 0; i < _labels.size(); ++i)
    {
      if (position == relativeOffset)
      {
        return DnsName(std::vector<DnsLabel>(_labels.begin() + static_cast<std::ptrdiff_t>(i),
                                             _labels.end()));
      }
      position += _labels[i].wireLength();
      if (position > relativeOffset)
      {
        break;
      }
    }
    if (!isCompressed() && position == relativeOffset)
    {
      return DnsName();
    }
    throw DnsParseException("Offset " + std::to_string(relativeOffset) +
                            " is not on a label boundary of " + toString());
  }

  /// \brief Dotted text form. A trailing pointer is shown as "@offset".
  std::string toString() const
  {
    std::string text;
    for (const auto &label : _labels)
    {
      if (!text.empty())
      {
        text += ".";
      }
      text += label.isPointer() ? "@" + std::to_string(label.offset()) : label.text();
    }
    return text;
  }

  bool operator==(const DnsName &other) const { return _labels == other._labels; }
  bool operator!=(const DnsName &other) const { return !(*this == other); }

private:
  std::vector<DnsLabel> _labels;
};

} // namespace dns
} // namespace network
} // namespace dnsfwd
