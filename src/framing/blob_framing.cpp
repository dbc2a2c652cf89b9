// src/framing/blob_framing.cpp
#include "blob_framing.hpp"

#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "fileformat.pb.h"

namespace pbf_framing
{

    using osmpbf_reader::Blob;
    using osmpbf_reader::BlobKind;
    using osmpbf_reader::Compression;
    using osmpbf_reader::ErrorKind;
    using osmpbf_reader::ReaderError;

    static std::string at_offset(size_t offset)
    {
        return " at offset " + std::to_string(offset);
    }

    static std::string remaining_text(size_t expected, size_t available)
    {
        return "; expected " + std::to_string(expected) + " bytes, available " +
               std::to_string(available);
    }

    // Windows are < 32 MiB by the time they get here, so the int cast is exact.
    template <typename Message>
    static bool parse_window(Message &msg, const pbf_io::ByteView &window)
    {
        return msg.ParseFromArray(window.data(), static_cast<int>(window.size()));
    }

    static BlobKind classify_type(const std::string &type, size_t offset)
    {
        if (type == "OSMHeader")
        {
            return BlobKind::Header;
        }
        if (type == "OSMData")
        {
            return BlobKind::Primitive;
        }
        throw ReaderError(ErrorKind::UnknownBlobType,
                          "unknown or unsupported blob type '" + type + "'" + at_offset(offset));
    }

    static std::vector<uint8_t> copy_bytes(const std::string &bytes)
    {
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }

    uint32_t decode_u32_be(const uint8_t b[4])
    {
        return (static_cast<uint32_t>(b[0]) << 24) |
               (static_cast<uint32_t>(b[1]) << 16) |
               (static_cast<uint32_t>(b[2]) << 8) |
               (static_cast<uint32_t>(b[3]));
    }

    std::optional<Blob> read_next(pbf_io::Cursor &cursor)
    {
        if (cursor.at_end())
        {
            // Clean end of stream
            return std::nullopt;
        }

        const size_t record_start = cursor.position();
        if (cursor.remaining() < kLengthPrefixBytes)
        {
            throw ReaderError(ErrorKind::TruncatedLengthPrefix,
                              "not enough bytes to read header size" + at_offset(record_start) +
                                  remaining_text(kLengthPrefixBytes, cursor.remaining()));
        }

        uint8_t prefix[kLengthPrefixBytes] = {0, 0, 0, 0};
        cursor.read(prefix, kLengthPrefixBytes);
        const uint32_t header_len = decode_u32_be(prefix);

        if (header_len >= kMaxBlobHeaderBytes)
        {
            throw ReaderError(ErrorKind::HeaderTooLarge,
                              "header size " + std::to_string(header_len) + " exceeds the maximum of " +
                                  std::to_string(kMaxBlobHeaderBytes - 1) + " bytes" +
                                  at_offset(record_start));
        }

        const size_t header_start = cursor.position();
        if (cursor.remaining() < header_len)
        {
            throw ReaderError(ErrorKind::TruncatedHeader,
                              "not enough bytes to read blob header" + at_offset(header_start) +
                                  remaining_text(header_len, cursor.remaining()));
        }

        OSMPBF::BlobHeader header;
        if (!parse_window(header, cursor.take(header_len)))
        {
            throw ReaderError(ErrorKind::HeaderDecode,
                              "failed to parse BlobHeader" + at_offset(header_start));
        }

        const int32_t data_size = header.datasize();
        if (data_size < 0)
        {
            throw ReaderError(ErrorKind::HeaderDecode,
                              "negative blob size " + std::to_string(data_size) +
                                  at_offset(header_start));
        }
        if (data_size >= kMaxBlobBytes)
        {
            throw ReaderError(ErrorKind::BlobTooLarge,
                              "blob size " + std::to_string(data_size) + " exceeds the maximum of " +
                                  std::to_string(kMaxBlobBytes - 1) + " bytes" +
                                  at_offset(header_start));
        }

        const size_t blob_start = cursor.position();
        const size_t blob_len = static_cast<size_t>(data_size);
        if (cursor.remaining() < blob_len)
        {
            throw ReaderError(ErrorKind::TruncatedBlobPayload,
                              "not enough bytes to read blob" + at_offset(blob_start) +
                                  remaining_text(blob_len, cursor.remaining()));
        }

        OSMPBF::Blob blob;
        if (!parse_window(blob, cursor.take(blob_len)))
        {
            throw ReaderError(ErrorKind::BlobDecode,
                              "failed to parse Blob" + at_offset(blob_start));
        }

        const BlobKind kind = classify_type(header.type(), header_start);

        std::optional<int32_t> raw_size;
        if (blob.has_raw_size())
        {
            raw_size = blob.raw_size();
        }

        switch (blob.data_case())
        {
        case OSMPBF::Blob::kRaw:
            return Blob(kind, Compression::None, raw_size, copy_bytes(blob.raw()));
        case OSMPBF::Blob::kZlibData:
            return Blob(kind, Compression::Zlib, raw_size, copy_bytes(blob.zlib_data()));
        case OSMPBF::Blob::kLzmaData:
            throw ReaderError(ErrorKind::UnsupportedCompression,
                              "unsupported data compression 'lzma'" + at_offset(blob_start));
        case OSMPBF::Blob::kOBSOLETEBzip2Data:
            throw ReaderError(ErrorKind::UnsupportedCompression,
                              "unsupported data compression 'bzip2'" + at_offset(blob_start));
        case OSMPBF::Blob::kLz4Data:
            throw ReaderError(ErrorKind::UnsupportedCompression,
                              "unsupported data compression 'lz4'" + at_offset(blob_start));
        case OSMPBF::Blob::kZstdData:
            throw ReaderError(ErrorKind::UnsupportedCompression,
                              "unsupported data compression 'zstd'" + at_offset(blob_start));
        case OSMPBF::Blob::DATA_NOT_SET:
            break;
        }

        throw ReaderError(ErrorKind::EmptyPayload,
                          "blob does not contain any data" + at_offset(blob_start));
    }

} // namespace pbf_framing
