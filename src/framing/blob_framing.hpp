// src/framing/blob_framing.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "blob/blob.hpp"
#include "io/cursor.hpp"

namespace pbf_framing
{

    // Hard ceilings checked before anything proportional to a size is touched.
    constexpr uint32_t kMaxBlobHeaderBytes = 64u * 1024u;
    constexpr int32_t kMaxBlobBytes = 32 * 1024 * 1024;

    constexpr size_t kLengthPrefixBytes = 4;

    uint32_t decode_u32_be(const uint8_t b[4]);

    // Reads one record ([uint32_be L][L bytes BlobHeader][datasize bytes Blob]).
    // Returns:
    //  - a Blob  => record consumed, cursor left at the start of the next one
    //  - nullopt => cursor was exactly at the end of the region
    // Throws osmpbf_reader::ReaderError for any framing or decode failure.
    std::optional<osmpbf_reader::Blob> read_next(pbf_io::Cursor &cursor);

} // namespace pbf_framing
