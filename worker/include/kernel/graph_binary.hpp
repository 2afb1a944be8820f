//! # Module Graph Artifacts
//!
//! Binary encoding of a `ModuleGraph`, used both for the summaries a
//! compilation reads and for the artifact it writes.
//!
//! ## Layout
//!
//! ```text
//! +--------------------+---------------------------------------+
//! | Header (24 bytes)  | Payload                               |
//! +--------------------+---------------------------------------+
//!
//! Header:
//!   Offset  Size  Field
//!   0       4     magic (0x474E4C4B = "KLNG")
//!   4       2     version_major
//!   6       2     version_minor
//!   8       4     flags (bit 0: summary)
//!   12      4     payload_crc32c
//!   16      8     payload_size
//!
//! Payload:
//!   names[]:   count(u32) + [library_uri, member, owner(u32, 0xFFFFFFFF = external)]
//!   modules[]: count(u32) + [import_uri, file_uri, flags(u8), imports[], members[]]
//!   member:    kind(u8), name, type, refs[] = count(u32) + [name index(u32)]
//! ```
//!
//! All integers are little-endian; strings are `u32 length + bytes`.
//! Owner and name indices refer to positions in the payload's own tables.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "kernel/graph.hpp"

#include <string>

namespace kiln::kernel {

/// Artifact magic: "KLNG" read as a little-endian u32.
constexpr uint32_t GRAPH_MAGIC = 0x474E4C4B;

constexpr uint16_t GRAPH_VERSION_MAJOR = 1;
constexpr uint16_t GRAPH_VERSION_MINOR = 0;

constexpr size_t GRAPH_HEADER_SIZE = 24;

constexpr uint32_t NO_OWNER = 0xFFFFFFFF;

/// Header flag bits.
namespace graph_flags {
constexpr uint32_t SUMMARY = 1u << 0;
} // namespace graph_flags

/// Module flag bits.
namespace module_flags {
constexpr uint8_t CANONICAL_OWNER = 1u << 0;
} // namespace module_flags

struct DecodedGraph {
    ModuleGraph graph;
    bool summary = false;
};

/// Encodes the top-level modules of `graph`.
///
/// Canonical names are computed for every top-level module first. Every
/// reference made by an encoded module must then resolve to a name that is
/// either external or owned by an encoded module; anything else fails with
/// `FilterInvariantViolation`.
[[nodiscard]] auto encode_graph(const ModuleGraph& graph, bool summary)
    -> Result<Bytes, diag::Diagnostic>;

/// Decodes an artifact, validating the header, checksum and every index.
/// The decoded graph's arena holds exactly the encoded modules, in order.
[[nodiscard]] auto decode_graph(const Bytes& data) -> Result<DecodedGraph, std::string>;

} // namespace kiln::kernel
