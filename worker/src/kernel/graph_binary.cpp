//! # Module Graph Binary Codec
//!
//! `GraphWriter` appends little-endian primitives to a byte buffer;
//! `GraphReader` reads them back and records the first error instead of
//! throwing. Callers check `has_error()` after each structural step.
//!
//! The encoder works on a copy of the graph's name root, so encoding never
//! mutates the graph it is given.

#include "kernel/graph_binary.hpp"

#include "common/crc32c.hpp"
#include "log/log.hpp"

#include <set>
#include <unordered_map>

namespace kiln::kernel {

namespace {

// ============================================================================
// Writer
// ============================================================================

class GraphWriter {
public:
    void write_u8(uint8_t value) {
        out_.push_back(value);
    }

    void write_u16(uint16_t value) {
        for (int i = 0; i < 2; ++i) {
            out_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void write_u32(uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void write_u64(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void write_string(const std::string& s) {
        write_u32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    [[nodiscard]] auto take() -> Bytes {
        return std::move(out_);
    }

private:
    Bytes out_;
};

// ============================================================================
// Reader
// ============================================================================

class GraphReader {
public:
    GraphReader(const Bytes& data, size_t offset, size_t end)
        : data_(data), pos_(offset), end_(end) {}

    auto read_u8() -> uint8_t {
        if (!require(1)) {
            return 0;
        }
        return data_[pos_++];
    }

    auto read_u16() -> uint16_t {
        if (!require(2)) {
            return 0;
        }
        uint16_t value = 0;
        for (int i = 0; i < 2; ++i) {
            value |= static_cast<uint16_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    auto read_u32() -> uint32_t {
        if (!require(4)) {
            return 0;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    auto read_u64() -> uint64_t {
        if (!require(8)) {
            return 0;
        }
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    auto read_string() -> std::string {
        uint32_t len = read_u32();
        if (!require(len)) {
            return {};
        }
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    /// Reads a count and checks that at least `min_item_size` bytes per item
    /// remain, so a corrupt count cannot trigger a huge allocation.
    auto read_count(size_t min_item_size) -> uint32_t {
        uint32_t count = read_u32();
        if (!has_error_ && static_cast<uint64_t>(count) * min_item_size > end_ - pos_) {
            set_error("Count " + std::to_string(count) + " exceeds remaining payload");
            return 0;
        }
        return count;
    }

    void set_error(const std::string& msg) {
        if (!has_error_) {
            has_error_ = true;
            error_ = msg + " at offset " + std::to_string(pos_);
        }
    }

    [[nodiscard]] auto has_error() const -> bool {
        return has_error_;
    }

    [[nodiscard]] auto error_message() const -> const std::string& {
        return error_;
    }

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ == end_;
    }

private:
    const Bytes& data_;
    size_t pos_;
    size_t end_;
    bool has_error_ = false;
    std::string error_;

    auto require(size_t n) -> bool {
        if (has_error_) {
            return false;
        }
        if (end_ - pos_ < n) {
            set_error("Unexpected end of artifact");
            return false;
        }
        return true;
    }
};

auto violation(std::string message) -> diag::Diagnostic {
    KILN_LOG_ERROR("artifact", message);
    return diag::Diagnostic::error(diag::ErrorKind::FilterInvariantViolation, std::move(message));
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

auto encode_graph(const ModuleGraph& graph, bool summary) -> Result<Bytes, diag::Diagnostic> {
    CanonicalNameRoot names = graph.names();
    const auto& top_level = graph.top_level();

    std::unordered_map<ModuleId, uint32_t> position;
    for (uint32_t i = 0; i < top_level.size(); ++i) {
        position.emplace(top_level[i], i);
    }

    std::set<Reference> table_refs;
    for (auto id : top_level) {
        const auto& module = graph.node(id);
        std::optional<ModuleId> owner;
        if (module.is_canonical_owner) {
            owner = id;
        }
        for (const auto& member : module.members) {
            Reference ref{module.import_uri, member.name};
            auto bound = names.bind(ref, owner);
            if (is_err(bound)) {
                return violation(unwrap_err(bound));
            }
            table_refs.insert(std::move(ref));
        }
    }

    for (auto id : top_level) {
        const auto& module = graph.node(id);
        for (const auto& member : module.members) {
            for (const auto& ref : member.references) {
                const CanonicalName* name = names.lookup(ref);
                if (name == nullptr) {
                    return violation("Reference to unbound canonical name " + ref.to_string() +
                                     " from " + module.import_uri + "::" + member.name);
                }
                if (name->owner && position.count(*name->owner) == 0) {
                    return violation("Canonical name " + ref.to_string() +
                                     " is owned by a module that is not part of the output");
                }
                table_refs.insert(ref);
            }
        }
    }

    // Payload
    GraphWriter payload;
    std::map<Reference, uint32_t> name_index;
    payload.write_u32(static_cast<uint32_t>(table_refs.size()));
    for (const auto& ref : table_refs) {
        const CanonicalName* name = names.lookup(ref);
        name_index.emplace(ref, static_cast<uint32_t>(name_index.size()));
        payload.write_string(ref.library_uri);
        payload.write_string(ref.member);
        payload.write_u32(name != nullptr && name->owner ? position.at(*name->owner) : NO_OWNER);
    }

    payload.write_u32(static_cast<uint32_t>(top_level.size()));
    for (auto id : top_level) {
        const auto& module = graph.node(id);
        payload.write_string(module.import_uri);
        payload.write_string(module.file_uri);
        payload.write_u8(module.is_canonical_owner ? module_flags::CANONICAL_OWNER : 0);
        payload.write_u32(static_cast<uint32_t>(module.imports.size()));
        for (const auto& imp : module.imports) {
            payload.write_string(imp);
        }
        payload.write_u32(static_cast<uint32_t>(module.members.size()));
        for (const auto& member : module.members) {
            payload.write_u8(static_cast<uint8_t>(member.kind));
            payload.write_string(member.name);
            payload.write_string(member.type);
            payload.write_u32(static_cast<uint32_t>(member.references.size()));
            for (const auto& ref : member.references) {
                payload.write_u32(name_index.at(ref));
            }
        }
    }
    Bytes body = payload.take();

    // Header
    GraphWriter out;
    out.write_u32(GRAPH_MAGIC);
    out.write_u16(GRAPH_VERSION_MAJOR);
    out.write_u16(GRAPH_VERSION_MINOR);
    out.write_u32(summary ? graph_flags::SUMMARY : 0);
    out.write_u32(crc32c(body.data(), body.size()));
    out.write_u64(body.size());
    Bytes result = out.take();
    result.insert(result.end(), body.begin(), body.end());

    KILN_LOG_DEBUG("artifact", "Encoded " << top_level.size() << " modules, " << table_refs.size()
                                          << " canonical names, " << result.size() << " bytes");
    return result;
}

// ============================================================================
// Decoding
// ============================================================================

auto decode_graph(const Bytes& data) -> Result<DecodedGraph, std::string> {
    if (data.size() < GRAPH_HEADER_SIZE) {
        return std::string("Artifact too small for header");
    }

    GraphReader header(data, 0, GRAPH_HEADER_SIZE);
    uint32_t magic = header.read_u32();
    uint16_t major = header.read_u16();
    uint16_t minor = header.read_u16();
    uint32_t flags = header.read_u32();
    uint32_t checksum = header.read_u32();
    uint64_t payload_size = header.read_u64();

    if (magic != GRAPH_MAGIC) {
        return std::string("Not a module graph artifact (bad magic)");
    }
    if (major != GRAPH_VERSION_MAJOR) {
        return "Unsupported artifact version " + std::to_string(major) + "." +
               std::to_string(minor);
    }
    if (payload_size != data.size() - GRAPH_HEADER_SIZE) {
        return "Artifact payload size mismatch: header says " + std::to_string(payload_size) +
               ", found " + std::to_string(data.size() - GRAPH_HEADER_SIZE);
    }
    if (crc32c(data.data() + GRAPH_HEADER_SIZE, payload_size) != checksum) {
        return std::string("Artifact checksum mismatch");
    }

    GraphReader reader(data, GRAPH_HEADER_SIZE, data.size());

    struct NameEntry {
        Reference ref;
        uint32_t owner;
    };
    std::vector<NameEntry> table;
    uint32_t name_count = reader.read_count(12);
    table.reserve(name_count);
    for (uint32_t i = 0; i < name_count && !reader.has_error(); ++i) {
        NameEntry entry;
        entry.ref.library_uri = reader.read_string();
        entry.ref.member = reader.read_string();
        entry.owner = reader.read_u32();
        table.push_back(std::move(entry));
    }

    DecodedGraph decoded;
    decoded.summary = (flags & graph_flags::SUMMARY) != 0;
    auto& graph = decoded.graph;

    uint32_t module_count = reader.read_count(17);
    for (uint32_t m = 0; m < module_count && !reader.has_error(); ++m) {
        ModuleNode node;
        node.import_uri = reader.read_string();
        node.file_uri = reader.read_string();
        node.is_canonical_owner = (reader.read_u8() & module_flags::CANONICAL_OWNER) != 0;

        uint32_t import_count = reader.read_count(4);
        for (uint32_t i = 0; i < import_count && !reader.has_error(); ++i) {
            node.imports.push_back(reader.read_string());
        }

        uint32_t member_count = reader.read_count(13);
        for (uint32_t i = 0; i < member_count && !reader.has_error(); ++i) {
            Member member;
            uint8_t kind = reader.read_u8();
            if (kind > static_cast<uint8_t>(MemberKind::Fn)) {
                reader.set_error("Invalid member kind " + std::to_string(kind));
                break;
            }
            member.kind = static_cast<MemberKind>(kind);
            member.name = reader.read_string();
            member.type = reader.read_string();
            uint32_t ref_count = reader.read_count(4);
            for (uint32_t r = 0; r < ref_count && !reader.has_error(); ++r) {
                uint32_t index = reader.read_u32();
                if (index >= table.size()) {
                    reader.set_error("Name index " + std::to_string(index) + " out of range");
                    break;
                }
                member.references.push_back(table[index].ref);
            }
            node.members.push_back(std::move(member));
        }
        graph.add_module(std::move(node));
    }

    if (reader.has_error()) {
        return reader.error_message();
    }
    if (!reader.at_end()) {
        return std::string("Trailing bytes after artifact payload");
    }

    for (const auto& entry : table) {
        std::optional<ModuleId> owner;
        if (entry.owner != NO_OWNER) {
            if (entry.owner >= module_count) {
                return "Owner index " + std::to_string(entry.owner) + " out of range for " +
                       entry.ref.to_string();
            }
            owner = entry.owner;
        }
        auto bound = graph.names_mut().bind(entry.ref, owner);
        if (is_err(bound)) {
            return unwrap_err(bound);
        }
    }

    return decoded;
}

} // namespace kiln::kernel
