
#include "nbt/nbt.hpp"
#include "nbt/nbt_cursor.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include <zlib.h>

namespace nbt {

NbtError::NbtError(ErrorKind k, const std::string& msg)
    : std::runtime_error(msg), kind_(k) {}

NbtError::NbtError(ErrorKind k, const std::string& msg, std::uint8_t observed_type)
    : std::runtime_error(msg), kind_(k), observed_type_(observed_type) {}

ErrorKind NbtError::kind() const noexcept { return kind_; }

std::optional<std::uint8_t> NbtError::observed_type() const noexcept { return observed_type_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::StillCompressed: return "StillCompressed";
        case ErrorKind::InvalidRoot: return "InvalidRoot";
        case ErrorKind::UnexpectedEndOfData: return "UnexpectedEndOfData";
        case ErrorKind::MalformedData: return "MalformedData";
        case ErrorKind::DepthExceeded: return "DepthExceeded";
        case ErrorKind::DecompressionFailure: return "DecompressionFailure";
        case ErrorKind::Io: return "Io";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        default: return "Unknown";
    }
}

// ------------------------------
// Small helpers
// ------------------------------

static constexpr std::size_t kInflateChunk = 64u * 1024u;
static constexpr std::size_t kMaxInflateInput = 1u << 30; // per inflate() call, fits uInt

static bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::size_t>::max)() / b) return false;
    out = a * b;
    return true;
}

// ------------------------------
// Tag type helpers
// ------------------------------

std::string to_string(TagType t) {
    switch (t) {
        case TagType::End: return "End";
        case TagType::Byte: return "Byte";
        case TagType::Short: return "Short";
        case TagType::Int: return "Int";
        case TagType::Long: return "Long";
        case TagType::Float: return "Float";
        case TagType::Double: return "Double";
        case TagType::ByteArray: return "ByteArray";
        case TagType::String: return "String";
        case TagType::List: return "List";
        case TagType::Compound: return "Compound";
        case TagType::IntArray: return "IntArray";
        case TagType::LongArray: return "LongArray";
        default: return "Unknown";
    }
}

TagType tag_type_from_id(std::uint8_t id) {
    if (id > static_cast<std::uint8_t>(TagType::LongArray)) {
        throw NbtError(ErrorKind::MalformedData, "unknown tag type " + std::to_string(id), id);
    }
    return static_cast<TagType>(id);
}

// Smallest number of bytes a payload of type `t` can occupy.
static std::size_t min_payload_size(TagType t) {
    switch (t) {
        case TagType::End: return 0;
        case TagType::Byte: return 1;
        case TagType::Short: return 2;
        case TagType::Int: return 4;
        case TagType::Long: return 8;
        case TagType::Float: return 4;
        case TagType::Double: return 8;
        case TagType::ByteArray: return 4;
        case TagType::String: return 2;
        case TagType::List: return 5;
        case TagType::Compound: return 1;
        case TagType::IntArray: return 4;
        case TagType::LongArray: return 4;
        default: return 1;
    }
}

// ------------------------------
// Tag / List / Compound
// ------------------------------

List::List(TagType element_type, std::vector<Tag> elements)
    : element_type_(element_type), elements_(std::move(elements)) {}

const Tag& List::at(std::size_t i) const {
    if (i >= elements_.size()) {
        throw NbtError(ErrorKind::NotFound,
                       "list index " + std::to_string(i) + " out of range (size " +
                       std::to_string(elements_.size()) + ")");
    }
    return elements_[i];
}

void Compound::set(std::string_view name, Tag tag) {
    tags_.insert_or_assign(name, std::move(tag));
}

const Tag* Compound::get(std::string_view name) const {
    auto it = tags_.find(name);
    if (it == tags_.end()) return nullptr;
    return &it->second;
}

const Tag& Compound::at(std::string_view name) const {
    const Tag* t = get(name);
    if (!t) throw NbtError(ErrorKind::NotFound, "no tag named '" + std::string(name) + "'");
    return *t;
}

bool Compound::contains(std::string_view name) const {
    return tags_.find(name) != tags_.end();
}

Tag Tag::make_compound(Compound c) {
    Tag t;
    t.v = std::move(c);
    return t;
}

Tag Tag::make_list(List l) {
    Tag t;
    t.v = std::move(l);
    return t;
}

template <std::size_t I>
static const std::variant_alternative_t<I, decltype(Tag::v)>& expect_alt(const Tag& t) {
    if (t.v.index() != I) {
        throw NbtError(ErrorKind::TypeMismatch,
                       "expected " + to_string(static_cast<TagType>(I)) + " tag, got " + to_string(t.type()));
    }
    return std::get<I>(t.v);
}

std::int8_t Tag::as_byte() const { return expect_alt<1>(*this); }
std::int16_t Tag::as_short() const { return expect_alt<2>(*this); }
std::int32_t Tag::as_int() const { return expect_alt<3>(*this); }
std::int64_t Tag::as_long() const { return expect_alt<4>(*this); }
float Tag::as_float() const { return expect_alt<5>(*this); }
double Tag::as_double() const { return expect_alt<6>(*this); }
const ByteArray& Tag::as_byte_array() const { return expect_alt<7>(*this); }
std::string_view Tag::as_string() const { return expect_alt<8>(*this); }
const List& Tag::as_list() const { return expect_alt<9>(*this); }
const Compound& Tag::as_compound() const { return expect_alt<10>(*this); }
const IntArray& Tag::as_int_array() const { return expect_alt<11>(*this); }
const LongArray& Tag::as_long_array() const { return expect_alt<12>(*this); }

// ------------------------------
// Text
// ------------------------------

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept {
    std::size_t i = 0;
    while (i < size) {
        std::uint8_t c = data[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t n = 0;
        std::uint32_t cp = 0;
        std::uint32_t min = 0;
        if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1Fu; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0Fu; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07u; min = 0x10000; }
        else return false;

        if (n > size - i - 1) return false;
        for (std::size_t k = 1; k <= n; ++k) {
            std::uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if (cp < min) return false;                      // overlong
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;  // surrogate
        i += n + 1;
    }
    return true;
}

std::string_view read_text(Cursor& cur) {
    std::size_t at = cur.position();
    std::uint16_t len = cur.read_u16();
    const std::uint8_t* p = cur.take(len);
    if (!is_valid_utf8(p, len)) {
        throw NbtError(ErrorKind::MalformedData,
                       "invalid UTF-8 in string at offset " + std::to_string(at));
    }
    return std::string_view(reinterpret_cast<const char*>(p), len);
}

// ------------------------------
// Decompression gate
// ------------------------------

bool is_gzip(const std::uint8_t* data, std::size_t size) noexcept {
    return size >= 2 && data[0] == 0x1F && data[1] == 0x8B;
}

bool is_gzip(const std::vector<std::uint8_t>& data) noexcept {
    return is_gzip(data.data(), data.size());
}

namespace {

struct InflateStream {
    z_stream zs{};
    bool live{false};

    InflateStream() {
        // 16 + MAX_WBITS: expect a gzip header and trailer.
        if (::inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
            throw NbtError(ErrorKind::DecompressionFailure, "zlib inflateInit2 failed");
        }
        live = true;
    }
    ~InflateStream() {
        if (live) ::inflateEnd(&zs);
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

} // namespace

static std::vector<std::uint8_t> gzip_inflate(const std::uint8_t* data, std::size_t size, std::uint64_t limit) {
    InflateStream s;
    z_stream& zs = s.zs;

    std::vector<std::uint8_t> out;
    std::size_t in_off = 0;

    while (true) {
        if (zs.avail_in == 0 && in_off < size) {
            std::size_t n = std::min(size - in_off, kMaxInflateInput);
            zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data + in_off));
            zs.avail_in = static_cast<uInt>(n);
            in_off += n;
        }

        std::size_t old = out.size();
        out.resize(old + kInflateChunk);
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + old);
        zs.avail_out = static_cast<uInt>(kInflateChunk);

        int rc = ::inflate(&zs, Z_NO_FLUSH);
        out.resize(old + (kInflateChunk - zs.avail_out));

        if (static_cast<std::uint64_t>(out.size()) > limit) {
            throw NbtError(ErrorKind::DecompressionFailure,
                           "inflated size exceeds limit of " + std::to_string(limit) + " bytes");
        }
        if (rc == Z_STREAM_END) break;
        if (rc == Z_BUF_ERROR && zs.avail_in == 0 && in_off >= size) {
            throw NbtError(ErrorKind::DecompressionFailure, "truncated gzip stream");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            std::string why = zs.msg ? zs.msg : ("zlib error " + std::to_string(rc));
            throw NbtError(ErrorKind::DecompressionFailure, "gzip inflate failed: " + why);
        }
    }

    out.shrink_to_fit();
    return out;
}

std::vector<std::uint8_t> decompress(const std::uint8_t* data, std::size_t size, const ParseOptions& opts) {
    if (!is_gzip(data, size)) {
        if (size == 0) return {};
        return std::vector<std::uint8_t>(data, data + size);
    }
    return gzip_inflate(data, size, opts.max_inflated_size);
}

std::vector<std::uint8_t> decompress(const std::vector<std::uint8_t>& data, const ParseOptions& opts) {
    return decompress(data.data(), data.size(), opts);
}

// ------------------------------
// Payload decoder
// ------------------------------

static std::size_t enter_container(std::size_t depth, const ParseOptions& opts, const Cursor& cur) {
    std::size_t inner = depth + 1;
    if (inner > opts.max_depth) {
        throw NbtError(ErrorKind::DepthExceeded,
                       "nesting depth exceeds limit of " + std::to_string(opts.max_depth) +
                       " at offset " + std::to_string(cur.position()));
    }
    return inner;
}

static std::int32_t read_length(Cursor& cur, const char* what) {
    std::size_t at = cur.position();
    std::int32_t len = cur.read_i32();
    if (len < 0) {
        throw NbtError(ErrorKind::MalformedData,
                       std::string("negative ") + what + " " + std::to_string(len) +
                       " at offset " + std::to_string(at));
    }
    return len;
}

template <typename T>
static BigEndianArray<T> read_array(Cursor& cur) {
    std::size_t count = static_cast<std::size_t>(read_length(cur, "array length"));
    std::size_t nbytes = 0;
    if (!checked_mul_size(count, sizeof(T), nbytes)) {
        throw NbtError(ErrorKind::MalformedData, "array size overflow");
    }
    const std::uint8_t* p = cur.take(nbytes);
    return BigEndianArray<T>(p, count);
}

static List read_list(Cursor& cur, const ParseOptions& opts, std::size_t depth) {
    TagType elem = tag_type_from_id(cur.read_u8());
    std::size_t count = static_cast<std::size_t>(read_length(cur, "list length"));

    if (count > 0 && elem == TagType::End) {
        throw NbtError(ErrorKind::MalformedData,
                       "list of End tags with non-zero length " + std::to_string(count));
    }
    // Every element needs at least min_payload_size bytes; reject counts the buffer cannot hold.
    std::size_t need = 0;
    if (!checked_mul_size(count, min_payload_size(elem), need) || need > cur.remaining()) {
        throw NbtError(ErrorKind::UnexpectedEndOfData,
                       "list of " + std::to_string(count) + " " + to_string(elem) +
                       " elements exceeds remaining " + std::to_string(cur.remaining()) + " bytes");
    }

    std::vector<Tag> elements;
    elements.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        elements.push_back(read_payload(cur, elem, opts, depth));
    }
    return List(elem, std::move(elements));
}

static Compound read_compound(Cursor& cur, const ParseOptions& opts, std::size_t depth) {
    Compound c;
    while (true) {
        TagType type = tag_type_from_id(cur.read_u8());
        if (type == TagType::End) break;
        std::string_view name = read_text(cur);
        c.set(name, read_payload(cur, type, opts, depth));
    }
    return c;
}

Tag read_payload(Cursor& cur, TagType type, const ParseOptions& opts, std::size_t depth) {
    Tag t;
    switch (type) {
        case TagType::End:
            break;
        case TagType::Byte:
            t.v.emplace<1>(cur.read_i8());
            break;
        case TagType::Short:
            t.v.emplace<2>(cur.read_i16());
            break;
        case TagType::Int:
            t.v.emplace<3>(cur.read_i32());
            break;
        case TagType::Long:
            t.v.emplace<4>(cur.read_i64());
            break;
        case TagType::Float:
            t.v.emplace<5>(cur.read_f32());
            break;
        case TagType::Double:
            t.v.emplace<6>(cur.read_f64());
            break;
        case TagType::ByteArray:
            t.v.emplace<7>(read_array<std::int8_t>(cur));
            break;
        case TagType::String:
            t.v.emplace<8>(read_text(cur));
            break;
        case TagType::List:
            t.v.emplace<9>(read_list(cur, opts, enter_container(depth, opts, cur)));
            break;
        case TagType::Compound:
            t.v.emplace<10>(read_compound(cur, opts, enter_container(depth, opts, cur)));
            break;
        case TagType::IntArray:
            t.v.emplace<11>(read_array<std::int32_t>(cur));
            break;
        case TagType::LongArray:
            t.v.emplace<12>(read_array<std::int64_t>(cur));
            break;
        default: {
            auto id = static_cast<std::uint8_t>(type);
            throw NbtError(ErrorKind::MalformedData, "unknown tag type " + std::to_string(id), id);
        }
    }
    return t;
}

// ------------------------------
// API implementations
// ------------------------------

NamedTag parse(const std::uint8_t* data, std::size_t size, const ParseOptions& opts) {
    if (is_gzip(data, size)) {
        throw NbtError(ErrorKind::StillCompressed,
                       "input is gzip-compressed; call nbt::decompress before parsing");
    }

    Cursor cur(data, size);
    std::uint8_t id = cur.read_u8();
    if (id != static_cast<std::uint8_t>(TagType::Compound)) {
        throw NbtError(ErrorKind::InvalidRoot,
                       "root tag must be Compound (10), got type " + std::to_string(id), id);
    }

    NamedTag out;
    if (opts.named_root) out.name = read_text(cur);
    out.tag = read_payload(cur, TagType::Compound, opts, 0);
    out.bytes_read = cur.position();
    return out;
}

NamedTag parse(const std::vector<std::uint8_t>& data, const ParseOptions& opts) {
    return parse(data.data(), data.size(), opts);
}

Document Document::from_bytes(std::vector<std::uint8_t> bytes, const ParseOptions& opts) {
    Document doc;
    doc.was_compressed_ = is_gzip(bytes);
    if (doc.was_compressed_) {
        bytes = decompress(bytes, opts);
    }
    auto buf = std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes));
    doc.root_ = parse(*buf, opts);
    doc.buffer_ = std::move(buf);
    return doc;
}

Document Document::read_file(const std::filesystem::path& file, const ParseOptions& opts) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw NbtError(ErrorKind::Io, "failed to open file: " + file.string());
    }

    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(file, ec);
    if (ec) {
        throw NbtError(ErrorKind::Io, "failed to stat file: " + file.string() + ": " + ec.message());
    }

    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
    is.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!is) {
        throw NbtError(ErrorKind::Io, "unexpected EOF reading file: " + file.string());
    }

    return from_bytes(std::move(bytes), opts);
}

const Compound& Document::compound() const {
    return root_.tag.as_compound();
}

} // namespace nbt
