
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace nbt {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    StillCompressed,
    InvalidRoot,
    UnexpectedEndOfData,
    MalformedData,
    DepthExceeded,
    DecompressionFailure,
    Io,
    NotFound,
    TypeMismatch,
};

std::string to_string(ErrorKind k);

class NbtError : public std::runtime_error {
public:
    NbtError(ErrorKind k, const std::string& msg);
    NbtError(ErrorKind k, const std::string& msg, std::uint8_t observed_type);
    ErrorKind kind() const noexcept;

    // Raw type id that triggered InvalidRoot (and unknown-type MalformedData).
    std::optional<std::uint8_t> observed_type() const noexcept;

private:
    ErrorKind kind_;
    std::optional<std::uint8_t> observed_type_;
};

// ------------------------------
// Tag types
// ------------------------------

enum class TagType : std::uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12,
};

std::string to_string(TagType t);

/// Validate a raw wire id; throws MalformedData outside 0..12.
TagType tag_type_from_id(std::uint8_t id);

namespace detail {

// Big-endian two's complement load of an integral T from unaligned bytes.
template <typename T>
inline T load_be(const std::uint8_t* p) noexcept {
    static_assert(std::is_integral_v<T>, "load_be requires an integral type");
    using U = std::make_unsigned_t<T>;
    U u = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        u = static_cast<U>((u << 8) | static_cast<U>(p[i]));
    }
    return static_cast<T>(u);
}

} // namespace detail

// ------------------------------
// Public data model
// ------------------------------

// View over `count` big-endian elements stored in a borrowed buffer.
// Elements are decoded on access, so the view has no alignment requirement.
template <typename T>
class BigEndianArray {
public:
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = T;

        const_iterator() = default;
        explicit const_iterator(const std::uint8_t* p) noexcept : p_(p) {}

        T operator*() const noexcept { return detail::load_be<T>(p_); }
        const_iterator& operator++() noexcept {
            p_ += sizeof(T);
            return *this;
        }
        const_iterator operator++(int) noexcept {
            const_iterator tmp = *this;
            ++*this;
            return tmp;
        }
        bool operator==(const const_iterator& o) const noexcept { return p_ == o.p_; }
        bool operator!=(const const_iterator& o) const noexcept { return p_ != o.p_; }

    private:
        const std::uint8_t* p_{nullptr};
    };

    BigEndianArray() = default;
    BigEndianArray(const std::uint8_t* data, std::size_t count) noexcept
        : data_(data), count_(count) {}

    std::size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }

    // Raw (still big-endian) bytes of the view.
    const std::uint8_t* bytes() const noexcept { return data_; }
    std::size_t byte_size() const noexcept { return count_ * sizeof(T); }

    T operator[](std::size_t i) const noexcept { return detail::load_be<T>(data_ + i * sizeof(T)); }

    T at(std::size_t i) const {
        if (i >= count_) throw std::out_of_range("array index out of range");
        return (*this)[i];
    }

    const_iterator begin() const noexcept { return const_iterator(data_); }
    const_iterator end() const noexcept { return const_iterator(data_ + byte_size()); }

    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) out.push_back((*this)[i]);
        return out;
    }

private:
    const std::uint8_t* data_{nullptr};
    std::size_t count_{0};
};

using ByteArray = BigEndianArray<std::int8_t>;
using IntArray = BigEndianArray<std::int32_t>;
using LongArray = BigEndianArray<std::int64_t>;

struct Tag;

class List {
public:
    using const_iterator = std::vector<Tag>::const_iterator;

    List() = default;
    List(TagType element_type, std::vector<Tag> elements);

    TagType element_type() const noexcept { return element_type_; }
    const std::vector<Tag>& elements() const noexcept { return elements_; }

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const Tag& operator[](std::size_t i) const;
    const Tag& at(std::size_t i) const;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    TagType element_type_{TagType::End};
    std::vector<Tag> elements_{};
};

class Compound {
public:
    // Keys view the source buffer; ordering is by key, not by stream position.
    using Map = std::map<std::string_view, Tag, std::less<>>;
    using const_iterator = Map::const_iterator;

    /// Insert or overwrite: the last occurrence of a name wins.
    void set(std::string_view name, Tag tag);

    const Tag* get(std::string_view name) const;
    const Tag& at(std::string_view name) const;
    bool contains(std::string_view name) const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    Map tags_{};
};

struct Tag {
    // Alternative index == wire type id.
    std::variant<
        std::monostate,
        std::int8_t,
        std::int16_t,
        std::int32_t,
        std::int64_t,
        float,
        double,
        ByteArray,
        std::string_view,
        List,
        Compound,
        IntArray,
        LongArray
    > v;

    static Tag make_compound(Compound c);
    static Tag make_list(List l);

    TagType type() const noexcept { return static_cast<TagType>(v.index()); }
    bool is(TagType t) const noexcept { return type() == t; }
    bool is_compound() const noexcept { return is(TagType::Compound); }
    bool is_list() const noexcept { return is(TagType::List); }

    std::int8_t as_byte() const;
    std::int16_t as_short() const;
    std::int32_t as_int() const;
    std::int64_t as_long() const;
    float as_float() const;
    double as_double() const;
    const ByteArray& as_byte_array() const;
    std::string_view as_string() const;
    const List& as_list() const;
    const Compound& as_compound() const;
    const IntArray& as_int_array() const;
    const LongArray& as_long_array() const;
};

inline std::size_t List::size() const noexcept { return elements_.size(); }
inline bool List::empty() const noexcept { return elements_.empty(); }
inline const Tag& List::operator[](std::size_t i) const { return elements_[i]; }
inline List::const_iterator List::begin() const noexcept { return elements_.begin(); }
inline List::const_iterator List::end() const noexcept { return elements_.end(); }

inline std::size_t Compound::size() const noexcept { return tags_.size(); }
inline bool Compound::empty() const noexcept { return tags_.empty(); }
inline Compound::const_iterator Compound::begin() const noexcept { return tags_.begin(); }
inline Compound::const_iterator Compound::end() const noexcept { return tags_.end(); }

// Root of a parsed document. `name` views the input buffer.
struct NamedTag {
    std::string_view name{};
    Tag tag{};
    std::size_t bytes_read{0};
};

// ------------------------------
// Options
// ------------------------------

struct ParseOptions {
    std::size_t max_depth{512};  // root compound counts as depth 1
    bool named_root{true};       // false: network format, root has no name
    std::uint64_t max_inflated_size{256ull * 1024ull * 1024ull};
};

// ------------------------------
// API
// ------------------------------

/// True when `data` starts with the gzip magic 1F 8B.
bool is_gzip(const std::uint8_t* data, std::size_t size) noexcept;
bool is_gzip(const std::vector<std::uint8_t>& data) noexcept;

/// Inflate a gzip envelope into an owned buffer, or return a copy of plain input.
std::vector<std::uint8_t> decompress(
    const std::uint8_t* data,
    std::size_t size,
    const ParseOptions& opts = ParseOptions{}
);
std::vector<std::uint8_t> decompress(
    const std::vector<std::uint8_t>& data,
    const ParseOptions& opts = ParseOptions{}
);

/// Parse an already decompressed buffer. The result views `data` and must not outlive it.
NamedTag parse(
    const std::uint8_t* data,
    std::size_t size,
    const ParseOptions& opts = ParseOptions{}
);
NamedTag parse(
    const std::vector<std::uint8_t>& data,
    const ParseOptions& opts = ParseOptions{}
);

// Owns the bytes a tree views, so the pair can be moved and shared freely.
class Document {
public:
    /// Decompress if needed, take ownership and parse.
    static Document from_bytes(std::vector<std::uint8_t> bytes, const ParseOptions& opts = ParseOptions{});

    /// Read a whole file, then as from_bytes.
    static Document read_file(const std::filesystem::path& file, const ParseOptions& opts = ParseOptions{});

    std::string_view name() const noexcept { return root_.name; }
    const Tag& root() const noexcept { return root_.tag; }
    const Compound& compound() const;
    const std::vector<std::uint8_t>& bytes() const noexcept { return *buffer_; }
    bool was_compressed() const noexcept { return was_compressed_; }

private:
    Document() = default;

    std::shared_ptr<const std::vector<std::uint8_t>> buffer_{};
    NamedTag root_{};
    bool was_compressed_{false};
};

// ------------------------------
// Utilities
// ------------------------------

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) noexcept;

} // namespace nbt
