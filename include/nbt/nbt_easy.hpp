#pragma once

#include "nbt/nbt.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace nbt::easy {

// Dot-separated lookup into a decoded tree, e.g. "Data.Player.Inventory.0.id".
// A segment applied to a List is a decimal element index.
namespace detail {

inline bool parse_index(std::string_view s, std::size_t& out) {
    if (s.empty() || s.size() > 10) return false;
    std::size_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<std::size_t>(c - '0');
    }
    out = v;
    return true;
}

inline const Tag* child(const Tag& parent, std::string_view seg) {
    if (parent.is_compound()) {
        return parent.as_compound().get(seg);
    }
    if (parent.is_list()) {
        const List& l = parent.as_list();
        std::size_t idx = 0;
        if (!parse_index(seg, idx) || idx >= l.size()) return nullptr;
        return &l[idx];
    }
    return nullptr;
}

template <std::size_t I>
inline std::optional<std::variant_alternative_t<I, decltype(Tag::v)>> get_alt(const Tag* t) {
    if (!t || t->v.index() != I) return std::nullopt;
    return std::get<I>(t->v);
}

} // namespace detail

/// Resolve `path` below `root`. Returns nullptr when any segment is missing.
/// Throws MalformedData for an empty path or an empty segment.
inline const Tag* find(const Compound& root, std::string_view path) {
    if (path.empty()) {
        throw NbtError(ErrorKind::MalformedData, "invalid path: empty");
    }

    const Tag* cur = nullptr;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = path.find('.', start);
        std::string_view seg = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (seg.empty()) {
            throw NbtError(ErrorKind::MalformedData, "invalid path: empty segment in '" + std::string(path) + "'");
        }
        cur = cur ? detail::child(*cur, seg) : root.get(seg);
        if (!cur) return nullptr;
        if (dot == std::string_view::npos) return cur;
        start = dot + 1;
    }
}

inline std::optional<std::int8_t> get_byte(const Compound& root, std::string_view path) {
    return detail::get_alt<1>(find(root, path));
}

inline std::optional<std::int16_t> get_short(const Compound& root, std::string_view path) {
    return detail::get_alt<2>(find(root, path));
}

inline std::optional<std::int32_t> get_int(const Compound& root, std::string_view path) {
    return detail::get_alt<3>(find(root, path));
}

inline std::optional<std::int64_t> get_long(const Compound& root, std::string_view path) {
    return detail::get_alt<4>(find(root, path));
}

inline std::optional<float> get_float(const Compound& root, std::string_view path) {
    return detail::get_alt<5>(find(root, path));
}

inline std::optional<double> get_double(const Compound& root, std::string_view path) {
    return detail::get_alt<6>(find(root, path));
}

inline std::optional<std::string_view> get_string(const Compound& root, std::string_view path) {
    return detail::get_alt<8>(find(root, path));
}

// Boolean flags are stored as Byte 0/1.
inline std::optional<bool> get_bool(const Compound& root, std::string_view path) {
    auto b = get_byte(root, path);
    if (!b) return std::nullopt;
    return *b != 0;
}

inline const List* get_list(const Compound& root, std::string_view path) {
    const Tag* t = find(root, path);
    return (t && t->is_list()) ? &t->as_list() : nullptr;
}

inline const Compound* get_compound(const Compound& root, std::string_view path) {
    const Tag* t = find(root, path);
    return (t && t->is_compound()) ? &t->as_compound() : nullptr;
}

} // namespace nbt::easy
