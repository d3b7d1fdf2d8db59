/**
 *  @file
 *  @copyright defined in dsched/LICENSE.txt
 */
#pragma once

#include <string>
#include <ostream>
#include <string_view>
#include <fc/reflect/reflect.hpp>

namespace dsched { namespace chain {
struct name;
}}  // namespace dsched::chain

namespace fc {
class variant;
void to_variant(const dsched::chain::name& n, fc::variant& v);
void from_variant(const fc::variant& v, dsched::chain::name& n);
}  // namespace fc

namespace dsched { namespace chain {

static constexpr uint64_t
char_to_symbol(char c) {
    if(c >= 'a' && c <= 'z') {
        return (c - 'a') + 6;
    }
    if(c >= '1' && c <= '5') {
        return (c - '1') + 1;
    }
    return 0;
}

// Each char of the string is encoded into 5-bit chunk and left-shifted
// to its 5-bit slot starting with the highest slot for the first char.
// The 13th char, if str is long enough, is encoded into 4-bit chunk
// and placed in the lowest 4 bits. 64 = 12 * 5 + 4
static constexpr uint64_t
string_to_uint64_t(std::string_view str) {
    uint64_t n = 0;
    size_t   i = 0;
    for(; i < str.size() && i < 12; ++i) {
        n |= (char_to_symbol(str[i]) & 0x1f) << (64 - 5 * (i + 1));
    }
    if(i == 12 && str.size() > 12) {
        n |= char_to_symbol(str[12]) & 0x0F;
    }
    return n;
}

/**
 *  Account and action names are 64 bit integers packed from strings of up to
 *  13 characters taken from `.12345abcdefghijklmnopqrstuvwxyz`.
 */
struct name {
public:
    name() = default;
    constexpr explicit name(uint64_t v) : value(v) {}
    explicit name(std::string_view str) { set(str); }

public:
    void set(std::string_view str);

    std::string to_string() const;

    constexpr bool empty() const { return value == 0; }
    constexpr uint64_t to_uint64_t() const { return value; }

    explicit operator std::string() const { return to_string(); }

    friend std::ostream& operator<<(std::ostream& out, const name& n) {
        return out << n.to_string();
    }

    friend constexpr bool operator<(const name& a, const name& b) { return a.value < b.value; }
    friend constexpr bool operator>(const name& a, const name& b) { return a.value > b.value; }
    friend constexpr bool operator<=(const name& a, const name& b) { return a.value <= b.value; }
    friend constexpr bool operator>=(const name& a, const name& b) { return a.value >= b.value; }
    friend constexpr bool operator==(const name& a, const name& b) { return a.value == b.value; }
    friend constexpr bool operator!=(const name& a, const name& b) { return a.value != b.value; }

public:
    uint64_t value = 0;
};

namespace name_literals {

inline constexpr name
operator""_n(const char* s, size_t n) {
    return name(string_to_uint64_t(std::string_view(s, n)));
}

}  // namespace name_literals

}}  // namespace dsched::chain

namespace std {
template <>
struct hash<dsched::chain::name> : private hash<uint64_t> {
    typedef dsched::chain::name argument_type;
    size_t
    operator()(const argument_type& n) const noexcept {
        return hash<uint64_t>::operator()(n.value);
    }
};
}  // namespace std

FC_REFLECT(dsched::chain::name, (value));
